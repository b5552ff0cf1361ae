// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <stdexcept>
#include <string>

namespace pilegate {

enum class ErrorKind {
    DeviceOffline,
    InvalidRequest,
    SendFailure,
    ResponseTimeout,
    DeviceFault,
    DuplicateSession,
    DuplicateCommand,
    Cancelled,
    Shutdown
};

const char* to_string(ErrorKind kind);

/// \brief Failure of a charge-control operation, classified by kind.
class ChargeError : public std::runtime_error {
public:
    ChargeError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const {
        return kind_;
    }

private:
    ErrorKind kind_;
};

} // namespace pilegate
