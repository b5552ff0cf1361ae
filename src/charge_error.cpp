// SPDX-License-Identifier: Apache-2.0
#include "charge_error.hpp"

namespace pilegate {

const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::DeviceOffline:
        return "device_offline";
    case ErrorKind::InvalidRequest:
        return "invalid_request";
    case ErrorKind::SendFailure:
        return "send_failure";
    case ErrorKind::ResponseTimeout:
        return "response_timeout";
    case ErrorKind::DeviceFault:
        return "device_fault";
    case ErrorKind::DuplicateSession:
        return "duplicate_session";
    case ErrorKind::DuplicateCommand:
        return "duplicate_command";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Shutdown:
        return "shutdown";
    }
    return "unknown";
}

ChargeError::ChargeError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind) {
}

} // namespace pilegate
