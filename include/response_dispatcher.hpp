// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "command_tracker.hpp"
#include "device_interface.hpp"

#include <cstdint>
#include <vector>

namespace pilegate {

/// \brief Routes inbound command-response frames into the command tracker. Holds no state of its own.
class ResponseDispatcher {
public:
    ResponseDispatcher(const FrameCodec& codec, CommandTracker& tracker);

    /// Returns true when the frame resolved an outstanding command.
    bool dispatch(const std::vector<uint8_t>& frame) const;
    bool dispatch(const DeviceResponse& response) const;

private:
    const FrameCodec& codec_;
    CommandTracker& tracker_;
};

} // namespace pilegate
