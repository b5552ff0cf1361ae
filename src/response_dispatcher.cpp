// SPDX-License-Identifier: Apache-2.0
#include "response_dispatcher.hpp"
#include "dny_contract.hpp"

#include <stdexcept>

#include <everest/logging.hpp>

namespace pilegate {

ResponseDispatcher::ResponseDispatcher(const FrameCodec& codec, CommandTracker& tracker) :
    codec_(codec), tracker_(tracker) {
}

bool ResponseDispatcher::dispatch(const std::vector<uint8_t>& frame) const {
    DeviceResponse response;
    try {
        response = codec_.parse_response_frame(frame);
    } catch (const std::invalid_argument& e) {
        EVLOG_warning << "Discarding malformed response frame (" << frame.size() << " bytes): " << e.what();
        return false;
    }
    return dispatch(response);
}

bool ResponseDispatcher::dispatch(const DeviceResponse& response) const {
    if (response.command != dny_contract::kCmdChargeControl) {
        return false;
    }
    return tracker_.notify_response(response.device_id, response.message_id, response);
}

} // namespace pilegate
