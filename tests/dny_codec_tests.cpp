// SPDX-License-Identifier: Apache-2.0
#include "command_tracker.hpp"
#include "dny_codec.hpp"
#include "dny_contract.hpp"
#include "response_dispatcher.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>

using namespace pilegate;
using namespace std::chrono_literals;

namespace {
template <typename F> bool throws_invalid(F&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

void test_device_id_mapping() {
    assert(parse_device_id("04CEAA40") == 0x04CEAA40u);
    assert(parse_device_id("04ceaa40") == 0x04CEAA40u);
    assert(format_device_id(0x04CEAA40u) == "04CEAA40");
    assert(format_device_id(0x1u) == "00000001");
    assert(throws_invalid([]() { parse_device_id("X"); }));
    assert(throws_invalid([]() { parse_device_id("04CEAA4"); }));
    assert(throws_invalid([]() { parse_device_id("04CEAA4G"); }));
}

void test_start_frame_layout() {
    DnyCodec codec;
    ChargeControlFields fields;
    fields.charge_command = dny_contract::kChargeStart;
    fields.port = 1;
    fields.balance = 10000;
    fields.duration_min = 240;
    fields.order_number = "O1";
    const auto frame = codec.build_command_frame("04CEAA40", 0x1234, dny_contract::kCmdChargeControl, fields);

    assert(frame.size() == 14 + dny_contract::kChargeControlDataLen);
    assert(frame[0] == 'D' && frame[1] == 'N' && frame[2] == 'Y');
    // length covers physical id, message id, command, data and checksum
    assert((frame[3] | (frame[4] << 8)) == 4 + 2 + 1 + 30 + 2);
    // physical id little-endian
    assert(frame[5] == 0x40 && frame[6] == 0xAA && frame[7] == 0xCE && frame[8] == 0x04);
    assert(frame[9] == 0x34 && frame[10] == 0x12);
    assert(frame[11] == dny_contract::kCmdChargeControl);
    const uint8_t* data = frame.data() + 12;
    assert(data[0] == 0);                                   // rate mode
    assert((data[1] | (data[2] << 8)) == 10000);            // balance low bytes
    assert(data[5] == 0);                                   // api port 1 -> device port 0
    assert(data[6] == dny_contract::kChargeStart);
    assert((data[7] | (data[8] << 8)) == 240);
    assert(data[9] == 'O' && data[10] == '1' && data[11] == 0);

    const auto sum = DnyCodec::checksum(frame.data(), frame.size() - 2);
    assert(frame[frame.size() - 2] == (sum & 0xFF));
    assert(frame[frame.size() - 1] == ((sum >> 8) & 0xFF));

    const auto decoded = DnyCodec::decode_frame(frame.data(), frame.size());
    assert(decoded.physical_id == 0x04CEAA40u);
    assert(decoded.message_id == 0x1234);
    assert(decoded.data.size() == dny_contract::kChargeControlDataLen);
}

void test_parse_response() {
    DnyCodec codec;
    const auto data = DnyCodec::encode_charge_control_reply(dny_contract::kStatusSuccess, "ORDER-77", 2, 0x0003, 3);
    const auto frame = DnyCodec::encode_frame(0x04CEAA40u, 77, dny_contract::kCmdChargeControl, data);
    const auto resp = codec.parse_response_frame(frame);
    assert(resp.device_id == "04CEAA40");
    assert(resp.message_id == 77);
    assert(resp.command == dny_contract::kCmdChargeControl);
    assert(resp.status_code == 0);
    assert(resp.order_number == "ORDER-77");
    assert(resp.port == 2);
    assert(resp.wait_ports == 0x0003);
    assert(resp.port_state && *resp.port_state == 3);

    // minimal reply: status only
    const auto short_frame = DnyCodec::encode_frame(0x04CEAA40u, 78, dny_contract::kCmdChargeControl, {0x06});
    const auto short_resp = codec.parse_response_frame(short_frame);
    assert(short_resp.status_code == dny_contract::kStatusOverPower);
    assert(short_resp.order_number.empty());
    assert(!short_resp.port_state);

    const auto empty = DnyCodec::encode_frame(0x04CEAA40u, 79, dny_contract::kCmdChargeControl, {});
    assert(throws_invalid([&]() { codec.parse_response_frame(empty); }));
}

void test_malformed_frames_rejected() {
    DnyCodec codec;
    auto frame = DnyCodec::encode_frame(0x04CEAA40u, 1, dny_contract::kCmdChargeControl, {0x00});
    auto bad_checksum = frame;
    bad_checksum.back() ^= 0xFF;
    assert(throws_invalid([&]() { codec.parse_response_frame(bad_checksum); }));
    auto bad_header = frame;
    bad_header[0] = 'X';
    assert(throws_invalid([&]() { codec.parse_response_frame(bad_header); }));
    auto truncated = frame;
    truncated.pop_back();
    assert(throws_invalid([&]() { codec.parse_response_frame(truncated); }));
}

void test_stream_framing() {
    const auto frame = DnyCodec::encode_frame(0x04CEAA40u, 5, dny_contract::kCmdDeviceHeartbeat, {1, 2, 3});
    std::vector<uint8_t> buffer(frame.begin(), frame.begin() + 4);
    assert(DnyCodec::complete_frame_length(buffer) == 0);
    buffer.assign(frame.begin(), frame.end() - 1);
    assert(DnyCodec::complete_frame_length(buffer) == 0);
    buffer = frame;
    buffer.push_back('D');
    assert(DnyCodec::complete_frame_length(buffer) == frame.size());
    std::vector<uint8_t> garbage{'A', 'B', 'C', 'D', 'E'};
    assert(throws_invalid([&]() { DnyCodec::complete_frame_length(garbage); }));
}

void test_status_classification() {
    assert(describe_response_status(0x00) == "success");
    assert(describe_response_status(0x0B) == "smoke alarm");
    assert(describe_response_status(0xFF) == "device offline");
    assert(describe_response_status(0x42).find("unknown") != std::string::npos);
    assert(is_port_fault(dny_contract::kStatusPortError));
    assert(is_port_fault(dny_contract::kStatusShortCircuit));
    assert(!is_port_fault(dny_contract::kStatusSuccess));
    assert(!is_port_fault(dny_contract::kStatusSameState));
    assert(!is_port_fault(dny_contract::kStatusDeviceOffline));
}

void test_dispatcher_routes_charge_responses() {
    DnyCodec codec;
    CommandTracker tracker;
    ResponseDispatcher dispatcher(codec, tracker);

    auto cmd = tracker.track_command("04CEAA40", dny_contract::kCmdChargeControl, 21, 1s);
    const auto reply = DnyCodec::encode_frame(
        0x04CEAA40u, 21, dny_contract::kCmdChargeControl,
        DnyCodec::encode_charge_control_reply(dny_contract::kStatusSuccess, "O1", 1, 0, 1));
    assert(dispatcher.dispatch(reply));
    assert(tracker.wait_for_response(cmd).port_state == std::optional<uint8_t>(1));
    // duplicate delivery is not matched
    assert(!dispatcher.dispatch(reply));

    // heartbeats are not command responses
    tracker.track_command("04CEAA40", dny_contract::kCmdChargeControl, 22, 1s);
    const auto heartbeat = DnyCodec::encode_frame(0x04CEAA40u, 22, dny_contract::kCmdDeviceHeartbeat, {0x00});
    assert(!dispatcher.dispatch(heartbeat));
    assert(tracker.pending_count() == 1);

    std::vector<uint8_t> junk{'D', 'N', 'Y', 0x01};
    assert(!dispatcher.dispatch(junk));
    tracker.shutdown();
}
} // namespace

int main() {
    test_device_id_mapping();
    test_start_frame_layout();
    test_parse_response();
    test_malformed_frames_rejected();
    test_stream_framing();
    test_status_classification();
    test_dispatcher_routes_charge_responses();

    std::cout << "dny_codec_tests passed\n";
    return 0;
}
