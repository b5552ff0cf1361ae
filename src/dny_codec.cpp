// SPDX-License-Identifier: Apache-2.0
#include "dny_codec.hpp"
#include "dny_contract.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace pilegate {

namespace {
void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

void put_order(std::vector<uint8_t>& out, const std::string& order_number) {
    const auto n = std::min(order_number.size(), dny_contract::kOrderNumberLen);
    out.insert(out.end(), order_number.begin(), order_number.begin() + static_cast<std::ptrdiff_t>(n));
    out.insert(out.end(), dny_contract::kOrderNumberLen - n, 0);
}

std::string get_order(const uint8_t* p) {
    std::size_t n = 0;
    while (n < dny_contract::kOrderNumberLen && p[n] != 0) {
        ++n;
    }
    return std::string(reinterpret_cast<const char*>(p), n);
}
} // namespace

uint16_t DnyCodec::checksum(const uint8_t* bytes, std::size_t len) {
    uint16_t sum = 0;
    for (std::size_t i = 0; i < len; ++i) {
        sum = static_cast<uint16_t>(sum + bytes[i]);
    }
    return sum;
}

std::vector<uint8_t> DnyCodec::encode_frame(uint32_t physical_id, uint16_t message_id, uint8_t command,
                                            const std::vector<uint8_t>& data) {
    std::vector<uint8_t> out;
    out.reserve(dny_contract::kMinFrameLen + data.size());
    out.insert(out.end(), dny_contract::kHeader, dny_contract::kHeader + dny_contract::kHeaderLen);
    // physical id + message id + command + data + checksum
    put_u16(out, static_cast<uint16_t>(4 + 2 + 1 + data.size() + dny_contract::kChecksumLen));
    put_u32(out, physical_id);
    put_u16(out, message_id);
    out.push_back(command);
    out.insert(out.end(), data.begin(), data.end());
    put_u16(out, checksum(out.data(), out.size()));
    return out;
}

DnyFrame DnyCodec::decode_frame(const uint8_t* bytes, std::size_t len) {
    if (len < dny_contract::kMinFrameLen) {
        throw std::invalid_argument("DNY frame too short: " + std::to_string(len));
    }
    if (std::memcmp(bytes, dny_contract::kHeader, dny_contract::kHeaderLen) != 0) {
        throw std::invalid_argument("DNY frame header mismatch");
    }
    const std::size_t declared = get_u16(bytes + 3);
    if (declared + dny_contract::kHeaderLen + dny_contract::kLengthFieldLen != len) {
        throw std::invalid_argument("DNY length field " + std::to_string(declared) + " does not match frame size " +
                                    std::to_string(len));
    }
    const uint16_t expected = checksum(bytes, len - dny_contract::kChecksumLen);
    const uint16_t actual = get_u16(bytes + len - dny_contract::kChecksumLen);
    if (expected != actual) {
        throw std::invalid_argument("DNY checksum mismatch");
    }
    DnyFrame frame;
    frame.physical_id = get_u32(bytes + 5);
    frame.message_id = get_u16(bytes + 9);
    frame.command = bytes[11];
    frame.data.assign(bytes + 12, bytes + len - dny_contract::kChecksumLen);
    return frame;
}

std::size_t DnyCodec::complete_frame_length(const std::vector<uint8_t>& buffer) {
    const auto prefix = std::min(buffer.size(), dny_contract::kHeaderLen);
    if (std::memcmp(buffer.data(), dny_contract::kHeader, prefix) != 0) {
        throw std::invalid_argument("stream is not aligned on a DNY header");
    }
    if (buffer.size() < dny_contract::kHeaderLen + dny_contract::kLengthFieldLen) {
        return 0;
    }
    const std::size_t total = dny_contract::kHeaderLen + dny_contract::kLengthFieldLen + get_u16(buffer.data() + 3);
    if (total < dny_contract::kMinFrameLen || total > dny_contract::kMaxFrameLen) {
        throw std::invalid_argument("implausible DNY frame length " + std::to_string(total));
    }
    return buffer.size() >= total ? total : 0;
}

std::vector<uint8_t> DnyCodec::encode_charge_control(const ChargeControlFields& fields) {
    if (fields.port < 1 || fields.port > 256) {
        throw std::invalid_argument("port out of range: " + std::to_string(fields.port));
    }
    std::vector<uint8_t> data;
    data.reserve(dny_contract::kChargeControlDataLen);
    data.push_back(fields.rate_mode);
    put_u32(data, fields.balance);
    data.push_back(static_cast<uint8_t>(fields.port - 1)); // devices count ports from 0
    data.push_back(fields.charge_command);
    put_u16(data, fields.duration_min);
    put_order(data, fields.order_number);
    put_u16(data, fields.max_duration_min);
    put_u16(data, fields.max_power_w);
    data.push_back(fields.qr_light);
    return data;
}

std::vector<uint8_t> DnyCodec::encode_charge_control_reply(uint8_t status, const std::string& order_number, int port,
                                                           uint16_t wait_ports, std::optional<uint8_t> port_state) {
    std::vector<uint8_t> data;
    data.push_back(status);
    put_order(data, order_number);
    data.push_back(static_cast<uint8_t>(port > 0 ? port - 1 : 0));
    put_u16(data, wait_ports);
    if (port_state) {
        data.push_back(*port_state);
    }
    return data;
}

std::vector<uint8_t> DnyCodec::build_command_frame(const std::string& device_id, uint16_t message_id, uint8_t command,
                                                   const ChargeControlFields& fields) const {
    const auto physical_id = parse_device_id(device_id);
    if (command != dny_contract::kCmdChargeControl) {
        return encode_frame(physical_id, message_id, command, {});
    }
    return encode_frame(physical_id, message_id, command, encode_charge_control(fields));
}

DeviceResponse DnyCodec::parse_response_frame(const std::vector<uint8_t>& bytes) const {
    const auto frame = decode_frame(bytes.data(), bytes.size());
    DeviceResponse resp;
    resp.device_id = format_device_id(frame.physical_id);
    resp.message_id = frame.message_id;
    resp.command = frame.command;
    const auto& d = frame.data;
    if (frame.command == dny_contract::kCmdChargeControl && d.empty()) {
        throw std::invalid_argument("charge control response without status byte");
    }
    if (!d.empty()) {
        resp.status_code = d[0];
    }
    if (frame.command != dny_contract::kCmdChargeControl) {
        return resp;
    }
    const std::size_t order_end = 1 + dny_contract::kOrderNumberLen;
    if (d.size() >= order_end) {
        resp.order_number = get_order(d.data() + 1);
    }
    if (d.size() > order_end) {
        resp.port = d[order_end] + 1;
    }
    if (d.size() >= order_end + 3) {
        resp.wait_ports = get_u16(d.data() + order_end + 1);
    }
    if (d.size() >= order_end + 4) {
        resp.port_state = d[order_end + 3];
    }
    return resp;
}

uint32_t parse_device_id(const std::string& device_id) {
    if (device_id.size() != 8 ||
        !std::all_of(device_id.begin(), device_id.end(), [](unsigned char c) { return std::isxdigit(c) != 0; })) {
        throw std::invalid_argument("device id must be 8 hex digits: '" + device_id + "'");
    }
    return static_cast<uint32_t>(std::stoul(device_id, nullptr, 16));
}

std::string format_device_id(uint32_t physical_id) {
    char buf[9];
    std::snprintf(buf, sizeof(buf), "%08X", physical_id);
    return buf;
}

std::string describe_response_status(uint8_t status) {
    using namespace dny_contract;
    switch (status) {
    case kStatusSuccess:
        return "success";
    case kStatusNoCharger:
        return "no charger connected";
    case kStatusSameState:
        return "port already in requested state";
    case kStatusPortError:
        return "port error";
    case kStatusNoSuchPort:
        return "port does not exist";
    case kStatusMultipleWaitPorts:
        return "multiple ports waiting";
    case kStatusOverPower:
        return "power over limit";
    case kStatusStorageError:
        return "storage error";
    case kStatusRelayFault:
        return "relay fault";
    case kStatusRelayStuck:
        return "relay stuck";
    case kStatusShortCircuit:
        return "short circuit";
    case kStatusSmokeAlarm:
        return "smoke alarm";
    case kStatusOverVoltage:
        return "over voltage";
    case kStatusUnderVoltage:
        return "under voltage";
    case kStatusNoResponse:
        return "device not responding";
    case kStatusDeviceOffline:
        return "device offline";
    default:
        return "unknown status 0x" + format_device_id(status).substr(6);
    }
}

bool is_port_fault(uint8_t status) {
    using namespace dny_contract;
    switch (status) {
    case kStatusPortError:
    case kStatusNoSuchPort:
    case kStatusOverPower:
    case kStatusRelayFault:
    case kStatusRelayStuck:
    case kStatusShortCircuit:
    case kStatusSmokeAlarm:
    case kStatusOverVoltage:
    case kStatusUnderVoltage:
        return true;
    default:
        return false;
    }
}

} // namespace pilegate
