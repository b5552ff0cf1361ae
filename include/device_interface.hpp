// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pilegate {

using Clock = std::chrono::steady_clock;

/// UTC, second precision: "2024-05-01T12:00:00Z".
std::string to_iso8601(std::chrono::system_clock::time_point tp);

/// \brief Payload of a charge-control (0x82) request. Port is 1-based as seen by operators.
struct ChargeControlFields {
    uint8_t charge_command{0};
    int port{1};
    uint32_t balance{0};
    uint16_t duration_min{0};
    std::string order_number;
    uint8_t rate_mode{0};
    uint16_t max_duration_min{0};
    uint16_t max_power_w{0};
    uint8_t qr_light{0};
};

/// \brief Decoded device reply, as handed to the command tracker.
struct DeviceResponse {
    std::string device_id;
    uint16_t message_id{0};
    uint8_t command{0};
    uint8_t status_code{0};
    std::string order_number;
    int port{0}; // 1-based, 0 when the device did not report one
    uint16_t wait_ports{0};
    std::optional<uint8_t> port_state;
    std::chrono::system_clock::time_point received_at{std::chrono::system_clock::now()};
};

struct ConnectionHandle {
    std::string device_id;
    std::string remote_address;
    Clock::time_point connected_at{};
    Clock::time_point last_seen{};
};

/// \brief Wire codec toward devices.
class FrameCodec {
public:
    virtual ~FrameCodec() = default;

    virtual std::vector<uint8_t> build_command_frame(const std::string& device_id, uint16_t message_id,
                                                     uint8_t command, const ChargeControlFields& fields) const = 0;
    /// Throws std::invalid_argument on a malformed frame.
    virtual DeviceResponse parse_response_frame(const std::vector<uint8_t>& frame) const = 0;
};

/// \brief Per-device persistent connections. Read-only from the control plane's side.
class DeviceTransport {
public:
    virtual ~DeviceTransport() = default;

    virtual bool send(const std::string& device_id, const std::vector<uint8_t>& frame) = 0;
    virtual bool is_online(const std::string& device_id) const = 0;
    virtual std::optional<ConnectionHandle> resolve(const std::string& device_id) const = 0;
    /// Hands a sent frame to the transport for resend until acknowledged.
    virtual void register_retry(const std::string& device_id, uint16_t message_id, uint8_t command,
                                const std::vector<uint8_t>& frame) = 0;
};

/// \brief Fire-and-forget event sink toward the business platform.
class EventNotifier {
public:
    virtual ~EventNotifier() = default;

    virtual void notify(const std::string& event_type, const nlohmann::json& payload) = 0;
};

} // namespace pilegate
