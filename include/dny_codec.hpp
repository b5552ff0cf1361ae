// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_interface.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pilegate {

/// \brief Frame-level view of a DNY packet.
struct DnyFrame {
    uint32_t physical_id{0};
    uint16_t message_id{0};
    uint8_t command{0};
    std::vector<uint8_t> data;
};

/// \brief DNY binary protocol: "DNY" | len | physical id | message id | cmd | data | checksum.
class DnyCodec : public FrameCodec {
public:
    std::vector<uint8_t> build_command_frame(const std::string& device_id, uint16_t message_id, uint8_t command,
                                             const ChargeControlFields& fields) const override;
    DeviceResponse parse_response_frame(const std::vector<uint8_t>& frame) const override;

    static std::vector<uint8_t> encode_frame(uint32_t physical_id, uint16_t message_id, uint8_t command,
                                             const std::vector<uint8_t>& data);
    static DnyFrame decode_frame(const uint8_t* bytes, std::size_t len);

    /// Length of the first complete frame at the start of buffer, 0 when more bytes are needed.
    /// Throws std::invalid_argument when the buffer does not start with a plausible frame.
    static std::size_t complete_frame_length(const std::vector<uint8_t>& buffer);

    static std::vector<uint8_t> encode_charge_control(const ChargeControlFields& fields);
    static std::vector<uint8_t> encode_charge_control_reply(uint8_t status, const std::string& order_number, int port,
                                                            uint16_t wait_ports, std::optional<uint8_t> port_state);
    static uint16_t checksum(const uint8_t* bytes, std::size_t len);
};

/// "04CEAA40" -> 0x04CEAA40. Throws std::invalid_argument unless exactly 8 hex digits.
uint32_t parse_device_id(const std::string& device_id);
std::string format_device_id(uint32_t physical_id);

std::string describe_response_status(uint8_t status);
/// Device-reported port or hardware faults that are not self-healing.
bool is_port_fault(uint8_t status);

} // namespace pilegate
