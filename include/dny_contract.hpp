// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>

namespace dny_contract {
inline constexpr char kHeader[3] = {'D', 'N', 'Y'};
inline constexpr std::size_t kHeaderLen = 3;
inline constexpr std::size_t kLengthFieldLen = 2;
inline constexpr std::size_t kChecksumLen = 2;
// header + length + physical id + message id + command + checksum
inline constexpr std::size_t kMinFrameLen = 14;
inline constexpr std::size_t kMaxFrameLen = 1024;

inline constexpr uint8_t kCmdHeartbeat = 0x01;
inline constexpr uint8_t kCmdDeviceRegister = 0x20;
inline constexpr uint8_t kCmdDeviceHeartbeat = 0x21;
inline constexpr uint8_t kCmdChargeControl = 0x82;

inline constexpr uint8_t kChargeStop = 0x00;
inline constexpr uint8_t kChargeStart = 0x01;
inline constexpr uint8_t kChargeQuery = 0x03;

inline constexpr std::size_t kOrderNumberLen = 16;
inline constexpr std::size_t kChargeControlDataLen = 30;

inline constexpr uint8_t kStatusSuccess = 0x00;
inline constexpr uint8_t kStatusNoCharger = 0x01;
inline constexpr uint8_t kStatusSameState = 0x02;
inline constexpr uint8_t kStatusPortError = 0x03;
inline constexpr uint8_t kStatusNoSuchPort = 0x04;
inline constexpr uint8_t kStatusMultipleWaitPorts = 0x05;
inline constexpr uint8_t kStatusOverPower = 0x06;
inline constexpr uint8_t kStatusStorageError = 0x07;
inline constexpr uint8_t kStatusRelayFault = 0x08;
inline constexpr uint8_t kStatusRelayStuck = 0x09;
inline constexpr uint8_t kStatusShortCircuit = 0x0A;
inline constexpr uint8_t kStatusSmokeAlarm = 0x0B;
inline constexpr uint8_t kStatusOverVoltage = 0x0C;
inline constexpr uint8_t kStatusUnderVoltage = 0x0D;
inline constexpr uint8_t kStatusNoResponse = 0x0E;
inline constexpr uint8_t kStatusDeviceOffline = 0xFF;
} // namespace dny_contract
