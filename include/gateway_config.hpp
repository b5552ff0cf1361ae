// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "charging_monitor.hpp"
#include "charging_orchestrator.hpp"
#include "platform_notifier.hpp"
#include "tcp_transport.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace pilegate {

namespace fs = std::filesystem;

struct SimulatedDeviceConfig {
    std::string device_id;
    int reply_delay_ms{50};
    int port_state{0};
};

struct GatewayConfig {
    std::string gateway_id{"pilegate-1"};
    fs::path logging_config;
    bool simulation_mode{false}; // If true, serve scripted in-process devices instead of TCP
    TcpServerConfig listen;
    OrchestratorConfig orchestrator;
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(30)};
    MonitorConfig monitor;
    PlatformConfig platform;
    std::map<int, std::string> status_labels; // port state byte -> label overrides
    std::vector<SimulatedDeviceConfig> simulated_devices;
};

GatewayConfig load_gateway_config(const fs::path& config_path);

} // namespace pilegate
