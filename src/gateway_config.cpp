// SPDX-License-Identifier: Apache-2.0
#include "gateway_config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace pilegate {

namespace {
fs::path make_absolute(const fs::path& base, const fs::path& relative_or_absolute) {
    if (relative_or_absolute.is_absolute()) {
        return relative_or_absolute;
    }
    return fs::weakly_canonical(base / relative_or_absolute);
}

std::chrono::milliseconds seconds_value(const nlohmann::json& obj, const char* key, std::chrono::milliseconds fallback) {
    const double seconds = obj.value(key, std::chrono::duration<double>(fallback).count());
    if (seconds <= 0.0) {
        return fallback;
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

SimulatedDeviceConfig parse_sim_device(const nlohmann::json& device_json) {
    SimulatedDeviceConfig device;
    device.device_id = device_json.value("deviceId", "");
    std::transform(device.device_id.begin(), device.device_id.end(), device.device_id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    device.reply_delay_ms = std::max(0, device_json.value("replyDelayMs", device.reply_delay_ms));
    device.port_state = std::clamp(device_json.value("portState", device.port_state), 0, 255);
    return device;
}
} // namespace

GatewayConfig load_gateway_config(const fs::path& config_path) {
    if (!fs::exists(config_path)) {
        throw std::runtime_error("Config file not found: " + config_path.string());
    }

    std::ifstream file(config_path);
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Config file " + config_path.string() + " is not valid JSON: " + e.what());
    }
    if (!json.is_object()) {
        throw std::runtime_error("Config file " + config_path.string() + " must contain a JSON object");
    }
    const auto base_dir = config_path.parent_path().empty() ? fs::current_path() : config_path.parent_path();

    GatewayConfig cfg{};
    cfg.gateway_id = json.value("gatewayId", cfg.gateway_id);
    cfg.logging_config = make_absolute(base_dir, json.value("loggingConfig", "logging.ini"));
    cfg.simulation_mode = json.value("simulationMode", false);

    const auto listen = json.value("listen", nlohmann::json::object());
    cfg.listen.host = listen.value("host", cfg.listen.host);
    cfg.listen.port = listen.value("port", cfg.listen.port);
    if (cfg.listen.port <= 0 || cfg.listen.port > 65535) {
        throw std::runtime_error("listen.port out of range: " + std::to_string(cfg.listen.port));
    }

    const auto commands = json.value("commands", nlohmann::json::object());
    cfg.orchestrator.response_timeout =
        seconds_value(commands, "responseTimeoutSeconds", cfg.orchestrator.response_timeout);
    cfg.orchestrator.max_ports = std::clamp(commands.value("maxPorts", cfg.orchestrator.max_ports), 1, 256);
    cfg.sweep_interval = seconds_value(commands, "sweepIntervalSeconds", cfg.sweep_interval);
    cfg.listen.resend_timeout = seconds_value(commands, "resendTimeoutSeconds", cfg.listen.resend_timeout);
    cfg.listen.max_retries = std::max(0, commands.value("maxRetries", cfg.listen.max_retries));
    cfg.listen.max_age = seconds_value(commands, "maxAgeSeconds", cfg.listen.max_age);

    const auto monitor = json.value("monitor", nlohmann::json::object());
    cfg.monitor.check_interval = seconds_value(monitor, "checkIntervalSeconds", cfg.monitor.check_interval);
    cfg.monitor.max_monitor_time = seconds_value(monitor, "maxMonitorTimeSeconds", cfg.monitor.max_monitor_time);
    cfg.monitor.timeout_threshold = seconds_value(monitor, "timeoutThresholdSeconds", cfg.monitor.timeout_threshold);
    cfg.monitor.retry_count = monitor.value("retryCount", cfg.monitor.retry_count);
    cfg.monitor.retry_interval = seconds_value(monitor, "retryIntervalSeconds", cfg.monitor.retry_interval);
    cfg.monitor.enable_alerts = monitor.value("enableAlerts", cfg.monitor.enable_alerts);
    cfg.monitor.enable_auto_recover = monitor.value("enableAutoRecover", cfg.monitor.enable_auto_recover);
    if (cfg.monitor.retry_count < 1) {
        cfg.monitor.retry_count = 1;
    }
    if (cfg.monitor.max_monitor_time < cfg.monitor.check_interval) {
        cfg.monitor.max_monitor_time = cfg.monitor.check_interval;
    }

    const auto platform = json.value("platform", nlohmann::json::object());
    cfg.platform.enabled = platform.value("enabled", cfg.platform.enabled);
    cfg.platform.base_url = platform.value("baseUrl", cfg.platform.base_url);
    cfg.platform.api_key = platform.value("apiKey", cfg.platform.api_key);
    cfg.platform.api_secret = platform.value("apiSecret", cfg.platform.api_secret);
    cfg.platform.timeout = seconds_value(platform, "timeoutSeconds", cfg.platform.timeout);
    cfg.platform.retry_count = std::max(0, platform.value("retryCount", cfg.platform.retry_count));
    cfg.platform.retry_interval = seconds_value(platform, "retryIntervalSeconds", cfg.platform.retry_interval);
    cfg.platform.queue_size = std::max<std::size_t>(1, platform.value("queueSize", cfg.platform.queue_size));
    cfg.platform.workers = std::clamp(platform.value("workers", cfg.platform.workers), 1, 64);
    if (cfg.platform.enabled && cfg.platform.base_url.empty()) {
        throw std::runtime_error("platform.enabled requires platform.baseUrl");
    }

    const auto labels = json.value("statusLabels", nlohmann::json::object());
    for (const auto& [key, value] : labels.items()) {
        int state = 0;
        try {
            state = std::stoi(key);
        } catch (const std::exception&) {
            throw std::runtime_error("statusLabels key '" + key + "' is not a port state number");
        }
        if (!value.is_string()) {
            throw std::runtime_error("statusLabels['" + key + "'] must be a string");
        }
        cfg.status_labels[state] = value.get<std::string>();
    }

    const auto simulation = json.value("simulation", nlohmann::json::object());
    if (simulation.contains("devices") && simulation["devices"].is_array()) {
        for (const auto& device_json : simulation["devices"]) {
            auto device = parse_sim_device(device_json);
            if (device.device_id.empty()) {
                throw std::runtime_error("simulation.devices entry without deviceId");
            }
            cfg.simulated_devices.push_back(std::move(device));
        }
    }
    return cfg;
}

} // namespace pilegate
