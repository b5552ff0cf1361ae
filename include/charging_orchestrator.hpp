// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "charge_error.hpp"
#include "charging_monitor.hpp"
#include "command_tracker.hpp"
#include "device_interface.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace pilegate {

enum class ChargeAction { Start, Stop, Query };

const char* to_string(ChargeAction action);

struct ChargingRequest {
    std::string device_id;
    int port{0}; // 1-based
    ChargeAction action{ChargeAction::Query};
    int duration_min{0};
    std::string order_number;
    uint32_t balance{0};
    int mode{0}; // 0 = timed, 1 = metered
    uint16_t max_power_w{0};
};

struct ChargingResponse {
    bool success{false};
    std::string message;
    std::string device_id;
    int port{0};
    std::string order_number;
    std::string status;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    nlohmann::json to_json() const;
};

struct OrchestratorConfig {
    std::chrono::milliseconds response_timeout{std::chrono::seconds(10)};
    int max_ports{16};
};

/// \brief Start / stop / query operations toward charging piles.
///
/// Every operation funnels through send_command(): resolve the connection, build the frame,
/// track it, transmit it and hand it to the transport's retry bookkeeping. A successful start
/// spawns a ChargingMonitor for the order; a successful stop finalizes it.
///
/// Completion callbacks of the *_async operations run on the command tracker's callback worker,
/// so the tracker must be shut down before the orchestrator is destroyed.
class ChargingOrchestrator : public StatusQuerier {
public:
    using ResultCallback = std::function<void(std::optional<ChargingResponse>, std::optional<ChargeError>)>;

    ChargingOrchestrator(const OrchestratorConfig& cfg, const MonitorConfig& monitor_cfg, const StatusLabels& labels,
                         const FrameCodec& codec, DeviceTransport& transport, CommandTracker& tracker,
                         EventNotifier& notifier);
    ~ChargingOrchestrator() override;

    ChargingOrchestrator(const ChargingOrchestrator&) = delete;
    ChargingOrchestrator& operator=(const ChargingOrchestrator&) = delete;

    ChargingResponse start(const ChargingRequest& req);
    ChargingResponse stop(const ChargingRequest& req);
    ChargingResponse query(const ChargingRequest& req);
    ChargingResponse query_with_timeout(const ChargingRequest& req, std::chrono::milliseconds timeout);

    /// Validation, offline and send errors are thrown synchronously; the rest arrives via callback.
    void start_async(const ChargingRequest& req, ResultCallback callback);
    void stop_async(const ChargingRequest& req, ResultCallback callback);
    void query_async(const ChargingRequest& req, ResultCallback callback);

    std::shared_ptr<PendingCommand> issue_status_query(const std::string& device_id, int port,
                                                       std::chrono::milliseconds timeout) override;

    MonitorService& monitors() {
        return monitors_;
    }
    const StatusLabels& labels() const {
        return labels_;
    }

    void shutdown();

private:
    void validate(const ChargingRequest& req, ChargeAction action) const;
    ChargeControlFields to_fields(const ChargingRequest& req, ChargeAction action) const;
    uint16_t next_message_id();
    std::shared_ptr<PendingCommand> send_command(const std::string& device_id, const ChargeControlFields& fields,
                                                 std::chrono::milliseconds timeout, ResponseCallback callback);
    ResponseCallback adapt(const ChargingRequest& req, ResultCallback callback);

    ChargingResponse complete(const ChargingRequest& req, const DeviceResponse& resp);
    ChargingResponse complete_start(const ChargingRequest& req, const DeviceResponse& resp);
    ChargingResponse complete_stop(const ChargingRequest& req, const DeviceResponse& resp);
    ChargingResponse complete_query(const ChargingRequest& req, const DeviceResponse& resp) const;
    ChargingResponse make_response(const ChargingRequest& req) const;
    void emit(const std::string& event_type, const nlohmann::json& payload);

    OrchestratorConfig cfg_;
    StatusLabels labels_;
    const FrameCodec& codec_;
    DeviceTransport& transport_;
    CommandTracker& tracker_;
    EventNotifier& notifier_;
    std::atomic<uint16_t> message_id_{0};
    MonitorService monitors_;
};

} // namespace pilegate
