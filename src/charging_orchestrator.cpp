// SPDX-License-Identifier: Apache-2.0
#include "charging_orchestrator.hpp"
#include "dny_codec.hpp"
#include "dny_contract.hpp"

#include <stdexcept>

#include <everest/logging.hpp>

namespace pilegate {

namespace {
uint8_t charge_command_for(ChargeAction action) {
    switch (action) {
    case ChargeAction::Start:
        return dny_contract::kChargeStart;
    case ChargeAction::Stop:
        return dny_contract::kChargeStop;
    case ChargeAction::Query:
        return dny_contract::kChargeQuery;
    }
    return dny_contract::kChargeQuery;
}
} // namespace

const char* to_string(ChargeAction action) {
    switch (action) {
    case ChargeAction::Start:
        return "start";
    case ChargeAction::Stop:
        return "stop";
    case ChargeAction::Query:
        return "query";
    }
    return "unknown";
}

nlohmann::json ChargingResponse::to_json() const {
    return nlohmann::json{{"success", success},       {"message", message},
                          {"device_id", device_id},   {"port", port},
                          {"order_number", order_number}, {"status", status},
                          {"timestamp", to_iso8601(timestamp)}};
}

ChargingOrchestrator::ChargingOrchestrator(const OrchestratorConfig& cfg, const MonitorConfig& monitor_cfg,
                                           const StatusLabels& labels, const FrameCodec& codec,
                                           DeviceTransport& transport, CommandTracker& tracker,
                                           EventNotifier& notifier) :
    cfg_(cfg),
    labels_(labels),
    codec_(codec),
    transport_(transport),
    tracker_(tracker),
    notifier_(notifier),
    monitors_(monitor_cfg, labels_, *this, tracker, notifier) {
    if (cfg_.max_ports < 1) {
        cfg_.max_ports = 1;
    }
}

ChargingOrchestrator::~ChargingOrchestrator() {
    shutdown();
}

void ChargingOrchestrator::shutdown() {
    monitors_.shutdown();
}

void ChargingOrchestrator::validate(const ChargingRequest& req, ChargeAction action) const {
    if (req.device_id.empty()) {
        throw ChargeError(ErrorKind::InvalidRequest, "device id is required");
    }
    if (req.port < 1 || req.port > cfg_.max_ports) {
        throw ChargeError(ErrorKind::InvalidRequest,
                          "port " + std::to_string(req.port) + " outside 1.." + std::to_string(cfg_.max_ports));
    }
    if (action == ChargeAction::Start) {
        if (req.order_number.empty()) {
            throw ChargeError(ErrorKind::InvalidRequest, "order number is required to start charging");
        }
        if (req.order_number.size() > dny_contract::kOrderNumberLen) {
            throw ChargeError(ErrorKind::InvalidRequest, "order number longer than " +
                                                             std::to_string(dny_contract::kOrderNumberLen) +
                                                             " characters");
        }
        if (req.duration_min < 0 || req.duration_min > 0xFFFF) {
            throw ChargeError(ErrorKind::InvalidRequest, "duration out of range: " + std::to_string(req.duration_min));
        }
        if (req.mode != 0 && req.mode != 1) {
            throw ChargeError(ErrorKind::InvalidRequest, "unsupported rate mode " + std::to_string(req.mode));
        }
    }
}

ChargeControlFields ChargingOrchestrator::to_fields(const ChargingRequest& req, ChargeAction action) const {
    ChargeControlFields fields;
    fields.charge_command = charge_command_for(action);
    fields.port = req.port;
    fields.order_number = req.order_number;
    if (action == ChargeAction::Start) {
        fields.rate_mode = static_cast<uint8_t>(req.mode);
        fields.balance = req.balance;
        fields.duration_min = static_cast<uint16_t>(req.duration_min);
        fields.max_duration_min = static_cast<uint16_t>(req.duration_min);
        fields.max_power_w = req.max_power_w;
    }
    return fields;
}

uint16_t ChargingOrchestrator::next_message_id() {
    uint16_t id = 0;
    while (id == 0) {
        id = static_cast<uint16_t>(message_id_.fetch_add(1) + 1);
    }
    return id;
}

std::shared_ptr<PendingCommand> ChargingOrchestrator::send_command(const std::string& device_id,
                                                                   const ChargeControlFields& fields,
                                                                   std::chrono::milliseconds timeout,
                                                                   ResponseCallback callback) {
    if (!transport_.resolve(device_id)) {
        throw ChargeError(ErrorKind::DeviceOffline, "device " + device_id + " is not connected");
    }
    const auto message_id = next_message_id();
    std::vector<uint8_t> frame;
    try {
        frame = codec_.build_command_frame(device_id, message_id, dny_contract::kCmdChargeControl, fields);
    } catch (const std::invalid_argument& e) {
        throw ChargeError(ErrorKind::InvalidRequest, e.what());
    }

    auto cmd =
        tracker_.track_command(device_id, dny_contract::kCmdChargeControl, message_id, timeout, std::move(callback));
    if (!transport_.send(device_id, frame)) {
        tracker_.cancel(cmd, "send failed");
        throw ChargeError(ErrorKind::SendFailure, "failed to send charge command to device " + device_id);
    }
    transport_.register_retry(device_id, message_id, dny_contract::kCmdChargeControl, frame);
    EVLOG_debug << "Sent charge command 0x" << std::hex << static_cast<int>(fields.charge_command) << std::dec
                << " to " << device_id << " port " << fields.port << " msg=" << message_id;
    return cmd;
}

ChargingResponse ChargingOrchestrator::make_response(const ChargingRequest& req) const {
    ChargingResponse out;
    out.device_id = req.device_id;
    out.port = req.port;
    out.order_number = req.order_number;
    return out;
}

ChargingResponse ChargingOrchestrator::complete(const ChargingRequest& req, const DeviceResponse& resp) {
    switch (req.action) {
    case ChargeAction::Start:
        return complete_start(req, resp);
    case ChargeAction::Stop:
        return complete_stop(req, resp);
    case ChargeAction::Query:
        break;
    }
    return complete_query(req, resp);
}

ChargingResponse ChargingOrchestrator::complete_start(const ChargingRequest& req, const DeviceResponse& resp) {
    auto out = make_response(req);
    const auto status = resp.status_code;
    if (status == dny_contract::kStatusSuccess) {
        monitors_.start_monitoring(req.order_number, req.device_id, req.port);
        emit("charging_start", nlohmann::json{{"order_number", req.order_number},
                                              {"device_id", req.device_id},
                                              {"port", req.port},
                                              {"balance", req.balance},
                                              {"duration_min", req.duration_min},
                                              {"mode", req.mode}});
        EVLOG_info << "Charging started on " << req.device_id << " port " << req.port << " order "
                   << req.order_number;
        out.success = true;
        out.status = "started";
        out.message = "charging started";
        return out;
    }
    const auto description = describe_response_status(status);
    if (is_port_fault(status)) {
        EVLOG_error << "Start of order " << req.order_number << " failed with port fault on " << req.device_id
                    << " port " << req.port << ": " << description;
        emit("charging_failed", nlohmann::json{{"order_number", req.order_number},
                                               {"device_id", req.device_id},
                                               {"port", req.port},
                                               {"error_code", status},
                                               {"reason", description},
                                               {"refund", true}});
        throw ChargeError(ErrorKind::DeviceFault, "port fault, refund initiated: " + description);
    }
    EVLOG_warning << "Start of order " << req.order_number << " rejected by " << req.device_id << ": " << description;
    out.success = false;
    out.status = "failed";
    out.message = description;
    return out;
}

ChargingResponse ChargingOrchestrator::complete_stop(const ChargingRequest& req, const DeviceResponse& resp) {
    auto out = make_response(req);
    const auto status = resp.status_code;
    if (status == dny_contract::kStatusSuccess || status == dny_contract::kStatusSameState) {
        if (!req.order_number.empty() && !monitors_.stop_monitoring(req.order_number, StopReason::Stopped)) {
            EVLOG_debug << "Stop for order " << req.order_number << " had no active monitor";
        }
        out.success = true;
        out.status = "stopped";
        out.message = status == dny_contract::kStatusSameState ? "port already stopped" : "charging stopped";
        return out;
    }
    out.success = false;
    out.status = "failed";
    out.message = describe_response_status(status);
    EVLOG_warning << "Stop on " << req.device_id << " port " << req.port << " rejected: " << out.message;
    return out;
}

ChargingResponse ChargingOrchestrator::complete_query(const ChargingRequest& req, const DeviceResponse& resp) const {
    auto out = make_response(req);
    if (!resp.order_number.empty()) {
        out.order_number = resp.order_number;
    }
    if (resp.status_code == dny_contract::kStatusSuccess) {
        out.success = true;
        out.status = labels_.label_for(resp.port_state);
        out.message = "ok";
        return out;
    }
    out.success = false;
    out.status = resp.status_code == dny_contract::kStatusDeviceOffline ? "device_offline" : "error";
    out.message = describe_response_status(resp.status_code);
    return out;
}

ChargingResponse ChargingOrchestrator::start(const ChargingRequest& req) {
    validate(req, ChargeAction::Start);
    // Held until the monitor is registered, so a concurrent start for the same order is refused
    // before it reaches the device.
    const auto reservation = monitors_.reserve(req.order_number);
    auto cmd = send_command(req.device_id, to_fields(req, ChargeAction::Start), cfg_.response_timeout, nullptr);
    const auto resp = tracker_.wait_for_response(cmd);
    auto start_req = req;
    start_req.action = ChargeAction::Start;
    return complete_start(start_req, resp);
}

ChargingResponse ChargingOrchestrator::stop(const ChargingRequest& req) {
    validate(req, ChargeAction::Stop);
    auto cmd = send_command(req.device_id, to_fields(req, ChargeAction::Stop), cfg_.response_timeout, nullptr);
    return complete_stop(req, tracker_.wait_for_response(cmd));
}

ChargingResponse ChargingOrchestrator::query(const ChargingRequest& req) {
    return query_with_timeout(req, cfg_.response_timeout);
}

ChargingResponse ChargingOrchestrator::query_with_timeout(const ChargingRequest& req,
                                                          std::chrono::milliseconds timeout) {
    validate(req, ChargeAction::Query);
    auto cmd = send_command(req.device_id, to_fields(req, ChargeAction::Query), timeout, nullptr);
    return complete_query(req, tracker_.wait_for_response(cmd));
}

ResponseCallback ChargingOrchestrator::adapt(const ChargingRequest& req, ResultCallback callback) {
    return [this, req, callback = std::move(callback)](std::optional<DeviceResponse> resp,
                                                       std::optional<ChargeError> err) {
        if (err) {
            callback(std::nullopt, err);
            return;
        }
        try {
            auto out = complete(req, *resp);
            callback(out, std::nullopt);
        } catch (const ChargeError& e) {
            callback(std::nullopt, e);
        }
    };
}

void ChargingOrchestrator::start_async(const ChargingRequest& req, ResultCallback callback) {
    validate(req, ChargeAction::Start);
    std::shared_ptr<MonitorService::Reservation> reservation = monitors_.reserve(req.order_number);
    auto start_req = req;
    start_req.action = ChargeAction::Start;
    auto on_result = adapt(start_req, std::move(callback));
    send_command(req.device_id, to_fields(req, ChargeAction::Start), cfg_.response_timeout,
                 [reservation, on_result = std::move(on_result)](std::optional<DeviceResponse> resp,
                                                                 std::optional<ChargeError> err) {
                     on_result(std::move(resp), std::move(err));
                     reservation->release();
                 });
}

void ChargingOrchestrator::stop_async(const ChargingRequest& req, ResultCallback callback) {
    validate(req, ChargeAction::Stop);
    auto stop_req = req;
    stop_req.action = ChargeAction::Stop;
    send_command(req.device_id, to_fields(req, ChargeAction::Stop), cfg_.response_timeout,
                 adapt(stop_req, std::move(callback)));
}

void ChargingOrchestrator::query_async(const ChargingRequest& req, ResultCallback callback) {
    validate(req, ChargeAction::Query);
    auto query_req = req;
    query_req.action = ChargeAction::Query;
    send_command(req.device_id, to_fields(req, ChargeAction::Query), cfg_.response_timeout,
                 adapt(query_req, std::move(callback)));
}

std::shared_ptr<PendingCommand> ChargingOrchestrator::issue_status_query(const std::string& device_id, int port,
                                                                         std::chrono::milliseconds timeout) {
    ChargingRequest req;
    req.device_id = device_id;
    req.port = port;
    return send_command(device_id, to_fields(req, ChargeAction::Query), timeout, nullptr);
}

void ChargingOrchestrator::emit(const std::string& event_type, const nlohmann::json& payload) {
    try {
        notifier_.notify(event_type, payload);
    } catch (const std::exception& e) {
        EVLOG_error << "Failed to notify " << event_type << ": " << e.what();
    }
}

} // namespace pilegate
