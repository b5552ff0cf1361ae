// SPDX-License-Identifier: Apache-2.0
#include "charging_monitor.hpp"
#include "dny_codec.hpp"
#include "dny_contract.hpp"

#include <algorithm>
#include <iterator>

#include <everest/logging.hpp>

namespace pilegate {

const char* to_string(SessionState state) {
    switch (state) {
    case SessionState::Starting:
        return "starting";
    case SessionState::Charging:
        return "charging";
    case SessionState::ChargingError:
        return "charging_error";
    case SessionState::ChargingCompleted:
        return "charging_completed";
    case SessionState::ChargingStopped:
        return "charging_stopped";
    case SessionState::Error:
        return "error";
    case SessionState::DeviceOffline:
        return "device_offline";
    case SessionState::PortFault:
        return "port_fault";
    case SessionState::Terminated:
        return "terminated";
    }
    return "unknown";
}

const char* to_string(AlertLevel level) {
    switch (level) {
    case AlertLevel::Info:
        return "info";
    case AlertLevel::Warning:
        return "warning";
    case AlertLevel::Error:
        return "error";
    }
    return "unknown";
}

StatusLabels::StatusLabels() :
    labels_{{0, "charging_stopped"},   {1, "charging"},      {2, "plugged_not_charging"},
            {3, "charging_completed"}, {4, "not_metered"},   {5, "float_charging"}} {
}

StatusLabels::StatusLabels(const std::map<int, std::string>& overrides) : StatusLabels() {
    for (const auto& [state, label] : overrides) {
        if (!label.empty()) {
            labels_[state] = label;
        }
    }
}

std::string StatusLabels::label_for(std::optional<uint8_t> port_state) const {
    // A successful query without a port state byte means the port is still delivering.
    if (!port_state) {
        return to_string(SessionState::Charging);
    }
    const auto it = labels_.find(*port_state);
    return it != labels_.end() ? it->second : fault_label_;
}

SessionState StatusLabels::classify(const std::string& label) {
    if (label == to_string(SessionState::ChargingCompleted)) {
        return SessionState::ChargingCompleted;
    }
    if (label == to_string(SessionState::ChargingStopped)) {
        return SessionState::ChargingStopped;
    }
    if (label == to_string(SessionState::ChargingError)) {
        return SessionState::ChargingError;
    }
    return SessionState::Charging;
}

std::chrono::milliseconds MonitorConfig::poll_timeout() const {
    const auto headroom = std::max(std::chrono::milliseconds(1), check_interval / 5);
    const auto bound = std::max(std::chrono::milliseconds(1), check_interval - headroom);
    return std::min(timeout_threshold, bound);
}

nlohmann::json MonitorAlert::to_json() const {
    return nlohmann::json{{"alert_type", type},
                          {"level", to_string(level)},
                          {"order_number", order_number},
                          {"device_id", device_id},
                          {"message", message},
                          {"timestamp", to_iso8601(timestamp)},
                          {"context", context}};
}

nlohmann::json ChargingSession::to_json() const {
    return nlohmann::json{{"order_number", order_number},
                          {"device_id", device_id},
                          {"port", port},
                          {"start_time", to_iso8601(start_time)},
                          {"last_check_time", to_iso8601(last_check_time)},
                          {"state", to_string(state)},
                          {"last_status", last_status},
                          {"check_count", check_count},
                          {"error_count", error_count},
                          {"is_active", is_active}};
}

ChargingMonitor::ChargingMonitor(ChargingSession session, const MonitorConfig& cfg, const StatusLabels& labels,
                                 StatusQuerier& querier, CommandTracker& tracker, EventNotifier& notifier,
                                 FinishedHandler on_finished) :
    order_number_(session.order_number),
    cfg_(cfg),
    labels_(labels),
    querier_(querier),
    tracker_(tracker),
    notifier_(notifier),
    on_finished_(std::move(on_finished)),
    session_(std::move(session)) {
}

ChargingMonitor::~ChargingMonitor() {
    request_stop(StopReason::Shutdown);
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void ChargingMonitor::start() {
    thread_ = std::thread([this]() { run(); });
}

void ChargingMonitor::request_stop(StopReason reason) {
    std::shared_ptr<PendingCommand> inflight;
    {
        std::lock_guard<std::mutex> lock(ctrl_mtx_);
        if (stop_requested_) {
            return;
        }
        stop_requested_ = true;
        stop_reason_ = reason;
        inflight = inflight_;
    }
    ctrl_cv_.notify_all();
    if (inflight) {
        tracker_.cancel(inflight, "monitor for order " + order_number_ + " stopping");
    }
}

void ChargingMonitor::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

ChargingSession ChargingMonitor::snapshot() const {
    std::lock_guard<std::mutex> lock(session_mtx_);
    return session_;
}

void ChargingMonitor::run() {
    try {
        run_loop();
    } catch (const std::exception& e) {
        EVLOG_error << "Monitor for order " << order_number_ << " aborted: " << e.what();
        std::lock_guard<std::mutex> lock(session_mtx_);
        session_.state = SessionState::Error;
        session_.is_active = false;
    }

    finished_ = true;
    if (on_finished_) {
        try {
            on_finished_(order_number_, this);
        } catch (const std::exception& e) {
            EVLOG_warning << "Monitor completion handler for order " << order_number_ << " threw: " << e.what();
        }
    }
}

void ChargingMonitor::run_loop() {
    const auto started = Clock::now();
    const auto hard_deadline = started + cfg_.max_monitor_time;
    auto next_poll = started + cfg_.check_interval;
    EVLOG_info << "Monitoring order " << order_number_ << " on device " << session_.device_id << " port "
               << session_.port << " every " << cfg_.check_interval.count() << "ms";

    bool active = true;
    while (active) {
        {
            std::unique_lock<std::mutex> lock(ctrl_mtx_);
            ctrl_cv_.wait_until(lock, std::min(next_poll, hard_deadline), [this]() { return stop_requested_; });
            if (stop_requested_) {
                break;
            }
        }
        if (Clock::now() >= hard_deadline) {
            const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(cfg_.max_monitor_time).count();
            raise_alert("max_time_reached", AlertLevel::Warning,
                        "monitoring exceeded maximum duration of " + std::to_string(minutes) + " min",
                        {{"max_monitor_time_ms", cfg_.max_monitor_time.count()}});
            terminate(SessionState::Terminated, "maximum monitor time reached");
            active = false;
            break;
        }
        try {
            active = poll_once();
        } catch (const std::exception& e) {
            last_poll_ok_ = false;
            active = record_poll_failure(std::string("monitor loop error: ") + e.what());
        }
        if (recovering_) {
            recovering_ = false;
            if (last_poll_ok_) {
                EVLOG_info << "Auto recover succeeded for order " << order_number_;
            } else {
                EVLOG_warning << "Auto recover failed for order " << order_number_;
            }
        }
        if (active && recover_pending_) {
            recover_pending_ = false;
            recovering_ = true;
            EVLOG_info << "Attempting auto recover for order " << order_number_ << " in "
                       << cfg_.retry_interval.count() << "ms";
            next_poll = Clock::now() + cfg_.retry_interval;
        } else {
            next_poll = Clock::now() + cfg_.check_interval;
        }
    }

    if (active) {
        StopReason reason;
        {
            std::lock_guard<std::mutex> lock(ctrl_mtx_);
            reason = stop_reason_;
        }
        if (reason == StopReason::Stopped) {
            auto payload = base_payload();
            payload["reason"] = "stopped";
            emit("charging_end", payload);
            terminate(SessionState::ChargingStopped, "stopped by request");
        } else {
            terminate(SessionState::Terminated, "monitor shut down");
        }
    }
}

bool ChargingMonitor::poll_once() {
    last_poll_ok_ = false;
    std::shared_ptr<PendingCommand> cmd;
    try {
        cmd = querier_.issue_status_query(session_.device_id, session_.port, cfg_.poll_timeout());
        {
            std::lock_guard<std::mutex> lock(ctrl_mtx_);
            if (stop_requested_) {
                tracker_.cancel(cmd, "monitor for order " + order_number_ + " stopping");
                return true;
            }
            inflight_ = cmd;
        }
        const auto resp = tracker_.wait_for_response(cmd);
        {
            std::lock_guard<std::mutex> lock(ctrl_mtx_);
            inflight_.reset();
        }
        return handle_response(resp);
    } catch (const ChargeError& e) {
        {
            std::lock_guard<std::mutex> lock(ctrl_mtx_);
            inflight_.reset();
            if (stop_requested_) {
                return true;
            }
        }
        return record_poll_failure(e.what());
    }
}

bool ChargingMonitor::record_poll_failure(const std::string& reason) {
    int errors = 0;
    {
        std::lock_guard<std::mutex> lock(session_mtx_);
        session_.check_count++;
        errors = ++session_.error_count;
    }
    if (errors < cfg_.retry_count) {
        EVLOG_warning << "Status poll " << errors << "/" << cfg_.retry_count << " failed for order " << order_number_
                      << ": " << reason;
        return true;
    }
    raise_alert("monitor_error", AlertLevel::Error,
                "status polling failed " + std::to_string(errors) + " consecutive times: " + reason,
                {{"error_count", errors}, {"last_error", reason}});
    terminate(SessionState::Error, "too many consecutive poll failures");
    return false;
}

bool ChargingMonitor::handle_response(const DeviceResponse& resp) {
    const auto status = resp.status_code;
    if (status == dny_contract::kStatusDeviceOffline) {
        {
            std::lock_guard<std::mutex> lock(session_mtx_);
            session_.check_count++;
            session_.last_check_time = std::chrono::system_clock::now();
        }
        raise_alert("device_offline", AlertLevel::Warning, "device " + session_.device_id + " reported offline",
                    {{"status_code", status}});
        emit("device_offline", base_payload());
        terminate(SessionState::DeviceOffline, "device offline");
        return false;
    }
    if (is_port_fault(status)) {
        const auto description = describe_response_status(status);
        {
            std::lock_guard<std::mutex> lock(session_mtx_);
            session_.check_count++;
            session_.last_check_time = std::chrono::system_clock::now();
        }
        raise_alert("port_fault", AlertLevel::Error, "port " + std::to_string(session_.port) + " fault: " + description,
                    {{"status_code", status}});
        auto payload = base_payload();
        payload["error_code"] = status;
        payload["error"] = description;
        emit("error", payload);
        terminate(SessionState::PortFault, description);
        return false;
    }
    if (status != dny_contract::kStatusSuccess) {
        return record_poll_failure("status query rejected: " + describe_response_status(status));
    }

    last_poll_ok_ = true;
    const auto label = labels_.label_for(resp.port_state);
    std::string previous;
    {
        std::lock_guard<std::mutex> lock(session_mtx_);
        session_.check_count++;
        session_.error_count = 0;
        session_.last_check_time = std::chrono::system_clock::now();
        if (label == session_.last_status) {
            return true;
        }
        previous = session_.last_status;
        session_.last_status = label;
        session_.state = StatusLabels::classify(label);
    }
    EVLOG_info << "Order " << order_number_ << " status " << previous << " -> " << label;
    auto payload = base_payload();
    payload["status"] = label;
    payload["previous_status"] = previous;
    emit("charging_status", payload);

    const auto state = StatusLabels::classify(label);
    if (state == SessionState::ChargingCompleted || state == SessionState::ChargingStopped) {
        payload = base_payload();
        payload["reason"] = state == SessionState::ChargingCompleted ? "completed" : "stopped";
        emit("charging_end", payload);
        terminate(state, label);
        return false;
    }
    if (state == SessionState::ChargingError) {
        raise_alert("charging_error", AlertLevel::Error,
                    "port " + std::to_string(session_.port) + " reported " + label,
                    {{"response_status", status}, {"status_desc", label}});
        recover_pending_ = cfg_.enable_auto_recover;
    }
    return true;
}

void ChargingMonitor::terminate(SessionState final_state, const std::string& reason) {
    ChargingSession final_session;
    {
        std::lock_guard<std::mutex> lock(session_mtx_);
        session_.state = final_state;
        session_.is_active = false;
        final_session = session_;
    }
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - final_session.start_time);
    EVLOG_info << "Monitor for order " << order_number_ << " finished (" << to_string(final_state) << "): " << reason
               << " after " << elapsed.count() << "s, " << final_session.check_count << " checks";
}

void ChargingMonitor::raise_alert(const std::string& type, AlertLevel level, const std::string& message,
                                  nlohmann::json context) {
    MonitorAlert alert;
    alert.type = type;
    alert.level = level;
    alert.order_number = order_number_;
    alert.device_id = session_.device_id;
    alert.message = message;
    alert.context = std::move(context);
    alert.context["port"] = session_.port;

    if (level == AlertLevel::Error) {
        EVLOG_error << "Monitor alert [" << type << "] order " << order_number_ << ": " << message;
    } else {
        EVLOG_warning << "Monitor alert [" << type << "] order " << order_number_ << ": " << message;
    }
    if (cfg_.enable_alerts) {
        emit("charging_monitor_alert", alert.to_json());
    }
}

void ChargingMonitor::emit(const std::string& event_type, nlohmann::json payload) {
    try {
        notifier_.notify(event_type, payload);
    } catch (const std::exception& e) {
        EVLOG_error << "Failed to notify " << event_type << " for order " << order_number_ << ": " << e.what();
    }
}

nlohmann::json ChargingMonitor::base_payload() const {
    std::lock_guard<std::mutex> lock(session_mtx_);
    return nlohmann::json{{"order_number", session_.order_number},
                          {"device_id", session_.device_id},
                          {"port", session_.port},
                          {"check_count", session_.check_count},
                          {"duration_seconds", std::chrono::duration_cast<std::chrono::seconds>(
                                                   std::chrono::system_clock::now() - session_.start_time)
                                                   .count()}};
}

MonitorService::MonitorService(const MonitorConfig& cfg, const StatusLabels& labels, StatusQuerier& querier,
                               CommandTracker& tracker, EventNotifier& notifier) :
    cfg_(cfg), labels_(labels), querier_(querier), tracker_(tracker), notifier_(notifier) {
}

MonitorService::~MonitorService() {
    shutdown();
}

MonitorService::Reservation::Reservation(MonitorService& service, std::string order_number, std::uint64_t token) :
    service_(service), order_number_(std::move(order_number)), token_(token) {
}

MonitorService::Reservation::~Reservation() {
    release();
}

void MonitorService::Reservation::release() {
    if (released_) {
        return;
    }
    released_ = true;
    service_.release(order_number_, token_);
}

std::unique_ptr<MonitorService::Reservation> MonitorService::reserve(const std::string& order_number) {
    reap_retired();
    std::uint64_t token = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) {
            throw ChargeError(ErrorKind::Shutdown, "monitor service is shut down");
        }
        if (active_.count(order_number) > 0 || reserved_.count(order_number) > 0) {
            throw ChargeError(ErrorKind::DuplicateSession, "order " + order_number + " is already being charged");
        }
        token = next_token_++;
        reserved_.emplace(order_number, token);
    }
    return std::make_unique<Reservation>(*this, order_number, token);
}

bool MonitorService::is_reserved(const std::string& order_number) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return reserved_.count(order_number) > 0;
}

void MonitorService::release(const std::string& order_number, std::uint64_t token) {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = reserved_.find(order_number);
    if (it != reserved_.end() && it->second == token) {
        reserved_.erase(it);
    }
}

void MonitorService::start_monitoring(const std::string& order_number, const std::string& device_id, int port) {
    reap_retired();
    std::shared_ptr<ChargingMonitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) {
            throw ChargeError(ErrorKind::Shutdown, "monitor service is shut down");
        }
        if (active_.count(order_number) > 0) {
            throw ChargeError(ErrorKind::DuplicateSession, "order " + order_number + " is already monitored");
        }
        ChargingSession session;
        session.order_number = order_number;
        session.device_id = device_id;
        session.port = port;
        session.start_time = std::chrono::system_clock::now();
        session.last_check_time = session.start_time;
        monitor = std::make_shared<ChargingMonitor>(
            std::move(session), cfg_, labels_, querier_, tracker_, notifier_,
            [this](const std::string& order, const ChargingMonitor* m) { on_monitor_finished(order, m); });
        active_.emplace(order_number, monitor);
        // Started under the lock so a fast finish cannot run before the monitor is registered.
        monitor->start();
    }
}

bool MonitorService::stop_monitoring(const std::string& order_number, StopReason reason) {
    std::shared_ptr<ChargingMonitor> monitor;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        const auto it = active_.find(order_number);
        if (it == active_.end()) {
            return false;
        }
        monitor = it->second;
        active_.erase(it);
    }
    monitor->request_stop(reason);
    monitor->join();
    reap_retired();
    return true;
}

bool MonitorService::is_monitoring(const std::string& order_number) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return active_.count(order_number) > 0;
}

std::optional<ChargingSession> MonitorService::session(const std::string& order_number) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = active_.find(order_number);
    if (it == active_.end()) {
        return std::nullopt;
    }
    return it->second->snapshot();
}

std::vector<ChargingSession> MonitorService::sessions() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ChargingSession> out;
    out.reserve(active_.size());
    for (const auto& entry : active_) {
        out.push_back(entry.second->snapshot());
    }
    return out;
}

std::size_t MonitorService::active_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return active_.size();
}

void MonitorService::shutdown() {
    std::vector<std::shared_ptr<ChargingMonitor>> monitors;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
        for (auto& entry : active_) {
            monitors.push_back(entry.second);
        }
        active_.clear();
    }
    if (!monitors.empty()) {
        EVLOG_info << "Stopping " << monitors.size() << " charging monitor(s)";
    }
    for (auto& monitor : monitors) {
        monitor->request_stop(StopReason::Shutdown);
    }
    for (auto& monitor : monitors) {
        monitor->join();
    }
    reap_retired();
}

void MonitorService::on_monitor_finished(const std::string& order_number, const ChargingMonitor* monitor) {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = active_.find(order_number);
    if (it != active_.end() && it->second.get() == monitor) {
        retired_.push_back(it->second);
        active_.erase(it);
    }
}

void MonitorService::reap_retired() {
    std::vector<std::shared_ptr<ChargingMonitor>> done;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = std::partition(retired_.begin(), retired_.end(),
                                 [](const std::shared_ptr<ChargingMonitor>& m) { return !m->finished(); });
        done.assign(std::make_move_iterator(it), std::make_move_iterator(retired_.end()));
        retired_.erase(it, retired_.end());
    }
    for (auto& monitor : done) {
        monitor->join();
    }
}

} // namespace pilegate
