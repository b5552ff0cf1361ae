// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "command_tracker.hpp"
#include "device_interface.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace pilegate {

enum class SessionState {
    Starting,
    Charging,
    ChargingError,
    ChargingCompleted,
    ChargingStopped,
    Error,
    DeviceOffline,
    PortFault,
    Terminated
};

const char* to_string(SessionState state);

/// \brief Maps the port state byte of a status reply to a session label.
///
/// Only "charging_completed" and "charging_stopped" are terminal. "charging_error" raises an alert
/// but keeps the session alive; every other label is an intermediate charging state, so new labels
/// can be configured without code changes.
class StatusLabels {
public:
    StatusLabels();
    explicit StatusLabels(const std::map<int, std::string>& overrides);

    std::string label_for(std::optional<uint8_t> port_state) const;
    static SessionState classify(const std::string& label);

    const std::map<int, std::string>& table() const {
        return labels_;
    }

private:
    std::map<int, std::string> labels_;
    std::string fault_label_{"port_fault_state"};
};

struct MonitorConfig {
    std::chrono::milliseconds check_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds max_monitor_time{std::chrono::hours(8)};
    std::chrono::milliseconds timeout_threshold{std::chrono::minutes(5)}; // ceiling for one poll
    int retry_count{3};                                                   // consecutive poll failures tolerated
    std::chrono::milliseconds retry_interval{std::chrono::seconds(10)};   // back-off before a recovery re-check
    bool enable_alerts{true};
    bool enable_auto_recover{true}; // re-check once after retry_interval when the port reports charging_error

    /// Per-poll timeout, always strictly shorter than check_interval.
    std::chrono::milliseconds poll_timeout() const;
};

enum class AlertLevel { Info, Warning, Error };

const char* to_string(AlertLevel level);

struct MonitorAlert {
    std::string type;
    AlertLevel level{AlertLevel::Info};
    std::string order_number;
    std::string device_id;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    nlohmann::json context = nlohmann::json::object();

    nlohmann::json to_json() const;
};

/// \brief Snapshot of one monitored charging attempt.
struct ChargingSession {
    std::string order_number;
    std::string device_id;
    int port{0};
    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point last_check_time{};
    SessionState state{SessionState::Starting};
    std::string last_status{"starting"};
    int check_count{0};
    int error_count{0};
    bool is_active{true};

    nlohmann::json to_json() const;
};

/// \brief Issues one status query toward a device port and returns the tracked command.
class StatusQuerier {
public:
    virtual ~StatusQuerier() = default;

    virtual std::shared_ptr<PendingCommand> issue_status_query(const std::string& device_id, int port,
                                                               std::chrono::milliseconds timeout) = 0;
};

enum class StopReason { Stopped, Shutdown };

/// \brief Polls one order's port on its own thread until completion, fault or a bound is hit.
class ChargingMonitor {
public:
    using FinishedHandler = std::function<void(const std::string& order_number, const ChargingMonitor* monitor)>;

    ChargingMonitor(ChargingSession session, const MonitorConfig& cfg, const StatusLabels& labels,
                    StatusQuerier& querier, CommandTracker& tracker, EventNotifier& notifier, FinishedHandler on_finished);
    ~ChargingMonitor();

    ChargingMonitor(const ChargingMonitor&) = delete;
    ChargingMonitor& operator=(const ChargingMonitor&) = delete;

    void start();
    /// Wakes the loop and cancels the in-flight poll, if any.
    void request_stop(StopReason reason);
    void join();

    ChargingSession snapshot() const;
    bool finished() const {
        return finished_;
    }
    const std::string& order_number() const {
        return order_number_;
    }

private:
    void run();
    bool poll_once();
    void run_loop();
    bool handle_response(const DeviceResponse& resp);
    bool record_poll_failure(const std::string& reason);
    void terminate(SessionState final_state, const std::string& reason);
    void raise_alert(const std::string& type, AlertLevel level, const std::string& message,
                     nlohmann::json context = nlohmann::json::object());
    void emit(const std::string& event_type, nlohmann::json payload);
    nlohmann::json base_payload() const;

    const std::string order_number_;
    MonitorConfig cfg_;
    const StatusLabels& labels_;
    StatusQuerier& querier_;
    CommandTracker& tracker_;
    EventNotifier& notifier_;
    FinishedHandler on_finished_;

    mutable std::mutex session_mtx_;
    ChargingSession session_;

    mutable std::mutex ctrl_mtx_;
    std::condition_variable ctrl_cv_;
    bool stop_requested_{false};
    StopReason stop_reason_{StopReason::Shutdown};
    std::shared_ptr<PendingCommand> inflight_;

    // Only touched by the monitor thread.
    bool recover_pending_{false};
    bool recovering_{false};
    bool last_poll_ok_{false};

    std::atomic<bool> finished_{false};
    std::thread thread_;
};

/// \brief Registry of active monitors keyed by order number.
class MonitorService {
public:
    MonitorService(const MonitorConfig& cfg, const StatusLabels& labels, StatusQuerier& querier, CommandTracker& tracker,
                   EventNotifier& notifier);
    ~MonitorService();

    MonitorService(const MonitorService&) = delete;
    MonitorService& operator=(const MonitorService&) = delete;

    /// \brief Holds an order number from the start command until the monitor takes over.
    ///
    /// Released on destruction, so an abandoned start frees the order again.
    class Reservation {
    public:
        Reservation(MonitorService& service, std::string order_number, std::uint64_t token);
        ~Reservation();

        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;

        void release();
        const std::string& order_number() const {
            return order_number_;
        }

    private:
        MonitorService& service_;
        std::string order_number_;
        std::uint64_t token_;
        bool released_{false};
    };

    /// Throws ChargeError(DuplicateSession) if the order is monitored or reserved,
    /// ChargeError(Shutdown) after shutdown().
    std::unique_ptr<Reservation> reserve(const std::string& order_number);
    bool is_reserved(const std::string& order_number) const;

    /// Throws ChargeError(DuplicateSession) if the order is already monitored.
    void start_monitoring(const std::string& order_number, const std::string& device_id, int port);
    /// Returns false when the order is not monitored.
    bool stop_monitoring(const std::string& order_number, StopReason reason = StopReason::Stopped);

    bool is_monitoring(const std::string& order_number) const;
    std::optional<ChargingSession> session(const std::string& order_number) const;
    std::vector<ChargingSession> sessions() const;
    std::size_t active_count() const;

    void shutdown();

    const MonitorConfig& config() const {
        return cfg_;
    }

private:
    void on_monitor_finished(const std::string& order_number, const ChargingMonitor* monitor);
    void reap_retired();
    void release(const std::string& order_number, std::uint64_t token);

    MonitorConfig cfg_;
    const StatusLabels& labels_;
    StatusQuerier& querier_;
    CommandTracker& tracker_;
    EventNotifier& notifier_;

    mutable std::mutex mtx_;
    bool stopping_{false};
    std::map<std::string, std::shared_ptr<ChargingMonitor>> active_;
    std::map<std::string, std::uint64_t> reserved_;
    std::uint64_t next_token_{1};
    std::vector<std::shared_ptr<ChargingMonitor>> retired_;
};

} // namespace pilegate
