// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "charge_error.hpp"
#include "device_interface.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pilegate {

/// Exactly one of response / error is set.
using ResponseCallback = std::function<void(std::optional<DeviceResponse>, std::optional<ChargeError>)>;

/// \brief One outbound command awaiting its correlated device reply.
class PendingCommand {
public:
    const std::string& id() const {
        return id_;
    }
    const std::string& device_id() const {
        return device_id_;
    }
    uint8_t command() const {
        return command_;
    }
    uint16_t message_id() const {
        return message_id_;
    }
    Clock::time_point created_at() const {
        return created_at_;
    }
    std::chrono::milliseconds timeout() const {
        return timeout_;
    }
    Clock::time_point deadline() const {
        return created_at_ + timeout_;
    }
    bool resolved() const;

private:
    class Passkey {
        friend class CommandTracker;
        explicit Passkey() = default;
    };

public:
    /// Only CommandTracker can name the passkey, so commands are created through track().
    PendingCommand(Passkey, std::string id, std::string device_id, uint8_t command, uint16_t message_id,
                   std::chrono::milliseconds timeout, ResponseCallback callback);

private:
    friend class CommandTracker;

    /// First call wins; later calls are ignored and return false.
    bool resolve(std::optional<DeviceResponse> response, std::optional<ChargeError> error);

    std::string id_;
    std::string device_id_;
    uint8_t command_{0};
    uint16_t message_id_{0};
    Clock::time_point created_at_;
    std::chrono::milliseconds timeout_;
    ResponseCallback callback_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool resolved_{false};
    std::optional<DeviceResponse> response_;
    std::optional<ChargeError> error_;
};

/// \brief Correlates unsolicited device replies with outstanding commands and enforces deadlines.
///
/// Commands are keyed by a generated id; a reply is matched on (device id, message id), oldest first.
/// A single timer thread expires deadlines and runs the periodic stale sweep. Callbacks never run on
/// the thread that delivered the reply: they are queued to a dedicated callback worker.
class CommandTracker {
public:
    explicit CommandTracker(std::chrono::milliseconds sweep_interval = std::chrono::seconds(30));
    ~CommandTracker();

    CommandTracker(const CommandTracker&) = delete;
    CommandTracker& operator=(const CommandTracker&) = delete;

    /// Throws ChargeError(DuplicateCommand) if (device, command, message id) is already live,
    /// ChargeError(Shutdown) after shutdown().
    std::shared_ptr<PendingCommand> track_command(const std::string& device_id, uint8_t command, uint16_t message_id,
                                                  std::chrono::milliseconds timeout,
                                                  ResponseCallback callback = nullptr);

    /// Returns false when no outstanding command matches (stale, duplicate or unexpected reply).
    bool notify_response(const std::string& device_id, uint16_t message_id, const DeviceResponse& response);

    /// Blocks until the command resolves or its deadline passes. Throws ChargeError on timeout,
    /// cancellation or shutdown.
    DeviceResponse wait_for_response(const std::shared_ptr<PendingCommand>& cmd);

    /// Resolves with ChargeError(Cancelled) without invoking the callback.
    bool cancel(const std::shared_ptr<PendingCommand>& cmd, const std::string& reason);

    /// Removes commands older than their timeout. Returns how many were removed.
    std::size_t sweep_expired();

    void shutdown();

    std::size_t pending_count() const;
    bool contains(const std::string& id) const;

private:
    using DeadlineEntry = std::pair<Clock::time_point, std::string>;

    bool finish_locked(const std::shared_ptr<PendingCommand>& cmd, std::optional<DeviceResponse> response,
                       std::optional<ChargeError> error, bool invoke_callback);
    ChargeError timeout_error(const PendingCommand& cmd) const;
    void post_callback(std::function<void()> fn);
    void timer_loop();
    void callback_loop();

    mutable std::mutex mtx_;
    std::condition_variable timer_cv_;
    std::map<std::string, std::shared_ptr<PendingCommand>> commands_;
    std::priority_queue<DeadlineEntry, std::vector<DeadlineEntry>, std::greater<DeadlineEntry>> deadlines_;
    std::uint64_t next_seq_{1};
    bool stopping_{false};
    std::chrono::milliseconds sweep_interval_;
    Clock::time_point next_sweep_;

    std::mutex cb_mtx_;
    std::condition_variable cb_cv_;
    std::deque<std::function<void()>> cb_queue_;
    bool cb_stopping_{false};

    std::thread timer_thread_;
    std::thread callback_thread_;
};

} // namespace pilegate
