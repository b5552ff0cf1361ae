// SPDX-License-Identifier: Apache-2.0
#include "command_tracker.hpp"

#include <cstdio>
#include <sstream>

#include <everest/logging.hpp>

namespace pilegate {

namespace {
std::string describe(const PendingCommand& cmd) {
    std::ostringstream oss;
    oss << "device=" << cmd.device_id() << " cmd=0x" << std::hex << static_cast<int>(cmd.command()) << std::dec
        << " msg=" << cmd.message_id();
    return oss.str();
}
} // namespace

PendingCommand::PendingCommand(Passkey, std::string id, std::string device_id, uint8_t command, uint16_t message_id,
                               std::chrono::milliseconds timeout, ResponseCallback callback) :
    id_(std::move(id)),
    device_id_(std::move(device_id)),
    command_(command),
    message_id_(message_id),
    created_at_(Clock::now()),
    timeout_(timeout),
    callback_(std::move(callback)) {
}

bool PendingCommand::resolved() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return resolved_;
}

bool PendingCommand::resolve(std::optional<DeviceResponse> response, std::optional<ChargeError> error) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (resolved_) {
            return false;
        }
        resolved_ = true;
        response_ = std::move(response);
        error_ = std::move(error);
    }
    cv_.notify_all();
    return true;
}

CommandTracker::CommandTracker(std::chrono::milliseconds sweep_interval) :
    sweep_interval_(sweep_interval.count() > 0 ? sweep_interval : std::chrono::seconds(30)),
    next_sweep_(Clock::now() + sweep_interval_) {
    timer_thread_ = std::thread([this]() { timer_loop(); });
    callback_thread_ = std::thread([this]() { callback_loop(); });
}

CommandTracker::~CommandTracker() {
    shutdown();
}

std::shared_ptr<PendingCommand> CommandTracker::track_command(const std::string& device_id, uint8_t command,
                                                              uint16_t message_id, std::chrono::milliseconds timeout,
                                                              ResponseCallback callback) {
    std::shared_ptr<PendingCommand> cmd;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_) {
            throw ChargeError(ErrorKind::Shutdown, "command tracker is shut down");
        }
        for (const auto& [id, existing] : commands_) {
            if (existing->device_id() == device_id && existing->command() == command &&
                existing->message_id() == message_id) {
                throw ChargeError(ErrorKind::DuplicateCommand, "command already pending: " + describe(*existing));
            }
        }
        char id_buf[32];
        std::snprintf(id_buf, sizeof(id_buf), "cmd-%012llu", static_cast<unsigned long long>(next_seq_++));
        cmd = std::make_shared<PendingCommand>(PendingCommand::Passkey{}, id_buf, device_id, command, message_id,
                                               timeout, std::move(callback));
        commands_.emplace(cmd->id(), cmd);
        deadlines_.emplace(cmd->deadline(), cmd->id());
    }
    timer_cv_.notify_all();
    EVLOG_debug << "Tracking " << cmd->id() << " " << describe(*cmd) << " timeout=" << timeout.count() << "ms";
    return cmd;
}

bool CommandTracker::finish_locked(const std::shared_ptr<PendingCommand>& cmd, std::optional<DeviceResponse> response,
                                   std::optional<ChargeError> error, bool invoke_callback) {
    if (commands_.erase(cmd->id()) == 0) {
        return false;
    }
    if (!cmd->resolve(response, error)) {
        return false;
    }
    if (invoke_callback && cmd->callback_) {
        auto callback = cmd->callback_;
        post_callback([callback, response = std::move(response), error = std::move(error)]() {
            callback(response, error);
        });
    }
    return true;
}

ChargeError CommandTracker::timeout_error(const PendingCommand& cmd) const {
    return ChargeError(ErrorKind::ResponseTimeout,
                       "no response for " + describe(cmd) + " within " + std::to_string(cmd.timeout().count()) + "ms");
}

bool CommandTracker::notify_response(const std::string& device_id, uint16_t message_id,
                                     const DeviceResponse& response) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& entry : commands_) {
        const auto cmd = entry.second;
        if (cmd->device_id() == device_id && cmd->message_id() == message_id) {
            const auto latency =
                std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - cmd->created_at());
            finish_locked(cmd, response, std::nullopt, true);
            EVLOG_debug << "Resolved " << cmd->id() << " " << describe(*cmd) << " status=0x" << std::hex
                        << static_cast<int>(response.status_code) << std::dec << " after " << latency.count() << "ms";
            return true;
        }
    }
    EVLOG_warning << "Dropping response from device=" << device_id << " msg=" << message_id
                  << ": no outstanding command (stale or duplicate)";
    return false;
}

DeviceResponse CommandTracker::wait_for_response(const std::shared_ptr<PendingCommand>& cmd) {
    bool resolved = false;
    {
        std::unique_lock<std::mutex> lock(cmd->mtx_);
        resolved = cmd->cv_.wait_until(lock, cmd->deadline(), [&]() { return cmd->resolved_; });
    }
    if (!resolved) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (finish_locked(cmd, std::nullopt, timeout_error(*cmd), true)) {
            EVLOG_warning << "Timed out waiting for " << cmd->id() << " " << describe(*cmd);
        }
    }
    std::unique_lock<std::mutex> lock(cmd->mtx_);
    cmd->cv_.wait(lock, [&]() { return cmd->resolved_; });
    if (cmd->response_) {
        return *cmd->response_;
    }
    throw *cmd->error_;
}

bool CommandTracker::cancel(const std::shared_ptr<PendingCommand>& cmd, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mtx_);
    const bool cancelled =
        finish_locked(cmd, std::nullopt, ChargeError(ErrorKind::Cancelled, reason + " (" + describe(*cmd) + ")"), false);
    if (cancelled) {
        EVLOG_debug << "Cancelled " << cmd->id() << ": " << reason;
    }
    return cancelled;
}

std::size_t CommandTracker::sweep_expired() {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto now = Clock::now();
    std::vector<std::shared_ptr<PendingCommand>> stale;
    for (const auto& entry : commands_) {
        if (now - entry.second->created_at() > entry.second->timeout()) {
            stale.push_back(entry.second);
        }
    }
    for (const auto& cmd : stale) {
        EVLOG_warning << "Sweeping stale command " << cmd->id() << " " << describe(*cmd);
        finish_locked(cmd, std::nullopt, timeout_error(*cmd), true);
    }
    return stale.size();
}

void CommandTracker::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!stopping_) {
            stopping_ = true;
            const auto outstanding = commands_;
            if (!outstanding.empty()) {
                EVLOG_info << "Command tracker shutting down with " << outstanding.size() << " outstanding command(s)";
            }
            for (const auto& entry : outstanding) {
                finish_locked(entry.second, std::nullopt,
                              ChargeError(ErrorKind::Shutdown, "tracker shut down (" + describe(*entry.second) + ")"),
                              true);
            }
        }
    }
    timer_cv_.notify_all();
    if (timer_thread_.joinable()) {
        timer_thread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(cb_mtx_);
        cb_stopping_ = true;
    }
    cb_cv_.notify_all();
    if (callback_thread_.joinable() && callback_thread_.get_id() != std::this_thread::get_id()) {
        callback_thread_.join();
    }
}

std::size_t CommandTracker::pending_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return commands_.size();
}

bool CommandTracker::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return commands_.count(id) > 0;
}

void CommandTracker::post_callback(std::function<void()> fn) {
    {
        std::lock_guard<std::mutex> lock(cb_mtx_);
        if (cb_stopping_) {
            EVLOG_warning << "Callback worker stopped; dropping completion callback";
            return;
        }
        cb_queue_.push_back(std::move(fn));
    }
    cb_cv_.notify_one();
}

void CommandTracker::timer_loop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
        try {
            const auto now = Clock::now();
            while (!deadlines_.empty() && deadlines_.top().first <= now) {
                const auto id = deadlines_.top().second;
                deadlines_.pop();
                const auto it = commands_.find(id);
                if (it == commands_.end()) {
                    continue;
                }
                const auto cmd = it->second;
                EVLOG_warning << "Command " << cmd->id() << " expired: " << describe(*cmd);
                finish_locked(cmd, std::nullopt, timeout_error(*cmd), true);
            }
            if (now >= next_sweep_) {
                lock.unlock();
                sweep_expired();
                lock.lock();
                next_sweep_ = Clock::now() + sweep_interval_;
            }
        } catch (const std::exception& e) {
            EVLOG_warning << "Command tracker timer error: " << e.what();
        }
        auto wake = next_sweep_;
        if (!deadlines_.empty() && deadlines_.top().first < wake) {
            wake = deadlines_.top().first;
        }
        timer_cv_.wait_until(lock, wake);
    }
}

void CommandTracker::callback_loop() {
    while (true) {
        std::function<void()> fn;
        {
            std::unique_lock<std::mutex> lock(cb_mtx_);
            cb_cv_.wait(lock, [this]() { return cb_stopping_ || !cb_queue_.empty(); });
            if (cb_queue_.empty()) {
                return;
            }
            fn = std::move(cb_queue_.front());
            cb_queue_.pop_front();
        }
        try {
            fn();
        } catch (const std::exception& e) {
            EVLOG_warning << "Command completion callback threw: " << e.what();
        }
    }
}

} // namespace pilegate
