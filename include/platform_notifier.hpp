// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_interface.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace pilegate {

struct PlatformConfig {
    bool enabled{false};
    std::string base_url;
    std::string api_key;
    std::string api_secret;
    std::chrono::milliseconds timeout{std::chrono::seconds(10)};
    int retry_count{3};
    std::chrono::milliseconds retry_interval{std::chrono::seconds(2)};
    std::size_t queue_size{1000};
    int workers{5};
};

struct PlatformEvent {
    std::string event_type;
    nlohmann::json data;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    nlohmann::json to_json() const;
};

struct NotifierStats {
    std::uint64_t sent{0};
    std::uint64_t failed{0};
    std::uint64_t sync_fallbacks{0};
};

/// \brief Pushes events to the business platform over HTTP from a bounded queue and worker pool.
class PlatformNotifier : public EventNotifier {
public:
    /// Returns false and fills error on failure. Defaults to an HTTP POST through libcurl.
    using Transport = std::function<bool(const std::string& url, const std::string& body, std::string& error)>;

    explicit PlatformNotifier(const PlatformConfig& cfg, Transport transport = nullptr);
    ~PlatformNotifier() override;

    PlatformNotifier(const PlatformNotifier&) = delete;
    PlatformNotifier& operator=(const PlatformNotifier&) = delete;

    void notify(const std::string& event_type, const nlohmann::json& payload) override;

    /// Synchronous send with retries.
    bool send_now(const PlatformEvent& event);

    /// Drains queued events, then stops the workers.
    void shutdown();

    std::size_t queued() const;
    NotifierStats stats() const;

    static std::string events_url(const std::string& base_url);

private:
    bool post_json(const std::string& url, const std::string& body, std::string& error) const;
    void worker_loop();

    PlatformConfig cfg_;
    Transport transport_;
    std::string url_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::condition_variable stop_cv_; // interrupts retry back-off
    std::deque<PlatformEvent> queue_;
    bool stopping_{false};
    std::vector<std::thread> workers_;

    std::atomic<std::uint64_t> sent_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> sync_fallbacks_{0};
};

/// \brief Log-only sink used when the business platform is not configured.
class LoggingNotifier : public EventNotifier {
public:
    void notify(const std::string& event_type, const nlohmann::json& payload) override;
};

} // namespace pilegate
