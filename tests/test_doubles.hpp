// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_interface.hpp"

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace pilegate::testing {

/// Keeps every notification for later inspection.
class RecordingNotifier : public EventNotifier {
public:
    void notify(const std::string& event_type, const nlohmann::json& payload) override {
        std::lock_guard<std::mutex> lock(mtx_);
        events_.emplace_back(event_type, payload);
    }

    std::vector<std::pair<std::string, nlohmann::json>> events() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return events_;
    }

    int count(const std::string& event_type) const {
        std::lock_guard<std::mutex> lock(mtx_);
        int n = 0;
        for (const auto& e : events_) {
            n += e.first == event_type ? 1 : 0;
        }
        return n;
    }

    int alerts(const std::string& alert_type) const {
        std::lock_guard<std::mutex> lock(mtx_);
        int n = 0;
        for (const auto& e : events_) {
            if (e.first == "charging_monitor_alert" && e.second.value("alert_type", "") == alert_type) {
                ++n;
            }
        }
        return n;
    }

    /// First payload of the given type, or null.
    nlohmann::json first(const std::string& event_type) const {
        std::lock_guard<std::mutex> lock(mtx_);
        for (const auto& e : events_) {
            if (e.first == event_type) {
                return e.second;
            }
        }
        return nullptr;
    }

private:
    mutable std::mutex mtx_;
    std::vector<std::pair<std::string, nlohmann::json>> events_;
};

inline bool eventually(const std::function<bool()>& pred,
                       std::chrono::milliseconds limit = std::chrono::milliseconds(3000)) {
    const auto end = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < end) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

} // namespace pilegate::testing
