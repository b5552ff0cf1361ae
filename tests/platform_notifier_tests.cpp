// SPDX-License-Identifier: Apache-2.0
#include "platform_notifier.hpp"
#include "test_doubles.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

using namespace pilegate;
using namespace pilegate::testing;
using namespace std::chrono_literals;

namespace {
struct RecordingTransport {
    std::mutex m;
    std::vector<std::pair<std::string, nlohmann::json>> calls;
    std::atomic<int> failures_left{0};

    PlatformNotifier::Transport fn() {
        return [this](const std::string& url, const std::string& body, std::string& error) {
            std::lock_guard<std::mutex> lock(m);
            calls.emplace_back(url, nlohmann::json::parse(body));
            if (failures_left > 0) {
                failures_left--;
                error = "HTTP 503";
                return false;
            }
            return true;
        };
    }

    std::size_t count() {
        std::lock_guard<std::mutex> lock(m);
        return calls.size();
    }
};

PlatformConfig enabled_config() {
    PlatformConfig cfg;
    cfg.enabled = true;
    cfg.base_url = "https://platform.test/";
    cfg.retry_count = 3;
    cfg.retry_interval = 10ms;
    cfg.workers = 2;
    return cfg;
}

void test_event_payload() {
    assert(PlatformNotifier::events_url("https://platform.test/") == "https://platform.test/api/v1/events");
    assert(PlatformNotifier::events_url("http://10.0.0.2:8080") == "http://10.0.0.2:8080/api/v1/events");

    PlatformEvent event;
    event.event_type = "charging_start";
    event.data = {{"order_number", "O1"}, {"port", 1}};
    const auto json = event.to_json();
    assert(json["event_type"] == "charging_start");
    assert(json["data"]["order_number"] == "O1");
    const auto ts = json["timestamp"].get<std::string>();
    assert(ts.size() == 20 && ts.back() == 'Z' && ts[10] == 'T');
}

void test_delivers_queued_events() {
    RecordingTransport transport;
    PlatformNotifier notifier(enabled_config(), transport.fn());
    for (int i = 0; i < 5; ++i) {
        notifier.notify("charging_status", {{"order_number", "O" + std::to_string(i)}});
    }
    assert(eventually([&]() { return notifier.stats().sent == 5; }));
    {
        std::lock_guard<std::mutex> lock(transport.m);
        for (const auto& call : transport.calls) {
            assert(call.first == "https://platform.test/api/v1/events");
            assert(call.second["event_type"] == "charging_status");
        }
    }
    notifier.shutdown();
    assert(notifier.stats().failed == 0);
}

void test_retries_then_succeeds() {
    RecordingTransport transport;
    transport.failures_left = 2;
    PlatformNotifier notifier(enabled_config(), transport.fn());
    assert(notifier.send_now(PlatformEvent{"device_offline", {{"device_id", "04CEAA40"}}}));
    assert(transport.count() == 3);
    assert(notifier.stats().sent == 1);
    assert(notifier.stats().failed == 0);
}

void test_gives_up_after_retry_count() {
    RecordingTransport transport;
    transport.failures_left = 100;
    auto cfg = enabled_config();
    cfg.retry_count = 1;
    PlatformNotifier notifier(cfg, transport.fn());
    assert(!notifier.send_now(PlatformEvent{"error", {}}));
    assert(transport.count() == 2);
    assert(notifier.stats().failed == 1);
}

void test_disabled_sends_nothing() {
    RecordingTransport transport;
    auto cfg = enabled_config();
    cfg.enabled = false;
    PlatformNotifier notifier(cfg, transport.fn());
    notifier.notify("charging_start", {{"order_number", "O1"}});
    std::this_thread::sleep_for(30ms);
    assert(transport.count() == 0);
    assert(notifier.queued() == 0);

    auto no_url = enabled_config();
    no_url.base_url.clear();
    PlatformNotifier unconfigured(no_url, transport.fn());
    unconfigured.notify("charging_start", {});
    std::this_thread::sleep_for(30ms);
    assert(transport.count() == 0);
}

void test_full_queue_falls_back_to_sync_send() {
    std::atomic<bool> release{false};
    std::atomic<bool> blocked{false};
    std::atomic<int> delivered{0};
    auto cfg = enabled_config();
    cfg.workers = 1;
    cfg.queue_size = 1;
    PlatformNotifier notifier(cfg, [&](const std::string&, const std::string& body, std::string&) {
        if (nlohmann::json::parse(body)["event_type"] == "block") {
            blocked = true;
            while (!release) {
                std::this_thread::sleep_for(1ms);
            }
        }
        delivered++;
        return true;
    });
    notifier.notify("block", {});
    assert(eventually([&]() { return blocked.load() && notifier.queued() == 0; }));
    notifier.notify("queued", {});
    assert(notifier.queued() == 1);
    notifier.notify("overflow", {});
    assert(notifier.stats().sync_fallbacks == 1);
    assert(delivered == 1); // the overflow went out on the caller's thread
    release = true;
    notifier.shutdown();
    assert(delivered == 3);
    assert(notifier.stats().sent == 3);
}

void test_shutdown_drains_queue() {
    std::atomic<int> delivered{0};
    auto cfg = enabled_config();
    cfg.workers = 1;
    PlatformNotifier notifier(cfg, [&](const std::string&, const std::string&, std::string&) {
        std::this_thread::sleep_for(2ms);
        delivered++;
        return true;
    });
    for (int i = 0; i < 20; ++i) {
        notifier.notify("charging_status", {{"seq", i}});
    }
    notifier.shutdown();
    assert(delivered == 20);
    assert(notifier.queued() == 0);

    // events after shutdown are sent synchronously rather than queued
    notifier.notify("charging_end", {});
    assert(delivered == 21);
}
} // namespace

int main() {
    test_event_payload();
    test_delivers_queued_events();
    test_retries_then_succeeds();
    test_gives_up_after_retry_count();
    test_disabled_sends_nothing();
    test_full_queue_falls_back_to_sync_send();
    test_shutdown_drains_queue();

    std::cout << "platform_notifier_tests passed\n";
    return 0;
}
