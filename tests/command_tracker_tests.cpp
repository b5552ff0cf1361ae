// SPDX-License-Identifier: Apache-2.0
#include "charge_error.hpp"
#include "device_interface.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#define private public
#define protected public

#include "command_tracker.hpp"

#undef private
#undef protected

using namespace pilegate;
using namespace std::chrono_literals;

namespace {
constexpr uint8_t kCmd = 0x82;

DeviceResponse make_response(const std::string& device, uint16_t msg, uint8_t status = 0) {
    DeviceResponse r;
    r.device_id = device;
    r.message_id = msg;
    r.command = kCmd;
    r.status_code = status;
    return r;
}

bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds limit = 2000ms) {
    const auto end = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < end) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

void test_duplicate_key_rejected() {
    CommandTracker tracker;
    auto first = tracker.track_command("04CEAA40", kCmd, 7, 1s);
    bool rejected = false;
    try {
        tracker.track_command("04CEAA40", kCmd, 7, 1s);
    } catch (const ChargeError& e) {
        rejected = e.kind() == ErrorKind::DuplicateCommand;
    }
    assert(rejected);
    assert(tracker.contains(first->id()));
    assert(tracker.pending_count() == 1);

    // same message id on another device or another command is a different key
    tracker.track_command("04CEAA41", kCmd, 7, 1s);
    tracker.track_command("04CEAA40", 0x96, 7, 1s);
    assert(tracker.pending_count() == 3);

    assert(tracker.notify_response("04CEAA40", 7, make_response("04CEAA40", 7)));
    assert(tracker.wait_for_response(first).message_id == 7);
    tracker.shutdown();
}

void test_concurrent_track_same_key() {
    CommandTracker tracker;
    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            try {
                tracker.track_command("04CEAA40", kCmd, 42, 1s);
                accepted++;
            } catch (const ChargeError& e) {
                assert(e.kind() == ErrorKind::DuplicateCommand);
                rejected++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    assert(accepted == 1);
    assert(rejected == 7);
    tracker.shutdown();
}

void test_notify_resolves_and_duplicate_dropped() {
    CommandTracker tracker;
    std::atomic<int> calls{0};
    std::atomic<bool> got_response{false};
    std::thread::id callback_thread;
    std::mutex m;
    auto cmd = tracker.track_command("04CEAA40", kCmd, 9, 2s,
                                     [&](std::optional<DeviceResponse> resp, std::optional<ChargeError> err) {
                                         calls++;
                                         got_response = resp.has_value() && !err.has_value();
                                         std::lock_guard<std::mutex> lock(m);
                                         callback_thread = std::this_thread::get_id();
                                     });
    assert(tracker.notify_response("04CEAA40", 9, make_response("04CEAA40", 9, 0x02)));
    assert(!tracker.contains(cmd->id()));
    assert(!tracker.notify_response("04CEAA40", 9, make_response("04CEAA40", 9)));

    const auto resp = tracker.wait_for_response(cmd);
    assert(resp.status_code == 0x02);
    assert(wait_until([&]() { return calls.load() == 1; }));
    std::this_thread::sleep_for(50ms);
    assert(calls == 1);
    assert(got_response);
    {
        std::lock_guard<std::mutex> lock(m);
        assert(callback_thread != std::this_thread::get_id());
    }

    // the key is free again once resolved
    auto again = tracker.track_command("04CEAA40", kCmd, 9, 1s);
    assert(tracker.contains(again->id()));
    tracker.shutdown();
}

void test_unknown_response_returns_false() {
    CommandTracker tracker;
    tracker.track_command("04CEAA40", kCmd, 1, 1s);
    assert(!tracker.notify_response("04CEAA40", 2, make_response("04CEAA40", 2)));
    assert(!tracker.notify_response("FFFFFFFF", 1, make_response("FFFFFFFF", 1)));
    assert(tracker.pending_count() == 1);
    tracker.shutdown();
}

void test_wait_times_out_and_removes() {
    CommandTracker tracker;
    auto cmd = tracker.track_command("04CEAA40", kCmd, 3, 80ms);
    const auto begin = std::chrono::steady_clock::now();
    bool timed_out = false;
    try {
        tracker.wait_for_response(cmd);
    } catch (const ChargeError& e) {
        timed_out = e.kind() == ErrorKind::ResponseTimeout;
    }
    const auto waited = std::chrono::steady_clock::now() - begin;
    assert(timed_out);
    assert(waited >= 75ms);
    assert(waited < 1s);
    assert(!tracker.contains(cmd->id()));
    assert(tracker.pending_count() == 0);
    // a late reply is dropped
    assert(!tracker.notify_response("04CEAA40", 3, make_response("04CEAA40", 3)));
    tracker.shutdown();
}

void test_expiry_fires_callback_once() {
    CommandTracker tracker;
    std::atomic<int> calls{0};
    std::atomic<bool> was_timeout{false};
    tracker.track_command("04CEAA40", kCmd, 4, 40ms,
                          [&](std::optional<DeviceResponse> resp, std::optional<ChargeError> err) {
                              calls++;
                              was_timeout = !resp && err && err->kind() == ErrorKind::ResponseTimeout;
                          });
    assert(wait_until([&]() { return calls.load() == 1; }));
    assert(was_timeout);
    assert(tracker.pending_count() == 0);
    std::this_thread::sleep_for(60ms);
    assert(calls == 1);
    tracker.shutdown();
}

void test_response_racing_deadline() {
    CommandTracker tracker;
    for (int round = 0; round < 20; ++round) {
        std::atomic<int> calls{0};
        const uint16_t msg = static_cast<uint16_t>(100 + round);
        tracker.track_command("04CEAA40", kCmd, msg, 30ms,
                              [&](std::optional<DeviceResponse>, std::optional<ChargeError>) { calls++; });
        std::this_thread::sleep_for(29ms);
        tracker.notify_response("04CEAA40", msg, make_response("04CEAA40", msg));
        assert(wait_until([&]() { return calls.load() >= 1; }));
        std::this_thread::sleep_for(20ms);
        assert(calls == 1);
    }
    assert(tracker.pending_count() == 0);
    tracker.shutdown();
}

void test_cancel_skips_callback() {
    CommandTracker tracker;
    std::atomic<int> calls{0};
    auto cmd = tracker.track_command("04CEAA40", kCmd, 5, 1s,
                                     [&](std::optional<DeviceResponse>, std::optional<ChargeError>) { calls++; });
    assert(tracker.cancel(cmd, "send failed"));
    assert(!tracker.cancel(cmd, "again"));
    assert(!tracker.contains(cmd->id()));
    bool cancelled = false;
    try {
        tracker.wait_for_response(cmd);
    } catch (const ChargeError& e) {
        cancelled = e.kind() == ErrorKind::Cancelled;
    }
    assert(cancelled);
    std::this_thread::sleep_for(30ms);
    assert(calls == 0);
    tracker.shutdown();
}

void test_oldest_match_wins() {
    CommandTracker tracker;
    auto older = tracker.track_command("04CEAA40", 0x82, 11, 1s);
    auto newer = tracker.track_command("04CEAA40", 0x96, 11, 1s);
    assert(tracker.notify_response("04CEAA40", 11, make_response("04CEAA40", 11)));
    assert(older->resolved());
    assert(!newer->resolved());
    assert(tracker.contains(newer->id()));
    tracker.shutdown();
}

void test_sweep_keeps_fresh_commands() {
    CommandTracker tracker(20ms);
    tracker.track_command("04CEAA40", kCmd, 12, 5s);
    assert(tracker.sweep_expired() == 0);
    std::this_thread::sleep_for(60ms);
    assert(tracker.pending_count() == 1);
    tracker.shutdown();
}

// Drops the deadline heap so only the periodic stale sweep can retire the command.
void drop_deadlines(CommandTracker& tracker) {
    std::lock_guard<std::mutex> lock(tracker.mtx_);
    tracker.deadlines_ = {};
}

void test_periodic_sweep_removes_stale_command() {
    CommandTracker tracker(20ms);
    std::atomic<int> calls{0};
    std::atomic<bool> was_timeout{false};
    auto cmd = tracker.track_command("04CEAA40", kCmd, 40, 30ms,
                                     [&](std::optional<DeviceResponse> resp, std::optional<ChargeError> err) {
                                         calls++;
                                         was_timeout = !resp && err && err->kind() == ErrorKind::ResponseTimeout;
                                     });
    drop_deadlines(tracker);
    assert(wait_until([&]() { return calls.load() == 1; }));
    assert(was_timeout);
    assert(!tracker.contains(cmd->id()));
    assert(tracker.pending_count() == 0);
    assert(cmd->resolved());
    tracker.shutdown();
}

void test_sweep_expired_reports_removed() {
    CommandTracker tracker(std::chrono::hours(1));
    std::atomic<int> calls{0};
    std::atomic<bool> was_timeout{false};
    auto stale = tracker.track_command("04CEAA40", kCmd, 41, 10ms,
                                       [&](std::optional<DeviceResponse> resp, std::optional<ChargeError> err) {
                                           calls++;
                                           was_timeout = !resp && err && err->kind() == ErrorKind::ResponseTimeout;
                                       });
    auto fresh = tracker.track_command("04CEAA40", kCmd, 42, 10s);
    drop_deadlines(tracker);
    std::this_thread::sleep_for(30ms);
    assert(tracker.pending_count() == 2);

    assert(tracker.sweep_expired() == 1);
    assert(!tracker.contains(stale->id()));
    assert(tracker.contains(fresh->id()));
    assert(wait_until([&]() { return calls.load() == 1; }));
    assert(was_timeout);
    bool timed_out = false;
    try {
        tracker.wait_for_response(stale);
    } catch (const ChargeError& e) {
        timed_out = e.kind() == ErrorKind::ResponseTimeout;
    }
    assert(timed_out);
    assert(tracker.sweep_expired() == 0);
    tracker.shutdown();
}

void test_shutdown_resolves_outstanding() {
    CommandTracker tracker;
    std::atomic<int> shutdown_errors{0};
    auto cmd = tracker.track_command("04CEAA40", kCmd, 13, 10s,
                                     [&](std::optional<DeviceResponse>, std::optional<ChargeError> err) {
                                         if (err && err->kind() == ErrorKind::Shutdown) {
                                             shutdown_errors++;
                                         }
                                     });
    std::atomic<bool> waiter_saw_shutdown{false};
    std::thread waiter([&]() {
        try {
            tracker.wait_for_response(cmd);
        } catch (const ChargeError& e) {
            waiter_saw_shutdown = e.kind() == ErrorKind::Shutdown;
        }
    });
    std::this_thread::sleep_for(20ms);
    tracker.shutdown();
    waiter.join();
    assert(waiter_saw_shutdown);
    assert(shutdown_errors == 1); // callbacks are drained before shutdown returns
    assert(tracker.pending_count() == 0);

    bool refused = false;
    try {
        tracker.track_command("04CEAA40", kCmd, 14, 1s);
    } catch (const ChargeError& e) {
        refused = e.kind() == ErrorKind::Shutdown;
    }
    assert(refused);
}
} // namespace

int main() {
    test_duplicate_key_rejected();
    test_concurrent_track_same_key();
    test_notify_resolves_and_duplicate_dropped();
    test_unknown_response_returns_false();
    test_wait_times_out_and_removes();
    test_expiry_fires_callback_once();
    test_response_racing_deadline();
    test_cancel_skips_callback();
    test_oldest_match_wins();
    test_sweep_keeps_fresh_commands();
    test_periodic_sweep_removes_stale_command();
    test_sweep_expired_reports_removed();
    test_shutdown_resolves_outstanding();

    std::cout << "command_tracker_tests passed\n";
    return 0;
}
