// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_interface.hpp"
#include "dny_codec.hpp"
#include "response_dispatcher.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pilegate {

struct TcpServerConfig {
    std::string host{"0.0.0.0"};
    int port{7054};
    std::chrono::milliseconds resend_timeout{std::chrono::seconds(15)};
    int max_retries{2};
    std::chrono::milliseconds max_age{std::chrono::seconds(60)};
};

/// \brief Accepts persistent device connections and speaks DNY over them.
///
/// A connection is bound to a device id by the physical id of the frames it carries. Charge-control
/// frames are handed to the response dispatcher; every inbound frame acknowledges the retry entry
/// with the same device and message id.
class TcpDeviceServer : public DeviceTransport {
public:
    TcpDeviceServer(const TcpServerConfig& cfg, const ResponseDispatcher& dispatcher, EventNotifier& notifier);
    ~TcpDeviceServer() override;

    TcpDeviceServer(const TcpDeviceServer&) = delete;
    TcpDeviceServer& operator=(const TcpDeviceServer&) = delete;

    /// Binds and listens; returns false when the socket cannot be opened.
    bool start();
    void stop();

    bool send(const std::string& device_id, const std::vector<uint8_t>& frame) override;
    bool is_online(const std::string& device_id) const override;
    std::optional<ConnectionHandle> resolve(const std::string& device_id) const override;
    void register_retry(const std::string& device_id, uint16_t message_id, uint8_t command,
                        const std::vector<uint8_t>& frame) override;

    std::size_t connection_count() const;
    std::size_t pending_retries() const;

private:
    struct Connection {
        int fd{-1};
        std::string remote;
        std::string device_id;
        std::vector<uint8_t> rx_buffer;
        Clock::time_point connected_at{};
        Clock::time_point last_seen{};
        std::mutex tx_mtx;
        std::atomic<bool> closed{false};
        std::thread rx_thread;
    };

    struct RetryEntry {
        std::string device_id;
        uint16_t message_id{0};
        uint8_t command{0};
        std::vector<uint8_t> frame;
        Clock::time_point created_at{};
        Clock::time_point last_sent{};
        int retries{0};
    };

    bool open_socket();
    void accept_loop();
    void rx_loop(const std::shared_ptr<Connection>& conn);
    void retry_loop();
    void consume(const std::shared_ptr<Connection>& conn);
    void handle_frame(const std::shared_ptr<Connection>& conn, const DnyFrame& frame, const std::vector<uint8_t>& raw);
    void on_disconnect(const std::shared_ptr<Connection>& conn);
    // device_id is copied under mtx_ by the caller; Connection::device_id may be rebound concurrently.
    bool write_all(Connection& conn, const std::string& device_id, const std::vector<uint8_t>& frame);
    void reap_closed();

    TcpServerConfig cfg_;
    const ResponseDispatcher& dispatcher_;
    EventNotifier& notifier_;

    int listen_fd_{-1};
    std::atomic<bool> running_{false};
    std::thread accept_thread_;
    std::thread retry_thread_;

    mutable std::mutex mtx_;
    std::vector<std::shared_ptr<Connection>> connections_;
    std::map<std::string, std::shared_ptr<Connection>> by_device_;

    mutable std::mutex retry_mtx_;
    std::condition_variable retry_cv_;
    std::map<std::pair<std::string, uint16_t>, RetryEntry> retries_;
};

} // namespace pilegate
