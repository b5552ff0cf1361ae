// SPDX-License-Identifier: Apache-2.0
#include "tcp_transport.hpp"
#include "dny_contract.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <everest/logging.hpp>

namespace pilegate {

namespace {
constexpr auto kAcceptPollMs = 500;
constexpr std::size_t kRxChunk = 512;
} // namespace

TcpDeviceServer::TcpDeviceServer(const TcpServerConfig& cfg, const ResponseDispatcher& dispatcher,
                                 EventNotifier& notifier) :
    cfg_(cfg), dispatcher_(dispatcher), notifier_(notifier) {
}

TcpDeviceServer::~TcpDeviceServer() {
    stop();
}

bool TcpDeviceServer::open_socket() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        EVLOG_error << "Failed to open device listener socket: " << std::strerror(errno);
        return false;
    }
    const int reuse = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    sockaddr_in addr {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(cfg_.port));
    if (inet_pton(AF_INET, cfg_.host.c_str(), &addr.sin_addr) != 1) {
        EVLOG_error << "Invalid listen address: " << cfg_.host;
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    if (bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        EVLOG_error << "Failed to bind " << cfg_.host << ":" << cfg_.port << ": " << std::strerror(errno);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    if (listen(listen_fd_, SOMAXCONN) < 0) {
        EVLOG_error << "Failed to listen on " << cfg_.host << ":" << cfg_.port << ": " << std::strerror(errno);
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }
    return true;
}

bool TcpDeviceServer::start() {
    if (running_) {
        return true;
    }
    if (!open_socket()) {
        return false;
    }
    running_ = true;
    accept_thread_ = std::thread([this]() { accept_loop(); });
    retry_thread_ = std::thread([this]() { retry_loop(); });
    EVLOG_info << "Listening for devices on " << cfg_.host << ":" << cfg_.port;
    return true;
}

void TcpDeviceServer::stop() {
    running_ = false;
    retry_cv_.notify_all();
    if (listen_fd_ >= 0) {
        shutdown(listen_fd_, SHUT_RDWR);
    }
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }
    if (retry_thread_.joinable()) {
        retry_thread_.join();
    }
    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    std::vector<std::shared_ptr<Connection>> conns;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        conns.swap(connections_);
        by_device_.clear();
    }
    for (auto& conn : conns) {
        shutdown(conn->fd, SHUT_RDWR);
    }
    for (auto& conn : conns) {
        if (conn->rx_thread.joinable()) {
            conn->rx_thread.join();
        }
        ::close(conn->fd);
    }
    std::lock_guard<std::mutex> lock(retry_mtx_);
    retries_.clear();
}

void TcpDeviceServer::accept_loop() {
    while (running_) {
        try {
            reap_closed();
            pollfd pfd {};
            pfd.fd = listen_fd_;
            pfd.events = POLLIN;
            const int ready = ::poll(&pfd, 1, kAcceptPollMs);
            if (ready <= 0 || !running_) {
                continue;
            }
            sockaddr_in peer {};
            socklen_t peer_len = sizeof(peer);
            const int fd = ::accept(listen_fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len);
            if (fd < 0) {
                if (running_) {
                    EVLOG_warning << "accept failed: " << std::strerror(errno);
                }
                continue;
            }
            char ip[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));

            auto conn = std::make_shared<Connection>();
            conn->fd = fd;
            conn->remote = std::string(ip) + ":" + std::to_string(ntohs(peer.sin_port));
            conn->connected_at = Clock::now();
            conn->last_seen = conn->connected_at;
            {
                std::lock_guard<std::mutex> lock(mtx_);
                connections_.push_back(conn);
                conn->rx_thread = std::thread([this, conn]() { rx_loop(conn); });
            }
            EVLOG_info << "Device connection from " << conn->remote;
        } catch (const std::exception& e) {
            EVLOG_warning << "Accept loop error: " << e.what();
        }
    }
}

void TcpDeviceServer::reap_closed() {
    std::vector<std::shared_ptr<Connection>> dead;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = std::partition(connections_.begin(), connections_.end(),
                                 [](const std::shared_ptr<Connection>& c) { return !c->closed; });
        dead.assign(it, connections_.end());
        connections_.erase(it, connections_.end());
    }
    for (auto& conn : dead) {
        if (conn->rx_thread.joinable()) {
            conn->rx_thread.join();
        }
        ::close(conn->fd);
    }
}

void TcpDeviceServer::rx_loop(const std::shared_ptr<Connection>& conn) {
    uint8_t chunk[kRxChunk];
    while (running_) {
        const auto n = ::recv(conn->fd, chunk, sizeof(chunk), 0);
        if (n == 0) {
            break;
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (running_) {
                EVLOG_warning << "Receive error on " << conn->remote << ": " << std::strerror(errno);
            }
            break;
        }
        conn->rx_buffer.insert(conn->rx_buffer.end(), chunk, chunk + n);
        try {
            consume(conn);
        } catch (const std::exception& e) {
            EVLOG_warning << "Frame handling error on " << conn->remote << ": " << e.what();
        }
    }
    on_disconnect(conn);
    conn->closed = true;
}

void TcpDeviceServer::consume(const std::shared_ptr<Connection>& conn) {
    auto& buf = conn->rx_buffer;
    while (!buf.empty()) {
        const auto header = std::search(buf.begin(), buf.end(), dny_contract::kHeader,
                                        dny_contract::kHeader + dny_contract::kHeaderLen);
        if (header == buf.end()) {
            // keep a possible partial header
            const auto keep = std::min(buf.size(), dny_contract::kHeaderLen - 1);
            buf.erase(buf.begin(), buf.end() - static_cast<std::ptrdiff_t>(keep));
            if (keep > 0 && buf.front() != static_cast<uint8_t>(dny_contract::kHeader[0])) {
                buf.erase(buf.begin());
            }
            return;
        }
        if (header != buf.begin()) {
            EVLOG_debug << "Skipping " << std::distance(buf.begin(), header) << " unframed bytes from "
                        << conn->remote;
            buf.erase(buf.begin(), header);
        }
        std::size_t total = 0;
        try {
            total = DnyCodec::complete_frame_length(buf);
        } catch (const std::invalid_argument& e) {
            EVLOG_warning << "Resyncing stream from " << conn->remote << ": " << e.what();
            buf.erase(buf.begin());
            continue;
        }
        if (total == 0) {
            return;
        }
        std::vector<uint8_t> raw(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(total));
        buf.erase(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(total));
        try {
            handle_frame(conn, DnyCodec::decode_frame(raw.data(), raw.size()), raw);
        } catch (const std::invalid_argument& e) {
            EVLOG_warning << "Dropping frame from " << conn->remote << ": " << e.what();
        }
    }
}

void TcpDeviceServer::handle_frame(const std::shared_ptr<Connection>& conn, const DnyFrame& frame,
                                   const std::vector<uint8_t>& raw) {
    const auto device_id = format_device_id(frame.physical_id);
    bool newly_bound = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        conn->last_seen = Clock::now();
        if (conn->device_id != device_id) {
            if (!conn->device_id.empty()) {
                EVLOG_warning << "Connection " << conn->remote << " switched from device " << conn->device_id << " to "
                              << device_id;
                by_device_.erase(conn->device_id);
            }
            conn->device_id = device_id;
            newly_bound = true;
        }
        auto& slot = by_device_[device_id];
        if (slot && slot != conn) {
            EVLOG_info << "Device " << device_id << " reconnected from " << conn->remote;
            shutdown(slot->fd, SHUT_RDWR);
        }
        slot = conn;
    }
    if (newly_bound) {
        EVLOG_info << "Device " << device_id << " online via " << conn->remote;
        try {
            notifier_.notify("device_online", nlohmann::json{{"device_id", device_id}, {"remote", conn->remote}});
        } catch (const std::exception& e) {
            EVLOG_error << "Failed to notify device_online for " << device_id << ": " << e.what();
        }
    }

    {
        std::lock_guard<std::mutex> lock(retry_mtx_);
        retries_.erase({device_id, frame.message_id});
    }

    if (frame.command == dny_contract::kCmdChargeControl) {
        dispatcher_.dispatch(raw);
        return;
    }
    EVLOG_debug << "Frame 0x" << std::hex << static_cast<int>(frame.command) << std::dec << " from " << device_id
                << " not handled by the control plane";
}

void TcpDeviceServer::on_disconnect(const std::shared_ptr<Connection>& conn) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (conn->device_id.empty()) {
        EVLOG_info << "Unidentified connection " << conn->remote << " closed";
        return;
    }
    const auto it = by_device_.find(conn->device_id);
    if (it != by_device_.end() && it->second == conn) {
        by_device_.erase(it);
        EVLOG_info << "Device " << conn->device_id << " disconnected";
    }
}

bool TcpDeviceServer::write_all(Connection& conn, const std::string& device_id, const std::vector<uint8_t>& frame) {
    std::lock_guard<std::mutex> lock(conn.tx_mtx);
    std::size_t offset = 0;
    while (offset < frame.size()) {
        const auto n = ::send(conn.fd, frame.data() + offset, frame.size() - offset, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            EVLOG_error << "Send to " << device_id << " (" << conn.remote << ") failed: " << std::strerror(errno);
            return false;
        }
        offset += static_cast<std::size_t>(n);
    }
    return true;
}

bool TcpDeviceServer::send(const std::string& device_id, const std::vector<uint8_t>& frame) {
    std::shared_ptr<Connection> conn;
    std::string bound_id;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        const auto it = by_device_.find(device_id);
        if (it == by_device_.end() || it->second->closed) {
            EVLOG_warning << "No connection for device " << device_id;
            return false;
        }
        conn = it->second;
        bound_id = conn->device_id;
    }
    return write_all(*conn, bound_id, frame);
}

bool TcpDeviceServer::is_online(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = by_device_.find(device_id);
    return it != by_device_.end() && !it->second->closed;
}

std::optional<ConnectionHandle> TcpDeviceServer::resolve(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = by_device_.find(device_id);
    if (it == by_device_.end() || it->second->closed) {
        return std::nullopt;
    }
    ConnectionHandle handle;
    handle.device_id = device_id;
    handle.remote_address = it->second->remote;
    handle.connected_at = it->second->connected_at;
    handle.last_seen = it->second->last_seen;
    return handle;
}

void TcpDeviceServer::register_retry(const std::string& device_id, uint16_t message_id, uint8_t command,
                                     const std::vector<uint8_t>& frame) {
    RetryEntry entry;
    entry.device_id = device_id;
    entry.message_id = message_id;
    entry.command = command;
    entry.frame = frame;
    entry.created_at = Clock::now();
    entry.last_sent = entry.created_at;
    std::lock_guard<std::mutex> lock(retry_mtx_);
    retries_[{device_id, message_id}] = std::move(entry);
}

void TcpDeviceServer::retry_loop() {
    const auto tick = std::max(std::chrono::milliseconds(100), std::min(cfg_.resend_timeout / 3,
                                                                         std::chrono::milliseconds(1000)));
    while (running_) {
        std::vector<RetryEntry> resend;
        {
            std::unique_lock<std::mutex> lock(retry_mtx_);
            retry_cv_.wait_for(lock, tick, [this]() { return !running_; });
            if (!running_) {
                break;
            }
            const auto now = Clock::now();
            for (auto it = retries_.begin(); it != retries_.end();) {
                auto& entry = it->second;
                if (now - entry.created_at > cfg_.max_age) {
                    EVLOG_warning << "Command msg=" << entry.message_id << " to " << entry.device_id
                                  << " expired unacknowledged";
                    it = retries_.erase(it);
                    continue;
                }
                if (now - entry.last_sent >= cfg_.resend_timeout) {
                    if (entry.retries >= cfg_.max_retries) {
                        EVLOG_warning << "Command msg=" << entry.message_id << " to " << entry.device_id
                                      << " unacknowledged after " << entry.retries << " resend(s)";
                        it = retries_.erase(it);
                        continue;
                    }
                    entry.retries++;
                    entry.last_sent = now;
                    resend.push_back(entry);
                }
                ++it;
            }
        }
        for (const auto& entry : resend) {
            EVLOG_info << "Resending msg=" << entry.message_id << " to " << entry.device_id << " (attempt "
                       << entry.retries << "/" << cfg_.max_retries << ")";
            if (!send(entry.device_id, entry.frame)) {
                EVLOG_warning << "Resend of msg=" << entry.message_id << " to " << entry.device_id << " failed";
            }
        }
    }
}

std::size_t TcpDeviceServer::connection_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return by_device_.size();
}

std::size_t TcpDeviceServer::pending_retries() const {
    std::lock_guard<std::mutex> lock(retry_mtx_);
    return retries_.size();
}

} // namespace pilegate
