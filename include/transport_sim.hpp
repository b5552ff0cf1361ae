// SPDX-License-Identifier: Apache-2.0
#pragma once

#include "device_interface.hpp"
#include "dny_codec.hpp"
#include "response_dispatcher.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace pilegate {

/// \brief In-process charging piles that answer charge-control frames through the dispatcher.
///
/// Each device keeps a state byte per port. A start that succeeds moves the port to charging (1),
/// a stop moves it to idle (0); queries report the current state. Replies are delivered on a
/// worker thread after the device's reply delay.
class SimulatedTransport : public DeviceTransport {
public:
    /// Produces the reply frame for a request, or nullopt to stay silent.
    using Responder = std::function<std::optional<std::vector<uint8_t>>(const DnyFrame& request)>;

    explicit SimulatedTransport(const ResponseDispatcher& dispatcher,
                                std::chrono::milliseconds default_delay = std::chrono::milliseconds(50));
    ~SimulatedTransport() override;

    SimulatedTransport(const SimulatedTransport&) = delete;
    SimulatedTransport& operator=(const SimulatedTransport&) = delete;

    void add_device(const std::string& device_id, std::optional<std::chrono::milliseconds> reply_delay = std::nullopt,
                    uint8_t initial_port_state = 0);
    void remove_device(const std::string& device_id);
    void set_silent(const std::string& device_id, bool silent);
    void set_send_failure(const std::string& device_id, bool fail);
    void set_port_state(const std::string& device_id, int port, uint8_t state);
    /// Status byte returned for a given charge command (0x00 stop, 0x01 start, 0x03 query).
    void set_reply_status(const std::string& device_id, uint8_t charge_command, uint8_t status);
    void set_responder(const std::string& device_id, Responder responder);
    void inject(const std::vector<uint8_t>& frame, std::chrono::milliseconds delay = std::chrono::milliseconds(0));

    bool send(const std::string& device_id, const std::vector<uint8_t>& frame) override;
    bool is_online(const std::string& device_id) const override;
    std::optional<ConnectionHandle> resolve(const std::string& device_id) const override;
    void register_retry(const std::string& device_id, uint16_t message_id, uint8_t command,
                        const std::vector<uint8_t>& frame) override;

    std::vector<DnyFrame> sent_frames(const std::string& device_id) const;
    std::size_t retry_registrations() const;

    void stop();

private:
    struct Device {
        ConnectionHandle handle;
        std::chrono::milliseconds reply_delay{0};
        bool silent{false};
        bool fail_send{false};
        std::map<int, uint8_t> port_states;
        std::map<uint8_t, uint8_t> reply_status;
        Responder responder;
        std::vector<DnyFrame> sent;
    };
    using Delivery = std::pair<Clock::time_point, std::vector<uint8_t>>;
    struct LaterFirst {
        bool operator()(const Delivery& a, const Delivery& b) const {
            return a.first > b.first;
        }
    };

    std::optional<std::vector<uint8_t>> default_reply(Device& device, const DnyFrame& request) const;
    void schedule(std::vector<uint8_t> frame, std::chrono::milliseconds delay);
    void delivery_loop();

    const ResponseDispatcher& dispatcher_;
    std::chrono::milliseconds default_delay_;

    mutable std::mutex mtx_;
    std::map<std::string, Device> devices_;
    std::size_t retry_registrations_{0};

    std::mutex delivery_mtx_;
    std::condition_variable delivery_cv_;
    std::priority_queue<Delivery, std::vector<Delivery>, LaterFirst> deliveries_;
    bool stopping_{false};
    std::thread delivery_thread_;
};

} // namespace pilegate
