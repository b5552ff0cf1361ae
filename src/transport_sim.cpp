// SPDX-License-Identifier: Apache-2.0
#include "transport_sim.hpp"
#include "dny_contract.hpp"

#include <cstring>
#include <stdexcept>

#include <everest/logging.hpp>

namespace pilegate {

SimulatedTransport::SimulatedTransport(const ResponseDispatcher& dispatcher, std::chrono::milliseconds default_delay) :
    dispatcher_(dispatcher), default_delay_(default_delay) {
    delivery_thread_ = std::thread([this]() { delivery_loop(); });
}

SimulatedTransport::~SimulatedTransport() {
    stop();
}

void SimulatedTransport::stop() {
    {
        std::lock_guard<std::mutex> lock(delivery_mtx_);
        stopping_ = true;
    }
    delivery_cv_.notify_all();
    if (delivery_thread_.joinable()) {
        delivery_thread_.join();
    }
}

void SimulatedTransport::add_device(const std::string& device_id, std::optional<std::chrono::milliseconds> reply_delay,
                                    uint8_t initial_port_state) {
    std::lock_guard<std::mutex> lock(mtx_);
    Device device;
    device.handle.device_id = device_id;
    device.handle.remote_address = "sim://" + device_id;
    device.handle.connected_at = Clock::now();
    device.handle.last_seen = device.handle.connected_at;
    device.reply_delay = reply_delay.value_or(default_delay_);
    device.port_states[0] = initial_port_state; // fallback for ports never touched
    devices_[device_id] = std::move(device);
    EVLOG_info << "Simulated device " << device_id << " connected";
}

void SimulatedTransport::remove_device(const std::string& device_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (devices_.erase(device_id) > 0) {
        EVLOG_info << "Simulated device " << device_id << " disconnected";
    }
}

void SimulatedTransport::set_silent(const std::string& device_id, bool silent) {
    std::lock_guard<std::mutex> lock(mtx_);
    devices_.at(device_id).silent = silent;
}

void SimulatedTransport::set_send_failure(const std::string& device_id, bool fail) {
    std::lock_guard<std::mutex> lock(mtx_);
    devices_.at(device_id).fail_send = fail;
}

void SimulatedTransport::set_port_state(const std::string& device_id, int port, uint8_t state) {
    std::lock_guard<std::mutex> lock(mtx_);
    devices_.at(device_id).port_states[port] = state;
}

void SimulatedTransport::set_reply_status(const std::string& device_id, uint8_t charge_command, uint8_t status) {
    std::lock_guard<std::mutex> lock(mtx_);
    devices_.at(device_id).reply_status[charge_command] = status;
}

void SimulatedTransport::set_responder(const std::string& device_id, Responder responder) {
    std::lock_guard<std::mutex> lock(mtx_);
    devices_.at(device_id).responder = std::move(responder);
}

void SimulatedTransport::inject(const std::vector<uint8_t>& frame, std::chrono::milliseconds delay) {
    schedule(frame, delay);
}

bool SimulatedTransport::send(const std::string& device_id, const std::vector<uint8_t>& frame) {
    std::optional<std::vector<uint8_t>> reply;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lock(mtx_);
        const auto it = devices_.find(device_id);
        if (it == devices_.end()) {
            EVLOG_warning << "Send to unknown simulated device " << device_id;
            return false;
        }
        auto& device = it->second;
        if (device.fail_send) {
            EVLOG_warning << "Simulated send failure toward " << device_id;
            return false;
        }
        DnyFrame request;
        try {
            request = DnyCodec::decode_frame(frame.data(), frame.size());
        } catch (const std::invalid_argument& e) {
            EVLOG_error << "Simulated device " << device_id << " rejected frame: " << e.what();
            return false;
        }
        device.sent.push_back(request);
        device.handle.last_seen = Clock::now();
        if (device.silent) {
            return true;
        }
        reply = device.responder ? device.responder(request) : default_reply(device, request);
        delay = device.reply_delay;
    }
    if (reply) {
        schedule(std::move(*reply), delay);
    }
    return true;
}

std::optional<std::vector<uint8_t>> SimulatedTransport::default_reply(Device& device, const DnyFrame& request) const {
    if (request.command != dny_contract::kCmdChargeControl ||
        request.data.size() < dny_contract::kChargeControlDataLen) {
        return std::nullopt;
    }
    const int port = request.data[5] + 1;
    const uint8_t charge_command = request.data[6];
    const std::string order(reinterpret_cast<const char*>(request.data.data() + 9),
                            strnlen(reinterpret_cast<const char*>(request.data.data() + 9),
                                    dny_contract::kOrderNumberLen));
    const auto scripted = device.reply_status.find(charge_command);
    const uint8_t status = scripted != device.reply_status.end() ? scripted->second : dny_contract::kStatusSuccess;

    auto state_it = device.port_states.find(port);
    if (state_it == device.port_states.end()) {
        state_it = device.port_states.emplace(port, device.port_states[0]).first;
    }
    std::optional<uint8_t> port_state;
    if (status == dny_contract::kStatusSuccess) {
        if (charge_command == dny_contract::kChargeStart) {
            state_it->second = 1;
        } else if (charge_command == dny_contract::kChargeStop) {
            state_it->second = 0;
        } else if (charge_command == dny_contract::kChargeQuery) {
            port_state = state_it->second;
        }
    }
    const auto data = DnyCodec::encode_charge_control_reply(status, order, port, 0, port_state);
    return DnyCodec::encode_frame(request.physical_id, request.message_id, request.command, data);
}

bool SimulatedTransport::is_online(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return devices_.count(device_id) > 0;
}

std::optional<ConnectionHandle> SimulatedTransport::resolve(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = devices_.find(device_id);
    if (it == devices_.end()) {
        return std::nullopt;
    }
    return it->second.handle;
}

void SimulatedTransport::register_retry(const std::string& device_id, uint16_t message_id, uint8_t command,
                                        const std::vector<uint8_t>&) {
    std::lock_guard<std::mutex> lock(mtx_);
    retry_registrations_++;
    EVLOG_debug << "Simulated retry registration for " << device_id << " msg=" << message_id << " cmd=0x" << std::hex
                << static_cast<int>(command);
}

std::vector<DnyFrame> SimulatedTransport::sent_frames(const std::string& device_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const auto it = devices_.find(device_id);
    return it == devices_.end() ? std::vector<DnyFrame>{} : it->second.sent;
}

std::size_t SimulatedTransport::retry_registrations() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return retry_registrations_;
}

void SimulatedTransport::schedule(std::vector<uint8_t> frame, std::chrono::milliseconds delay) {
    {
        std::lock_guard<std::mutex> lock(delivery_mtx_);
        if (stopping_) {
            return;
        }
        deliveries_.emplace(Clock::now() + delay, std::move(frame));
    }
    delivery_cv_.notify_all();
}

void SimulatedTransport::delivery_loop() {
    std::unique_lock<std::mutex> lock(delivery_mtx_);
    while (!stopping_) {
        if (deliveries_.empty()) {
            delivery_cv_.wait(lock);
            continue;
        }
        const auto due = deliveries_.top().first;
        if (Clock::now() < due) {
            delivery_cv_.wait_until(lock, due);
            continue;
        }
        auto frame = deliveries_.top().second;
        deliveries_.pop();
        lock.unlock();
        try {
            dispatcher_.dispatch(frame);
        } catch (const std::exception& e) {
            EVLOG_warning << "Simulated delivery error: " << e.what();
        }
        lock.lock();
    }
}

} // namespace pilegate
