// SPDX-License-Identifier: Apache-2.0
#include "charging_orchestrator.hpp"
#include "command_tracker.hpp"
#include "dny_codec.hpp"
#include "gateway_config.hpp"
#include "platform_notifier.hpp"
#include "response_dispatcher.hpp"
#include "tcp_transport.hpp"
#include "transport_sim.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include <everest/logging.hpp>

namespace {
std::atomic<bool> keep_running{true};

void handle_signal(int) {
    keep_running = false;
}

struct CliOptions {
    std::string config_path{"configs/gateway.json"};
    bool force_simulation{false};
};

CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;
    if (const char* env = std::getenv("PILEGATE_CONFIG"); env && *env) {
        opts.config_path = env;
    }
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--simulate") {
            opts.force_simulation = true;
        }
    }
    return opts;
}
} // namespace

int main(int argc, char* argv[]) {
    const auto opts = parse_args(argc, argv);

    pilegate::GatewayConfig cfg;
    try {
        cfg = pilegate::load_gateway_config(opts.config_path);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << std::endl;
        return 1;
    }
    cfg.simulation_mode = cfg.simulation_mode || opts.force_simulation;

    Everest::Logging::init(cfg.logging_config.string(), "pilegate");
    EVLOG_info << "pilegate " << cfg.gateway_id << " starting";

    std::unique_ptr<pilegate::EventNotifier> notifier;
    pilegate::PlatformNotifier* platform = nullptr;
    if (cfg.platform.enabled) {
        auto p = std::make_unique<pilegate::PlatformNotifier>(cfg.platform);
        platform = p.get();
        notifier = std::move(p);
    } else {
        notifier = std::make_unique<pilegate::LoggingNotifier>();
    }

    pilegate::DnyCodec codec;
    pilegate::CommandTracker tracker(cfg.sweep_interval);
    pilegate::ResponseDispatcher dispatcher(codec, tracker);

    std::unique_ptr<pilegate::TcpDeviceServer> tcp;
    std::unique_ptr<pilegate::SimulatedTransport> sim;
    pilegate::DeviceTransport* transport = nullptr;
    if (!cfg.simulation_mode) {
        tcp = std::make_unique<pilegate::TcpDeviceServer>(cfg.listen, dispatcher, *notifier);
        if (tcp->start()) {
            transport = tcp.get();
        } else {
            EVLOG_warning << "Device listener unavailable, falling back to simulated devices";
            tcp.reset();
        }
    }
    if (!transport) {
        sim = std::make_unique<pilegate::SimulatedTransport>(dispatcher);
        for (const auto& device : cfg.simulated_devices) {
            sim->add_device(device.device_id, std::chrono::milliseconds(device.reply_delay_ms),
                            static_cast<uint8_t>(device.port_state));
        }
        transport = sim.get();
    }

    const pilegate::StatusLabels labels(cfg.status_labels);
    pilegate::ChargingOrchestrator orchestrator(cfg.orchestrator, cfg.monitor, labels, codec, *transport, tracker,
                                                *notifier);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    while (keep_running) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    EVLOG_info << "Shutting down";
    if (tcp) {
        tcp->stop();
    }
    if (sim) {
        sim->stop();
    }
    orchestrator.shutdown();
    tracker.shutdown();
    if (platform) {
        platform->shutdown();
    }
    return 0;
}
