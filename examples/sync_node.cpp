// Demo sync node.
//
//   syncmd_node --config node.json --server    # responder + discovery responder
//   syncmd_node --config node.json --client    # periodic initiator
//   syncmd_node --config node.json --discover  # one discovery round
//
// In server mode with token credentials a client token is issued at startup
// and logged; put it in the client's "auth_token".

#include "syncmd/client/sync_client.hpp"
#include "syncmd/core/config.hpp"
#include "syncmd/events/event_bus.hpp"
#include "syncmd/events/events.hpp"
#include "syncmd/network/discovery.hpp"
#include "syncmd/server/auth.hpp"
#include "syncmd/server/device_registry.hpp"
#include "syncmd/server/sync_server.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

void wait_for_shutdown() {
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("Received shutdown signal");
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " --config <file> [--server | --client | --discover]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --config <file>   JSON node configuration\n";
    std::cout << "  --server          Serve sync requests (default)\n";
    std::cout << "  --client          Sync with the configured peer periodically\n";
    std::cout << "  --discover        Broadcast a discovery announce and list replies\n";
}

void log_transfers(syncmd::events::EventBus& bus) {
    using namespace syncmd::events;
    bus.subscribe<TransferCommittedEvent>([](const TransferCommittedEvent& e) {
        spdlog::info("[event] {} committed ({} bytes, {} ms)", e.path, e.size, e.duration.count());
    });
    bus.subscribe<TransferFailedEvent>([](const TransferFailedEvent& e) {
        spdlog::warn("[event] {} failed: {} ({})", e.path, e.message, syncmd::to_string(e.kind));
    });
    bus.subscribe<SyncCompletedEvent>([](const SyncCompletedEvent& e) {
        spdlog::info("[event] sync with {}: {} applied, {} sent", e.peer_device_id, e.operations_applied,
                     e.files_sent);
    });
}

int run_server(const syncmd::NodeConfig& config) {
    syncmd::events::EventBus bus;
    log_transfers(bus);

    std::unique_ptr<syncmd::server::Authenticator> authenticator;
    if (config.credential_mode == syncmd::CredentialMode::Token) {
        auto authority = std::make_unique<syncmd::server::TokenAuthority>();
        const auto token = authority->issue("demo-client", "Demo client");
        spdlog::info("Client token: {}", token);
        authenticator = std::move(authority);
    } else {
        authenticator = std::make_unique<syncmd::server::RootDigestAuthenticator>();
    }

    syncmd::server::DeviceRegistry devices;
    syncmd::transfer::TransferRegistry transfers;
    syncmd::server::SyncServer server(config, *authenticator, devices, transfers, &bus);
    if (auto res = server.start(); res.is_error()) {
        spdlog::error("Failed to start server: {}", res.error().describe());
        return 1;
    }

    syncmd::network::DiscoveryResponder discovery(config.device_id, config.listen_address, config.discovery_port);
    if (auto res = discovery.start(); res.is_error()) {
        spdlog::warn("Discovery disabled: {}", res.error().describe());
    }

    wait_for_shutdown();
    discovery.stop();
    server.stop();
    return 0;
}

int run_client(const syncmd::NodeConfig& config) {
    syncmd::events::EventBus bus;
    log_transfers(bus);

    syncmd::client::SyncClient client(config, &bus);
    auto first = client.sync_once();
    if (first.is_error()) {
        spdlog::error("Initial sync failed: {}", first.error().describe());
    }

    client.start_periodic(config.periodic_interval);
    wait_for_shutdown();
    client.stop();
    client.close();
    return 0;
}

int run_discovery(const syncmd::NodeConfig& config) {
    auto peers = syncmd::network::discover_peers(config.device_id, "255.255.255.255", config.discovery_port,
                                                 config.discovery_timeout);
    if (peers.is_error()) {
        spdlog::error("Discovery failed: {}", peers.error().describe());
        return 1;
    }
    if (peers.value().empty()) {
        std::cout << "No peers found\n";
    }
    for (const auto& peer : peers.value()) {
        std::cout << peer.device_id << "\t" << peer.address << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::string config_path;
    std::string mode = "server";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                spdlog::error("--config requires a value");
                return 1;
            }
            config_path = argv[++i];
        } else if (arg == "--server") {
            mode = "server";
        } else if (arg == "--client") {
            mode = "client";
        } else if (arg == "--discover") {
            mode = "discover";
        } else {
            spdlog::error("Unknown option: {}", arg);
            print_usage(argv[0]);
            return 1;
        }
    }

    if (config_path.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    auto config = syncmd::load_config(config_path);
    if (config.is_error()) {
        spdlog::error("Failed to load {}: {}", config_path, config.error().describe());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config.value().log_level));

    spdlog::info("syncmd node {} ({}) in {} mode", config.value().device_id, config.value().device_name, mode);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (mode == "client") {
        return run_client(config.value());
    }
    if (mode == "discover") {
        return run_discovery(config.value());
    }
    return run_server(config.value());
}
