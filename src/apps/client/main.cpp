/// @file main.cpp
/// @brief cgc_client entry point.
///
/// Connects to the configured server, logs connection events and sends a
/// GameData ping every second until SIGINT/SIGTERM.

#include <cstdlib>
#include <iostream>
#include <string>

#include "cgc/app/app_runner.hpp"
#include "cgc/async/cancellation_scope_manager.hpp"
#include "cgc/foundation/client_logger.hpp"
#include "cgc/foundation/config_manager.hpp"
#include "cgc/net/connection_client.hpp"
#include "cgc/net/event_notifier.hpp"
#include "cgc/net/resumption_store.hpp"

namespace {

using cgc::foundation::LogCategory;

constexpr std::chrono::milliseconds kPingInterval{1000};

std::vector<uint8_t> pingPayload(uint64_t counter) {
    std::string text = "ping " + std::to_string(counter);
    return std::vector<uint8_t>(text.begin(), text.end());
}

} // namespace

int main(int argc, char* argv[]) {
    cgc::app::SignalHandler signals;

    auto configPath = cgc::app::resolveConfigPath(argc, argv, "/etc/cgc/client.yaml");

    cgc::foundation::ConfigManager config;
    auto loadResult = cgc::app::loadConfig(config, configPath);
    if (!loadResult) {
        std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
        return EXIT_FAILURE;
    }

    auto netConfig = cgc::net::loadConnectionConfig(config);
    if (!netConfig) {
        std::cerr << "Invalid network config: " << netConfig.error().describe() << "\n";
        return EXIT_FAILURE;
    }

    cgc::async::CancellationScopeManager scopes;
    cgc::net::EventNotifier events;

    auto onConnected = events.onConnected([] {
        CGC_LOG_INFO(LogCategory::Core, "event: connected");
    });
    auto onDisconnected = events.onDisconnected([] {
        CGC_LOG_INFO(LogCategory::Core, "event: disconnected");
    });
    auto onError = events.onError([](const std::string& what) {
        CGC_LOG_WARN(LogCategory::Core, "event: error: " + what);
    });
    auto onLatency = events.onLatencyMeasured([](float ms) {
        CGC_LOG_DEBUG(LogCategory::Core, "event: latency " + std::to_string(ms) + "ms");
    });
    auto onMessage = events.onMessage([](const cgc::net::Message& message) {
        CGC_LOG_INFO(LogCategory::Core,
                     "event: " + std::string(cgc::net::messageTypeName(message.type)) + " #" +
                         std::to_string(message.sequenceNumber) + " (" +
                         std::to_string(message.payload.size()) + " bytes)");
    });

    cgc::net::ConnectionClient client(netConfig.value(), scopes, events,
                                      cgc::net::defaultTransportFactory(),
                                      std::make_shared<cgc::net::InMemoryResumptionStore>());

    auto connected = client.connect();
    if (!connected) {
        std::cerr << "Failed to connect to " << netConfig.value().serverAddress << ": "
                  << connected.error().describe() << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "Connected to " << netConfig.value().serverAddress << "\n";

    uint64_t counter = 0;
    while (!signals.waitFor(kPingInterval)) {
        if (client.state() != cgc::net::ConnectionState::Connected) {
            continue;
        }
        auto sent = client.send(cgc::net::MessageType::GameData, pingPayload(++counter));
        if (!sent) {
            CGC_LOG_WARN(LogCategory::Core, "ping not sent: " + sent.error().describe());
        }
    }

    std::cout << "Shutting down client...\n";
    auto closed = client.disconnect();
    if (!closed) {
        std::cerr << "Disconnect: " << closed.error().describe() << "\n";
    }
    client.dispose();
    scopes.shutdown();

    auto stats = client.metrics();
    std::cout << "Sent " << stats.messagesSent << " / received " << stats.messagesReceived
              << " frames, " << stats.totalConnections << " connection(s)\n";
    return EXIT_SUCCESS;
}
