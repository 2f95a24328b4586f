/// @file app_runner.cpp
/// @brief Implementation of shared client entry-point utilities.

#include "cgc/app/app_runner.hpp"

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <string_view>
#include <thread>

#include "cgc/foundation/client_logger.hpp"

namespace cgc::app {

using foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

bool SignalHandler::waitFor(std::chrono::milliseconds timeout) const {
    constexpr std::chrono::milliseconds kSlice{50};
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!shutdownRequested()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, kSlice));
    }
    return true;
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- Config ------------------------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i < argc - 1; ++i) {
        if (std::string_view(argv[i]) == "--config") {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    return {};
}

std::filesystem::path resolveConfigPath(int argc, char* argv[],
                                        const std::filesystem::path& defaultPath) {
    auto fromArgs = parseConfigArg(argc, argv);
    if (!fromArgs.empty()) {
        return fromArgs;
    }
    const char* envPath = std::getenv(kConfigPathEnv);
    if (envPath != nullptr && *envPath != '\0') {
        return envPath;
    }
    return defaultPath;
}

foundation::ClientResult<void> loadConfig(foundation::ConfigManager& config,
                                          const std::filesystem::path& path) {
    auto loaded = config.load(path);
    if (loaded) {
        CGC_LOG_INFO(LogCategory::Core, "configuration loaded from " + path.string());
    }
    return loaded;
}

} // namespace cgc::app
