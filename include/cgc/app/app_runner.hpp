#pragma once

/// @file app_runner.hpp
/// @brief Shared utilities for client entry points.
///
/// Signal handling, configuration path resolution and loading for the
/// CGC executables.

#include <atomic>
#include <chrono>
#include <filesystem>

#include "cgc/foundation/client_result.hpp"
#include "cgc/foundation/config_manager.hpp"

namespace cgc::app {

/// Environment variable naming the configuration file.
inline constexpr const char* kConfigPathEnv = "CGC_CONFIG_PATH";

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// The destructor restores the default handlers so that a second signal
/// after shutdown terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block the calling thread until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Sleep up to @p timeout, waking early on shutdown.
    /// @return true if shutdown was requested.
    bool waitFor(std::chrono::milliseconds timeout) const;

    /// Raise the flag without a signal (tests, programmatic exit).
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Parse `--config <path>` from command-line arguments.
///
/// @return Config file path, or empty path if not specified.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

/// Pick the configuration file: `--config` argument, then CGC_CONFIG_PATH,
/// then @p defaultPath.
[[nodiscard]] std::filesystem::path resolveConfigPath(int argc, char* argv[],
                                                      const std::filesystem::path& defaultPath);

/// Load a YAML configuration file into @p config.
///
/// @return Success or ConfigLoadFailed error.
[[nodiscard]] foundation::ClientResult<void> loadConfig(foundation::ConfigManager& config,
                                                        const std::filesystem::path& path);

} // namespace cgc::app
