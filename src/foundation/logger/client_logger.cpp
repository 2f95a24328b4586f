/// @file client_logger.cpp
/// @brief ClientLogger implementation over the kcenon logger registry.

#include "cgc/foundation/client_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace cgc::foundation {

namespace kci = kcenon::common::interfaces;

namespace {

kci::log_level toKcenonLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,    // Core
    LogLevel::Info,    // Connection
    LogLevel::Info,    // Transport
    LogLevel::Warning, // Codec
    LogLevel::Info,    // Health
    LogLevel::Info,    // Reconnect
    LogLevel::Debug,   // Scope
    LogLevel::Warning  // Events
};

std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, const auto& val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.endpoint && !ctx.endpoint->empty()) {
        append("endpoint", *ctx.endpoint);
    }
    if (ctx.attempt) {
        append("attempt", *ctx.attempt);
    }
    if (ctx.sequence) {
        append("seq", *ctx.sequence);
    }
    if (ctx.operation && !ctx.operation->empty()) {
        append("op", *ctx.operation);
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }
    return oss.str();
}

} // namespace

struct ClientLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // "cgc.<Category>" names looked up in the GlobalLoggerRegistry
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = "cgc." +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    /// Named per-category logger if one is registered, the default logger otherwise.
    std::shared_ptr<kci::ILogger> resolve(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto idx = static_cast<std::size_t>(cat);
        if (idx < kLogCategoryCount) {
            auto named = registry.get_logger(loggerNames[idx]);
            if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
                return named;
            }
        }
        return registry.get_default_logger();
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view suffix) const {
        std::string line;
        line.reserve(msg.size() + suffix.size() + 20);
        line += '[';
        line += logCategoryName(cat);
        line += "] ";
        line += msg;
        if (!suffix.empty()) {
            line += " {";
            line += suffix;
            line += '}';
        }
        resolve(cat)->log(toKcenonLevel(level), line);
    }
};

ClientLogger::ClientLogger() : impl_(std::make_unique<Impl>()) {}

ClientLogger::~ClientLogger() = default;

ClientLogger::ClientLogger(ClientLogger&&) noexcept = default;
ClientLogger& ClientLogger::operator=(ClientLogger&&) noexcept = default;

void ClientLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void ClientLogger::logWithContext(LogLevel level, LogCategory cat,
                                  std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void ClientLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel ClientLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool ClientLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

ClientResult<void> ClientLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return ClientResult<void>::err(
            ClientError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return ClientResult<void>::ok();
}

ClientLogger& ClientLogger::instance() {
    static ClientLogger inst;
    return inst;
}

} // namespace cgc::foundation
