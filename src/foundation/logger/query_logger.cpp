/// @file query_logger.cpp
/// @brief QueryLogger implementation over kcenon common_system logging.

#include "lq/foundation/query_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <cctype>
#include <string>

namespace lq::foundation {

namespace interfaces = kcenon::common::interfaces;

namespace {

// Indexed by LogLevel.
constexpr std::array<interfaces::log_level, 7> kKcenonLevels = {
    interfaces::log_level::trace,
    interfaces::log_level::debug,
    interfaces::log_level::info,
    interfaces::log_level::warning,
    interfaces::log_level::error,
    interfaces::log_level::critical,
    interfaces::log_level::off,
};

interfaces::log_level toKcenon(LogLevel level) {
    auto idx = static_cast<std::size_t>(level);
    return idx < kKcenonLevels.size() ? kKcenonLevels[idx] : interfaces::log_level::info;
}

// Indexed by LogCategory.
constexpr std::array<LogLevel, kLogCategoryCount> kDefaultLevels = {
    LogLevel::Info,     // Core
    LogLevel::Info,     // Object
    LogLevel::Warning,  // Source
    LogLevel::Warning,  // Query
};

// "key=val, key=val"; empty when the context carries nothing.
std::string renderContext(const LogContext& ctx) {
    std::string out;
    auto field = [&out](std::string_view key, std::string_view val) {
        if (!out.empty()) {
            out += ", ";
        }
        out.append(key).append("=").append(val);
    };

    if (ctx.operation && !ctx.operation->empty()) {
        field("operation", *ctx.operation);
    }
    if (ctx.itemIndex) {
        field("item_index", std::to_string(*ctx.itemIndex));
    }
    for (const auto& [key, val] : ctx.extra) {
        field(key, val);
    }
    return out;
}

// [Category] message {context}
std::string renderLine(LogCategory cat, std::string_view msg, const std::string& context) {
    std::string line;
    line.reserve(msg.size() + context.size() + 16);
    line.append("[").append(logCategoryName(cat)).append("] ").append(msg);
    if (!context.empty()) {
        line.append(" {").append(context).append("}");
    }
    return line;
}

} // namespace

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (key == "warn") {
        return LogLevel::Warning;
    }
    for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Off); ++i) {
        auto level = static_cast<LogLevel>(i);
        std::string candidate(logLevelName(level));
        for (auto& c : candidate) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (candidate == key) {
            return level;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------

/// One category: its threshold and the registry name it logs under.
struct Channel {
    std::atomic<LogLevel> threshold{LogLevel::Info};
    std::string registryName;
};

struct QueryLogger::Impl {
    std::array<Channel, kLogCategoryCount> channels;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            channels[i].threshold.store(kDefaultLevels[i], std::memory_order_relaxed);
            channels[i].registryName =
                "lq." + std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    Channel* channel(LogCategory cat) {
        auto idx = static_cast<std::size_t>(cat);
        return idx < kLogCategoryCount ? &channels[idx] : nullptr;
    }

    const Channel* channel(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        return idx < kLogCategoryCount ? &channels[idx] : nullptr;
    }

    // The "lq.<Category>" logger when registered, else the registry default.
    static std::shared_ptr<interfaces::ILogger> sinkFor(const Channel& ch) {
        auto& registry = interfaces::GlobalLoggerRegistry::instance();
        auto named = registry.get_logger(ch.registryName);
        if (named && named != interfaces::GlobalLoggerRegistry::null_logger()) {
            return named;
        }
        return registry.get_default_logger();
    }

    void write(LogLevel level, LogCategory cat, std::string_view msg,
               const std::string& context) const {
        const Channel* ch = channel(cat);
        if (ch == nullptr) {
            return;
        }
        if (auto sink = sinkFor(*ch)) {
            // Sink failures are not reported to query callers.
            (void)sink->log(toKcenon(level), renderLine(cat, msg, context));
        }
    }
};

// ---------------------------------------------------------------------------
// QueryLogger
// ---------------------------------------------------------------------------

QueryLogger::QueryLogger() : impl_(std::make_unique<Impl>()) {}

QueryLogger::~QueryLogger() = default;

QueryLogger::QueryLogger(QueryLogger&&) noexcept = default;
QueryLogger& QueryLogger::operator=(QueryLogger&&) noexcept = default;

void QueryLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (isEnabled(level, cat)) {
        impl_->write(level, cat, msg, std::string());
    }
}

void QueryLogger::logWithContext(LogLevel level, LogCategory cat,
                                 std::string_view msg, const LogContext& ctx) {
    if (isEnabled(level, cat)) {
        impl_->write(level, cat, msg, renderContext(ctx));
    }
}

void QueryLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    if (Channel* ch = impl_->channel(cat)) {
        ch->threshold.store(minLevel, std::memory_order_release);
    }
}

LogLevel QueryLogger::getCategoryLevel(LogCategory cat) const {
    const Channel* ch = impl_->channel(cat);
    return ch != nullptr ? ch->threshold.load(std::memory_order_acquire) : LogLevel::Off;
}

bool QueryLogger::isEnabled(LogLevel level, LogCategory cat) const {
    if (level == LogLevel::Off) {
        return false;
    }
    const Channel* ch = impl_->channel(cat);
    if (ch == nullptr) {
        return false;
    }
    return static_cast<uint8_t>(level) >=
           static_cast<uint8_t>(ch->threshold.load(std::memory_order_acquire));
}

QueryResult<void> QueryLogger::flush() {
    auto logger = interfaces::GlobalLoggerRegistry::instance().get_default_logger();
    if (logger && logger->flush().is_err()) {
        return QueryResult<void>::err(
            QueryError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return QueryResult<void>::ok();
}

QueryLogger& QueryLogger::instance() {
    static QueryLogger inst;
    return inst;
}

} // namespace lq::foundation
