/**
 * @file logger_adapter.cpp
 * @brief Implementation of logger adapter for edi_x12
 *
 * Provides two implementations:
 *   - ilogger_adapter: forwards to a common_system ILogger
 *   - console_logger_adapter: timestamped stdout/stderr output
 */

#include "edi/x12/integration/logger_adapter.h"

#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace edi::x12::integration {

namespace kci = kcenon::common::interfaces;

namespace {

// =============================================================================
// Log Level Conversion
// =============================================================================

constexpr std::array<const char*, 6> LEVEL_NAMES = {
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "CRIT"};

kci::log_level to_kcenon_level(log_level level) {
    switch (level) {
        case log_level::trace:
            return kci::log_level::trace;
        case log_level::debug:
            return kci::log_level::debug;
        case log_level::info:
            return kci::log_level::info;
        case log_level::warning:
            return kci::log_level::warning;
        case log_level::error:
            return kci::log_level::error;
        case log_level::critical:
            return kci::log_level::critical;
    }
    return kci::log_level::info;
}

log_level from_kcenon_level(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:
            return log_level::trace;
        case kci::log_level::debug:
            return log_level::debug;
        case kci::log_level::info:
            return log_level::info;
        case kci::log_level::warning:
            return log_level::warning;
        case kci::log_level::error:
            return log_level::error;
        default:
            return log_level::critical;
    }
}

void report_failure(std::string_view what, const kcenon::common::error_info& error) {
    std::cerr << "[x12_delimiters] " << what << ": " << error.message << '\n';
}

}  // namespace

std::optional<log_level> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warning;
    if (lower == "error") return log_level::error;
    if (lower == "critical" || lower == "fatal") return log_level::critical;
    return std::nullopt;
}

// =============================================================================
// ilogger_adapter - Wraps ILogger
// =============================================================================

class ilogger_adapter : public logger_adapter {
public:
    explicit ilogger_adapter(std::shared_ptr<kci::ILogger> logger)
        : logger_(std::move(logger)) {
        if (logger_) {
            current_level_.store(from_kcenon_level(logger_->get_level()));
        }
    }

    void log(log_level level, std::string_view message) override {
        if (!logger_ || !is_enabled(level)) {
            return;
        }

        auto result = logger_->log(to_kcenon_level(level), message);
        if (result.is_err()) {
            report_failure("logger rejected message", result.error());
        }
    }

    void set_level(log_level level) override {
        current_level_.store(level);
        if (!logger_) {
            return;
        }
        auto result = logger_->set_level(to_kcenon_level(level));
        if (result.is_err()) {
            report_failure("failed to set log level", result.error());
        }
    }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_.load();
    }

    void flush() override {
        if (!logger_) {
            return;
        }
        auto result = logger_->flush();
        if (result.is_err()) {
            report_failure("failed to flush logger", result.error());
        }
    }

private:
    std::shared_ptr<kci::ILogger> logger_;
    std::atomic<log_level> current_level_{log_level::info};
};

// =============================================================================
// console_logger_adapter
// =============================================================================

/**
 * @class console_logger_adapter
 * @brief Timestamped console logger
 *
 * Lines below error go to stdout, error and above to stderr. Output is
 * serialized so concurrent callers never interleave a line.
 */
class console_logger_adapter : public logger_adapter {
public:
    explicit console_logger_adapter(std::string_view name)
        : name_(name) {}

    void log(log_level level, std::string_view message) override {
        if (!is_enabled(level)) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::lock_guard<std::mutex> lock(mutex_);

        // std::localtime shares a static buffer; only called under the lock
        std::ostringstream line;
        line << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S") << '.'
             << std::setfill('0') << std::setw(3) << ms.count() << " ["
             << LEVEL_NAMES[static_cast<std::size_t>(level)] << "] ";
        if (!name_.empty()) {
            line << "[" << name_ << "] ";
        }
        line << message << '\n';

        auto& stream = (level >= log_level::error) ? std::cerr : std::cout;
        stream << line.str();
    }

    void set_level(log_level level) override { current_level_.store(level); }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_.load();
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
    }

private:
    std::string name_;
    std::atomic<log_level> current_level_{log_level::info};
    std::mutex mutex_;
};

// =============================================================================
// Global Logger Instance
// =============================================================================

namespace {

std::shared_ptr<logger_adapter> g_default_logger;
std::mutex g_logger_mutex;

}  // namespace

std::shared_ptr<logger_adapter> get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (!g_default_logger) {
        g_default_logger = std::make_shared<console_logger_adapter>("x12_delimiters");
    }

    return g_default_logger;
}

std::unique_ptr<logger_adapter> create_logger(std::string_view name) {
    return std::make_unique<console_logger_adapter>(name);
}

std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kci::ILogger> logger) {
    return std::make_unique<ilogger_adapter>(std::move(logger));
}

void set_default_logger(std::shared_ptr<kci::ILogger> logger) {
    auto replacement = std::make_shared<ilogger_adapter>(std::move(logger));

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger.swap(replacement);
}

void reset_default_logger() {
    std::shared_ptr<logger_adapter> previous;

    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger.swap(previous);
}

}  // namespace edi::x12::integration
