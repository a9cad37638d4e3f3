#ifndef EDI_X12_INTEGRATION_LOGGER_ADAPTER_H
#define EDI_X12_INTEGRATION_LOGGER_ADAPTER_H

/**
 * @file logger_adapter.h
 * @brief Integration Module - Logger system adapter
 *
 * Provides structured logging for delimiter inspection. Wraps the
 * common_system ILogger when one is installed, otherwise logs to the
 * console.
 */

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::common::interfaces {
class ILogger;
}  // namespace kcenon::common::interfaces

namespace edi::x12::integration {

/**
 * @brief Log levels
 */
enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

/**
 * @brief Parse a log level name (trace, debug, info, warn/warning, error,
 *        critical/fatal), case-insensitive
 */
[[nodiscard]] std::optional<log_level> parse_log_level(std::string_view name);

/**
 * @brief Logger adapter interface
 */
class logger_adapter {
public:
    virtual ~logger_adapter() = default;

    /**
     * @brief Log a message at specified level
     * @param level Log level
     * @param message Log message
     */
    virtual void log(log_level level, std::string_view message) = 0;

    void trace(std::string_view message) { log(log_level::trace, message); }

    void debug(std::string_view message) { log(log_level::debug, message); }

    void info(std::string_view message) { log(log_level::info, message); }

    void warning(std::string_view message) { log(log_level::warning, message); }

    void error(std::string_view message) { log(log_level::error, message); }

    void critical(std::string_view message) {
        log(log_level::critical, message);
    }

    /**
     * @brief Set minimum log level
     * @param level Minimum level to log
     */
    virtual void set_level(log_level level) = 0;

    /**
     * @brief Get current log level
     */
    [[nodiscard]] virtual log_level get_level() const noexcept = 0;

    /**
     * @brief Check whether a message at the given level would be emitted
     */
    [[nodiscard]] bool is_enabled(log_level level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(get_level());
    }

    /**
     * @brief Flush pending log entries
     */
    virtual void flush() = 0;
};

/**
 * @brief Get the global logger instance
 *
 * The returned pointer keeps the instance alive for as long as the caller
 * holds it, even if set_default_logger() or reset_default_logger() replaces
 * the global instance meanwhile.
 *
 * @return Shared logger adapter instance
 */
[[nodiscard]] std::shared_ptr<logger_adapter> get_logger();

/**
 * @brief Create a named console logger instance
 * @param name Logger name/category
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::string_view name);

/**
 * @brief Create a logger that forwards to a common_system ILogger
 *
 * A null ILogger yields an adapter that drops every message.
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Route the global logger through a common_system ILogger
 */
void set_default_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Drop the global logger; the next get_logger() recreates the console one
 *
 * Callers still holding the previous instance keep using it until they
 * release it.
 */
void reset_default_logger();

} // namespace edi::x12::integration

#endif // EDI_X12_INTEGRATION_LOGGER_ADAPTER_H
