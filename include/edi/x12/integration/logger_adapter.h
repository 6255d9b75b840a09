#ifndef EDI_X12_INTEGRATION_LOGGER_ADAPTER_H
#define EDI_X12_INTEGRATION_LOGGER_ADAPTER_H

/**
 * @file logger_adapter.h
 * @brief Integration Module - Logger adapter
 *
 * Provides structured logging for parser operations. The default logger
 * writes timestamped lines to stdout/stderr; ecosystem builds can route
 * through common_system's ILogger instead (see common_logger_bridge.h).
 */

#include <memory>
#include <string>
#include <string_view>

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
     * @brief Check whether a level passes the current filter
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
 * A console logger named "x12_edi" is created on first use.
 */
[[nodiscard]] logger_adapter& get_logger();

/**
 * @brief Create a named console logger
 * @param name Logger name/category
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::string_view name);

/**
 * @brief Replace the global logger
 * @param logger New global logger; null restores the console default
 */
void set_default_logger(std::unique_ptr<logger_adapter> logger);

/**
 * @brief Drop the global logger so the next get_logger() recreates it
 */
void reset_default_logger();

}  // namespace edi::x12::integration

#endif  // EDI_X12_INTEGRATION_LOGGER_ADAPTER_H
