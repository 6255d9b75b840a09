/**
 * @file logger_adapter.cpp
 * @brief Console logger adapter and global logger management
 *
 * The ILogger-backed adapter lives in common_logger_bridge.cpp and is
 * only compiled for ecosystem builds.
 *
 * @see include/edi/x12/integration/logger_adapter.h
 */

#include "edi/x12/integration/logger_adapter.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace edi::x12::integration {

namespace {

/**
 * @brief Get log level name string
 */
const char* level_name(log_level level) {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warning:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::critical:
            return "CRIT";
        default:
            return "UNKNOWN";
    }
}

}  // namespace

// =============================================================================
// console_logger_adapter
// =============================================================================

/**
 * @class console_logger_adapter
 * @brief Timestamped logger writing to stdout, or stderr for errors
 */
class console_logger_adapter : public logger_adapter {
public:
    explicit console_logger_adapter(std::string_view name) : name_(name) {}

    void log(log_level level, std::string_view message) override {
        if (!is_enabled(level)) {
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::tm local_tm{};
        localtime_r(&time, &local_tm);

        std::ostringstream oss;
        oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count() << " ["
            << level_name(level) << "] ";

        if (!name_.empty()) {
            oss << "[" << name_ << "] ";
        }

        oss << message << '\n';

        auto& stream = (level >= log_level::error) ? std::cerr : std::cout;
        stream << oss.str();
    }

    void set_level(log_level level) override { current_level_ = level; }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout.flush();
        std::cerr.flush();
    }

private:
    std::string name_;
    log_level current_level_{log_level::info};
    std::mutex mutex_;
};

// =============================================================================
// Global Logger Instance
// =============================================================================

namespace {

std::unique_ptr<logger_adapter> g_default_logger;
std::mutex g_logger_mutex;

}  // namespace

logger_adapter& get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (!g_default_logger) {
        g_default_logger = std::make_unique<console_logger_adapter>("x12_edi");
    }

    return *g_default_logger;
}

std::unique_ptr<logger_adapter> create_logger(std::string_view name) {
    return std::make_unique<console_logger_adapter>(name);
}

void set_default_logger(std::unique_ptr<logger_adapter> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger = std::move(logger);
}

void reset_default_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_default_logger.reset();
}

}  // namespace edi::x12::integration
