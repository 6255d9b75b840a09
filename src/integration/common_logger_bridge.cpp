/**
 * @file common_logger_bridge.cpp
 * @brief logger_adapter implementation over common_system's ILogger
 *
 * @see include/edi/x12/integration/common_logger_bridge.h
 */

#include "edi/x12/integration/common_logger_bridge.h"

namespace edi::x12::integration {

namespace {

// =============================================================================
// Log Level Conversion
// =============================================================================

kcenon::common::interfaces::log_level to_kcenon_level(log_level level) {
    switch (level) {
        case log_level::trace:
            return kcenon::common::interfaces::log_level::trace;
        case log_level::debug:
            return kcenon::common::interfaces::log_level::debug;
        case log_level::info:
            return kcenon::common::interfaces::log_level::info;
        case log_level::warning:
            return kcenon::common::interfaces::log_level::warning;
        case log_level::error:
            return kcenon::common::interfaces::log_level::error;
        case log_level::critical:
            return kcenon::common::interfaces::log_level::critical;
        default:
            return kcenon::common::interfaces::log_level::info;
    }
}

log_level from_kcenon_level(kcenon::common::interfaces::log_level level) {
    switch (level) {
        case kcenon::common::interfaces::log_level::trace:
            return log_level::trace;
        case kcenon::common::interfaces::log_level::debug:
            return log_level::debug;
        case kcenon::common::interfaces::log_level::info:
            return log_level::info;
        case kcenon::common::interfaces::log_level::warning:
            return log_level::warning;
        case kcenon::common::interfaces::log_level::error:
            return log_level::error;
        case kcenon::common::interfaces::log_level::critical:
        case kcenon::common::interfaces::log_level::off:
            return log_level::critical;
        default:
            return log_level::info;
    }
}

// =============================================================================
// ilogger_adapter
// =============================================================================

class ilogger_adapter : public logger_adapter {
public:
    explicit ilogger_adapter(
        std::shared_ptr<kcenon::common::interfaces::ILogger> logger)
        : logger_(std::move(logger)) {
        if (logger_) {
            current_level_ = from_kcenon_level(logger_->get_level());
        }
    }

    void log(log_level level, std::string_view message) override {
        if (!logger_ || !is_enabled(level)) {
            return;
        }
        // ILogger results are advisory here
        (void)logger_->log(to_kcenon_level(level), message);
    }

    void set_level(log_level level) override {
        current_level_ = level;
        if (logger_) {
            (void)logger_->set_level(to_kcenon_level(level));
        }
    }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_;
    }

    void flush() override {
        if (logger_) {
            (void)logger_->flush();
        }
    }

private:
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger_;
    log_level current_level_{log_level::info};
};

}  // namespace

std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger) {
    return std::make_unique<ilogger_adapter>(std::move(logger));
}

void set_default_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger) {
    set_default_logger(create_logger(std::move(logger)));
}

}  // namespace edi::x12::integration
