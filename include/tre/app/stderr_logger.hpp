#pragma once

/// @file stderr_logger.hpp
/// @brief Minimal ILogger sink that prints to standard error.

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace tre::app {

/// Writes "LEVEL message" lines to a stream (std::cerr by default).
///
/// Registered as the GlobalLoggerRegistry default logger by tre_rate so
/// that EngineLogger output has somewhere to go.
class StderrLogger : public kcenon::common::interfaces::ILogger {
public:
    using log_level = kcenon::common::interfaces::log_level;

    StderrLogger();
    explicit StderrLogger(std::ostream& out);

    kcenon::common::VoidResult log(log_level level, const std::string& message) override;

    kcenon::common::VoidResult log(
        log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(log_level level) const override;
    kcenon::common::VoidResult set_level(log_level level) override;
    log_level get_level() const override;
    kcenon::common::VoidResult flush() override;

private:
    std::ostream& out_;
    std::mutex mutex_;
    std::atomic<log_level> minLevel_{log_level::trace};
};

} // namespace tre::app
