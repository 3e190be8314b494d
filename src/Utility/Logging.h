//
// Logging
//   Debug and scope tracing through spdlog. Compiled in only when the
//   library is configured with QSW_ENABLE_LOGGING, otherwise every macro
//   expands to nothing.
//
#pragma once

#if defined(QSW_LOGGING_ENABLED)

#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <spdlog/fmt/ostr.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace qsw::debug {
    // a singleton logger for scope messages
    inline auto scope_logger = spdlog::stdout_color_mt("qsw_scope");

    inline int logger_init() {
        scope_logger->set_pattern("[scope %t| %v");
        spdlog::set_level(spdlog::level::debug);
        return 0;
    }

    inline int log_init_{logger_init()};

    // logs the message once on entry and once on exit of the enclosing scope
    struct scoped_var {
        std::string message_;

        explicit scoped_var(std::string message)
            : message_(std::move(message)) {
            scope_logger->info("enter {}", message_);
        }

        ~scoped_var() { scope_logger->info("leave {}", message_); }
    };

}  // namespace qsw::debug

#define SPDLOG_SCOPE(...) qsw::debug::scoped_var scope(fmt::format(__VA_ARGS__));

#else

// In increasing level
#define SPDLOG_TRACE(...)
#define SPDLOG_DEBUG(...)
#define SPDLOG_INFO(...)
#define SPDLOG_WARN(...)
#define SPDLOG_ERROR(...)
#define SPDLOG_CRITICAL(...)
//
#define SPDLOG_SCOPE(...)

#endif
