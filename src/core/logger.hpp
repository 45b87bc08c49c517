#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library core + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

namespace almanac::core
{
    /// @brief Centralized logging facility for Almanac.
    ///
    /// Provides two separate loggers:
    /// - **ALMANAC** (core): solar engine, image store, request queue
    /// - **APP**: command-line front end, user-facing messages
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging. Library code that
    /// may run without init() (unit tests) calls ensure_initialized(), which
    /// falls back to console-only loggers.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        static void init();

        /// @brief Create console-only loggers if init() has not been called yet.
        static void ensure_initialized();

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the library logger ("ALMANAC").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static void install(std::vector<spdlog::sink_ptr> sinks);

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace almanac::core

// -----------------------------------------------------------------
// Library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ALM_CORE_TRACE(...)    ::almanac::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ALM_CORE_DEBUG(...)    ::almanac::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define ALM_CORE_INFO(...)     ::almanac::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ALM_CORE_WARN(...)     ::almanac::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ALM_CORE_ERROR(...)    ::almanac::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ALM_CORE_CRITICAL(...) ::almanac::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ALM_TRACE(...)         ::almanac::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ALM_INFO(...)          ::almanac::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ALM_WARN(...)          ::almanac::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ALM_ERROR(...)         ::almanac::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ALM_CRITICAL(...)      ::almanac::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
