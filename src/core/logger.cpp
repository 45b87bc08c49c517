/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers with console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace almanac::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{
    std::mutex g_logger_mutex;

    constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";
}

void Logger::init()
{
    std::lock_guard lock(g_logger_mutex);

    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------

    // Console sink with color output
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);

    // Rotating file sink: 5 MB max size, 3 rotated files
    constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024; // 5 MB
    constexpr std::size_t kMaxFiles = 3;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "almanac.log", kMaxFileSize, kMaxFiles);
    file_sink->set_pattern(kPattern);

    install({console_sink, file_sink});
}

void Logger::ensure_initialized()
{
    std::lock_guard lock(g_logger_mutex);
    if (s_core_logger && s_app_logger)
    {
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    install({console_sink});
}

void Logger::install(std::vector<spdlog::sink_ptr> sinks)
{
    // Re-initialization replaces any previously registered loggers
    spdlog::drop("ALMANAC");
    spdlog::drop("APP");

    // -----------------------------------------------------------------
    // Core logger ("ALMANAC"): library internals
    // -----------------------------------------------------------------
    s_core_logger = std::make_shared<spdlog::logger>("ALMANAC", sinks.begin(), sinks.end());
    s_core_logger->set_level(spdlog::level::debug);
    s_core_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_core_logger);

    // -----------------------------------------------------------------
    // App logger ("APP"): command-line front end
    // -----------------------------------------------------------------
    s_app_logger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_app_logger->set_level(spdlog::level::trace);
    s_app_logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(s_app_logger);
}

void Logger::shutdown()
{
    std::lock_guard lock(g_logger_mutex);
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace almanac::core
