/// @file logger.cpp
/// @brief Logger implementation: two spdlog loggers over console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace almanac::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_search_logger;

namespace
{
    std::mutex s_init_mutex;

    std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                                const std::vector<spdlog::sink_ptr>& sinks,
                                                spdlog::level::level_enum level)
    {
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::drop(name);
        spdlog::register_logger(logger);
        return logger;
    }

    void init_locked(const LoggerConfig& config,
                     std::shared_ptr<spdlog::logger>& core,
                     std::shared_ptr<spdlog::logger>& search)
    {
        // -----------------------------------------------------------------
        // Shared sinks: both loggers write to the same console and file
        // -----------------------------------------------------------------
        std::vector<spdlog::sink_ptr> sinks;

        if (config.console)
        {
            auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            console_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
            sinks.push_back(console_sink);
        }

        if (config.file && !config.file_path.empty())
        {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path, config.max_file_size, config.max_files);
            file_sink->set_pattern("[%T.%e] [%n] [%^%l%$] %v");
            sinks.push_back(file_sink);
        }

        core = make_logger("ALMANAC", sinks, config.level);
        search = make_logger("SEARCH", sinks, config.level);
    }
}

void Logger::init(const LoggerConfig& config)
{
    const std::lock_guard<std::mutex> lock(s_init_mutex);
    init_locked(config, s_core_logger, s_search_logger);
}

void Logger::shutdown()
{
    const std::lock_guard<std::mutex> lock(s_init_mutex);
    s_core_logger.reset();
    s_search_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    const std::lock_guard<std::mutex> lock(s_init_mutex);
    if (!s_core_logger)
    {
        init_locked(LoggerConfig{}, s_core_logger, s_search_logger);
    }
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_search_logger()
{
    const std::lock_guard<std::mutex> lock(s_init_mutex);
    if (!s_search_logger)
    {
        init_locked(LoggerConfig{}, s_core_logger, s_search_logger);
    }
    return s_search_logger;
}

} // namespace almanac::core
