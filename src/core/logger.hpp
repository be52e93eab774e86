#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (computation + search loggers).

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <string>

namespace almanac::core
{
    /// @brief Logger setup. Defaults match a library embedded in a host program.
    struct LoggerConfig
    {
        std::string file_path = "almanac.log";
        std::size_t max_file_size = 5 * 1024 * 1024;  // 5 MB
        std::size_t max_files = 3;
        spdlog::level::level_enum level = spdlog::level::info;
        bool console = true;
        bool file = true;
    };

    /// @brief Centralized logging facility for Almanac.
    ///
    /// Provides two separate loggers:
    /// - **ALMANAC** (core): time scales, frame transforms, ephemeris, solvers
    /// - **SEARCH**: event finders (rise/set, seasons, lunar phases, apsides)
    ///
    /// Both write to the same sinks. init() is optional: the first log
    /// statement initializes the loggers with a default LoggerConfig.
    class Logger
    {
    public:
        /// @brief Initialize both loggers from the given configuration.
        /// Replaces any loggers created earlier.
        static void init(const LoggerConfig& config = {});

        /// @brief Flush and tear down all loggers.
        static void shutdown();

        /// @brief Access the core logger ("ALMANAC").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the event-search logger ("SEARCH").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_search_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_search_logger;
    };

} // namespace almanac::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ALM_CORE_TRACE(...)    ::almanac::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ALM_CORE_DEBUG(...)    ::almanac::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define ALM_CORE_INFO(...)     ::almanac::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ALM_CORE_WARN(...)     ::almanac::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ALM_CORE_ERROR(...)    ::almanac::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ALM_CORE_CRITICAL(...) ::almanac::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Event search log macros
// -----------------------------------------------------------------
#define ALM_TRACE(...)         ::almanac::core::Logger::get_search_logger()->trace(__VA_ARGS__)
#define ALM_DEBUG(...)         ::almanac::core::Logger::get_search_logger()->debug(__VA_ARGS__)
#define ALM_INFO(...)          ::almanac::core::Logger::get_search_logger()->info(__VA_ARGS__)
#define ALM_WARN(...)          ::almanac::core::Logger::get_search_logger()->warn(__VA_ARGS__)
#define ALM_ERROR(...)         ::almanac::core::Logger::get_search_logger()->error(__VA_ARGS__)
#define ALM_CRITICAL(...)      ::almanac::core::Logger::get_search_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
