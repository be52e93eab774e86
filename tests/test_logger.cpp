/// @file test_logger.cpp
/// @brief Unit tests for almanac::core::Logger.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace almanac::core;

// =================================================================
// Helpers
// =================================================================

static std::string read_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// =================================================================
// Tests
// =================================================================

TEST_CASE("Loggers are created on first use")
{
    Logger::shutdown();
    CHECK(Logger::get_core_logger() != nullptr);
    CHECK(Logger::get_search_logger() != nullptr);
    CHECK(Logger::get_core_logger()->name() == "ALMANAC");
    CHECK(Logger::get_search_logger()->name() == "SEARCH");
    Logger::shutdown();
}

TEST_CASE("Both loggers write to the configured file")
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "almanac_test_logger.log";
    std::filesystem::remove(path);

    Logger::init(LoggerConfig{
        .file_path = path.string(),
        .level     = spdlog::level::trace,
        .console   = false,
    });

    ALM_CORE_INFO("core message {}", 1);
    ALM_WARN("search message {}", 2);
    Logger::get_core_logger()->flush();
    Logger::get_search_logger()->flush();
    Logger::shutdown();

    const std::string text = read_file(path);
    CHECK(text.find("[ALMANAC]") != std::string::npos);
    CHECK(text.find("core message 1") != std::string::npos);
    CHECK(text.find("[SEARCH]") != std::string::npos);
    CHECK(text.find("search message 2") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("Messages below the configured level are dropped")
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / "almanac_test_level.log";
    std::filesystem::remove(path);

    Logger::init(LoggerConfig{
        .file_path = path.string(),
        .level     = spdlog::level::warn,
        .console   = false,
    });

    ALM_CORE_DEBUG("hidden debug");
    ALM_CORE_ERROR("visible error");
    Logger::get_core_logger()->flush();
    Logger::shutdown();

    const std::string text = read_file(path);
    CHECK(text.find("hidden debug") == std::string::npos);
    CHECK(text.find("visible error") != std::string::npos);

    std::filesystem::remove(path);
}

TEST_CASE("Logging without any sink is allowed")
{
    Logger::init(LoggerConfig{.console = false, .file = false});
    CHECK_NOTHROW(ALM_INFO("goes nowhere"));
    Logger::shutdown();
}
