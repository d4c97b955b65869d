/// formflow unit tests — logger file output, level filtering, shutdown

#include "test_framework.hpp"

#include <formflow/core/log.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

// =============================================================================
// Helpers
// =============================================================================

static std::string read_file_contents(const std::string& path) {
    std::ifstream f(path);
    return std::string(std::istreambuf_iterator<char>(f),
                       std::istreambuf_iterator<char>());
}

static std::string temp_log_path(const char* name) {
    auto dir = std::filesystem::temp_directory_path();
    return (dir / name).string();
}

// =============================================================================
// Tests
// =============================================================================

TEST(log_file_output) {
    auto path = temp_log_path("formflow_test_text.log");
    std::filesystem::remove(path);

    logger::init_with_file("test", path, logger::level::info);
    logger::info("hello text");
    logger::flush();
    logger::shutdown();

    auto contents = read_file_contents(path);
    // [timestamp] [info] [thread] [file:line] hello text
    ASSERT_TRUE(contents.find("hello text") != std::string::npos);
    ASSERT_TRUE(contents.find("[info]") != std::string::npos);
    ASSERT_TRUE(contents.find("test_log.cpp") != std::string::npos);

    std::filesystem::remove(path);
}

TEST(log_level_filtering) {
    auto path = temp_log_path("formflow_test_filter.log");
    std::filesystem::remove(path);

    logger::init_with_file("test", path, logger::level::warn);
    logger::debug("should not appear");
    logger::info("should not appear");
    logger::warn("warning message");
    logger::error("error message");
    logger::flush();
    logger::shutdown();

    auto contents = read_file_contents(path);
    ASSERT_TRUE(contents.find("should not appear") == std::string::npos);
    ASSERT_TRUE(contents.find("warning message") != std::string::npos);
    ASSERT_TRUE(contents.find("error message") != std::string::npos);

    std::filesystem::remove(path);
}

TEST(log_set_level_dynamic) {
    auto path = temp_log_path("formflow_test_setlevel.log");
    std::filesystem::remove(path);

    logger::init_with_file("test", path, logger::level::info);
    logger::info("visible");
    logger::set_level(logger::level::error);
    logger::info("invisible after set_level");
    logger::error("error after set_level");
    logger::flush();
    logger::shutdown();

    auto contents = read_file_contents(path);
    ASSERT_TRUE(contents.find("visible") != std::string::npos);
    ASSERT_TRUE(contents.find("invisible after set_level") == std::string::npos);
    ASSERT_TRUE(contents.find("error after set_level") != std::string::npos);

    std::filesystem::remove(path);
}

TEST(log_format_string_args) {
    auto path = temp_log_path("formflow_test_fmtargs.log");
    std::filesystem::remove(path);

    logger::init_with_file("test", path, logger::level::info);
    std::string name = "avatar";
    logger::info("value={} field={}", 42, name);
    logger::flush();
    logger::shutdown();

    auto contents = read_file_contents(path);
    ASSERT_TRUE(contents.find("value=42 field=avatar") != std::string::npos);

    std::filesystem::remove(path);
}

TEST(log_shutdown_detaches_file) {
    auto path = temp_log_path("formflow_test_shutdown.log");
    std::filesystem::remove(path);

    logger::init_with_file("test", path, logger::level::info);
    logger::info("before shutdown");
    logger::shutdown();
    logger::info("after shutdown");
    logger::flush();

    auto contents = read_file_contents(path);
    ASSERT_TRUE(contents.find("before shutdown") != std::string::npos);
    ASSERT_TRUE(contents.find("after shutdown") == std::string::npos);

    std::filesystem::remove(path);
}

TEST(log_init_console_only) {
    // 只输出到 stderr，不应抛出
    logger::init("console", logger::level::debug);
    logger::debug("console debug {}", 1);
    logger::critical("console critical");
    logger::init();
    ASSERT_TRUE(true);
}

RUN_TESTS()
