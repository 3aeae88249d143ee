#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest_compatibility.h"

#include "app_config.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_literals;
using namespace std::string_view_literals;

namespace fs = std::filesystem;

TEST_CASE("app config parsing")
{
    auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger    = std::make_shared<spdlog::logger>("default", null_sink);
    spdlog::set_default_logger(logger);

    SECTION("empty config returns defaults")
    {
        auto result = reset::parse_app_config(""sv);
        REQUIRE(result.has_value());

        auto& config = *result;
        REQUIRE_EQ(config.utility, "diskpart"s);
        REQUIRE_EQ(config.log_file, "/tmp/usb-reset.log"s);
        REQUIRE(config.log_level == spdlog::level::debug);
        REQUIRE(config.list_disks);
    }
    SECTION("empty object returns defaults")
    {
        auto result = reset::parse_app_config("{}"sv);
        REQUIRE(result.has_value());
        REQUIRE_EQ(result->utility, "diskpart"s);
        REQUIRE(result->list_disks);
    }
    SECTION("valid complete config")
    {
        constexpr auto json = R"({
            "utility": "/usr/local/bin/diskpart-compat",
            "log_file": "/var/log/usb-reset.log",
            "log_level": "warn",
            "list_disks": false
        })"sv;
        auto result = reset::parse_app_config(json);
        REQUIRE(result.has_value());

        auto& config = *result;
        REQUIRE_EQ(config.utility, "/usr/local/bin/diskpart-compat"s);
        REQUIRE_EQ(config.log_file, "/var/log/usb-reset.log"s);
        REQUIRE(config.log_level == spdlog::level::warn);
        REQUIRE(!config.list_disks);
    }
    SECTION("every log level name")
    {
        for (const auto& [name, level] : {std::pair{"trace"sv, spdlog::level::trace}, std::pair{"info"sv, spdlog::level::info},
                 std::pair{"error"sv, spdlog::level::err}, std::pair{"critical"sv, spdlog::level::critical}, std::pair{"off"sv, spdlog::level::off}}) {
            const auto& json = "{\"log_level\": \""s + std::string{name} + "\"}"s;
            auto result      = reset::parse_app_config(json);
            REQUIRE(result.has_value());
            CHECK(result->log_level == level);
        }
    }
    SECTION("invalid json")
    {
        auto result = reset::parse_app_config(R"({"utility": )"sv);
        REQUIRE(!result.has_value());
        CHECK(result.error().contains("JSON parse error"sv));
    }
    SECTION("root must be an object")
    {
        auto result = reset::parse_app_config("[1, 2]"sv);
        REQUIRE(!result.has_value());
        CHECK_EQ(result.error(), "JSON root must be an object"s);
    }
    SECTION("wrong types")
    {
        CHECK_EQ(reset::parse_app_config(R"({"utility": 5})"sv).error(), "'utility' must be a non-empty string"s);
        CHECK_EQ(reset::parse_app_config(R"({"utility": ""})"sv).error(), "'utility' must be a non-empty string"s);
        CHECK_EQ(reset::parse_app_config(R"({"log_file": true})"sv).error(), "'log_file' must be a non-empty string"s);
        CHECK_EQ(reset::parse_app_config(R"({"log_level": 1})"sv).error(), "'log_level' must be a string"s);
        CHECK_EQ(reset::parse_app_config(R"({"list_disks": "yes"})"sv).error(), "'list_disks' must be a boolean"s);
    }
    SECTION("unknown log level")
    {
        auto result = reset::parse_app_config(R"({"log_level": "verbose"})"sv);
        REQUIRE(!result.has_value());
        CHECK(result.error().contains("Invalid log level 'verbose'"sv));
    }
}

TEST_CASE("app config loading")
{
    auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger    = std::make_shared<spdlog::logger>("default", null_sink);
    spdlog::set_default_logger(logger);

    const auto& filename = (fs::temp_directory_path() / "usb-reset-test-config.json").string();

    SECTION("reads file")
    {
        {
            std::ofstream config_file{filename};
            REQUIRE(config_file.is_open());
            config_file << R"({"utility": "cat", "list_disks": false})";
        }
        auto result = reset::load_app_config(filename);
        fs::remove(filename);

        REQUIRE(result.has_value());
        CHECK_EQ(result->utility, "cat"s);
        CHECK(!result->list_disks);
    }
    SECTION("missing file")
    {
        fs::remove(filename);
        auto result = reset::load_app_config(filename);
        REQUIRE(!result.has_value());
        CHECK(result.error().contains("Failed to read config"sv));
    }
}

TEST_CASE("app config lookup")
{
    auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger    = std::make_shared<spdlog::logger>("default", null_sink);
    spdlog::set_default_logger(logger);

    const auto& config_dir = fs::temp_directory_path() / "usb-reset-test-lookup";
    fs::remove_all(config_dir);
    REQUIRE(fs::create_directories(config_dir));
    const auto& filename = (config_dir / "config.json").string();

    SECTION("no file means defaults")
    {
        auto result = reset::config_file_exists(filename);
        REQUIRE(result.has_value());
        CHECK(!*result);
    }
    SECTION("regular file is found")
    {
        std::ofstream{filename} << "{}";
        auto result = reset::config_file_exists(filename);
        REQUIRE(result.has_value());
        CHECK(*result);
    }
    SECTION("symlink loop is an error")
    {
        fs::create_symlink(filename, filename);
        auto result = reset::config_file_exists(filename);
        REQUIRE(!result.has_value());
        CHECK(result.error().contains("Cannot access config"sv));
    }
    SECTION("directory is an error")
    {
        REQUIRE(fs::create_directory(filename));
        auto result = reset::config_file_exists(filename);
        REQUIRE(!result.has_value());
        CHECK(result.error().contains("is not a regular file"sv));

        auto loaded = reset::load_app_config(filename);
        REQUIRE(!loaded.has_value());
        CHECK(loaded.error().contains("Failed to read config"sv));
    }

    fs::remove_all(config_dir);
}
