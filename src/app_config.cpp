#include "app_config.hpp"

// import usbreset
#include "usbreset/file_utils.hpp"

#include <algorithm>    // for ranges::find
#include <array>        // for array
#include <expected>     // for expected, unexpected
#include <filesystem>   // for status, file_type
#include <string>       // for string
#include <system_error> // for error_code
#include <string_view>  // for string_view

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace fs = std::filesystem;

namespace {

constexpr std::array LOG_LEVEL_NAMES{"trace"sv, "debug"sv, "info"sv, "warn"sv, "error"sv, "critical"sv, "off"sv};

}  // namespace

namespace reset {

auto get_default_config() noexcept -> AppConfig {
    return AppConfig{};
}

auto parse_app_config(std::string_view json_content) noexcept
    -> std::expected<AppConfig, std::string> {
    if (json_content.empty()) {
        return get_default_config();
    }

    rapidjson::Document doc;
    doc.Parse(json_content.data(), json_content.size());
    if (doc.HasParseError()) {
        return std::unexpected(fmt::format(FMT_COMPILE("JSON parse error at offset {}: {}"), doc.GetErrorOffset(), rapidjson::GetParseError_En(doc.GetParseError())));
    }
    if (!doc.IsObject()) {
        return std::unexpected("JSON root must be an object");
    }

    auto config = get_default_config();

    // Parse utility (optional, default diskpart)
    if (doc.HasMember("utility")) {
        if (!doc["utility"].IsString() || doc["utility"].GetStringLength() == 0) {
            return std::unexpected("'utility' must be a non-empty string");
        }
        config.utility = doc["utility"].GetString();
    }

    // Parse log_file (optional)
    if (doc.HasMember("log_file")) {
        if (!doc["log_file"].IsString() || doc["log_file"].GetStringLength() == 0) {
            return std::unexpected("'log_file' must be a non-empty string");
        }
        config.log_file = doc["log_file"].GetString();
    }

    // Parse log_level (optional, default debug)
    if (doc.HasMember("log_level")) {
        if (!doc["log_level"].IsString()) {
            return std::unexpected("'log_level' must be a string");
        }
        const std::string_view level_str{doc["log_level"].GetString(), doc["log_level"].GetStringLength()};
        if (std::ranges::find(LOG_LEVEL_NAMES, level_str) == LOG_LEVEL_NAMES.end()) {
            return std::unexpected(fmt::format(FMT_COMPILE("Invalid log level '{}'. Valid levels: trace, debug, info, warn, error, critical, off"), level_str));
        }
        config.log_level = spdlog::level::from_str(std::string{level_str});
    }

    // Parse list_disks (optional, default true)
    if (doc.HasMember("list_disks")) {
        if (!doc["list_disks"].IsBool()) {
            return std::unexpected("'list_disks' must be a boolean");
        }
        config.list_disks = doc["list_disks"].GetBool();
    }

    return config;
}

auto config_file_exists(std::string_view filepath) noexcept
    -> std::expected<bool, std::string> {
    std::error_code ec{};
    const auto& status = fs::status(std::string{filepath}, ec);
    if (status.type() == fs::file_type::not_found) {
        return false;
    }
    if (ec) {
        return std::unexpected(fmt::format(FMT_COMPILE("Cannot access config '{}': {}"), filepath, ec.message()));
    }
    if (status.type() != fs::file_type::regular) {
        return std::unexpected(fmt::format(FMT_COMPILE("Config '{}' is not a regular file"), filepath));
    }
    return true;
}

auto load_app_config(std::string_view filepath) noexcept
    -> std::expected<AppConfig, std::string> {
    const auto& content = usbreset::file_utils::read_whole_file(filepath);
    if (!content) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to read config '{}'"), filepath));
    }
    return parse_app_config(*content);
}

}  // namespace reset
