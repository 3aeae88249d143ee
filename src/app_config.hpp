#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

#include <spdlog/common.h>

namespace reset {

/// Where the configuration is looked up when present.
inline constexpr std::string_view DEFAULT_CONFIG_PATH = "/etc/usb-reset/config.json";

/// Runtime configuration of the reset tool.
struct AppConfig {
    /// Scripting utility the command script is piped into.
    std::string utility{"diskpart"};
    std::string log_file{"/tmp/usb-reset.log"};
    spdlog::level::level_enum log_level{spdlog::level::debug};
    /// Print the advisory disk listing before prompting.
    bool list_disks{true};
};

/// Parses configuration from JSON string content.
/// @param json_content The JSON configuration content.
/// @return AppConfig on success, or error string on failure.
[[nodiscard]] auto parse_app_config(std::string_view json_content) noexcept
    -> std::expected<AppConfig, std::string>;

/// Reads and parses the configuration file.
/// @param filepath Path of the JSON file.
/// @return AppConfig on success, or error string if the file is unreadable or invalid.
[[nodiscard]] auto load_app_config(std::string_view filepath) noexcept
    -> std::expected<AppConfig, std::string>;

/// Checks whether a configuration file is present at filepath.
/// @return false when nothing is there, true for a regular file, or error string when
///         the path cannot be inspected or is not a regular file.
[[nodiscard]] auto config_file_exists(std::string_view filepath) noexcept
    -> std::expected<bool, std::string>;

/// Returns default AppConfig.
[[nodiscard]] auto get_default_config() noexcept -> AppConfig;

}  // namespace reset

#endif  // APP_CONFIG_HPP
