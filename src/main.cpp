#include "app_config.hpp"   // for AppConfig, config_file_exists, load_app_config
#include "definitions.hpp"  // for error_inter
#include "reset_flow.hpp"   // for run_reset_flow

// import usbreset
#include "usbreset/logger.hpp"

#include <unistd.h>  // for geteuid

#include <chrono>      // for seconds
#include <iostream>    // for cin, cout, cerr
#include <string>      // for string
#include <utility>     // for move
#include <vector>      // for vector

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for spdlog_ex
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

namespace {

[[nodiscard]] bool check_root() noexcept {
    return geteuid() == 0;
}

constexpr auto to_exit_code(reset::ExitStatus status) noexcept -> int {
    return static_cast<int>(status);
}

}  // namespace

int main(int argc, char** argv) {
    const std::vector<std::string> raw_args(argv + 1, argv + argc);
    const auto& args = reset::parse_arguments(raw_args);
    if (!args) {
        error_inter("{}\n\n", args.error());
        output_inter("{}", reset::usage());
        return to_exit_code(reset::ExitStatus::InvalidInput);
    }
    if (args->show_help) {
        output_inter("{}", reset::usage());
        return to_exit_code(reset::ExitStatus::Success);
    }

    // Load config, defaults when there is none.
    const auto& has_config_file = reset::config_file_exists(reset::DEFAULT_CONFIG_PATH);
    if (!has_config_file) {
        error_inter("{}\n", has_config_file.error());
        return to_exit_code(reset::ExitStatus::InvalidInput);
    }
    auto config = reset::get_default_config();
    if (*has_config_file) {
        auto loaded_config = reset::load_app_config(reset::DEFAULT_CONFIG_PATH);
        if (!loaded_config) {
            error_inter("Invalid config '{}': {}\n", reset::DEFAULT_CONFIG_PATH, loaded_config.error());
            return to_exit_code(reset::ExitStatus::InvalidInput);
        }
        config = std::move(*loaded_config);
    }

    // Initialize logger.
    try {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("usb_reset_logger", config.log_file);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%r][%^---%L---%$] %v");
        spdlog::set_level(config.log_level);
        spdlog::flush_every(std::chrono::seconds(5));

        // Set usbreset logger.
        usbreset::logger::set_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        error_inter("Failed to open log file '{}': {}\n", config.log_file, ex.what());
        return to_exit_code(reset::ExitStatus::InvalidInput);
    }

    if (!*has_config_file) {
        spdlog::info("Config not found running with defaults");
    }
    spdlog::info("utility: '{}', list_disks: {}", config.utility, config.list_disks);

    // The scripting utility reports permission errors itself.
    if (!check_root()) {
        warning_inter("Warning: not running as root, '{}' will most likely refuse to touch the disk.\n", config.utility);
        spdlog::warn("Running without root privileges");
    }

    const reset::Console console{.in = std::cin, .out = std::cout, .err = std::cerr};
    const auto status = reset::run_reset_flow(*args, reset::make_system_hooks(config), console);
    spdlog::info("Finished with exit code {}", to_exit_code(status));

    spdlog::shutdown();
    return to_exit_code(status);
}
