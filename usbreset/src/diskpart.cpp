#include "usbreset/diskpart.hpp"
#include "usbreset/string_utils.hpp"

#include <algorithm>    // for copy_if
#include <iterator>     // for back_inserter
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

namespace {

// characters FAT does not allow in a volume label
constexpr auto FAT_FORBIDDEN_LABEL_CHARS = R"(*?.,;:/\|+=<>[]")"sv;

constexpr auto is_allowed_label_char(char ch) noexcept -> bool {
    const auto code = static_cast<unsigned char>(ch);
    if (code < 0x20 || code > 0x7E) {
        return false;
    }
    return FAT_FORBIDDEN_LABEL_CHARS.find(ch) == std::string_view::npos;
}

constexpr auto get_clean_command(usbreset::disk::WipeMode mode) noexcept -> std::string_view {
    // 'clean all' writes zeros to every sector, 'clean' only drops the partition table
    if (mode == usbreset::disk::WipeMode::Full) {
        return "clean all"sv;
    }
    return "clean"sv;
}

}  // namespace

namespace usbreset::disk {

auto wipe_mode_from_string(std::string_view mode_str) noexcept -> std::optional<WipeMode> {
    const auto& mode_lower = utils::to_lower(utils::trim(mode_str));
    if (mode_lower == "fast"sv) {
        return WipeMode::Fast;
    }
    if (mode_lower == "full"sv) {
        return WipeMode::Full;
    }
    return std::nullopt;
}

auto wipe_mode_to_string(WipeMode mode) noexcept -> std::string_view {
    switch (mode) {
    case WipeMode::Fast:
        return "Fast"sv;
    case WipeMode::Full:
        return "Full"sv;
    }
    return "unknown"sv;
}

auto sanitize_fat32_label(std::string_view label) noexcept -> std::string {
    std::string filtered{};
    std::ranges::copy_if(label, std::back_inserter(filtered), is_allowed_label_char);

    auto result = utils::trim(filtered);
    if (result.size() > FAT32_LABEL_MAX_LEN) {
        result = utils::trim(result.substr(0, FAT32_LABEL_MAX_LEN));
    }
    if (result.empty()) {
        return std::string{DEFAULT_VOLUME_LABEL};
    }
    return std::string{result};
}

auto gen_diskpart_script(const ResetRequest& request) noexcept -> std::string {
    const std::vector<std::string> commands{
        fmt::format(FMT_COMPILE("select disk {}"), request.disk_id),
        // write protection left by some vendors makes clean fail
        "attributes disk clear readonly"s,
        std::string{get_clean_command(request.mode)},
        "convert mbr"s,
        // no size= means the partition spans the whole disk
        "create partition primary"s,
        fmt::format(FMT_COMPILE("format fs=fat32 quick label=\"{}\""), request.label),
        // next free drive letter
        "assign"s,
        "exit"s,
    };
    return utils::make_multiline(commands);
}

auto run_diskpart_script(std::string_view script, std::string_view utility) noexcept -> std::optional<utils::ProcessResult> {
    spdlog::info("Running '{}' with script:\n{}", utility, script);

    auto result = utils::exec_with_input({std::string{utility}}, script);
    if (!result) {
        spdlog::error("Failed to run '{}'", utility);
        return std::nullopt;
    }

    spdlog::info("'{}' exited with code {}", utility, result->exit_code);
    spdlog::info("[DUMP_TO_LOG] :=\n{}", result->output);
    if (!result->succeeded()) {
        spdlog::error("'{}' reported failure (exit code {})", utility, result->exit_code);
    }
    return result;
}

}  // namespace usbreset::disk
