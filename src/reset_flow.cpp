#include "reset_flow.hpp"

// import usbreset
#include "usbreset/string_utils.hpp"

#include <charconv>      // for from_chars
#include <istream>       // for getline
#include <ostream>       // for flush
#include <system_error>  // for errc
#include <utility>       // for move

#include <fmt/color.h>
#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

using usbreset::disk::ResetRequest;
using usbreset::disk::WipeMode;

constexpr auto DISK_PROMPT  = "Enter the disk number: "sv;
constexpr auto MODE_PROMPT  = "Enter the wipe mode [Fast/Full]: "sv;
constexpr auto LABEL_PROMPT = "Enter the volume label (default USB): "sv;

constexpr auto CONFIRM_PROMPT = "Press ENTER to continue or Ctrl+C to abort..."sv;

constexpr auto USAGE = R"(Usage: usb-reset [DISK] [LABEL] [MODE]

Erases a disk and leaves a single FAT32 partition on it.

  DISK    disk number as shown in the disk list
  LABEL   volume label, up to 11 characters (default USB)
  MODE    Fast (remove partitions) or Full (overwrite every sector)

Any omitted value is asked for interactively.

Options:
  -h, --help   show this help and exit
)"sv;

auto cancelled_error() noexcept -> reset::FlowError {
    return reset::FlowError{.status = reset::ExitStatus::Cancelled, .message = "Input closed, nothing was changed"};
}

// Writes the prompt and reads one line. std::nullopt on end of input.
auto prompt_line(const reset::Console& console, std::string_view prompt) noexcept -> std::optional<std::string> {
    console.out << prompt << std::flush;

    std::string line{};
    if (!std::getline(console.in, line)) {
        console.out << '\n';
        return std::nullopt;
    }
    if (line.ends_with('\r')) {
        line.pop_back();
    }
    return line;
}

// Value from the arguments when given, otherwise asked for.
auto value_or_prompt(const std::optional<std::string>& arg, const reset::Console& console, std::string_view prompt) noexcept -> std::optional<std::string> {
    if (arg) {
        return arg;
    }
    return prompt_line(console, prompt);
}

}  // namespace

namespace reset {

auto parse_arguments(const std::vector<std::string>& args) noexcept
    -> std::expected<Arguments, std::string> {
    Arguments result{};

    std::vector<std::string> positional{};
    for (const auto& arg : args) {
        if (arg == "-h"sv || arg == "--help"sv) {
            result.show_help = true;
            continue;
        }
        if (arg.starts_with("--"sv)) {
            return std::unexpected(fmt::format(FMT_COMPILE("unknown option '{}'"), arg));
        }
        positional.push_back(arg);
    }

    if (positional.size() > 3) {
        return std::unexpected(fmt::format(FMT_COMPILE("too many arguments: expected at most 3, got {}"), positional.size()));
    }
    if (!positional.empty()) {
        result.disk_id = std::move(positional[0]);
    }
    if (positional.size() > 1) {
        result.label = std::move(positional[1]);
    }
    if (positional.size() > 2) {
        result.mode = std::move(positional[2]);
    }
    return result;
}

auto parse_disk_id(std::string_view disk_str) noexcept
    -> std::expected<std::uint32_t, std::string> {
    const auto& trimmed = usbreset::utils::trim(disk_str);
    if (trimmed.empty()) {
        return std::unexpected("invalid disk number: no value given");
    }

    std::uint32_t disk_id{};
    const auto* last           = trimmed.data() + trimmed.size();
    const auto [parsed_end, ec] = std::from_chars(trimmed.data(), last, disk_id);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(fmt::format(FMT_COMPILE("invalid disk number '{}': out of range"), trimmed));
    }
    if (ec != std::errc{} || parsed_end != last) {
        return std::unexpected(fmt::format(FMT_COMPILE("invalid disk number '{}': expected a non-negative integer"), trimmed));
    }
    return disk_id;
}

auto acquire_request(const Arguments& args, const Console& console) noexcept
    -> std::expected<ResetRequest, FlowError> {
    ResetRequest request{};

    const auto& disk_str = value_or_prompt(args.disk_id, console, DISK_PROMPT);
    if (!disk_str) {
        return std::unexpected(cancelled_error());
    }
    auto disk_id = parse_disk_id(*disk_str);
    if (!disk_id) {
        return std::unexpected(FlowError{.status = ExitStatus::InvalidInput, .message = std::move(disk_id.error())});
    }
    request.disk_id = *disk_id;

    const auto& mode_str = value_or_prompt(args.mode, console, MODE_PROMPT);
    if (!mode_str) {
        return std::unexpected(cancelled_error());
    }
    const auto& mode = usbreset::disk::wipe_mode_from_string(*mode_str);
    if (!mode) {
        return std::unexpected(FlowError{
            .status  = ExitStatus::InvalidInput,
            .message = fmt::format(FMT_COMPILE("invalid mode '{}': expected Fast or Full"), usbreset::utils::trim(*mode_str))});
    }
    request.mode = *mode;

    const auto& label_str = value_or_prompt(args.label, console, LABEL_PROMPT);
    if (!label_str) {
        return std::unexpected(cancelled_error());
    }
    request.label = usbreset::disk::sanitize_fat32_label(*label_str);

    const auto& label_trimmed = usbreset::utils::trim(*label_str);
    if (!label_trimmed.empty() && label_trimmed != request.label) {
        spdlog::warn("Label '{}' adjusted to '{}'", *label_str, request.label);
        console.out << fmt::format(fmt::fg(fmt::color::yellow), "Label '{}' adjusted to '{}' for FAT32\n", label_trimmed, request.label);
    }

    return request;
}

auto render_disk_table(const std::vector<usbreset::disk::DiskInfo>& disks) noexcept -> std::string {
    if (disks.empty()) {
        return "No disks found\n";
    }

    std::string table{"Available disks:\n"};
    table += fmt::format(FMT_COMPILE("  {:<6}{:<16}{:<32}{:>10}  {}\n"), "Disk", "Device", "Name", "Size", "Bus");
    for (const auto& disk : disks) {
        table += fmt::format(FMT_COMPILE("  {:<6}{:<16}{:<32}{:>10}  {}{}\n"),
            disk.index,
            disk.device,
            disk.model.value_or("-"),
            usbreset::disk::format_size(disk.size),
            usbreset::disk::disk_transport_to_string(disk.transport),
            disk.is_removable ? " (removable)" : "");
    }
    return table;
}

auto render_warning(const ResetRequest& request) noexcept -> std::string {
    std::string warning{};
    if (request.mode == WipeMode::Full) {
        warning = fmt::format(fmt::fg(fmt::color::red) | fmt::emphasis::bold,
            "\n!!! WARNING: FULL WIPE OF DISK {} !!!\n"
            "'clean all' overwrites all sectors of the disk. This is slow and the data cannot be recovered.\n",
            request.disk_id);
    } else {
        warning = fmt::format(fmt::fg(fmt::color::yellow),
            "\n!!! WARNING: FAST WIPE OF DISK {} !!!\n"
            "'clean' removes the partitions only. Existing data stays on the disk and may be recoverable.\n",
            request.disk_id);
    }
    warning += fmt::format(FMT_COMPILE("Every partition on disk {} will be deleted and the disk formatted as FAT32 with label \"{}\".\n"),
        request.disk_id, request.label);
    return warning;
}

auto confirm_reset(const Console& console) noexcept -> bool {
    return prompt_line(console, CONFIRM_PROMPT).has_value();
}

auto run_reset_flow(const Arguments& args, const FlowHooks& hooks, const Console& console) noexcept -> ExitStatus {
    if (args.show_help) {
        console.out << usage();
        return ExitStatus::Success;
    }

    std::optional<std::vector<usbreset::disk::DiskInfo>> disks{};
    if (hooks.list_disks) {
        disks = hooks.list_disks();
        if (disks) {
            spdlog::info("Found {} disk(s)", disks->size());
            console.out << render_disk_table(*disks) << '\n';
        } else {
            console.err << fmt::format(fmt::fg(fmt::color::yellow), "Could not list disks, continuing without the listing\n");
        }
    }

    auto request = acquire_request(args, console);
    if (!request) {
        const auto& error = request.error();
        if (error.status == ExitStatus::Cancelled) {
            spdlog::info("Operator cancelled: {}", error.message);
            console.out << "Aborted. Nothing was changed.\n";
        } else {
            spdlog::error("{}", error.message);
            console.err << fmt::format(fmt::fg(fmt::color::red), "Error: {}\n", error.message);
        }
        return error.status;
    }
    spdlog::info("Reset request: disk {}, label '{}', mode {}", request->disk_id, request->label, usbreset::disk::wipe_mode_to_string(request->mode));

    // the listing is advisory, an unknown disk number is still passed on
    if (disks && !usbreset::disk::find_disk_by_index(*disks, request->disk_id)) {
        spdlog::warn("Disk {} is not in the disk list", request->disk_id);
        console.err << fmt::format(fmt::fg(fmt::color::yellow), "Disk {} is not in the list above\n", request->disk_id);
    }

    console.out << render_warning(*request);
    if (!confirm_reset(console)) {
        spdlog::info("Operator cancelled at confirmation");
        console.out << "Aborted. Nothing was changed.\n";
        return ExitStatus::Cancelled;
    }
    spdlog::info("Operator confirmed reset of disk {}", request->disk_id);

    const auto& script = usbreset::disk::gen_diskpart_script(*request);
    std::optional<usbreset::utils::ProcessResult> result{};
    if (hooks.dispatch) {
        result = hooks.dispatch(script);
    } else {
        spdlog::error("No dispatcher configured");
    }

    if (result && !result->output.empty()) {
        console.out << result->output;
        if (!result->output.ends_with('\n')) {
            console.out << '\n';
        }
    }

    console.out << fmt::format(FMT_COMPILE("\nMode:  {}\nLabel: {}\n"), usbreset::disk::wipe_mode_to_string(request->mode), request->label);

    if (!result) {
        console.err << fmt::format(fmt::fg(fmt::color::red) | fmt::emphasis::bold, "FAILED: could not run '{}'\n", hooks.utility);
        return ExitStatus::UtilityFailed;
    }
    if (!result->succeeded()) {
        console.err << fmt::format(fmt::fg(fmt::color::red) | fmt::emphasis::bold,
            "FAILED: '{}' exited with code {}. Disk {} may be left partially erased.\n", hooks.utility, result->exit_code, request->disk_id);
        return ExitStatus::UtilityFailed;
    }

    console.out << fmt::format(fmt::fg(fmt::color::green), "DONE\n");
    return ExitStatus::Success;
}

auto make_system_hooks(const AppConfig& config) -> FlowHooks {
    FlowHooks hooks{};
    hooks.utility = config.utility;
    if (config.list_disks) {
        hooks.list_disks = [] { return usbreset::disk::list_disks(); };
    }
    hooks.dispatch = [utility = config.utility](std::string_view script) {
        return usbreset::disk::run_diskpart_script(script, utility);
    };
    return hooks;
}

auto usage() noexcept -> std::string_view {
    return USAGE;
}

}  // namespace reset
