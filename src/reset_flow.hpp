#ifndef RESET_FLOW_HPP
#define RESET_FLOW_HPP

#include "app_config.hpp"

// import usbreset
#include "usbreset/block_devices.hpp"
#include "usbreset/diskpart.hpp"
#include "usbreset/subprocess.hpp"

#include <cstdint>      // for int32_t, uint32_t
#include <expected>     // for expected
#include <functional>   // for function
#include <iosfwd>       // for istream, ostream
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace reset {

/// Process exit codes.
enum class ExitStatus : std::int32_t {
    Success       = 0,
    InvalidInput  = 1,
    UtilityFailed = 2,
    Cancelled     = 3
};

/// Reason the flow stopped before dispatching.
struct FlowError final {
    ExitStatus status{ExitStatus::InvalidInput};
    std::string message{};
};

/// Positional invocation arguments, each one optional.
struct Arguments final {
    std::optional<std::string> disk_id{};
    std::optional<std::string> label{};
    std::optional<std::string> mode{};
    bool show_help{false};
};

/// Operator streams.
struct Console final {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

/// System access used by the flow. Tests replace both callbacks.
struct FlowHooks final {
    /// Name of the scripting utility, used in messages.
    std::string utility{"diskpart"};
    /// Empty when the listing is disabled.
    std::function<std::optional<std::vector<usbreset::disk::DiskInfo>>()> list_disks{};
    std::function<std::optional<usbreset::utils::ProcessResult>(std::string_view)> dispatch{};
};

/// Parses [DISK] [LABEL] [MODE] and -h/--help.
/// @param args Invocation arguments without the program name.
[[nodiscard]] auto parse_arguments(const std::vector<std::string>& args) noexcept
    -> std::expected<Arguments, std::string>;

/// Parses a disk number, the whole string must be a non-negative decimal.
[[nodiscard]] auto parse_disk_id(std::string_view disk_str) noexcept
    -> std::expected<std::uint32_t, std::string>;

/// @brief Builds the request from arguments, prompting for every omitted field.
///
/// Prompts are issued in the order disk number, wipe mode, label.
/// End of input at a prompt is reported as ExitStatus::Cancelled.
[[nodiscard]] auto acquire_request(const Arguments& args, const Console& console) noexcept
    -> std::expected<usbreset::disk::ResetRequest, FlowError>;

/// Renders the advisory disk listing.
auto render_disk_table(const std::vector<usbreset::disk::DiskInfo>& disks) noexcept -> std::string;

/// Renders the mode dependent warning shown before the confirmation.
auto render_warning(const usbreset::disk::ResetRequest& request) noexcept -> std::string;

/// Blocks until the operator acknowledges. false on end of input.
auto confirm_reset(const Console& console) noexcept -> bool;

/// Runs list -> prompt -> confirm -> dispatch -> report.
auto run_reset_flow(const Arguments& args, const FlowHooks& hooks, const Console& console) noexcept -> ExitStatus;

/// Hooks backed by lsblk and the configured scripting utility.
auto make_system_hooks(const AppConfig& config) -> FlowHooks;

auto usage() noexcept -> std::string_view;

}  // namespace reset

#endif  // RESET_FLOW_HPP
