#ifndef DISKPART_HPP
#define DISKPART_HPP

#include "usbreset/subprocess.hpp"

#include <cstddef>      // for size_t
#include <cstdint>      // for uint8_t, uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace usbreset::disk {

/// Label applied when none is given.
inline constexpr std::string_view DEFAULT_VOLUME_LABEL = "USB";

/// FAT32 volume labels are at most 11 characters.
inline constexpr std::size_t FAT32_LABEL_MAX_LEN = 11;

/// Destructive clean step used before re-partitioning.
enum class WipeMode : std::uint8_t {
    /// Removes partition information only. Data is recoverable.
    Fast,
    /// Overwrites every sector of the disk. Slow.
    Full
};

/// Converts a string to WipeMode, ignoring case and surrounding whitespace.
/// @param mode_str The string representation of the wipe mode.
/// @return The WipeMode or std::nullopt if invalid.
[[nodiscard]] auto wipe_mode_from_string(std::string_view mode_str) noexcept -> std::optional<WipeMode>;

/// Converts WipeMode to string.
[[nodiscard]] auto wipe_mode_to_string(WipeMode mode) noexcept -> std::string_view;

/// @brief Makes a label acceptable as a FAT32 volume label.
///
/// Drops characters FAT forbids in labels along with control and non-ASCII
/// characters, trims whitespace and truncates to FAT32_LABEL_MAX_LEN.
/// @param label The label as entered by the operator.
/// @return The sanitized label, DEFAULT_VOLUME_LABEL if nothing usable is left.
[[nodiscard]] auto sanitize_fat32_label(std::string_view label) noexcept -> std::string;

/// Parameters of one reset run.
struct ResetRequest final {
    std::uint32_t disk_id{0};
    std::string label{DEFAULT_VOLUME_LABEL};
    WipeMode mode{WipeMode::Fast};
};

// Generates the diskpart command script for the request
auto gen_diskpart_script(const ResetRequest& request) noexcept -> std::string;

// Feeds the command script to the scripting utility on its stdin
auto run_diskpart_script(std::string_view script, std::string_view utility) noexcept -> std::optional<utils::ProcessResult>;

}  // namespace usbreset::disk

#endif  // DISKPART_HPP
