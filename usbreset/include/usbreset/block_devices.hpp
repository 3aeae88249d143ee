#ifndef BLOCK_DEVICES_HPP
#define BLOCK_DEVICES_HPP

#include <cstdint>      // for uint64_t, uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace usbreset::disk {

/// @brief Transport (bus) type for storage devices
enum class DiskTransport : std::uint8_t {
    Sata,
    Nvme,
    Usb,
    Scsi,
    Virtio,
    Unknown
};

/// @brief Information about a disk device
struct DiskInfo final {
    /// Disk number, the position of the disk in enumeration order
    std::uint32_t index{0};
    /// Disk device path
    std::string device;
    /// Disk model name
    std::optional<std::string> model;
    /// Total disk size in bytes
    std::uint64_t size{0};
    /// Transport type
    DiskTransport transport{DiskTransport::Unknown};
    /// Whether the disk is removable
    bool is_removable{false};
};

/// @brief Convert disk transport enum to string representation
/// @param transport The transport type to convert
/// @return string view of the transport type
auto disk_transport_to_string(DiskTransport transport) noexcept -> std::string_view;

/// @brief Convert transport string to disk transport enum
/// @param transport_str The transport string
/// @return disk transport enum value
auto string_to_disk_transport(std::string_view transport_str) noexcept -> DiskTransport;

/// @brief Lists all disk devices (excluding partitions and virtual devices)
/// @return Optional vector of DiskInfo, std::nullopt on failure
auto list_disks() noexcept -> std::optional<std::vector<DiskInfo>>;

/// @brief Finds a disk by its disk number.
/// @param disks A vector of DiskInfo objects.
/// @param index The disk number to find.
/// @return An optional DiskInfo object if found, std::nullopt otherwise.
auto find_disk_by_index(const std::vector<DiskInfo>& disks, std::uint32_t index) noexcept -> std::optional<DiskInfo>;

/// @brief Formats a size in bytes to human-readable string
/// @param bytes Size in bytes
/// @return Human-readable size string
auto format_size(std::uint64_t bytes) noexcept -> std::string;

/// @brief Parses JSON output from lsblk command into DiskInfo structures
/// @param json_output The JSON string from lsblk -J command
/// @return vector of DiskInfo numbered in output order, empty on error
auto parse_lsblk_disks_json(std::string_view json_output) noexcept -> std::vector<DiskInfo>;

}  // namespace usbreset::disk

#endif  // BLOCK_DEVICES_HPP
