#include "usbreset/block_devices.hpp"
#include "usbreset/io_utils.hpp"

#include <algorithm>  // for find, find_if
#include <array>      // for array
#include <charconv>   // for from_chars
#include <ranges>     // for ranges::*
#include <utility>    // for move

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

struct TransportName {
    std::string_view name;
    usbreset::disk::DiskTransport transport;
};

// lsblk TRAN values, several map onto one transport
constexpr std::array TRANSPORT_NAMES{
    TransportName{"sata"sv, usbreset::disk::DiskTransport::Sata},
    TransportName{"ata"sv, usbreset::disk::DiskTransport::Sata},
    TransportName{"nvme"sv, usbreset::disk::DiskTransport::Nvme},
    TransportName{"usb"sv, usbreset::disk::DiskTransport::Usb},
    TransportName{"scsi"sv, usbreset::disk::DiskTransport::Scsi},
    TransportName{"sas"sv, usbreset::disk::DiskTransport::Scsi},
    TransportName{"virtio"sv, usbreset::disk::DiskTransport::Virtio},
};

struct SizeUnit {
    std::uint64_t bytes;
    std::string_view suffix;
    bool with_fraction;
};

constexpr std::array SIZE_UNITS{
    SizeUnit{1ULL << 40, "TiB"sv, true},
    SizeUnit{1ULL << 30, "GiB"sv, true},
    SizeUnit{1ULL << 20, "MiB"sv, false},
    SizeUnit{1ULL << 10, "KiB"sv, false},
};

/// Determines transport type from device path and tran field
auto determine_transport(std::string_view device, std::string_view tran) noexcept -> usbreset::disk::DiskTransport {
    using usbreset::disk::DiskTransport;

    if (!tran.empty()) {
        return usbreset::disk::string_to_disk_transport(tran);
    }

    if (device.contains("nvme"sv)) {
        return DiskTransport::Nvme;
    } else if (device.contains("vd"sv)) {
        return DiskTransport::Virtio;
    }

    return DiskTransport::Unknown;
}

auto get_disk_from_json(const rapidjson::Value& doc) -> usbreset::disk::DiskInfo {
    usbreset::disk::DiskInfo disk{};

    if (doc.HasMember("name") && doc["name"].IsString()) {
        disk.device = doc["name"].GetString();
    }
    if (doc.HasMember("model") && doc["model"].IsString()) {
        disk.model = doc["model"].GetString();
    }
    // older util-linux reports numbers and flags as strings
    if (doc.HasMember("size") && doc["size"].IsUint64()) {
        disk.size = doc["size"].GetUint64();
    } else if (doc.HasMember("size") && doc["size"].IsString()) {
        const std::string_view size_str{doc["size"].GetString(), doc["size"].GetStringLength()};
        std::from_chars(size_str.data(), size_str.data() + size_str.size(), disk.size);
    }
    if (doc.HasMember("rm") && doc["rm"].IsBool()) {
        disk.is_removable = doc["rm"].GetBool();
    } else if (doc.HasMember("rm") && doc["rm"].IsString()) {
        disk.is_removable = (std::string_view{doc["rm"].GetString()} == "1"sv);
    }

    std::string_view tran{};
    if (doc.HasMember("tran") && doc["tran"].IsString()) {
        tran = doc["tran"].GetString();
    }
    disk.transport = determine_transport(disk.device, tran);

    return disk;
}

}  // namespace

namespace usbreset::disk {

auto disk_transport_to_string(DiskTransport transport) noexcept -> std::string_view {
    // first entry per transport is its canonical name
    const auto it = std::ranges::find(TRANSPORT_NAMES, transport, &TransportName::transport);
    return it != TRANSPORT_NAMES.end() ? it->name : "unknown"sv;
}

auto string_to_disk_transport(std::string_view transport_str) noexcept -> DiskTransport {
    const auto it = std::ranges::find(TRANSPORT_NAMES, transport_str, &TransportName::name);
    return it != TRANSPORT_NAMES.end() ? it->transport : DiskTransport::Unknown;
}

auto parse_lsblk_disks_json(std::string_view json_output) noexcept -> std::vector<DiskInfo> {
    if (json_output.empty()) {
        return {};
    }

    rapidjson::Document document;
    document.Parse(json_output.data(), json_output.size());

    if (document.HasParseError()) {
        spdlog::error("Failed to parse lsblk output: {}", rapidjson::GetParseError_En(document.GetParseError()));
        return {};
    }
    if (!document.IsObject()) {
        spdlog::error("lsblk output is not a valid JSON object");
        return {};
    }

    std::vector<DiskInfo> disks{};
    if (document.HasMember("blockdevices") && document["blockdevices"].IsArray()) {
        for (const auto& device_json : document["blockdevices"].GetArray()) {
            if (!device_json.IsObject() || !device_json.HasMember("type") || !device_json["type"].IsString()) {
                continue;
            }
            const std::string_view dev_type = device_json["type"].GetString();
            if (dev_type != "disk"sv) {
                continue;
            }
            auto disk  = get_disk_from_json(device_json);
            disk.index = static_cast<std::uint32_t>(disks.size());
            disks.emplace_back(std::move(disk));
        }
    }
    return disks;
}

auto list_disks() noexcept -> std::optional<std::vector<DiskInfo>> {
    const auto& lsblk_output = utils::exec(R"(lsblk -J -b -d -o NAME,TYPE,SIZE,MODEL,TRAN,RM -p)"sv);
    if (lsblk_output.empty()) {
        spdlog::error("Failed to get lsblk output");
        return std::nullopt;
    }

    auto disks = parse_lsblk_disks_json(lsblk_output);
    if (disks.empty()) {
        spdlog::warn("No disks found from lsblk");
    }

    return std::make_optional<std::vector<DiskInfo>>(std::move(disks));
}

auto find_disk_by_index(const std::vector<DiskInfo>& disks, std::uint32_t index) noexcept -> std::optional<DiskInfo> {
    auto it = std::ranges::find_if(disks, [index](auto&& disk) { return disk.index == index; });
    if (it != std::ranges::end(disks)) {
        return std::make_optional<DiskInfo>(*it);
    }
    return std::nullopt;
}

auto format_size(std::uint64_t bytes) noexcept -> std::string {
    // largest unit first, whole numbers below GiB
    for (const auto& unit : SIZE_UNITS) {
        if (bytes >= unit.bytes) {
            const auto scaled = static_cast<double>(bytes) / static_cast<double>(unit.bytes);
            return unit.with_fraction ? fmt::format(FMT_COMPILE("{:.1f}{}"), scaled, unit.suffix)
                                      : fmt::format(FMT_COMPILE("{:.0f}{}"), scaled, unit.suffix);
        }
    }
    return fmt::format(FMT_COMPILE("{}B"), bytes);
}

}  // namespace usbreset::disk
