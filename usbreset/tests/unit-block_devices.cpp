#include "doctest_compatibility.h"

#include "usbreset/block_devices.hpp"
#include "usbreset/logger.hpp"

#include <string>
#include <vector>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/spdlog.h>

using namespace std::string_view_literals;
using namespace std::string_literals;

TEST_CASE("disk transport conversion test")
{
    using usbreset::disk::DiskTransport;
    using usbreset::disk::disk_transport_to_string;
    using usbreset::disk::string_to_disk_transport;

    SECTION("transport to string")
    {
        CHECK(disk_transport_to_string(DiskTransport::Sata) == "sata"sv);
        CHECK(disk_transport_to_string(DiskTransport::Nvme) == "nvme"sv);
        CHECK(disk_transport_to_string(DiskTransport::Usb) == "usb"sv);
        CHECK(disk_transport_to_string(DiskTransport::Scsi) == "scsi"sv);
        CHECK(disk_transport_to_string(DiskTransport::Virtio) == "virtio"sv);
        CHECK(disk_transport_to_string(DiskTransport::Unknown) == "unknown"sv);
    }
    SECTION("string to transport")
    {
        CHECK(string_to_disk_transport("sata"sv) == DiskTransport::Sata);
        CHECK(string_to_disk_transport("ata"sv) == DiskTransport::Sata);
        CHECK(string_to_disk_transport("nvme"sv) == DiskTransport::Nvme);
        CHECK(string_to_disk_transport("usb"sv) == DiskTransport::Usb);
        CHECK(string_to_disk_transport("sas"sv) == DiskTransport::Scsi);
        CHECK(string_to_disk_transport("virtio"sv) == DiskTransport::Virtio);
        CHECK(string_to_disk_transport(""sv) == DiskTransport::Unknown);
    }
}

TEST_CASE("format size test")
{
    using usbreset::disk::format_size;

    SECTION("bytes")
    {
        CHECK(format_size(0) == "0B"sv);
        CHECK(format_size(1023) == "1023B"sv);
    }
    SECTION("kibibytes and mebibytes")
    {
        CHECK(format_size(2048) == "2KiB"sv);
        CHECK(format_size(512ULL * 1024 * 1024) == "512MiB"sv);
    }
    SECTION("gibibytes and tebibytes")
    {
        CHECK(format_size(16ULL * 1024 * 1024 * 1024) == "16.0GiB"sv);
        CHECK(format_size(2ULL * 1024 * 1024 * 1024 * 1024) == "2.0TiB"sv);
    }
}

TEST_CASE("parse_lsblk_disks_json test")
{
    auto null_sink = std::make_shared<spdlog::sinks::null_sink_mt>();
    auto logger    = std::make_shared<spdlog::logger>("default", null_sink);
    spdlog::set_default_logger(logger);
    usbreset::logger::set_logger(logger);

    using usbreset::disk::parse_lsblk_disks_json;
    using usbreset::disk::DiskTransport;

    SECTION("empty json output")
    {
        auto disks = parse_lsblk_disks_json(""sv);
        CHECK(disks.empty());
    }
    SECTION("invalid json")
    {
        auto disks = parse_lsblk_disks_json("{\"blockdevices\": ["sv);
        CHECK(disks.empty());
    }
    SECTION("empty blockdevices array")
    {
        constexpr auto json = R"({"blockdevices":[]})"sv;
        auto disks          = parse_lsblk_disks_json(json);
        CHECK(disks.empty());
    }
    SECTION("disks numbered in output order")
    {
        constexpr auto json = R"({
            "blockdevices": [
                {"name":"/dev/nvme0n1", "type":"disk", "size":512110190592, "model":"Samsung SSD 980 PRO", "tran":"nvme", "rm":false},
                {"name":"/dev/loop0", "type":"loop", "size":4096, "model":null, "tran":null, "rm":false},
                {"name":"/dev/sdb", "type":"disk", "size":31104958464, "model":"SanDisk Ultra", "tran":"usb", "rm":true}
            ]
        })"sv;
        auto disks = parse_lsblk_disks_json(json);
        REQUIRE_EQ(disks.size(), 2);

        CHECK_EQ(disks[0].index, 0);
        CHECK_EQ(disks[0].device, "/dev/nvme0n1"s);
        CHECK_EQ(disks[0].model, "Samsung SSD 980 PRO"s);
        CHECK_EQ(disks[0].size, 512110190592ULL);
        CHECK(disks[0].transport == DiskTransport::Nvme);
        CHECK(!disks[0].is_removable);

        CHECK_EQ(disks[1].index, 1);
        CHECK_EQ(disks[1].device, "/dev/sdb"s);
        CHECK(disks[1].transport == DiskTransport::Usb);
        CHECK(disks[1].is_removable);
    }
    SECTION("string fields from older lsblk")
    {
        constexpr auto json = R"({
            "blockdevices": [
                {"name":"/dev/vda", "type":"disk", "size":"10737418240", "model":null, "tran":null, "rm":"0"}
            ]
        })"sv;
        auto disks = parse_lsblk_disks_json(json);
        REQUIRE_EQ(disks.size(), 1);
        CHECK_EQ(disks[0].size, 10737418240ULL);
        CHECK(!disks[0].model.has_value());
        CHECK(disks[0].transport == DiskTransport::Virtio);
        CHECK(!disks[0].is_removable);
    }
}

TEST_CASE("find_disk_by_index test")
{
    using usbreset::disk::DiskInfo;
    using usbreset::disk::find_disk_by_index;

    const std::vector<DiskInfo> disks{
        DiskInfo{.index = 0, .device = "/dev/sda"s},
        DiskInfo{.index = 1, .device = "/dev/sdb"s},
    };

    SECTION("existing disk")
    {
        const auto& disk = find_disk_by_index(disks, 1);
        REQUIRE(disk.has_value());
        CHECK_EQ(disk->device, "/dev/sdb"s);
    }
    SECTION("missing disk")
    {
        CHECK(!find_disk_by_index(disks, 7).has_value());
        CHECK(!find_disk_by_index({}, 0).has_value());
    }
}
