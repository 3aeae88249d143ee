#include "usbreset/file_utils.hpp"

#include <sys/stat.h>  // for fstat, S_ISREG

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose, fileno
#include <cstring>  // for strerror
#include <memory>   // for unique_ptr

#include <spdlog/spdlog.h>

namespace usbreset::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string> {
    const std::string path{filepath};

    // Use std::fopen because it's faster than std::ifstream
    const std::unique_ptr<FILE, decltype(&std::fclose)> file(std::fopen(path.c_str(), "rb"), std::fclose);
    if (!file) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    // directories open fine on Linux, their offsets are not byte counts
    struct stat file_stat{};
    if (::fstat(::fileno(file.get()), &file_stat) != 0) {
        spdlog::error("[READWHOLEFILE] '{}' stat failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }
    if (!S_ISREG(file_stat.st_mode)) {
        spdlog::error("[READWHOLEFILE] '{}' is not a regular file", filepath);
        return std::nullopt;
    }

    if (std::fseek(file.get(), 0, SEEK_END) != 0) {
        spdlog::error("[READWHOLEFILE] '{}' seek failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }
    const auto end_pos = std::ftell(file.get());
    if (end_pos < 0 || std::fseek(file.get(), 0, SEEK_SET) != 0) {
        spdlog::error("[READWHOLEFILE] '{}' seek failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }
    const auto size = static_cast<std::size_t>(end_pos);

    std::string buf;
    buf.resize(size);

    const std::size_t read = std::fread(buf.data(), sizeof(char), size, file.get());
    if (read != size) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    return buf;
}

}  // namespace usbreset::file_utils
