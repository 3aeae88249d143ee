#include "usbreset/io_utils.hpp"

#include <cstdio>  // for feof, fgets, pclose, popen

#include <array>   // for array
#include <memory>  // for unique_ptr

#include <spdlog/spdlog.h>

namespace usbreset::utils {

auto exec(std::string_view command) noexcept -> std::string {
    spdlog::debug("[exec] cmd := '{}'", command);

    const std::string command_str{command};
    const std::unique_ptr<FILE, decltype(&pclose)> pipe(popen(command_str.c_str(), "r"), pclose);
    if (!pipe) {
        spdlog::error("popen failed! '{}'", command);
        return {};
    }

    std::string result{};
    std::array<char, 128> buffer{};
    while (!feof(pipe.get())) {
        if (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
            result += buffer.data();
        }
    }

    if (result.ends_with('\n')) {
        result.pop_back();
    }

    return result;
}

}  // namespace usbreset::utils
