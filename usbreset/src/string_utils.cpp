#include "usbreset/string_utils.hpp"

#include <algorithm>  // for transform
#include <cctype>     // for tolower, isspace

namespace usbreset::utils {

auto make_multiline_view(std::string_view str, char delim) noexcept -> std::vector<std::string_view> {
    std::vector<std::string_view> lines{};
    std::ranges::for_each(utils::make_split_view(str, delim), [&](auto&& rng) { lines.emplace_back(rng); });
    return lines;
}

auto make_multiline(const std::vector<std::string>& lines, std::string_view delim) noexcept -> std::string {
    std::string res{};
    for (const auto& line : lines) {
        res += line;
        res += delim;
    }
    return res;
}

auto trim(std::string_view str) noexcept -> std::string_view {
    constexpr auto is_space = [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; };

    while (!str.empty() && is_space(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

auto to_lower(std::string_view str) noexcept -> std::string {
    std::string res{str};
    std::ranges::transform(res, res.begin(),
        [](char ch) { return static_cast<char>(std::tolower(static_cast<unsigned char>(ch))); });
    return res;
}

}  // namespace usbreset::utils
