#ifndef STRING_UTILS_HPP
#define STRING_UTILS_HPP

#include <ranges>       // for ranges::*
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace usbreset::utils {

/// @brief Split a string into views of multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A vector of string views representing the split lines.
auto make_multiline_view(std::string_view str, char delim = '\n') noexcept -> std::vector<std::string_view>;

/// @brief Combine multiple lines into a single string, each line terminated by a delimiter.
/// @param lines The lines to combine.
/// @param delim The delimiter placed after every line.
/// @return The combined lines as a single string.
auto make_multiline(const std::vector<std::string>& lines, std::string_view delim = "\n") noexcept -> std::string;

/// @brief Strip leading and trailing whitespace.
auto trim(std::string_view str) noexcept -> std::string_view;

/// @brief Lowercase ASCII copy of the string.
auto to_lower(std::string_view str) noexcept -> std::string;

/// @brief Make a split view from a string into multiple lines based on a delimiter.
/// @param str The string to split.
/// @param delim The delimiter to split the string.
/// @return A range view representing the split lines.
constexpr auto make_split_view(std::string_view str, char delim = '\n') noexcept {
    constexpr auto functor = [](auto&& rng) {
        return std::string_view(&*rng.begin(), static_cast<size_t>(std::ranges::distance(rng)));
    };
    // empty chunks are dropped before dereferencing their begin()
    constexpr auto non_empty = [](auto&& rng) { return !std::ranges::empty(rng); };

    return str
        | std::ranges::views::split(delim)
        | std::ranges::views::filter(non_empty)
        | std::ranges::views::transform(functor);
}

}  // namespace usbreset::utils

#endif  // STRING_UTILS_HPP
