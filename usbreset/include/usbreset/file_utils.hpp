#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace usbreset::file_utils {

// Returns std::nullopt if the path is not a regular file or cannot be read.
auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string>;

}  // namespace usbreset::file_utils

#endif  // FILE_UTILS_HPP
