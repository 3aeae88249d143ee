#ifndef IO_UTILS_HPP
#define IO_UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace usbreset::utils {

// Runs command through the shell and returns its stdout without the trailing newline.
// Returns an empty string if the shell could not be started.
auto exec(std::string_view command) noexcept -> std::string;

}  // namespace usbreset::utils

#endif  // IO_UTILS_HPP
