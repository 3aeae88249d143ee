#ifndef SUBPROCESS_HPP
#define SUBPROCESS_HPP

#include <cstdint>      // for int32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace usbreset::utils {

/// @brief Outcome of a finished child process.
struct ProcessResult final {
    /// Exit status reported by the child.
    std::int32_t exit_code{-1};
    /// Combined stdout+stderr of the child.
    std::string output{};

    /// @return true when the child exited with status 0.
    [[nodiscard]] constexpr auto succeeded() const noexcept -> bool { return exit_code == 0; }
};

/// @brief Execute command args via subprocess, feeding input to its stdin.
///
/// The whole input is written as one block, then stdin is closed and the
/// combined stdout+stderr is collected until the child exits.
/// @param vec The arguments to launch. First element is looked up in PATH.
/// @param input Text written to the child's stdin.
/// @return The child's exit status and output, std::nullopt if it could not be spawned or joined.
auto exec_with_input(const std::vector<std::string>& vec, std::string_view input) noexcept -> std::optional<ProcessResult>;

}  // namespace usbreset::utils

#endif  // SUBPROCESS_HPP
