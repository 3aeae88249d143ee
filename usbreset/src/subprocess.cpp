#include "usbreset/subprocess.hpp"

#include <csignal>  // for sigaction, SIGPIPE
#include <cstdint>  // for uint32_t
#include <cstdio>   // for fwrite, fclose

#include <algorithm>  // for transform
#include <array>      // for array
#include <iterator>   // for back_inserter

#include <subprocess.h>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace {

// Child may exit before consuming stdin; the write must fail with EPIPE instead of killing us.
class ScopedIgnoreSigpipe final {
 public:
    ScopedIgnoreSigpipe() noexcept {
        struct sigaction ignore_action{};
        ignore_action.sa_handler = SIG_IGN;
        sigemptyset(&ignore_action.sa_mask);
        m_installed = (sigaction(SIGPIPE, &ignore_action, &m_previous) == 0);
    }
    ~ScopedIgnoreSigpipe() {
        if (m_installed) {
            sigaction(SIGPIPE, &m_previous, nullptr);
        }
    }

    ScopedIgnoreSigpipe(const ScopedIgnoreSigpipe&)     = delete;
    auto operator=(const ScopedIgnoreSigpipe&) = delete;

 private:
    struct sigaction m_previous{};
    bool m_installed{false};
};

}  // namespace

namespace usbreset::utils {

auto exec_with_input(const std::vector<std::string>& vec, std::string_view input) noexcept -> std::optional<ProcessResult> {
    if (vec.empty()) {
        spdlog::error("[exec_with_input] empty command");
        return std::nullopt;
    }
    spdlog::debug("[exec_with_input] cmd := {}", vec);

    std::vector<const char*> args;
    std::transform(vec.cbegin(), vec.cend(), std::back_inserter(args),
        [](const std::string& arg) -> const char* { return arg.c_str(); });
    args.push_back(nullptr);

    static constexpr int options = subprocess_option_enable_async
        | subprocess_option_combined_stdout_stderr
        | subprocess_option_inherit_environment
        | subprocess_option_search_user_path;

    subprocess_s process{};
    if (subprocess_create(args.data(), options, &process) != 0) {
        spdlog::error("[exec_with_input] Failed to spawn '{}'", vec.front());
        return std::nullopt;
    }

    {
        const ScopedIgnoreSigpipe sigpipe_guard{};
        FILE* stdin_file = subprocess_stdin(&process);
        if (!input.empty() && std::fwrite(input.data(), sizeof(char), input.size(), stdin_file) != input.size()) {
            spdlog::warn("[exec_with_input] '{}' did not accept the whole input", vec.front());
        }
        // EOF for the child; join must not close it a second time
        if (std::fclose(stdin_file) != 0) {
            spdlog::warn("[exec_with_input] '{}' closed its stdin early", vec.front());
        }
        process.stdin_file = nullptr;
    }

    ProcessResult result{};
    std::array<char, 8192> buf{};
    std::uint32_t bytes_read{};
    do {
        bytes_read = subprocess_read_stdout(&process, buf.data(), static_cast<std::uint32_t>(buf.size()));
        if (bytes_read > 0) {
            result.output.append(buf.data(), bytes_read);
        }
    } while (bytes_read != 0);

    int ret{-1};
    if (subprocess_join(&process, &ret) != 0) {
        spdlog::error("[exec_with_input] Failed to join process: return code {}", ret);
        if (subprocess_destroy(&process) != 0) {
            spdlog::error("[exec_with_input] Failed to destroy process");
        }
        return std::nullopt;
    }
    if (subprocess_destroy(&process) != 0) {
        spdlog::error("[exec_with_input] Failed to destroy process");
        return std::nullopt;
    }

    result.exit_code = static_cast<std::int32_t>(ret);
    spdlog::debug("[exec_with_input] '{}' exited with {}", vec.front(), result.exit_code);
    return result;
}

}  // namespace usbreset::utils
