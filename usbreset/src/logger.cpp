#include "usbreset/logger.hpp"

#include <utility>  // for move

namespace usbreset::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

}  // namespace usbreset::logger
