#include "vigil/logging.hpp"

#include <string>

#include <spdlog/spdlog.h>

#include "vigil/core/platform_utils.hpp"

namespace vigil {

auto init_logging(std::string_view default_level) -> void {
    std::string level_name(default_level);
    if (auto env = core::safe_getenv("VIGIL_LOG_LEVEL"); env && !env->empty()) {
        level_name = *env;
    }

    auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to off; only honour off when asked for explicitly.
    if (level == spdlog::level::off && level_name != "off") {
        level = spdlog::level::from_str(std::string(default_level));
    }

    spdlog::set_level(level);
    spdlog::set_pattern("%Y-%m-%dT%H:%M:%S.%e [%^%l%$] [%t] %v");
}

} // namespace vigil
