#pragma once

/** \file logging.hpp
 *  \brief Process-wide spdlog setup.
 */

#include <string_view>

namespace vigil {

/** \brief Configure the default spdlog logger.
 *
 * Level comes from VIGIL_LOG_LEVEL (trace, debug, info, warn, error, critical, off),
 * falling back to \p default_level when unset or unknown. Safe to call more than once.
 */
auto init_logging(std::string_view default_level = "info") -> void;

} // namespace vigil
