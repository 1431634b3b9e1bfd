#pragma once

/** \file log.hpp
 *  \brief Library logger.
 *
 * One spdlog logger named "vectra" writing to stderr. Messages carry the
 * originating component in brackets, e.g. "[ingest] batch 3 committed".
 */

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace vectra {

/** \brief Shared library logger; created on first use. */
auto logger() -> std::shared_ptr<spdlog::logger>;

/** \brief Apply "trace|debug|info|warn|error|critical|off"; unknown names map to info. */
auto set_log_level(std::string_view level) -> void;

} // namespace vectra
