/**
 * LAEP core.
 *
 * Logging macros used across the library, backed by spdlog.
 */

#ifndef LAEP_UTIL_DEBUG_HPP_
#define LAEP_UTIL_DEBUG_HPP_

#ifndef SPDLOG_ACTIVE_LEVEL
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include "spdlog/spdlog.h"
#include "spdlog/fmt/ranges.h"

#endif // LAEP_UTIL_DEBUG_HPP_
