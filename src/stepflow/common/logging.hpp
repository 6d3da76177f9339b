/**
 * @file logging.hpp
 * @brief Process-wide logger setup.
 */
#pragma once
#include "stepflow/common/common.hpp"

namespace stepflow
{

/**
 * @brief Install the `stepflow` stderr logger as spdlog's default logger.
 *
 * @details
 * All library code logs through the spdlog free functions (`spdlog::info`,
 * `spdlog::debug`, ...), so it writes to whatever default logger is installed.
 * stdout is left to the steps' own output.
 *
 * @param level Level name understood by `spdlog::level::from_str`
 *              ("trace", "debug", "info", "warn", "error", "critical", "off").
 *              A `SPDLOG_LEVEL` environment variable overrides it.
 */
void init_logging(const std::string& level = "info");

} // namespace stepflow
