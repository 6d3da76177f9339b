/**
 * @file logging.cpp
 */
#include "stepflow/common/logging.hpp"

#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace stepflow
{

void init_logging(const std::string& level)
{
    auto logger = spdlog::get("stepflow");
    if (!logger)
    {
        logger = spdlog::stderr_color_mt("stepflow");
    }
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [T%t] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::from_str(level));

    // SPDLOG_LEVEL=debug or SPDLOG_LEVEL=stepflow=trace
    spdlog::cfg::load_env_levels();
}

} // namespace stepflow
