/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "propsgen/logger.h"

namespace
{
    const char* logger_name = "propsgen";

    std::shared_ptr<spdlog::logger> get_logger()
    {
        auto logger = spdlog::get(logger_name);
        if (!logger)
        {
            // stdout is reserved for --dump output
            logger = spdlog::stderr_color_mt(logger_name);
            logger->set_pattern("[%^%l%$] %v");
            logger->set_level(spdlog::level::info);
        }
        return logger;
    }

    spdlog::level::level_enum to_spdlog_level(int level)
    {
        switch (level)
        {
        case 0:
            return spdlog::level::debug;
        case 1:
            return spdlog::level::trace;
        case 2:
            return spdlog::level::info;
        case 3:
            return spdlog::level::warn;
        case 4:
            return spdlog::level::err;
        default:
            return spdlog::level::critical;
        }
    }
}

void propsgen_log(int level, const std::string& message)
{
    get_logger()->log(to_spdlog_level(level), message);
}

void propsgen_set_verbose(bool verbose)
{
    get_logger()->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}
