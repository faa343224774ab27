/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <string>

#ifndef PROPSGEN_LOGGING_DEFINED

#if defined(USE_PROPSGEN_LOGGING)
// levels 0=DEBUG, 1=TRACE, 2=INFO, 3=WARNING, 4=ERROR, 5=CRITICAL
void propsgen_log(int level, const std::string& message);
void propsgen_set_verbose(bool verbose);

#define PROPSGEN_LOG_BACKEND(level, message) propsgen_log(level, message)
#else
#define PROPSGEN_LOG_BACKEND(level, message)                                                                           \
    do                                                                                                                 \
    {                                                                                                                  \
        (void)(level);                                                                                                 \
        (void)(message);                                                                                               \
    } while (0)
#endif

#if defined(USE_PROPSGEN_LOGGING)

#include <fmt/format.h>

#define PROPSGEN_DEBUG(format_str, ...)                                                                                \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        PROPSGEN_LOG_BACKEND(0, formatted);                                                                            \
    } while (0)

#define PROPSGEN_TRACE(format_str, ...)                                                                                \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        PROPSGEN_LOG_BACKEND(1, formatted);                                                                            \
    } while (0)

#define PROPSGEN_INFO(format_str, ...)                                                                                 \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        PROPSGEN_LOG_BACKEND(2, formatted);                                                                            \
    } while (0)

#define PROPSGEN_WARNING(format_str, ...)                                                                              \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        PROPSGEN_LOG_BACKEND(3, formatted);                                                                            \
    } while (0)

#define PROPSGEN_ERROR(format_str, ...)                                                                                \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        PROPSGEN_LOG_BACKEND(4, formatted);                                                                            \
    } while (0)

#define PROPSGEN_CRITICAL(format_str, ...)                                                                             \
    do                                                                                                                 \
    {                                                                                                                  \
        auto formatted = fmt::format(format_str, ##__VA_ARGS__);                                                       \
        PROPSGEN_LOG_BACKEND(5, formatted);                                                                            \
    } while (0)

#else
#define PROPSGEN_DEBUG(format_str, ...)
#define PROPSGEN_TRACE(format_str, ...)
#define PROPSGEN_INFO(format_str, ...)
#define PROPSGEN_WARNING(format_str, ...)
#define PROPSGEN_ERROR(format_str, ...)
#define PROPSGEN_CRITICAL(format_str, ...)
#endif
#define PROPSGEN_LOGGING_DEFINED
#endif
