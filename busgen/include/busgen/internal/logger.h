/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <functional>
#include <string>

#include <fmt/format.h>

namespace busgen
{
    enum class log_level
    {
        debug = 0,
        info,
        warning,
        error,
        off
    };

    using log_sink = std::function<void(log_level level, const std::string& message)>;

    void log(log_level level, const std::string& message);
    bool is_log_enabled(log_level level);
    void set_log_level(log_level level);
    log_level get_log_level();

    // replaces the stderr sink, an empty sink restores it
    void set_log_sink(log_sink sink);

    const char* to_string(log_level level);
}

#define BUSGEN_LOG(level, format_str, ...)                                                                             \
    do                                                                                                                 \
    {                                                                                                                  \
        if (::busgen::is_log_enabled(level))                                                                           \
            ::busgen::log(level, fmt::format(format_str, ##__VA_ARGS__));                                              \
    } while (0)

#define BUSGEN_DEBUG(format_str, ...) BUSGEN_LOG(::busgen::log_level::debug, format_str, ##__VA_ARGS__)
#define BUSGEN_INFO(format_str, ...) BUSGEN_LOG(::busgen::log_level::info, format_str, ##__VA_ARGS__)
#define BUSGEN_WARNING(format_str, ...) BUSGEN_LOG(::busgen::log_level::warning, format_str, ##__VA_ARGS__)
#define BUSGEN_ERROR(format_str, ...) BUSGEN_LOG(::busgen::log_level::error, format_str, ##__VA_ARGS__)
