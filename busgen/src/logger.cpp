/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <atomic>
#include <cstdio>
#include <mutex>

#include <busgen/internal/logger.h>

namespace busgen
{
    namespace
    {
        std::atomic<int> current_level{static_cast<int>(log_level::warning)};
        std::mutex sink_mutex;
        log_sink current_sink;
    }

    const char* to_string(log_level level)
    {
        switch (level)
        {
        case log_level::debug:
            return "debug";
        case log_level::info:
            return "info";
        case log_level::warning:
            return "warning";
        case log_level::error:
            return "error";
        case log_level::off:
            return "off";
        }
        return "?";
    }

    bool is_log_enabled(log_level level)
    {
        return level != log_level::off && static_cast<int>(level) >= current_level.load();
    }

    void set_log_level(log_level level)
    {
        current_level = static_cast<int>(level);
    }

    log_level get_log_level()
    {
        return static_cast<log_level>(current_level.load());
    }

    void set_log_sink(log_sink sink)
    {
        std::lock_guard<std::mutex> lock(sink_mutex);
        current_sink = std::move(sink);
    }

    void log(log_level level, const std::string& message)
    {
        log_sink sink;
        {
            std::lock_guard<std::mutex> lock(sink_mutex);
            sink = current_sink;
        }
        // called unlocked, a sink may log itself
        if (sink)
        {
            sink(level, message);
            return;
        }
        fmt::print(stderr, "[busgen][{}] {}\n", to_string(level), message);
    }
}
