#pragma once
#include <string>
#include <mutex>
#include <fmt/format.h>
#include <iostream>
#include "../config/Config.hpp"

enum LogLevel {
    NONE = -1,
    LOG  = 0,
    WARN,
    ERR,
    CRIT,
    INFO,
    TRACE
};

namespace Debug {
    // stdout is reserved for response bodies
    inline std::mutex logMutex;

    inline bool       quiet = false;

    template <typename... Args>
    void log(LogLevel level, fmt::format_string<Args...> fmt, Args&&... args) {

        std::string logMsg = "";

        if (level == TRACE && (!g_pConfig || !g_pConfig->m_config.trace_logging))
            return;

        if (quiet && (level == LOG || level == INFO || level == TRACE))
            return;

        switch (level) {
            case LOG: logMsg += "[LOG] "; break;
            case WARN: logMsg += "[WARN] "; break;
            case ERR: logMsg += "[ERR] "; break;
            case CRIT: logMsg += "[CRITICAL] "; break;
            case INFO: logMsg += "[INFO] "; break;
            case TRACE: logMsg += "[TRACE] "; break;
            default: break;
        }

        logMsg += fmt::vformat(fmt::string_view(fmt), fmt::make_format_args(args...));

        std::lock_guard<std::mutex> lg(logMutex);
        std::cerr << logMsg << "\n";
    }

    template <typename... Args>
    [[noreturn]] void die(fmt::format_string<Args...> fmt, Args&&... args) {
        const std::string logMsg = fmt::vformat(fmt::string_view(fmt), fmt::make_format_args(args...));

        {
            std::lock_guard<std::mutex> lg(logMutex);
            std::cerr << "[ERR] " << logMsg << "\n";
        }
        exit(1);
    }
};
