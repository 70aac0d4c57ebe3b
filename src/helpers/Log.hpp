#pragma once
#include <format>
#include <iostream>
#include <mutex>
#include <string>

enum eLogLevel
{
    TRACE = 0,
    INFO,
    LOG,
    WARN,
    ERR,
    CRIT
};

namespace Debug {
    inline bool       quiet   = false;
    inline bool       verbose = false;
    inline std::mutex logMutex;

    template <typename... Args>
    void log(eLogLevel level, const std::string& fmt, Args&&... args) {
        if (quiet)
            return;

        if (level == TRACE && !verbose)
            return;

        // workers finishing a Start log while the loop thread does
        std::lock_guard<std::mutex> lg(logMutex);

        std::cout << '[';

        switch (level) {
            case TRACE: std::cout << "TRACE"; break;
            case INFO: std::cout << "INFO"; break;
            case LOG: std::cout << "LOG"; break;
            case WARN: std::cout << "WARN"; break;
            case ERR: std::cout << "ERR"; break;
            case CRIT: std::cout << "CRITICAL"; break;
        }

        std::cout << "] ";

        std::cout << std::vformat(fmt, std::make_format_args(args...)) << std::endl;
    }
};
