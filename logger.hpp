#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include "spdlog/spdlog.h"
#include "spdlog/sinks/stdout_color_sinks.h"

static const char* const LOGGER_NAME = "clusterupload";

// Creates the shared console logger. Safe to call more than once.
inline void initLogging()
{
    if (spdlog::get(LOGGER_NAME) == nullptr) {
        auto console = spdlog::stderr_color_mt(LOGGER_NAME);
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    }
}

inline std::shared_ptr<spdlog::logger> logger()
{
    auto log = spdlog::get(LOGGER_NAME);
    if (log == nullptr) {
        initLogging();
        log = spdlog::get(LOGGER_NAME);
    }
    return log;
}

inline bool setLogLevel(const std::string& name)
{
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if (level == spdlog::level::off && name != "off") {
        return false;
    }
    spdlog::set_level(level);
    return true;
}

#endif // LOGGER_HPP
