#include "querygen/common/logger.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>

namespace querygen {
namespace common {

void Logger::Init() {
    try {
        auto console = spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

bool Logger::SetLevel(const std::string& level_name) {
    if (level_name == "trace") SetLevel(spdlog::level::trace);
    else if (level_name == "debug") SetLevel(spdlog::level::debug);
    else if (level_name == "info") SetLevel(spdlog::level::info);
    else if (level_name == "warn") SetLevel(spdlog::level::warn);
    else if (level_name == "error") SetLevel(spdlog::level::err);
    else if (level_name == "off") SetLevel(spdlog::level::off);
    else return false;
    return true;
}

} // namespace common
} // namespace querygen
