#ifndef QUERYGEN_COMMON_LOGGER_H_
#define QUERYGEN_COMMON_LOGGER_H_

#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace querygen {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Set the level from its name (trace, debug, info, warn, error, off)
     * @return false if the name is not recognized; the level is left unchanged
     */
    static bool SetLevel(const std::string& level_name);
};

} // namespace common
} // namespace querygen

// Macros for convenient logging
#define QUERYGEN_TRACE(...) spdlog::trace(__VA_ARGS__)
#define QUERYGEN_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define QUERYGEN_INFO(...)  spdlog::info(__VA_ARGS__)
#define QUERYGEN_WARN(...)  spdlog::warn(__VA_ARGS__)
#define QUERYGEN_ERROR(...) spdlog::error(__VA_ARGS__)
#define QUERYGEN_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // QUERYGEN_COMMON_LOGGER_H_
