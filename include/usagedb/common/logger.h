#ifndef USAGEDB_COMMON_LOGGER_H_
#define USAGEDB_COMMON_LOGGER_H_

#include <memory>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

namespace usagedb {
namespace common {

class Logger {
public:
    static void Init();
    static void SetLevel(spdlog::level::level_enum level);
};

/**
 * @brief Build an unregistered console logger for injection into an engine
 */
std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name);

/**
 * @brief Build a logger that discards everything
 */
std::shared_ptr<spdlog::logger> MakeNullLogger(const std::string& name = "null");

} // namespace common
} // namespace usagedb

// Macros for convenient logging through the default logger
#define USAGEDB_TRACE(...) spdlog::trace(__VA_ARGS__)
#define USAGEDB_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define USAGEDB_INFO(...)  spdlog::info(__VA_ARGS__)
#define USAGEDB_WARN(...)  spdlog::warn(__VA_ARGS__)
#define USAGEDB_ERROR(...) spdlog::error(__VA_ARGS__)
#define USAGEDB_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // USAGEDB_COMMON_LOGGER_H_
