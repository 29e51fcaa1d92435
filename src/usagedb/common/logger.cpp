#include "usagedb/common/logger.h"

#include <iostream>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace usagedb {
namespace common {

namespace {
const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
}

void Logger::Init() {
    try {
        auto console = spdlog::stdout_color_mt("console");
        spdlog::set_default_logger(console);
        spdlog::set_pattern(kPattern);
        spdlog::set_level(spdlog::level::info);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

std::shared_ptr<spdlog::logger> MakeLogger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_st>();
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_pattern(kPattern);
    logger->set_level(spdlog::get_level());
    return logger;
}

std::shared_ptr<spdlog::logger> MakeNullLogger(const std::string& name) {
    auto sink = std::make_shared<spdlog::sinks::null_sink_st>();
    return std::make_shared<spdlog::logger>(name, sink);
}

} // namespace common
} // namespace usagedb
