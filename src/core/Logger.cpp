#include "core/Logger.hpp"

namespace core {

std::mutex Logger::mutex_;
std::atomic<LogLevel> Logger::level_{LogLevel::INFO};

std::optional<LogLevel> Logger::parseLevel(const std::string& name) {
    if (name == "debug") return LogLevel::DEBUG;
    if (name == "info")  return LogLevel::INFO;
    if (name == "warn")  return LogLevel::WARN;
    if (name == "error") return LogLevel::ERROR;
    return std::nullopt;
}

} // namespace core
