#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>

std::mutex Logger::logMutex;

namespace {
std::atomic<LogLevel> currentLevel{LogLevel::Info};
}

void Logger::setLevel(LogLevel level) {
    currentLevel.store(level);
}

LogLevel Logger::level() {
    return currentLevel.load();
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::Debug; return true; }
    if (name == "info")  { out = LogLevel::Info;  return true; }
    if (name == "warn")  { out = LogLevel::Warn;  return true; }
    if (name == "error") { out = LogLevel::Error; return true; }
    return false;
}

void Logger::write(std::ostream& out, const char* tag, const std::string& message) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    std::lock_guard<std::mutex> lock(logMutex);
    out << std::put_time(&tm, "%F %T") << " " << tag << " " << message << std::endl;
}

void Logger::error(const std::string& message) {
    write(std::cerr, "\033[1;31m[ERROR]\033[0m", message);
}

void Logger::warn(const std::string& message) {
    if (level() > LogLevel::Warn) return;
    write(std::cerr, "\033[1;35m[WARN]\033[0m", message);
}

void Logger::info(const std::string& message) {
    if (level() > LogLevel::Info) return;
    write(std::cout, "\033[1;32m[INFO]\033[0m", message);
}

// Yellow, only shown with LOG_LEVEL=debug
void Logger::debug(const std::string& message) {
    if (level() > LogLevel::Debug) return;
    write(std::cout, "\033[1;33m[DEBUG]\033[0m", message);
}
