#pragma once
#include <string>
#include <iostream>
#include <mutex>
#include <format>

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

class Logger {
public:
    static void error(const std::string& message);
    static void warn(const std::string& message);
    static void info(const std::string& message);
    static void debug(const std::string& message);

    static void setLevel(LogLevel level);
    static LogLevel level();

    // "debug" | "info" | "warn" | "error"; returns false on unknown names
    static bool parseLevel(const std::string& name, LogLevel& out);

    template<typename... Args>
    static void formattedError(std::format_string<Args...> fmt, Args&&... args) {
        error(std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void formattedWarn(std::format_string<Args...> fmt, Args&&... args) {
        warn(std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void formattedInfo(std::format_string<Args...> fmt, Args&&... args) {
        if (level() > LogLevel::Info) return;
        info(std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    static void formattedDebug(std::format_string<Args...> fmt, Args&&... args) {
        if (level() > LogLevel::Debug) return;
        debug(std::format(fmt, std::forward<Args>(args)...));
    }

private:
    static void write(std::ostream& out, const char* tag, const std::string& message);

    static std::mutex logMutex;
};
