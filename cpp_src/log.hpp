#pragma once
#include <functional>
#include <iostream>
#include <mutex>
#include <string>

namespace bj {

    enum class LogLevel { Debug = 0, Info = 1, Warning = 2 };

    inline const char* log_level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Debug: return "DEBUG";
            case LogLevel::Info: return "INFO";
            case LogLevel::Warning: return "WARNING";
        }
        return "INFO";
    }

    // Sinks may be called from several session worker threads at once.
    using LogSink = std::function<void(LogLevel, const std::string&)>;

    inline LogSink stdout_log_sink(LogLevel min_level = LogLevel::Info) {
        return [min_level](LogLevel level, const std::string& msg) {
            if (level < min_level) return;
            static std::mutex mtx;
            std::lock_guard<std::mutex> lock(mtx);
            std::cout << "C++ [" << log_level_to_string(level) << "]: " << msg << std::endl;
        };
    }

    inline LogSink null_log_sink() {
        return [](LogLevel, const std::string&) {};
    }
}
