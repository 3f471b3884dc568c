#pragma once
#include <atomic>
#include <cstdio>
#include <cstdarg>
#include <mutex>

namespace tessera {

enum class LogLevel { TRACE=0, DEBUG, INFO, WARN, ERROR };

class Logger {
public:
    static Logger& instance();
    void set_level(LogLevel lvl);
    // Unknown names fall back to INFO.
    void set_level_by_name(const char* name);
    LogLevel level() const { return level_.load(std::memory_order_relaxed); }
    void log(LogLevel lvl, const char* fmt, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
private:
    Logger() = default;
    std::mutex mtx_;
    std::atomic<LogLevel> level_{LogLevel::INFO};
    const char* level_str(LogLevel lvl);
};

} // namespace tessera
