#pragma once
#include <string>
#include <cstdio>
#include <cstdarg>

namespace vram_sizer {

enum class LogLevel { TRACE = 0, DEBUG = 1, INFO = 2, WARN = 3, ERROR = 4 };

LogLevel log_level_from_int(int value);

class Logger {
public:
    static Logger& get();
    void set_level(LogLevel level);
    LogLevel get_level() const;
    void set_colors(bool enabled);
    void debug(const char* fmt, ...);
    void info(const char* fmt, ...);
    void warn(const char* fmt, ...);
    void error(const char* fmt, ...);
    void flush();
private:
    Logger();
    ~Logger() = default;
    void log(LogLevel level, const char* fmt, va_list args);
    LogLevel level_ = LogLevel::INFO;
    bool colors_ = true;
};

} // namespace vram_sizer
