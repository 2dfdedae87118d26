#include "utils/logger.hpp"
#include <chrono>
#include <ctime>
#include <cstdio>
#include <cstdarg>

namespace vram_sizer {

namespace {
    const char* level_strings[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR"};
    const char* color_codes[] = {"\033[0;90m", "\033[0;36m", "\033[0;32m", "\033[0;33m", "\033[0;31m"};
    const char* reset_code = "\033[0m";
}

LogLevel log_level_from_int(int value) {
    if (value <= 0) return LogLevel::TRACE;
    if (value >= 4) return LogLevel::ERROR;
    return static_cast<LogLevel>(value);
}

Logger::Logger() {
    std::setvbuf(stdout, nullptr, _IONBF, 0);
}

Logger& Logger::get() {
    static Logger instance;
    return instance;
}

void Logger::set_level(LogLevel level) {
    level_ = level;
}

LogLevel Logger::get_level() const {
    return level_;
}

void Logger::set_colors(bool enabled) {
    colors_ = enabled;
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log(LogLevel::ERROR, fmt, args);
    va_end(args);
}

void Logger::log(LogLevel level, const char* fmt, va_list args) {
    if (level_ > level) return;

    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm local_tm = *std::localtime(&time_t);

    std::printf("[%02d:%02d:%02d] ", local_tm.tm_hour, local_tm.tm_min, local_tm.tm_sec);

    if (colors_) {
        std::printf("%s%s%s: ", color_codes[static_cast<int>(level)],
                   level_strings[static_cast<int>(level)], reset_code);
    } else {
        std::printf("%s: ", level_strings[static_cast<int>(level)]);
    }

    std::vprintf(fmt, args);
    std::printf("\n");
}

void Logger::flush() {
    std::fflush(stdout);
}

} // namespace vram_sizer
