/**
 * @file Logger.cpp
 * @brief Implementação do logger com formatação `printf`.
 */
#include "Logger.hpp"
#include <cstdarg>

namespace cavern {

static void emit(std::FILE* f, const char* prefix, const char* fmt, va_list ap) {
    if (!f) return;
    if (prefix) std::fputs(prefix, f);
    std::vfprintf(f, fmt, ap);
    std::fputc('\n', f);
    std::fflush(f);
}

void Logger::report(const char* fmt, ...) {
    if (!enabled(LogLevel::Info)) return;
    va_list ap;
    va_start(ap, fmt);
    emit(out_, nullptr, fmt, ap);
    va_end(ap);
}

void Logger::debug(const char* fmt, ...) {
    if (!enabled(LogLevel::Debug)) return;
    va_list ap;
    va_start(ap, fmt);
    emit(err_, "[DEBUG] ", fmt, ap);
    va_end(ap);
}

void Logger::warn(const char* fmt, ...) {
    if (!enabled(LogLevel::Warn)) return;
    va_list ap;
    va_start(ap, fmt);
    emit(err_, "[WARN] ", fmt, ap);
    va_end(ap);
}

void Logger::error(const char* fmt, ...) {
    if (!enabled(LogLevel::Error)) return;
    va_list ap;
    va_start(ap, fmt);
    emit(err_, "[ERROR] ", fmt, ap);
    va_end(ap);
}

Logger& Logger::silent() {
    static Logger quiet(LogLevel::Off, nullptr, nullptr);
    return quiet;
}

} // namespace cavern
