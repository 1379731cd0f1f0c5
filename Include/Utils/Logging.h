/**
 * @file Logging.h
 * @author ShadowCard developers
 * @brief Logging utilities
 * @version 0.2
 * @date 2026-03-02
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdarg>
#include <cstdio>
#include <cstring>

#ifndef SHADOW_ENABLE_LOGGING
#define SHADOW_ENABLE_LOGGING 1
#endif

#ifndef SHADOW_LOG_DEBUG
#define SHADOW_LOG_DEBUG 0
#endif

#define LOG_INFO(fmt, ...)  Logger::log("INFO", __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  Logger::log("WARN", __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) Logger::log("ERROR", __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#if SHADOW_LOG_DEBUG
#define LOG_DEBUG(fmt, ...) Logger::log("DEBUG", __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#else
#define LOG_DEBUG(fmt, ...) ((void)0)
#endif

class Logger {
public:
    // ANSI color codes
    static constexpr const char* COLOR_RESET   = "\033[0m";
    static constexpr const char* COLOR_RED     = "\033[31m";
    static constexpr const char* COLOR_YELLOW  = "\033[33m";
    static constexpr const char* COLOR_GREEN   = "\033[32m";
    static constexpr const char* COLOR_CYAN    = "\033[36m";
    static constexpr const char* COLOR_GRAY    = "\033[90m";

    static void log(const char* level, const char* file, int line, const char* fmt, ...) {
#if SHADOW_ENABLE_LOGGING
        const char* color = COLOR_RESET;
        if (std::strcmp(level, "ERROR") == 0) {
            color = COLOR_RED;
        } else if (std::strcmp(level, "WARN") == 0) {
            color = COLOR_YELLOW;
        } else if (std::strcmp(level, "INFO") == 0) {
            color = COLOR_GREEN;
        } else if (std::strcmp(level, "DEBUG") == 0) {
            color = COLOR_CYAN;
        }

        // Format into one buffer so lines from the reader context and the
        // operator context do not interleave mid-line.
        char message[256];
        va_list args;
        va_start(args, fmt);
        std::vsnprintf(message, sizeof(message), fmt, args);
        va_end(args);

        std::printf("%s[%s]%s %s[%s:%d]%s %s\n",
                    color, level, COLOR_RESET,
                    COLOR_GRAY, baseName(file), line, COLOR_RESET,
                    message);
#else
        (void)level;
        (void)file;
        (void)line;
        (void)fmt;
#endif
    }

private:
    static const char* baseName(const char* path) {
        const char* slash = std::strrchr(path, '/');
        return slash ? slash + 1 : path;
    }
};
