/**
 * @file Logging.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
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
#include <cstdint>

#ifndef SIMTRACE_ENABLE_LOGGING
#define SIMTRACE_ENABLE_LOGGING 1
#endif

#define LOG_DEBUG(fmt, ...) Logger::log(LogLevel::Debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  Logger::log(LogLevel::Info, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  Logger::log(LogLevel::Warn, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) Logger::log(LogLevel::Error, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

enum class LogLevel : uint8_t {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off
};

/**
 * @brief Console logger
 *
 * Log lines are written to stderr so decoded trace records on stdout
 * are never interleaved with diagnostics.
 */
class Logger {
public:
    // ANSI color codes
    static constexpr const char* COLOR_RESET   = "\033[0m";
    static constexpr const char* COLOR_RED     = "\033[31m";
    static constexpr const char* COLOR_YELLOW  = "\033[33m";
    static constexpr const char* COLOR_GREEN   = "\033[32m";
    static constexpr const char* COLOR_CYAN    = "\033[36m";
    static constexpr const char* COLOR_GRAY    = "\033[90m";

    static void setLevel(LogLevel level) {
        minLevel = level;
    }

    static LogLevel getLevel() {
        return minLevel;
    }

    static bool isEnabled(LogLevel level) {
        return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
    }

    static void log(LogLevel level, const char* file, int line, const char* fmt, ...) {
#if SIMTRACE_ENABLE_LOGGING
        if (!isEnabled(level)) {
            return;
        }

        // Choose color based on log level
        const char* color = COLOR_RESET;
        const char* name = "INFO";
        switch (level) {
            case LogLevel::Debug:
                color = COLOR_CYAN;
                name = "DEBUG";
                break;
            case LogLevel::Info:
                color = COLOR_GREEN;
                name = "INFO";
                break;
            case LogLevel::Warn:
                color = COLOR_YELLOW;
                name = "WARN";
                break;
            case LogLevel::Error:
                color = COLOR_RED;
                name = "ERROR";
                break;
            default:
                return;
        }

        // Print colored level with file and line info
        std::fprintf(stderr, "%s[%s]%s %s[%s:%d]%s ",
                     color, name, COLOR_RESET,
                     COLOR_GRAY, file, line, COLOR_RESET);

        va_list args;
        va_start(args, fmt);
        std::vfprintf(stderr, fmt, args);
        va_end(args);

        std::fprintf(stderr, "\n");
#else
        (void)level;
        (void)file;
        (void)line;
        (void)fmt;
#endif
    }

private:
    static inline LogLevel minLevel = LogLevel::Info;
};
