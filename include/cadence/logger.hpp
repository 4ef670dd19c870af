/*
 * cadence - Unattended Job Supervisor
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace cadence {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Mirror every emitted line into an append-mode file; an empty path disables it.
    [[nodiscard]] static bool setFile(const std::filesystem::path& path) noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

    [[nodiscard]] static LogLevel parseLevel(const std::string& value, LogLevel fallback) noexcept;

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
void clearThreadName();

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::cadence::Logger::error(msg)
#define LOG_WARN(msg)  ::cadence::Logger::warn(msg)  
#define LOG_INFO(msg)  ::cadence::Logger::info(msg)
#define LOG_DEBUG(msg) ::cadence::Logger::debug(msg)
#define LOG_TRACE(msg) ::cadence::Logger::trace(msg)
