//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Logger.cpp
// Purpose: Logger static state, environment seeding and file sink.
//==========================================================================================================

#include "logging/Logger.h"

namespace {

// CREDO_LOG_LEVEL picks the starting level so that library code logging before
// configureFromEnvironment() is filtered the same way.
LogLevel initialLevel() {
    const std::string lvl = GetEnvOrDefault("CREDO_LOG_LEVEL", "");
    if (lvl.empty()) {
        return LogLevel::LOG_INFO_LEVEL;
    }
    return Logger::toLogLevel(Logger::levelFromString(lvl));
}

} // namespace

LogLevel Logger::sLogLevel = initialLevel();
std::ofstream Logger::sLogFile;
std::mutex Logger::sLogMutex;

void Logger::configureFromEnvironment() {
    const std::string lvl = GetEnvOrDefault("CREDO_LOG_LEVEL", "");
    if (!lvl.empty()) {
        setLogLevel(toLogLevel(levelFromString(lvl)));
    }
}

void Logger::setLogFile(const std::string& filePath) {
    std::lock_guard<std::mutex> lock(sLogMutex);
    if (sLogFile.is_open()) {
        sLogFile.close();
    }
    sLogFile.open(filePath, std::ios::out | std::ios::app);
    if (!sLogFile.is_open()) {
        std::cerr << "[ERROR] Failed to open log file: " << filePath << " (errno=" << errno << ")" << std::endl;
        return;
    }
    auto now = std::chrono::system_clock::now();
    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm buf{};
    ::localtime_r(&nowTime, &buf);
    sLogFile << "\n=== credo log opened at " << std::put_time(&buf, "%Y-%m-%d %H:%M:%S") << " ===\n";
    sLogFile.flush();
}
