/**
 * @file logger.cpp
 * @brief Logger实现
 */
#include "logger.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

LogLevel Logger::currentLevel = LogLevel::INFO;
std::mutex Logger::logMutex;

const char* Logger::getLevelString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex);
    if (level < currentLevel) return;

    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&now_c, &tm);  // localtime 非线程安全

    std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
              << " [" << getLevelString(level) << "] "
              << message << std::endl;
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex);
    currentLevel = level;
}

LogLevel Logger::getLogLevel() {
    std::lock_guard<std::mutex> lock(logMutex);
    return currentLevel;
}

bool parseLogLevel(const std::string& text, LogLevel& outLevel) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        outLevel = LogLevel::DEBUG;
    } else if (lower == "info") {
        outLevel = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        outLevel = LogLevel::WARNING;
    } else if (lower == "error") {
        outLevel = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}
