/**
 * @file logger.h
 * @brief 简单的线程安全日志工具
 */
#pragma once
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

/**
 * @class Logger
 * @brief 进程级日志器，输出到标准错误
 *
 * 所有成员均为静态，多线程同时写日志时由logMutex保证每行完整输出。
 * 注意：不要在持有停车场锁的情况下写日志。
 */
class Logger {
private:
    static LogLevel currentLevel;
    static std::mutex logMutex;

    static const char* getLevelString(LogLevel level);

public:
    static void log(LogLevel level, const std::string& message);
    static void setLogLevel(LogLevel level);
    static LogLevel getLogLevel();

    static void debug(const std::string& message) { log(LogLevel::DEBUG, message); }
    static void info(const std::string& message) { log(LogLevel::INFO, message); }
    static void warning(const std::string& message) { log(LogLevel::WARNING, message); }
    static void error(const std::string& message) { log(LogLevel::ERROR, message); }
};

/**
 * @brief 解析日志级别字符串（debug/info/warning/error，不区分大小写）
 * @param text 输入字符串
 * @param[out] outLevel 解析结果
 * @return 是否解析成功
 */
bool parseLogLevel(const std::string& text, LogLevel& outLevel);
