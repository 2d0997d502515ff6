#pragma once

#include "Constants.hpp"

#include <trantor/utils/AsyncFileLogger.h>
#include <trantor/utils/Logger.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief 日志管理器 - trantor::AsyncFileLogger 异步写盘 + 按日期轮转
 *
 * 文件命名: logs/uv-panel_YYYY-MM-DD.log
 * 轮转策略: 每天自动创建新文件 + 单文件超 100MB 时轮转
 * 可选同时输出到控制台（探测工具前台运行时使用）
 */
class LoggerManager {
private:
    static std::unique_ptr<trantor::AsyncFileLogger> fileLogger_;
    static std::shared_mutex loggerMutex_;
    static std::string logDir_;
    static std::atomic<int> currentDay_;
    static std::atomic<bool> consoleEnabled_;
    static constexpr uint64_t FILE_SIZE_LIMIT = 100 * 1024 * 1024;  // 100MB

    /** 当天日期 YYYYMMDD */
    static int todayInt() {
        auto now = std::chrono::system_clock::now();
        auto dp = std::chrono::floor<std::chrono::days>(now);
        std::chrono::year_month_day ymd{dp};
        return static_cast<int>(ymd.year()) * 10000
             + static_cast<int>(static_cast<unsigned>(ymd.month())) * 100
             + static_cast<int>(static_cast<unsigned>(ymd.day()));
    }

    static std::string dayToStr(int day) {
        char buf[11];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                      day / 10000, day % 10000 / 100, day % 100);
        return buf;
    }

    static std::unique_ptr<trantor::AsyncFileLogger> createLogger(int day) {
        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(logDir_ + "/" + Constants::LOG_FILE_PREFIX + "_" + dayToStr(day));
        logger->setFileSizeLimit(FILE_SIZE_LIMIT);
        logger->startLogging();
        return logger;
    }

    static void rotateDailyLog(int today) {
        std::unique_ptr<trantor::AsyncFileLogger> oldLogger;
        {
            std::unique_lock lock(loggerMutex_);
            if (today == currentDay_.load(std::memory_order_relaxed)) return;

            oldLogger = std::move(fileLogger_);
            fileLogger_ = createLogger(today);
            currentDay_.store(today, std::memory_order_relaxed);
        }
        // oldLogger 在锁外析构，flush 剩余数据
    }

    static void outputFunction(const char* msg, const uint64_t len) {
        std::string formatted = formatLogMessage(msg, len);

        if (consoleEnabled_.load(std::memory_order_relaxed)) {
            std::cout << formatted << std::flush;
        }

        int today = todayInt();
        if (today != currentDay_.load(std::memory_order_relaxed)) {
            rotateDailyLog(today);
        }

        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->output(formatted.c_str(), formatted.size());
        }
    }

    static void flushFunction() {
        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->flush();
        }
    }

public:
    /**
     * @brief 格式化 trantor 原始日志行
     *
     * 原始: "YYYYMMDD HH:MM:SS.micro ThreadID Level [func] message - file:line"
     * 目标: "YYYY-MM-DD HH:MM:SS ThreadID Level message"
     */
    static std::string formatLogMessage(const char* msg, uint64_t len) {
        std::string logMsg(msg, len);
        if (len < 17 || logMsg[8] != ' ') return logMsg;

        size_t timeEnd = logMsg.find(' ', 9);
        if (timeEnd == std::string::npos || timeEnd <= 15) return logMsg;

        std::string rest = logMsg.substr(timeEnd);

        // lambda 的函数名 [operator ()] 没有意义
        size_t opStart = rest.find("[operator ()");
        if (opStart != std::string::npos) {
            size_t opEnd = rest.find("] ", opStart);
            if (opEnd != std::string::npos) {
                rest = rest.substr(0, opStart) + rest.substr(opEnd + 2);
            }
        }

        size_t filePos = rest.rfind(" - ");
        if (filePos != std::string::npos) {
            std::string suffix = rest.substr(filePos + 3);
            if (suffix.find(".cpp:") != std::string::npos ||
                suffix.find(".hpp:") != std::string::npos) {
                rest = rest.substr(0, filePos) + "\n";
            }
        }

        return logMsg.substr(0, 4) + "-" + logMsg.substr(4, 2) + "-" + logMsg.substr(6, 2)
            + " " + logMsg.substr(9, 8) + rest;
    }

    /**
     * @brief 日志级别字符串 → trantor 级别，无法识别返回 nullopt
     */
    static std::optional<trantor::Logger::LogLevel> parseLevel(const std::string& level) {
        if (level == "TRACE") return trantor::Logger::kTrace;
        if (level == "DEBUG") return trantor::Logger::kDebug;
        if (level == "INFO") return trantor::Logger::kInfo;
        if (level == "WARN") return trantor::Logger::kWarn;
        if (level == "ERROR") return trantor::Logger::kError;
        if (level == "FATAL") return trantor::Logger::kFatal;
        return std::nullopt;
    }

    /**
     * @brief 初始化日志系统
     * @param logDir 日志目录
     * @param console 同时输出到 stdout
     */
    static void initialize(const std::string& logDir, bool console = false) {
        fs::create_directories(logDir);
        logDir_ = logDir;
        consoleEnabled_.store(console, std::memory_order_relaxed);

        int today = todayInt();
        currentDay_.store(today, std::memory_order_relaxed);
        fileLogger_ = createLogger(today);

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(outputFunction, flushFunction);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    /**
     * @brief 设置日志级别（无法识别的级别保持不变）
     */
    static void setLogLevel(const std::string& level) {
        if (auto parsed = parseLevel(level)) {
            trantor::Logger::setLogLevel(*parsed);
        }
    }

    static void close() {
        std::unique_lock lock(loggerMutex_);
        if (fileLogger_) fileLogger_->flush();
        fileLogger_.reset();
    }
};

// 静态成员初始化（inline 避免多翻译单元 ODR 违规）
inline std::unique_ptr<trantor::AsyncFileLogger> LoggerManager::fileLogger_;
inline std::shared_mutex LoggerManager::loggerMutex_;
inline std::string LoggerManager::logDir_;
inline std::atomic<int> LoggerManager::currentDay_{0};
inline std::atomic<bool> LoggerManager::consoleEnabled_{false};
