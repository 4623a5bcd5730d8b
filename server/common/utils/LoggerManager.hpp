#pragma once

#include "Constants.hpp"

namespace fs = std::filesystem;

/**
 * @brief 日志管理器 - trantor::AsyncFileLogger 异步写盘 + 控制台同步输出
 *
 * 文件: LOG_FILE 指定的路径（默认 ./deconz_viewer.log）
 * 轮转策略: 单文件超过 100MB 时由 AsyncFileLogger 自动轮转
 */
class LoggerManager {
private:
    static std::unique_ptr<trantor::AsyncFileLogger> fileLogger_;
    static std::shared_mutex loggerMutex_;
    static std::mutex consoleMutex_;
    static std::atomic<bool> consoleEnabled_;

    /**
     * @brief 格式化日志消息
     * @details 原始: "YYYYMMDD HH:MM:SS.micro ThreadID LEVEL [func] message - file:line"
     *          目标: "YYYY-MM-DD HH:MM:SS ThreadID LEVEL message"
     */
    static std::string formatLogMessage(const char* msg, uint64_t len) {
        std::string_view raw(msg, len);
        if (len < 17 || raw[8] != ' ') {
            return std::string(raw);
        }

        size_t timeEnd = raw.find(' ', 9);
        if (timeEnd == std::string_view::npos || timeEnd <= 15) {
            return std::string(raw);
        }

        std::string rest(raw.substr(timeEnd));

        // lambda 的函数名 [operator()] 无意义
        if (size_t opStart = rest.find("[operator()"); opStart != std::string::npos) {
            if (size_t opEnd = rest.find("] ", opStart); opEnd != std::string::npos) {
                rest.erase(opStart, opEnd + 2 - opStart);
            }
        }

        // 去掉末尾的 " - file.hpp:line"
        if (size_t filePos = rest.rfind(" - "); filePos != std::string::npos) {
            auto suffix = rest.substr(filePos + 3);
            if (suffix.find(".cpp:") != std::string::npos ||
                suffix.find(".hpp:") != std::string::npos ||
                suffix.find(".cc:") != std::string::npos) {
                rest = rest.substr(0, filePos) + "\n";
            }
        }

        std::string formatted;
        formatted.reserve(rest.size() + 20);
        formatted.append(raw.substr(0, 4)).append("-")
                 .append(raw.substr(4, 2)).append("-")
                 .append(raw.substr(6, 2)).append(" ")
                 .append(raw.substr(9, 8))
                 .append(rest);
        return formatted;
    }

    /** 日志输出函数（注册到 trantor::Logger） */
    static void outputFunction(const char* msg, const uint64_t len) {
        std::string formatted = formatLogMessage(msg, len);

        {
            std::shared_lock lock(loggerMutex_);
            if (fileLogger_) {
                fileLogger_->output(formatted.c_str(), formatted.size());
            }
        }

        if (consoleEnabled_.load(std::memory_order_relaxed)) {
            std::lock_guard lock(consoleMutex_);
            std::cout.write(formatted.data(), static_cast<std::streamsize>(formatted.size()));
        }
    }

    /** 日志刷新函数（注册到 trantor::Logger） */
    static void flushFunction() {
        {
            std::shared_lock lock(loggerMutex_);
            if (fileLogger_) {
                fileLogger_->flush();
            }
        }
        std::lock_guard lock(consoleMutex_);
        std::cout.flush();
    }

public:
    /**
     * @brief 初始化日志系统
     * @param logFile 日志文件路径，例如 "logs/deconz_viewer.log"
     * @param console 是否同时输出到 stdout
     */
    static void initialize(const std::string& logFile, bool console = true) {
        fs::path path(logFile.empty() ? Constants::DEFAULT_LOG_FILE : logFile);
        fs::path dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
        std::string ext = path.has_extension() ? path.extension().string() : ".log";
        fs::create_directories(dir);

        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(path.stem().string(), ext, dir.string());
        logger->setFileSizeLimit(Constants::LOG_FILE_SIZE_LIMIT);
        logger->startLogging();

        {
            std::unique_lock lock(loggerMutex_);
            fileLogger_ = std::move(logger);
        }
        consoleEnabled_.store(console, std::memory_order_relaxed);

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(outputFunction, flushFunction);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    /**
     * @brief 设置日志级别（兼容 WARNING / CRITICAL 写法）
     */
    static void setLogLevel(const std::string& level) {
        if (level == "TRACE") {
            trantor::Logger::setLogLevel(trantor::Logger::kTrace);
        } else if (level == "DEBUG") {
            trantor::Logger::setLogLevel(trantor::Logger::kDebug);
        } else if (level == "INFO") {
            trantor::Logger::setLogLevel(trantor::Logger::kInfo);
        } else if (level == "WARN" || level == "WARNING") {
            trantor::Logger::setLogLevel(trantor::Logger::kWarn);
        } else if (level == "ERROR") {
            trantor::Logger::setLogLevel(trantor::Logger::kError);
        } else if (level == "FATAL" || level == "CRITICAL") {
            trantor::Logger::setLogLevel(trantor::Logger::kFatal);
        }
    }

    /**
     * @brief 关闭日志系统（析构时 flush 剩余数据）
     */
    static void close() {
        std::unique_lock lock(loggerMutex_);
        fileLogger_.reset();
    }
};

// 静态成员初始化（inline 避免多翻译单元 ODR 违规）
inline std::unique_ptr<trantor::AsyncFileLogger> LoggerManager::fileLogger_;
inline std::shared_mutex LoggerManager::loggerMutex_;
inline std::mutex LoggerManager::consoleMutex_;
inline std::atomic<bool> LoggerManager::consoleEnabled_{true};
