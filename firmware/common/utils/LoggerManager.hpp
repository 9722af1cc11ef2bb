#pragma once

namespace fs = std::filesystem;

/**
 * @brief 日志管理器 - trantor::AsyncFileLogger 异步写盘 + 按日期轮转
 *
 * 文件命名: logs/flowmeter_YYYY-MM-DD.log
 * 轮转策略: 每天自动创建新文件 + 单文件超 100MB 时轮转
 * 可选同时回显到 stdout（调试台架使用）
 */
class LoggerManager {
private:
    static std::unique_ptr<trantor::AsyncFileLogger> fileLogger_;
    static std::shared_mutex loggerMutex_;
    static std::string logDir_;
    static std::atomic<int> currentDay_;
    static std::atomic<bool> consoleEcho_;
    static constexpr uint64_t FILE_SIZE_LIMIT = 100 * 1024 * 1024;  // 100MB

    /** 当天日期整数 YYYYMMDD */
    static int todayInt() {
        auto now = std::chrono::system_clock::now();
        auto dp = std::chrono::floor<std::chrono::days>(now);
        std::chrono::year_month_day ymd{dp};
        return static_cast<int>(ymd.year()) * 10000
             + static_cast<unsigned>(ymd.month()) * 100
             + static_cast<unsigned>(ymd.day());
    }

    static std::string dayToStr(int day) {
        char buf[11];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                      day / 10000, day % 10000 / 100, day % 100);
        return buf;
    }

    static std::unique_ptr<trantor::AsyncFileLogger> createLogger(int day) {
        auto logger = std::make_unique<trantor::AsyncFileLogger>();
        logger->setFileName(logDir_ + "/flowmeter_" + dayToStr(day));
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
        // oldLogger 在锁外析构，自动 flush 剩余数据
    }

    /**
     * @brief 去掉 trantor 行尾的 " - file.hpp:line" 源码位置
     */
    static std::string stripSourceLocation(const char* msg, uint64_t len) {
        std::string logMsg(msg, len);
        size_t filePos = logMsg.rfind(" - ");
        if (filePos != std::string::npos) {
            std::string suffix = logMsg.substr(filePos + 3);
            if (suffix.find(".cpp:") != std::string::npos ||
                suffix.find(".hpp:") != std::string::npos) {
                logMsg = logMsg.substr(0, filePos) + "\n";
            }
        }
        return logMsg;
    }

    static void outputFunction(const char* msg, const uint64_t len) {
        std::string formatted = stripSourceLocation(msg, len);

        int today = todayInt();
        if (today != currentDay_.load(std::memory_order_relaxed)) {
            rotateDailyLog(today);
        }

        if (consoleEcho_.load(std::memory_order_relaxed)) {
            std::fwrite(formatted.data(), 1, formatted.size(), stdout);
        }

        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->output(formatted.c_str(), formatted.size());
        }
    }

    static void flushFunction() {
        if (consoleEcho_.load(std::memory_order_relaxed)) {
            std::fflush(stdout);
        }
        std::shared_lock lock(loggerMutex_);
        if (fileLogger_) {
            fileLogger_->flush();
        }
    }

public:
    /**
     * @brief 初始化日志系统
     * @param logDir 日志目录路径
     */
    static void initialize(const std::string& logDir) {
        fs::create_directories(logDir);
        logDir_ = logDir;

        int today = todayInt();
        currentDay_.store(today, std::memory_order_relaxed);
        fileLogger_ = createLogger(today);

        trantor::Logger::setDisplayLocalTime(true);
        trantor::Logger::setOutputFunction(outputFunction, flushFunction);
        trantor::Logger::setLogLevel(trantor::Logger::kInfo);
    }

    /**
     * @brief 设置日志级别
     * @return 级别字符串是否可识别
     */
    static bool setLogLevel(const std::string& level) {
        static const std::map<std::string, trantor::Logger::LogLevel> levels = {
            {"TRACE", trantor::Logger::kTrace},
            {"DEBUG", trantor::Logger::kDebug},
            {"INFO", trantor::Logger::kInfo},
            {"WARN", trantor::Logger::kWarn},
            {"ERROR", trantor::Logger::kError},
            {"FATAL", trantor::Logger::kFatal},
        };
        auto it = levels.find(level);
        if (it == levels.end()) return false;
        trantor::Logger::setLogLevel(it->second);
        return true;
    }

    static void setConsoleEcho(bool enabled) {
        consoleEcho_.store(enabled, std::memory_order_relaxed);
    }

    static void close() {
        std::unique_lock lock(loggerMutex_);
        fileLogger_.reset();
    }
};

// 静态成员初始化（inline 避免多翻译单元 ODR 违规）
inline std::unique_ptr<trantor::AsyncFileLogger> LoggerManager::fileLogger_;
inline std::shared_mutex LoggerManager::loggerMutex_;
inline std::string LoggerManager::logDir_;
inline std::atomic<int> LoggerManager::currentDay_{0};
inline std::atomic<bool> LoggerManager::consoleEcho_{false};
