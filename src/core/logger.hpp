// 全局日志：单例，线程安全，按组件打标签输出到控制台和/或文件

#pragma once

#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace core {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Critical
};

// "info" / "WARN" 等配置字符串转成日志级别，无法识别返回 nullopt
std::optional<LogLevel> parseLogLevel(std::string_view text);

class Logger {
public:
    static Logger& instance();

    // 启动时调用一次
    // level: 最低日志级别
    // filePath: 日志文件路径（为空则不写文件）
    // useConsole: 是否同时输出到控制台
    void configure(LogLevel level, const std::string& filePath = "", bool useConsole = true);

    // 运行期调整级别（配置热加载时使用）
    void setLevel(LogLevel level) { minLevel_.store(level); }
    LogLevel level() const { return minLevel_.load(); }

    bool enabled(LogLevel level) const { return level >= minLevel_.load(); }

    // LOG_INFO("gateway", "connection ", id, " closed");
    template <typename... Args>
    void log(LogLevel level, std::string_view component, Args&&... args) {
        if (!enabled(level)) {
            return;
        }

        std::ostringstream oss;
        (oss << ... << std::forward<Args>(args));
        write(level, component, oss.str());
    }

private:
    Logger() = default;
    ~Logger() = default;

    void write(LogLevel level, std::string_view component, const std::string& message);

    static const char* levelToString(LogLevel level);

    std::mutex mutex_;
    std::atomic<LogLevel> minLevel_{LogLevel::Info};
    std::ofstream fileStream_;
    bool consoleEnabled_{true};
    bool fileEnabled_{false};
};

} // namespace core

#define LOG_TRACE(component, ...) ::core::Logger::instance().log(::core::LogLevel::Trace, component, __VA_ARGS__)
#define LOG_DEBUG(component, ...) ::core::Logger::instance().log(::core::LogLevel::Debug, component, __VA_ARGS__)
#define LOG_INFO(component, ...)  ::core::Logger::instance().log(::core::LogLevel::Info, component, __VA_ARGS__)
#define LOG_WARN(component, ...)  ::core::Logger::instance().log(::core::LogLevel::Warn, component, __VA_ARGS__)
#define LOG_ERROR(component, ...) ::core::Logger::instance().log(::core::LogLevel::Error, component, __VA_ARGS__)
#define LOG_CRITICAL(component, ...) ::core::Logger::instance().log(::core::LogLevel::Critical, component, __VA_ARGS__)
