#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

namespace core {

std::optional<LogLevel> parseLogLevel(std::string_view text)
{
    std::string lowered(text);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "critical") return LogLevel::Critical;
    return std::nullopt;
}

Logger& Logger::instance()
{
    // C++11 起静态局部变量的初始化是线程安全的
    static Logger instance;
    return instance;
}

void Logger::configure(LogLevel level, const std::string& filePath, bool useConsole)
{
    std::lock_guard<std::mutex> lk(mutex_);
    minLevel_.store(level);
    consoleEnabled_ = useConsole;

    if (fileStream_.is_open()) {
        fileStream_.close();
        fileEnabled_ = false;
    }

    if (!filePath.empty())
    {
        std::error_code ec;
        auto parent = std::filesystem::path(filePath).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
        }
        fileStream_.open(filePath, std::ios::out | std::ios::app);
        fileEnabled_ = fileStream_.is_open();
    }
}

const char* Logger::levelToString(LogLevel level)
{
    switch (level)
    {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Critical: return "CRITICAL";
    default: return "UNKNOWN";
    }
}

// 格式：2024-01-14 10:30:45 [INFO] [gateway] message
void Logger::write(LogLevel level, std::string_view component, const std::string& message)
{
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    std::ostringstream prefix;
    prefix << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
           << " [" << levelToString(level) << "]"
           << " [" << component << "] ";

    std::lock_guard<std::mutex> lk(mutex_);
    if (consoleEnabled_)
    {
        // 错误级别走 stderr，方便运维单独收集
        auto& out = level >= LogLevel::Error ? std::cerr : std::cout;
        out << prefix.str() << message << std::endl;
    }
    if (fileEnabled_)
    {
        fileStream_ << prefix.str() << message << std::endl;
    }
}

} // namespace core
