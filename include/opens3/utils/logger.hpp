#pragma once

#include <string>
#include <iostream>
#include <sstream>
#include <fstream>
#include <memory>
#include <mutex>
#include <map>
#include <vector>
#include <chrono>
#include <iomanip>
#include <nlohmann/json.hpp>

namespace opens3 {
namespace utils {

// 日志级别, 数值越小越严重
enum class LogLevel : int {
    Fatal = 0,
    Error = 1,
    Warn  = 2,
    Info  = 3,
    Debug = 4
};

// 日志配置
struct LoggingConfig {
    std::string level = "info";     // debug, info, warn, error, fatal
    std::string format = "json";    // json, text
    std::string output = "console"; // console, file
    std::string file = "opens3-server.log";
};

// 获取当前时间字符串
std::string GetTimeString();

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string time;
    std::map<std::string, std::string> fields;
};

class LogFormatter {
public:
    virtual ~LogFormatter() = default;
    virtual std::string Format(const LogEntry& entry) = 0;
};

class JSONFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

class TextFormatter : public LogFormatter {
public:
    std::string Format(const LogEntry& entry) override;
};

class LogOutput {
public:
    virtual ~LogOutput() = default;
    virtual void Write(LogLevel level, const std::string& message) = 0;
};

// 控制台输出, Warn 及以上写 stderr
class ConsoleOutput : public LogOutput {
public:
    void Write(LogLevel level, const std::string& message) override;
};

class FileOutput : public LogOutput {
public:
    explicit FileOutput(const std::string& filename);
    ~FileOutput();
    void Write(LogLevel level, const std::string& message) override;
    bool IsOpen() const { return file_.is_open(); }

private:
    std::ofstream file_;
};

// 内存输出, 测试中用于断言日志内容
class MemoryOutput : public LogOutput {
public:
    void Write(LogLevel level, const std::string& message) override;
    std::vector<std::string> Lines() const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

// 日志上下文
class LogContext {
public:
    LogContext() = default;
    LogContext(std::map<std::string, std::string> fields) : fields_(std::move(fields)) {}

    const std::map<std::string, std::string>& Fields() const { return fields_; }

    void WithField(const std::string& key, const std::string& value);

    // 创建带有新字段的上下文
    LogContext With(const std::string& key, const std::string& value) const;

private:
    std::map<std::string, std::string> fields_;
};

class Logger {
public:
    static Logger& GetInstance();

    void Initialize(const LoggingConfig& config);

    void SetLevel(LogLevel level);
    void SetLevel(const std::string& level);
    LogLevel GetLevel() const;

    // 替换全部输出
    void SetOutput(std::unique_ptr<LogOutput> output);
    void AddOutput(std::unique_ptr<LogOutput> output);
    void SetFormatter(std::unique_ptr<LogFormatter> formatter);

    void Log(LogLevel level, const std::string& message, const LogContext& ctx = LogContext());

    void Debug(const std::string& message, const LogContext& ctx = LogContext());
    void Info(const std::string& message, const LogContext& ctx = LogContext());
    void Warn(const std::string& message, const LogContext& ctx = LogContext());
    void Error(const std::string& message, const LogContext& ctx = LogContext());
    void Fatal(const std::string& message, const LogContext& ctx = LogContext());

    // 全局字段, 附加到每条日志
    Logger& WithField(const std::string& key, const std::string& value);

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    bool ShouldLog(LogLevel level) const;

    LogLevel level_ = LogLevel::Info;
    std::vector<std::unique_ptr<LogOutput>> outputs_;
    std::unique_ptr<LogFormatter> formatter_;
    LogContext context_;
    mutable std::mutex mutex_;
};

inline Logger& GetLogger() {
    return Logger::GetInstance();
}

LogLevel ParseLogLevel(const std::string& level);
std::string LogLevelToString(LogLevel level);

} // namespace utils
} // namespace opens3
