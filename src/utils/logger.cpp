#include "opens3/utils/logger.hpp"
#include <ctime>

namespace opens3 {
namespace utils {

std::string GetTimeString() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm now_tm;
    localtime_r(&now_time_t, &now_tm);

    std::stringstream ss;
    ss << std::put_time(&now_tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return ss.str();
}

LogLevel ParseLogLevel(const std::string& level) {
    if (level == "debug" || level == "DEBUG") return LogLevel::Debug;
    if (level == "info" || level == "INFO") return LogLevel::Info;
    if (level == "warn" || level == "WARN" || level == "warning" || level == "WARNING") return LogLevel::Warn;
    if (level == "error" || level == "ERROR") return LogLevel::Error;
    if (level == "fatal" || level == "FATAL") return LogLevel::Fatal;

    return LogLevel::Info;
}

std::string LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

std::string JSONFormatter::Format(const LogEntry& entry) {
    using json = nlohmann::json;

    json j = {
        {"level", LogLevelToString(entry.level)},
        {"time", entry.time},
        {"msg", entry.message}
    };

    for (const auto& field : entry.fields) {
        j[field.first] = field.second;
    }

    // 字段中可能含有非 UTF-8 的对象键, 替换而不是抛异常
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string TextFormatter::Format(const LogEntry& entry) {
    std::stringstream ss;
    ss << "[" << entry.time << "] "
       << "[" << LogLevelToString(entry.level) << "] "
       << entry.message;

    if (!entry.fields.empty()) {
        ss << " {";
        bool first = true;
        for (const auto& field : entry.fields) {
            if (!first) ss << ", ";
            ss << field.first << "=" << field.second;
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

void ConsoleOutput::Write(LogLevel level, const std::string& message) {
    if (level <= LogLevel::Warn) {
        std::cerr << message << std::endl;
    } else {
        std::cout << message << std::endl;
    }
}

FileOutput::FileOutput(const std::string& filename) {
    file_.open(filename, std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Failed to open log file: " << filename << std::endl;
    }
}

FileOutput::~FileOutput() {
    if (file_.is_open()) {
        file_.close();
    }
}

void FileOutput::Write(LogLevel, const std::string& message) {
    if (file_.is_open()) {
        file_ << message << std::endl;
        file_.flush();
    }
}

void MemoryOutput::Write(LogLevel, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(message);
}

std::vector<std::string> MemoryOutput::Lines() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

void MemoryOutput::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

void LogContext::WithField(const std::string& key, const std::string& value) {
    fields_[key] = value;
}

LogContext LogContext::With(const std::string& key, const std::string& value) const {
    LogContext newContext = *this;
    newContext.WithField(key, value);
    return newContext;
}

Logger::Logger() {
    AddOutput(std::make_unique<ConsoleOutput>());
    SetFormatter(std::make_unique<JSONFormatter>());
}

Logger& Logger::GetInstance() {
    static Logger instance;
    return instance;
}

void Logger::Initialize(const LoggingConfig& config) {
    SetLevel(config.level);

    if (config.format == "json") {
        SetFormatter(std::make_unique<JSONFormatter>());
    } else {
        SetFormatter(std::make_unique<TextFormatter>());
    }

    if (config.output == "file" && !config.file.empty()) {
        auto fileOutput = std::make_unique<FileOutput>(config.file);
        if (fileOutput->IsOpen()) {
            SetOutput(std::move(fileOutput));
            return;
        }
        // 打不开日志文件时退回控制台
    }
    SetOutput(std::make_unique<ConsoleOutput>());
}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

void Logger::SetLevel(const std::string& level) {
    SetLevel(ParseLogLevel(level));
}

LogLevel Logger::GetLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

void Logger::SetOutput(std::unique_ptr<LogOutput> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.clear();
    outputs_.push_back(std::move(output));
}

void Logger::AddOutput(std::unique_ptr<LogOutput> output) {
    std::lock_guard<std::mutex> lock(mutex_);
    outputs_.push_back(std::move(output));
}

void Logger::SetFormatter(std::unique_ptr<LogFormatter> formatter) {
    std::lock_guard<std::mutex> lock(mutex_);
    formatter_ = std::move(formatter);
}

void Logger::Log(LogLevel level, const std::string& message, const LogContext& ctx) {
    if (!ShouldLog(level)) return;

    LogEntry entry;
    entry.level = level;
    entry.message = message;
    entry.time = GetTimeString();
    entry.fields = ctx.Fields();

    std::lock_guard<std::mutex> lock(mutex_);
    // 全局字段不覆盖调用方字段
    for (const auto& field : context_.Fields()) {
        entry.fields.emplace(field.first, field.second);
    }

    if (formatter_) {
        std::string formatted = formatter_->Format(entry);
        for (auto& output : outputs_) {
            output->Write(level, formatted);
        }
    }
}

void Logger::Debug(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Debug, message, ctx);
}

void Logger::Info(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Info, message, ctx);
}

void Logger::Warn(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Warn, message, ctx);
}

void Logger::Error(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Error, message, ctx);
}

void Logger::Fatal(const std::string& message, const LogContext& ctx) {
    Log(LogLevel::Fatal, message, ctx);
}

Logger& Logger::WithField(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    context_.WithField(key, value);
    return *this;
}

bool Logger::ShouldLog(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) <= static_cast<int>(level_);
}

} // namespace utils
} // namespace opens3
