#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>
#include "opens3/utils/logger.hpp"

using namespace opens3::utils;

namespace {

// 测试结束后恢复控制台输出
struct MemoryLogger {
    MemoryOutput* output;

    MemoryLogger() {
        auto memory = std::make_unique<MemoryOutput>();
        output = memory.get();
        GetLogger().SetOutput(std::move(memory));
        GetLogger().SetFormatter(std::make_unique<JSONFormatter>());
        GetLogger().SetLevel(LogLevel::Info);
    }

    ~MemoryLogger() {
        GetLogger().SetOutput(std::make_unique<ConsoleOutput>());
    }
};

} // namespace

TEST_CASE("Logger - Levels", "[logger]") {
    REQUIRE(ParseLogLevel("debug") == LogLevel::Debug);
    REQUIRE(ParseLogLevel("WARN") == LogLevel::Warn);
    REQUIRE(ParseLogLevel("bogus") == LogLevel::Info);
    REQUIRE(LogLevelToString(LogLevel::Error) == "ERROR");
}

TEST_CASE("Logger - Structured JSON output", "[logger]") {
    MemoryLogger logger;

    GetLogger().Info("Object uploaded",
        LogContext().With("bucket", "docs").With("key", "a/b.txt"));
    GetLogger().Debug("filtered out");

    auto lines = logger.output->Lines();
    REQUIRE(lines.size() == 1);

    auto entry = nlohmann::json::parse(lines[0]);
    REQUIRE(entry["msg"] == "Object uploaded");
    REQUIRE(entry["bucket"] == "docs");
    REQUIRE(entry["key"] == "a/b.txt");
}

TEST_CASE("Logger - Text output", "[logger]") {
    MemoryLogger logger;
    GetLogger().SetFormatter(std::make_unique<TextFormatter>());

    GetLogger().Warn("Bucket not empty", LogContext().With("bucket", "full"));

    auto lines = logger.output->Lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].find("Bucket not empty") != std::string::npos);
    REQUIRE(lines[0].find("bucket=full") != std::string::npos);
}
