#include <filesystem>
#include <string>
#include <CLI/CLI.hpp>
#include "opens3/config.hpp"
#include "opens3/server/server.hpp"
#include "opens3/storage/object_store.hpp"
#include "opens3/utils/logger.hpp"

int main(int argc, char* argv[]) {
    CLI::App app{"OpenS3服务器 - 基于本地文件系统的S3风格对象存储"};

    std::string addr;
    std::string storageRoot;
    std::string accessKey;
    std::string secretKey;
    std::string configFile;
    std::string envFile = ".env";
    bool noPathLocks = false;

    // 日志配置
    std::string logLevel;
    std::string logFormat;
    std::string logOutput;
    std::string logFile;

    auto* addrOpt = app.add_option("--addr", addr, "服务器监听地址, 格式: host:port");
    auto* rootOpt = app.add_option("--storage-root", storageRoot, "存储根目录");
    auto* accessOpt = app.add_option("--access-key", accessKey, "Basic认证用户名");
    auto* secretOpt = app.add_option("--secret-key", secretKey, "Basic认证密码");
    app.add_option("--config", configFile, "JSON配置文件");
    auto* envOpt = app.add_option("--env-file", envFile, ".env文件路径");
    app.add_flag("--no-path-locks", noPathLocks, "关闭按路径的写操作串行化");

    auto* levelOpt = app.add_option("--log-level", logLevel, "日志级别: debug, info, warn, error, fatal");
    auto* formatOpt = app.add_option("--log-format", logFormat, "日志格式: json, text");
    auto* outputOpt = app.add_option("--log-output", logOutput, "日志输出: console, file");
    auto* fileOpt = app.add_option("--log-file", logFile, "日志文件路径(当log-output为file时使用)");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    auto& logger = opens3::utils::GetLogger();
    opens3::Config config;

    // .env 文件只在显式指定时要求存在
    std::map<std::string, std::string> envValues;
    auto envResult = opens3::LoadEnvFile(envFile);
    if (envResult.ok()) {
        envValues = envResult.value();
    } else if (envOpt->count() > 0) {
        logger.Fatal("无法读取.env文件",
            opens3::utils::LogContext()
                .With("path", envFile)
                .With("error", envResult.error().what()));
        return 1;
    }
    opens3::ApplyEnvironment(config, opens3::ProcessEnvironment(envValues));

    if (!configFile.empty()) {
        auto err = opens3::ApplyConfigFile(config, configFile);
        if (err.hasError()) {
            logger.Fatal("无法加载配置文件",
                opens3::utils::LogContext()
                    .With("path", configFile)
                    .With("error", err.what()));
            return 1;
        }
    }

    // 命令行参数优先级最高
    if (addrOpt->count() > 0) config.addr = addr;
    if (rootOpt->count() > 0) config.storage.root = storageRoot;
    if (accessOpt->count() > 0) config.credentials.accessKey = accessKey;
    if (secretOpt->count() > 0) config.credentials.secretKey = secretKey;
    if (noPathLocks) config.storage.lockPaths = false;
    if (levelOpt->count() > 0) config.logging.level = logLevel;
    if (formatOpt->count() > 0) config.logging.format = logFormat;
    if (outputOpt->count() > 0) config.logging.output = logOutput;
    if (fileOpt->count() > 0) config.logging.file = logFile;

    auto validateErr = opens3::ValidateConfig(config);
    if (validateErr.hasError()) {
        logger.Fatal("配置无效",
            opens3::utils::LogContext().With("error", validateErr.what()));
        return 1;
    }

    logger.Initialize(config.logging);

    std::error_code ec;
    std::filesystem::create_directories(config.storage.root, ec);
    if (ec) {
        logger.Fatal("无法创建存储根目录",
            opens3::utils::LogContext()
                .With("root", config.storage.root)
                .With("error", ec.message()));
        return 1;
    }

    logger.Info("OpenS3服务器配置",
        opens3::utils::LogContext()
            .With("addr", config.addr)
            .With("storageRoot", config.storage.root)
            .With("lockPaths", config.storage.lockPaths ? "true" : "false")
            .With("logLevel", config.logging.level)
            .With("logFormat", config.logging.format)
            .With("logOutput", config.logging.output));

    opens3::storage::ObjectStore store(config.storage);

    opens3::server::ServerConfig serverConfig;
    serverConfig.addr = config.addr;
    serverConfig.credentials = config.credentials;
    serverConfig.store = &store;

    opens3::server::Server server(serverConfig);
    auto err = server.Run();
    if (!err.ok()) {
        logger.Fatal("服务器启动失败",
            opens3::utils::LogContext().With("error", err.Detail()));
        return 1;
    }

    return 0;
}
