#pragma once

#include <string>
#include <map>
#include <optional>
#include <functional>
#include "opens3/types.hpp"
#include "opens3/utils/logger.hpp"

namespace opens3 {

// 存储配置
struct StoreConfig {
    std::string root = "./storage";  // 存储根目录, 每个存储桶是其下的一个目录
    bool lockPaths = true;           // 写操作按路径串行化
};

// 共享的一对访问凭据
struct Credentials {
    std::string accessKey = "admin";
    std::string secretKey = "password";
};

struct Config {
    StoreConfig storage;
    Credentials credentials;
    std::string addr = "0.0.0.0:8001";
    utils::LoggingConfig logging;
};

// 环境变量查询函数, 未设置时返回 nullopt
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// 读取 .env 文件: KEY=VALUE 行, 支持 # 注释, export 前缀和引号
Result<std::map<std::string, std::string>> LoadEnvFile(const std::string& path);

// 先查进程环境变量, 再查 fallback (通常来自 .env 文件)
EnvLookup ProcessEnvironment(std::map<std::string, std::string> fallback = {});

// OPENS3_ACCESS_KEY / S3_USERNAME, OPENS3_SECRET_KEY / S3_PASSWORD, BASE_DIR, OPENS3_ADDR
void ApplyEnvironment(Config& config, const EnvLookup& env);

// JSON 配置文件, 包含 storage, auth, server, logging 段
Error ApplyConfigFile(Config& config, const std::string& path);

Error ValidateConfig(const Config& config);

// "host:port" 或 "port"; 缺省主机为 0.0.0.0
Result<std::pair<std::string, int>> ParseAddress(const std::string& addr);

} // namespace opens3
