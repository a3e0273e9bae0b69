#include "opens3/config.hpp"
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include "opens3/utils/tools.hpp"

namespace opens3 {

using json = nlohmann::json;

namespace {

std::string unquote(const std::string& value) {
    if (value.size() >= 2) {
        char first = value.front();
        char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

// 从 JSON 段中读取字符串字段, 类型不对时报错
Error readString(const json& section, const std::string& sectionName,
                 const std::string& field, std::string& out) {
    if (!section.contains(field)) {
        return Error();
    }
    const auto& value = section[field];
    if (!value.is_string()) {
        return Error::InvalidArgument("Config field " + sectionName + "." + field + " must be a string");
    }
    out = value.get<std::string>();
    return Error();
}

} // namespace

Result<std::map<std::string, std::string>> LoadEnvFile(const std::string& path) {
    using EnvMap = std::map<std::string, std::string>;

    std::ifstream file(path);
    if (!file) {
        return Result<EnvMap>(Error::NotFound("Env file not found: " + path));
    }

    EnvMap values;
    std::string line;
    while (std::getline(file, line)) {
        std::string trimmed = utils::TrimSpace(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }
        if (utils::StartsWith(trimmed, "export ")) {
            trimmed = utils::TrimSpace(trimmed.substr(7));
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        std::string key = utils::TrimSpace(trimmed.substr(0, eq));
        std::string value = unquote(utils::TrimSpace(trimmed.substr(eq + 1)));
        values[key] = value;
    }
    return Result<EnvMap>(std::move(values));
}

EnvLookup ProcessEnvironment(std::map<std::string, std::string> fallback) {
    return [fallback = std::move(fallback)](const std::string& name) -> std::optional<std::string> {
        // .env 中的值不覆盖进程环境
        if (const char* value = std::getenv(name.c_str())) {
            return std::string(value);
        }
        auto it = fallback.find(name);
        if (it != fallback.end()) {
            return it->second;
        }
        return std::nullopt;
    };
}

void ApplyEnvironment(Config& config, const EnvLookup& env) {
    if (auto v = env("OPENS3_ACCESS_KEY")) {
        config.credentials.accessKey = *v;
    } else if (auto v2 = env("S3_USERNAME")) {
        config.credentials.accessKey = *v2;
    }

    if (auto v = env("OPENS3_SECRET_KEY")) {
        config.credentials.secretKey = *v;
    } else if (auto v2 = env("S3_PASSWORD")) {
        config.credentials.secretKey = *v2;
    }

    if (auto v = env("BASE_DIR")) {
        config.storage.root = *v;
    }
    if (auto v = env("OPENS3_ADDR")) {
        config.addr = *v;
    }
}

Error ApplyConfigFile(Config& config, const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Error::NotFound("Config file not found: " + path);
    }

    json document = json::parse(file, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return Error::InvalidArgument("Config file is not a valid JSON object: " + path);
    }

    if (document.contains("storage")) {
        const auto& storage = document["storage"];
        auto err = readString(storage, "storage", "root", config.storage.root);
        if (err.hasError()) return err;
        if (storage.contains("lockPaths")) {
            if (!storage["lockPaths"].is_boolean()) {
                return Error::InvalidArgument("Config field storage.lockPaths must be a boolean");
            }
            config.storage.lockPaths = storage["lockPaths"].get<bool>();
        }
    }

    if (document.contains("auth")) {
        const auto& auth = document["auth"];
        auto err = readString(auth, "auth", "accessKey", config.credentials.accessKey);
        if (err.hasError()) return err;
        err = readString(auth, "auth", "secretKey", config.credentials.secretKey);
        if (err.hasError()) return err;
    }

    if (document.contains("server")) {
        auto err = readString(document["server"], "server", "addr", config.addr);
        if (err.hasError()) return err;
    }

    if (document.contains("logging")) {
        const auto& logging = document["logging"];
        const std::map<std::string, std::string*> fields = {
            {"level", &config.logging.level},
            {"format", &config.logging.format},
            {"output", &config.logging.output},
            {"file", &config.logging.file},
        };
        for (const auto& field : fields) {
            auto err = readString(logging, "logging", field.first, *field.second);
            if (err.hasError()) return err;
        }
    }

    return Error();
}

Error ValidateConfig(const Config& config) {
    if (config.storage.root.empty()) {
        return Error::InvalidArgument("Storage root must not be empty");
    }
    if (config.credentials.accessKey.empty()) {
        return Error::InvalidArgument("Access key must not be empty");
    }
    auto addr = ParseAddress(config.addr);
    if (!addr.ok()) {
        return addr.error();
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        return Error::InvalidArgument("Unsupported log format: " + config.logging.format);
    }
    if (config.logging.output != "console" && config.logging.output != "file") {
        return Error::InvalidArgument("Unsupported log output: " + config.logging.output);
    }
    return Error();
}

Result<std::pair<std::string, int>> ParseAddress(const std::string& addr) {
    using Address = std::pair<std::string, int>;

    std::string host = "0.0.0.0";
    std::string portStr = addr;
    size_t colonPos = addr.rfind(':');
    if (colonPos != std::string::npos) {
        host = addr.substr(0, colonPos);
        portStr = addr.substr(colonPos + 1);
        if (host.empty()) {
            host = "0.0.0.0";
        }
    }

    if (portStr.empty() || portStr.find_first_not_of("0123456789") != std::string::npos ||
        portStr.size() > 5) {
        return Result<Address>(Error::InvalidArgument("Invalid listen address: " + addr));
    }
    int port = std::stoi(portStr);
    if (port <= 0 || port > 65535) {
        return Result<Address>(Error::InvalidArgument("Port out of range in address: " + addr));
    }
    return Result<Address>(Address(host, port));
}

} // namespace opens3
