#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "opens3/types.hpp"

namespace opens3 {
namespace storage {

using json = nlohmann::json;

// 对象旁的元数据文件 <object-path>.metadata
// 读路径降级而不失败: 文件不存在返回 {}, 解析失败返回 {"error": ...}
class MetadataSidecar {
public:
    // 写入元数据, 失败只返回错误, 由调用方记录后忽略
    static Error Write(const std::filesystem::path& objectPath, const json& metadata);

    static json Read(const std::filesystem::path& objectPath);

    // 文件不存在不算错误
    static Error Remove(const std::filesystem::path& objectPath);

    // 从上传表单的 {"metadata": {...}} 包装中取出内部对象
    // 原始串无法解析或没有 metadata 字段时返回 nullopt
    static std::optional<json> ExtractEnvelope(const std::string& raw);
};

} // namespace storage
} // namespace opens3
