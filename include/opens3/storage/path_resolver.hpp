#pragma once

#include <string>
#include <filesystem>

namespace opens3 {
namespace storage {

// (bucket, key) 到文件系统路径的纯映射, 不做任何 I/O
// 名字按原样拼接, 不做穿越检查; 校验由 HTTP 层负责
class PathResolver {
public:
    explicit PathResolver(const std::filesystem::path& root);

    const std::filesystem::path& Root() const { return root_; }

    // <root>/<bucket>
    std::filesystem::path BucketPath(const std::string& bucket) const;

    // <root>/<bucket>/<key>, key 中的 '/' 作为目录分隔符
    // 不会创建中间目录
    std::filesystem::path ObjectPath(const std::string& bucket, const std::string& key) const;

    // <object-path>.metadata
    static std::filesystem::path MetadataPath(const std::filesystem::path& objectPath);

private:
    std::filesystem::path root_;
};

} // namespace storage
} // namespace opens3
