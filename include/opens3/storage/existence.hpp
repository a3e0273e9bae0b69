#pragma once

#include <string>
#include "opens3/storage/path_resolver.hpp"

namespace opens3 {
namespace storage {

// 通过文件系统判断存储桶/对象是否存在
class ExistenceOracle {
public:
    explicit ExistenceOracle(const PathResolver& resolver) : resolver_(resolver) {}

    // 路径存在且是目录
    bool BucketExists(const std::string& bucket) const;

    // 路径存在且是普通文件; 父目录不存在时返回 false
    bool ObjectExists(const std::string& bucket, const std::string& key) const;

private:
    const PathResolver& resolver_;
};

} // namespace storage
} // namespace opens3
