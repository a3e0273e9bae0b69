#include "opens3/storage/path_resolver.hpp"
#include "opens3/types.hpp"

namespace opens3 {
namespace storage {

namespace fs = std::filesystem;

PathResolver::PathResolver(const fs::path& root) : root_(root) {}

fs::path PathResolver::BucketPath(const std::string& bucket) const {
    return root_ / bucket;
}

fs::path PathResolver::ObjectPath(const std::string& bucket, const std::string& key) const {
    // operator/ 会把以 '/' 开头的 key 当成绝对路径, 这里按字符串拼接保持原样
    std::string path = BucketPath(bucket).string();
    if (!path.empty() && path.back() != '/') {
        path.push_back('/');
    }
    path.append(key);
    return fs::path(path);
}

fs::path PathResolver::MetadataPath(const fs::path& objectPath) {
    return fs::path(objectPath.string() + METADATA_SUFFIX);
}

} // namespace storage
} // namespace opens3
