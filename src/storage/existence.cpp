#include "opens3/storage/existence.hpp"
#include <system_error>
#include "opens3/utils/logger.hpp"

namespace opens3 {
namespace storage {

namespace fs = std::filesystem;

bool ExistenceOracle::BucketExists(const std::string& bucket) const {
    if (bucket.empty()) {
        return false;
    }
    std::error_code ec;
    bool isDir = fs::is_directory(resolver_.BucketPath(bucket), ec);
    return !ec && isDir;
}

bool ExistenceOracle::ObjectExists(const std::string& bucket, const std::string& key) const {
    if (key.empty()) {
        return false;
    }
    fs::path objectPath = resolver_.ObjectPath(bucket, key);

    std::error_code ec;
    if (!fs::is_directory(objectPath.parent_path(), ec)) {
        utils::GetLogger().Debug("Parent directory does not exist",
            utils::LogContext()
                .With("bucket", bucket)
                .With("key", key));
        return false;
    }

    bool isFile = fs::is_regular_file(objectPath, ec);
    return !ec && isFile;
}

} // namespace storage
} // namespace opens3
