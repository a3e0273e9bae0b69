#include "opens3/storage/object_store.hpp"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <system_error>
#include <sys/stat.h>
#include <unistd.h>
#include "opens3/storage/directory_marker.hpp"
#include "opens3/storage/listing.hpp"
#include "opens3/storage/sidecar.hpp"
#include "opens3/utils/logger.hpp"
#include "opens3/utils/tools.hpp"

namespace opens3 {
namespace storage {

namespace fs = std::filesystem;

namespace {

constexpr size_t kReadChunkSize = 64 * 1024;

TimePoint toTimePoint(time_t t) {
    return std::chrono::system_clock::from_time_t(t);
}

bool isPermissionError(const std::error_code& ec) {
    return ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted;
}

} // namespace

ObjectStore::ObjectStore(const StoreConfig& config)
    : config_(config), resolver_(config.root), oracle_(resolver_) {
    std::error_code ec;
    if (!fs::exists(resolver_.Root(), ec)) {
        fs::create_directories(resolver_.Root(), ec);
        if (ec) {
            utils::GetLogger().Error("Failed to create storage root",
                utils::LogContext()
                    .With("root", resolver_.Root().string())
                    .With("error", ec.message()));
        }
    }
    utils::GetLogger().Info("Object store initialized",
        utils::LogContext()
            .With("root", resolver_.Root().string())
            .With("lockPaths", config_.lockPaths ? "true" : "false"));
}

PathLockTable::Guard ObjectStore::lockPath(const fs::path& path) {
    if (!config_.lockPaths) {
        return PathLockTable::Guard();
    }
    return locks_.Acquire(path.string());
}

Result<BucketInfo> ObjectStore::CreateBucket(const std::string& name) {
    fs::path bucketPath = resolver_.BucketPath(name);
    auto guard = lockPath(bucketPath);

    std::error_code ec;
    if (fs::exists(bucketPath, ec)) {
        return Result<BucketInfo>(Error::AlreadyExists(
            "Bucket '" + name + "' already exists. Choose a unique bucket name for creation."));
    }

    fs::create_directories(bucketPath, ec);
    if (ec) {
        utils::GetLogger().Error("Failed to create bucket",
            utils::LogContext()
                .With("bucket", name)
                .With("path", bucketPath.string())
                .With("error", ec.message()));
        if (isPermissionError(ec)) {
            return Result<BucketInfo>(Error::PermissionDenied(
                "Permission denied: Cannot create bucket '" + name +
                "'. Please check storage directory permissions."));
        }
        return Result<BucketInfo>(Error::IOFailure(
            "Failed to create bucket '" + name + "': " + ec.message()));
    }

    utils::GetLogger().Info("Bucket created",
        utils::LogContext()
            .With("bucket", name)
            .With("path", bucketPath.string()));

    BucketInfo info;
    info.name = name;
    info.creationDate = std::chrono::system_clock::now();
    return Result<BucketInfo>(info);
}

Result<std::vector<BucketInfo>> ObjectStore::ListBuckets() const {
    std::vector<BucketInfo> buckets;

    std::error_code ec;
    fs::directory_iterator it(resolver_.Root(), ec);
    if (ec) {
        return Result<std::vector<BucketInfo>>(Error::IOFailure(
            "Failed to list storage root '" + resolver_.Root().string() + "': " + ec.message()));
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Result<std::vector<BucketInfo>>(Error::IOFailure(
                "Failed to list storage root: " + ec.message()));
        }
        std::error_code statEc;
        if (!it->is_directory(statEc)) {
            continue;
        }

        struct stat info;
        if (stat(it->path().c_str(), &info) != 0) {
            continue;
        }
        BucketInfo bucket;
        bucket.name = it->path().filename().string();
        bucket.creationDate = toTimePoint(info.st_ctime);
        buckets.push_back(std::move(bucket));
    }
    if (ec) {
        return Result<std::vector<BucketInfo>>(Error::IOFailure(
            "Failed to list storage root: " + ec.message()));
    }

    return Result<std::vector<BucketInfo>>(std::move(buckets));
}

Error ObjectStore::HeadBucket(const std::string& name) const {
    if (!oracle_.BucketExists(name)) {
        return Error::NotFound("Bucket " + name + " not found");
    }
    return Error();
}

Error ObjectStore::DeleteBucket(const std::string& name, bool force) {
    if (!oracle_.BucketExists(name)) {
        return Error::NotFound("Bucket " + name + " not found");
    }

    fs::path bucketPath = resolver_.BucketPath(name);
    auto guard = lockPath(bucketPath);

    // 浅层检查, 不递归
    bool hasObjects = false;
    std::error_code ec;
    for (fs::directory_iterator it(bucketPath, ec), end; !ec && it != end; it.increment(ec)) {
        std::string entryName = it->path().filename().string();
        if (!utils::EndsWith(entryName, METADATA_SUFFIX) &&
            !utils::EndsWith(entryName, DIRECTORY_MARKER)) {
            hasObjects = true;
            break;
        }
    }
    if (ec) {
        return Error::IOFailure("Failed to inspect bucket '" + name + "': " + ec.message());
    }

    if (hasObjects && !force) {
        return Error::NotEmpty("Bucket " + name +
            " cannot be deleted because it still contains objects. Delete all objects from the "
            "bucket first before attempting to delete the bucket, or use force=true.");
    }

    if (force) {
        std::vector<fs::path> entries;
        for (fs::directory_iterator it(bucketPath, ec), end; !ec && it != end; it.increment(ec)) {
            entries.push_back(it->path());
        }
        if (ec) {
            return Error::IOFailure("Failed to inspect bucket '" + name + "': " + ec.message());
        }
        for (const auto& entry : entries) {
            std::error_code removeEc;
            fs::remove_all(entry, removeEc);
            if (removeEc) {
                utils::GetLogger().Warn("Error during forced bucket cleanup",
                    utils::LogContext()
                        .With("bucket", name)
                        .With("path", entry.string())
                        .With("error", removeEc.message()));
            }
        }
    }

    // 剩余的顶层文件只可能是 sidecar 或目录标记
    std::vector<fs::path> leftovers;
    for (fs::directory_iterator it(bucketPath, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statEc;
        if (it->is_regular_file(statEc)) {
            leftovers.push_back(it->path());
        }
    }
    ec.clear();
    for (const auto& path : leftovers) {
        std::error_code removeEc;
        if (!fs::remove(path, removeEc) && removeEc) {
            utils::GetLogger().Warn("Failed to remove leftover bucket file",
                utils::LogContext()
                    .With("bucket", name)
                    .With("path", path.string())
                    .With("error", removeEc.message()));
        }
    }

    if (!fs::remove(bucketPath, ec) || ec) {
        return Error::IOFailure("Failed to delete bucket '" + name + "': " +
                                (ec ? ec.message() : std::string("directory not removed")));
    }

    utils::GetLogger().Info("Bucket deleted",
        utils::LogContext()
            .With("bucket", name)
            .With("force", force ? "true" : "false"));
    return Error();
}

Result<DirectoryInfo> ObjectStore::CreateDirectory(const std::string& bucket,
                                                   const std::string& directoryPath) {
    if (!oracle_.BucketExists(bucket)) {
        return Result<DirectoryInfo>(Error::NotFound("Bucket " + bucket + " not found"));
    }

    fs::path bucketPath = resolver_.BucketPath(bucket);
    auto guard = lockPath(resolver_.ObjectPath(bucket, directoryPath));

    auto created = DirectoryMarker::CreateDirectoryPath(bucketPath, directoryPath);
    if (!created.ok()) {
        utils::GetLogger().Warn("Failed to create directory",
            utils::LogContext()
                .With("bucket", bucket)
                .With("directory", directoryPath)
                .With("error", created.error().what()));
        return Result<DirectoryInfo>(created.error());
    }

    utils::GetLogger().Info("Directory created",
        utils::LogContext()
            .With("bucket", bucket)
            .With("directory", created.value()));

    DirectoryInfo info;
    info.bucket = bucket;
    info.directory = created.value();
    info.creationDate = std::chrono::system_clock::now();
    return Result<DirectoryInfo>(info);
}

Result<PutResult> ObjectStore::PutObject(const std::string& bucket,
                                         const std::string& key,
                                         const std::string& content,
                                         const std::optional<json>& metadata,
                                         const std::string& contentType) {
    if (!oracle_.BucketExists(bucket)) {
        return Result<PutResult>(Error::NotFound("Bucket " + bucket + " not found"));
    }
    if (key.empty()) {
        return Result<PutResult>(Error::InvalidArgument(
            "Object key must not be empty (bucket '" + bucket + "')"));
    }

    fs::path objectPath = resolver_.ObjectPath(bucket, key);
    auto guard = lockPath(objectPath);

    PutResult result;
    result.bucket = bucket;
    result.key = key;
    result.contentType = contentType;

    if (DirectoryMarker::IsDirectoryMarkerKey(key)) {
        auto dir = DirectoryMarker::Materialize(resolver_.BucketPath(bucket), key);
        if (!dir.ok()) {
            return Result<PutResult>(Error::IOFailure(
                "Failed to upload '" + key + "' to bucket '" + bucket + "': " + dir.error().what()));
        }
        result.directoryMarker = true;
        utils::GetLogger().Info("Directory marker uploaded",
            utils::LogContext()
                .With("bucket", bucket)
                .With("key", key));
        return Result<PutResult>(result);
    }

    std::error_code ec;
    fs::create_directories(objectPath.parent_path(), ec);
    if (ec) {
        return Result<PutResult>(Error::IOFailure(
            "Failed to upload '" + key + "' to bucket '" + bucket +
            "': cannot create parent directory: " + ec.message()));
    }

    std::ofstream file(objectPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Result<PutResult>(Error::IOFailure(
            "Failed to upload '" + key + "' to bucket '" + bucket + "': cannot open " + objectPath.string()));
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        return Result<PutResult>(Error::IOFailure(
            "Failed to upload '" + key + "' to bucket '" + bucket + "': write failed"));
    }
    result.size = content.size();

    if (metadata.has_value()) {
        auto err = MetadataSidecar::Write(objectPath, *metadata);
        if (err.hasError()) {
            utils::GetLogger().Warn("Failed to save object metadata",
                utils::LogContext()
                    .With("bucket", bucket)
                    .With("key", key)
                    .With("error", err.what()));
        } else {
            result.metadata = *metadata;
        }
    } else {
        // 覆盖上传不带元数据时, 旧的 sidecar 不再属于新内容
        auto err = MetadataSidecar::Remove(objectPath);
        if (err.hasError()) {
            utils::GetLogger().Warn("Failed to remove stale object metadata",
                utils::LogContext()
                    .With("bucket", bucket)
                    .With("key", key)
                    .With("error", err.what()));
        }
    }

    utils::GetLogger().Info("Object uploaded",
        utils::LogContext()
            .With("bucket", bucket)
            .With("key", key)
            .With("size", std::to_string(result.size)));
    return Result<PutResult>(result);
}

Result<std::vector<ObjectInfo>> ObjectStore::ListObjects(const std::string& bucket,
                                                         const std::optional<std::string>& prefix) const {
    if (!oracle_.BucketExists(bucket)) {
        return Result<std::vector<ObjectInfo>>(Error::NotFound("Bucket " + bucket + " not found"));
    }
    return Result<std::vector<ObjectInfo>>(
        ListingEngine::List(resolver_.BucketPath(bucket), prefix));
}

Result<ObjectHead> ObjectStore::HeadObject(const std::string& bucket, const std::string& key) const {
    if (!oracle_.BucketExists(bucket)) {
        return Result<ObjectHead>(Error::NotFound("Bucket " + bucket + " not found"));
    }
    if (!oracle_.ObjectExists(bucket, key)) {
        return Result<ObjectHead>(Error::NotFound("Object " + key + " not found"));
    }

    fs::path objectPath = resolver_.ObjectPath(bucket, key);
    struct stat info;
    if (stat(objectPath.c_str(), &info) != 0) {
        return Result<ObjectHead>(Error::NotFound("Object " + key + " not found"));
    }

    ObjectHead head;
    head.key = key;
    head.size = static_cast<uint64_t>(info.st_size);
    head.lastModified = toTimePoint(info.st_mtime);
    head.contentType = utils::GuessContentType(objectPath.string());
    head.metadata = MetadataSidecar::Read(objectPath);

    auto md5 = utils::CalculateFileMD5(objectPath.string());
    if (!md5.ok()) {
        return Result<ObjectHead>(Error::IOFailure(
            "Failed to retrieve metadata for object '" + key + "' in bucket '" + bucket +
            "': " + md5.error().what()));
    }
    head.etag = "\"" + md5.value() + "\"";
    return Result<ObjectHead>(head);
}

Result<json> ObjectStore::GetObjectMetadata(const std::string& bucket, const std::string& key) const {
    if (!oracle_.BucketExists(bucket)) {
        return Result<json>(Error::NotFound("Bucket " + bucket + " not found"));
    }
    if (!oracle_.ObjectExists(bucket, key)) {
        return Result<json>(Error::NotFound("Object " + key + " not found"));
    }
    return Result<json>(MetadataSidecar::Read(resolver_.ObjectPath(bucket, key)));
}

Result<std::string> ObjectStore::GetObject(const std::string& bucket, const std::string& key) const {
    std::string data;
    auto read = StreamObject(bucket, key, 0, UINT64_MAX,
        [&data](const char* chunk, size_t size) {
            data.append(chunk, size);
            return true;
        });
    if (!read.ok()) {
        return Result<std::string>(read.error());
    }
    return Result<std::string>(std::move(data));
}

Result<uint64_t> ObjectStore::StreamObject(const std::string& bucket,
                                           const std::string& key,
                                           uint64_t offset,
                                           uint64_t length,
                                           const ChunkSink& sink) const {
    if (!oracle_.BucketExists(bucket)) {
        return Result<uint64_t>(Error::NotFound(
            "Bucket '" + bucket + "' not found. Please ensure the bucket exists and try again."));
    }
    if (!oracle_.ObjectExists(bucket, key)) {
        return Result<uint64_t>(Error::NotFound(
            "Object '" + key + "' not found in bucket '" + bucket +
            "'. Please ensure the object exists and try again."));
    }

    fs::path objectPath = resolver_.ObjectPath(bucket, key);
    std::ifstream file(objectPath, std::ios::binary);
    if (!file || access(objectPath.c_str(), R_OK) != 0) {
        return Result<uint64_t>(Error::NotFound(
            "Object '" + key + "' in bucket '" + bucket + "' exists but is not readable"));
    }

    if (offset > 0) {
        file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
        if (!file) {
            return Result<uint64_t>(Error::InvalidArgument(
                "Invalid offset " + std::to_string(offset) + " for object '" + key + "'"));
        }
    }

    std::vector<char> buffer(kReadChunkSize);
    uint64_t remaining = length;
    uint64_t total = 0;
    while (remaining > 0 && file) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer.size()));
        file.read(buffer.data(), static_cast<std::streamsize>(want));
        std::streamsize got = file.gcount();
        if (got <= 0) {
            break;
        }
        total += static_cast<uint64_t>(got);
        remaining -= static_cast<uint64_t>(got);
        if (!sink(buffer.data(), static_cast<size_t>(got))) {
            break;
        }
    }
    if (file.bad()) {
        return Result<uint64_t>(Error::IOFailure(
            "Failed to read object '" + key + "' from bucket '" + bucket + "'"));
    }
    return Result<uint64_t>(total);
}

Error ObjectStore::DeleteObject(const std::string& bucket, const std::string& key) {
    if (!oracle_.BucketExists(bucket)) {
        return Error::NotFound("Bucket " + bucket + " not found");
    }

    fs::path objectPath = resolver_.ObjectPath(bucket, key);
    auto guard = lockPath(objectPath);

    if (!oracle_.ObjectExists(bucket, key)) {
        return Error::NotFound("Object '" + key + "' not found in bucket '" + bucket +
            "'. Please verify that both the object key and bucket name are correct.");
    }

    auto err = MetadataSidecar::Remove(objectPath);
    if (err.hasError()) {
        utils::GetLogger().Warn("Error deleting metadata file",
            utils::LogContext()
                .With("bucket", bucket)
                .With("key", key)
                .With("error", err.what()));
    }

    std::error_code ec;
    if (!fs::remove(objectPath, ec) || ec) {
        if (!ec) {
            // 检查之后被并发删除
            return Error::NotFound("Object '" + key + "' not found in bucket '" + bucket + "'");
        }
        return Error::IOFailure("Failed to delete object '" + key + "' from bucket '" +
                                bucket + "': " + ec.message());
    }

    utils::GetLogger().Info("Object deleted",
        utils::LogContext()
            .With("bucket", bucket)
            .With("key", key));
    return Error();
}

} // namespace storage
} // namespace opens3
