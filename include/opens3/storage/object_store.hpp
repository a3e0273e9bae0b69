#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "opens3/types.hpp"
#include "opens3/config.hpp"
#include "opens3/storage/path_resolver.hpp"
#include "opens3/storage/existence.hpp"
#include "opens3/storage/lock_table.hpp"

namespace opens3 {
namespace storage {

using json = nlohmann::json;

// 读取对象时的数据回调, 返回 false 表示停止
using ChunkSink = std::function<bool(const char* data, size_t size)>;

// 存储桶/对象的生命周期操作, 以文件系统为唯一的事实来源
// 除可选的路径锁之外不保存任何跨请求的内存状态
class ObjectStore {
public:
    explicit ObjectStore(const StoreConfig& config);

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    const PathResolver& Resolver() const { return resolver_; }
    const ExistenceOracle& Oracle() const { return oracle_; }

    // === 存储桶 ===

    Result<BucketInfo> CreateBucket(const std::string& name);
    Result<std::vector<BucketInfo>> ListBuckets() const;
    Error HeadBucket(const std::string& name) const;

    // 默认只做浅层检查: 顶层存在 .metadata/.directory 以外的条目即视为非空
    Error DeleteBucket(const std::string& name, bool force);

    // === 目录 ===

    Result<DirectoryInfo> CreateDirectory(const std::string& bucket, const std::string& directoryPath);

    // === 对象 ===

    // 以 '/' 结尾的 key 只创建目录标记, 不写数据文件
    Result<PutResult> PutObject(const std::string& bucket,
                                const std::string& key,
                                const std::string& content,
                                const std::optional<json>& metadata = std::nullopt,
                                const std::string& contentType = "");

    Result<std::vector<ObjectInfo>> ListObjects(const std::string& bucket,
                                                const std::optional<std::string>& prefix) const;

    Result<ObjectHead> HeadObject(const std::string& bucket, const std::string& key) const;

    // 返回 sidecar 中的元数据, 解析失败时降级为 {"error": ...}
    Result<json> GetObjectMetadata(const std::string& bucket, const std::string& key) const;

    Result<std::string> GetObject(const std::string& bucket, const std::string& key) const;

    // 从 offset 开始最多读取 length 字节, 分块交给 sink; 返回实际读取的字节数
    Result<uint64_t> StreamObject(const std::string& bucket,
                                  const std::string& key,
                                  uint64_t offset,
                                  uint64_t length,
                                  const ChunkSink& sink) const;

    Error DeleteObject(const std::string& bucket, const std::string& key);

private:
    PathLockTable::Guard lockPath(const std::filesystem::path& path);

    StoreConfig config_;
    PathResolver resolver_;
    ExistenceOracle oracle_;
    PathLockTable locks_;
};

} // namespace storage
} // namespace opens3
