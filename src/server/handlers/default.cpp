#include "opens3/server/server.hpp"
#include <algorithm>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "opens3/server/handlers/validation.hpp"
#include "opens3/storage/sidecar.hpp"
#include "opens3/utils/logger.hpp"
#include "opens3/utils/tools.hpp"

namespace opens3 {
namespace server {
namespace handlers {

namespace {

void writeJSON(Response& resp, int status, const json& body) {
    resp.status = status;
    resp.body = body.dump();
    resp.headers["Content-Type"] = "application/json";
}

std::string param(const Context& ctx, const std::string& name) {
    auto it = ctx.request.params.find(name);
    return it == ctx.request.params.end() ? std::string() : it->second;
}

// 路径形式取 {key}, 查询形式取 object_key
std::string objectKeyOf(const Context& ctx) {
    std::string key = param(ctx, "key");
    if (key.empty()) {
        if (const std::string* q = ctx.request.Query("object_key")) {
            key = *q;
        }
    }
    return key;
}

// 校验存储桶名和对象键, 有存储服务时返回成功
Error checkObjectRequest(const Context& ctx, const std::string& bucket, const std::string& key) {
    if (!ctx.store) {
        return Error::ErrNoStorage;
    }
    Error err = ValidateBucketName(bucket);
    if (!err.ok()) {
        return err;
    }
    return ValidateObjectKey(key);
}

std::string baseName(const std::string& key) {
    size_t slash = key.find_last_of('/');
    return slash == std::string::npos ? key : key.substr(slash + 1);
}

std::string contentDisposition(const std::string& key) {
    std::string name;
    for (char c : baseName(key)) {
        if (c == '"' || c == '\\') {
            name += '\\';
        }
        name += c;
    }
    return "attachment; filename=\"" + name + "\"";
}

} // namespace

// 主页处理程序
Error MainHandler(const Context& ctx, Response& resp) {
    utils::GetLogger().Debug("处理主页请求");
    writeJSON(resp, 200, {
        {"message", "Welcome to OpenS3 - a local implementation of S3-like object storage"},
        {"documentation", "/"},
        {"version", "1.0.0"}
    });
    return Error();
}

Error PreflightHandler(const Context& ctx, Response& resp) {
    resp.status = 204;
    resp.headers["Access-Control-Allow-Methods"] = "GET, POST, DELETE, HEAD, OPTIONS";
    std::string requested = ctx.request.Header("Access-Control-Request-Headers");
    resp.headers["Access-Control-Allow-Headers"] = requested.empty() ? "*" : requested;
    resp.headers["Access-Control-Max-Age"] = "86400";
    return Error();
}

// 404处理程序
Error NotFoundHandler(const Context& ctx, Response& resp) {
    utils::GetLogger().Warn("资源未找到",
        utils::LogContext()
            .With("method", ctx.request.method)
            .With("path", ctx.request.path));
    return Error::ErrNoRoute;
}

// === 存储桶 ===

Error CreateBucketHandler(const Context& ctx, Response& resp) {
    if (!ctx.store) {
        return Error::ErrNoStorage;
    }

    json body = json::parse(ctx.request.body, nullptr, false);
    if (body.is_discarded() || !body.is_object() || !body.contains("name") ||
        !body["name"].is_string()) {
        return Error::ErrMalformedJSON.WithDetail("Request body must be a JSON object with a string 'name'");
    }
    std::string name = body["name"].get<std::string>();

    Error err = ValidateBucketName(name);
    if (!err.ok()) {
        return err;
    }

    auto created = ctx.store->CreateBucket(name);
    if (!created.ok()) {
        return Error::FromStoreError(created.error());
    }

    writeJSON(resp, 201, {
        {"message", "Bucket '" + name + "' created successfully"},
        {"bucket", name},
        {"creation_date", utils::FormatISO8601(created.value().creationDate)}
    });
    return Error();
}

Error ListBucketsHandler(const Context& ctx, Response& resp) {
    if (!ctx.store) {
        return Error::ErrNoStorage;
    }

    auto listed = ctx.store->ListBuckets();
    if (!listed.ok()) {
        return Error::FromStoreError(listed.error());
    }

    auto buckets = std::move(listed).value();
    std::sort(buckets.begin(), buckets.end(),
              [](const BucketInfo& a, const BucketInfo& b) { return a.name < b.name; });

    json items = json::array();
    for (const auto& bucket : buckets) {
        items.push_back({
            {"name", bucket.name},
            {"creation_date", utils::FormatISO8601(bucket.creationDate)}
        });
    }
    writeJSON(resp, 200, {{"buckets", items}});
    return Error();
}

Error HeadBucketHandler(const Context& ctx, Response& resp) {
    if (!ctx.store) {
        return Error::ErrNoStorage;
    }
    std::string bucket = param(ctx, "bucket");
    Error err = ValidateBucketName(bucket);
    if (!err.ok()) {
        return err;
    }

    auto headErr = ctx.store->HeadBucket(bucket);
    if (headErr.hasError()) {
        return Error::FromStoreError(headErr);
    }
    writeJSON(resp, 200, {{"message", "Bucket " + bucket + " exists"}});
    return Error();
}

Error DeleteBucketHandler(const Context& ctx, Response& resp) {
    if (!ctx.store) {
        return Error::ErrNoStorage;
    }
    std::string bucket = param(ctx, "bucket");
    Error err = ValidateBucketName(bucket);
    if (!err.ok()) {
        return err;
    }

    bool force = false;
    if (const std::string* value = ctx.request.Query("force")) {
        if (!ParseBoolFlag(*value, force)) {
            return Error::ErrInvalidArgument.WithDetail("Invalid value for 'force': " + *value);
        }
    }

    auto deleteErr = ctx.store->DeleteBucket(bucket, force);
    if (deleteErr.hasError()) {
        return Error::FromStoreError(deleteErr);
    }

    writeJSON(resp, 200, {
        {"message", "Bucket " + bucket + " deleted successfully"},
        {"force_applied", force}
    });
    return Error();
}

Error CreateDirectoryHandler(const Context& ctx, Response& resp) {
    if (!ctx.store) {
        return Error::ErrNoStorage;
    }
    std::string bucket = param(ctx, "bucket");
    Error err = ValidateBucketName(bucket);
    if (!err.ok()) {
        return err;
    }

    const std::string* directoryPath = ctx.request.Query("directory_path");
    if (!directoryPath) {
        return Error::ErrInvalidArgument.WithDetail("Missing query parameter 'directory_path'");
    }
    for (const auto& segment : utils::SplitString(*directoryPath, '/')) {
        if (segment == "..") {
            return Error::ErrInvalidArgument.WithDetail(
                "Directory path '" + *directoryPath + "' must not contain '..' segments");
        }
    }

    auto created = ctx.store->CreateDirectory(bucket, *directoryPath);
    if (!created.ok()) {
        return Error::FromStoreError(created.error());
    }

    writeJSON(resp, 201, {
        {"message", "Directory '" + created.value().directory +
                    "' created successfully in bucket '" + bucket + "'"},
        {"directory", created.value().directory},
        {"creation_date", utils::FormatISO8601(created.value().creationDate)}
    });
    return Error();
}

// === 对象 ===

Error UploadObjectHandler(const Context& ctx, Response& resp) {
    if (!ctx.store) {
        return Error::ErrNoStorage;
    }
    std::string bucket = param(ctx, "bucket");
    Error err = ValidateBucketName(bucket);
    if (!err.ok()) {
        return err;
    }

    const Request::File* file = ctx.request.FormPart("file");
    if (!file) {
        utils::GetLogger().Warn("上传请求缺少文件部分",
            utils::LogContext()
                .With("bucket", bucket)
                .With("parts", std::to_string(ctx.request.files.size())));
        return Error::ErrMalformedUpload.WithDetail("Missing multipart field 'file'");
    }

    const std::string& key = file->filename;
    err = ValidateObjectKey(key);
    if (!err.ok()) {
        return err;
    }

    // 元数据解析失败不影响上传
    std::optional<json> metadata;
    if (const Request::File* jsonPart = ctx.request.FormPart("json")) {
        metadata = storage::MetadataSidecar::ExtractEnvelope(jsonPart->content);
        if (!metadata) {
            utils::GetLogger().Debug("忽略无效的元数据",
                utils::LogContext()
                    .With("bucket", bucket)
                    .With("key", key));
        }
    }

    std::string contentType = ctx.request.Header("Content-Type");
    if (contentType.empty() || utils::StartsWith(contentType, "multipart/")) {
        contentType = file->content_type;
    }

    auto put = ctx.store->PutObject(bucket, key, file->content, metadata, contentType);
    if (!put.ok()) {
        return Error::FromStoreError(put.error());
    }

    const auto& result = put.value();
    writeJSON(resp, 201, {
        {"key", result.key},
        {"size", result.size},
        {"bucket", result.bucket},
        {"content_type", result.contentType.empty() ? json(nullptr) : json(result.contentType)},
        {"metadata", result.metadata}
    });
    return Error();
}

Error ListObjectsHandler(const Context& ctx, Response& resp) {
    if (!ctx.store) {
        return Error::ErrNoStorage;
    }
    std::string bucket = param(ctx, "bucket");
    Error err = ValidateBucketName(bucket);
    if (!err.ok()) {
        return err;
    }

    std::optional<std::string> prefix;
    if (const std::string* value = ctx.request.Query("prefix")) {
        prefix = *value;
    }

    auto listed = ctx.store->ListObjects(bucket, prefix);
    if (!listed.ok()) {
        return Error::FromStoreError(listed.error());
    }

    auto objects = std::move(listed).value();
    std::sort(objects.begin(), objects.end(),
              [](const ObjectInfo& a, const ObjectInfo& b) { return a.key < b.key; });

    json items = json::array();
    for (const auto& object : objects) {
        items.push_back({
            {"key", object.key},
            {"size", object.size},
            {"last_modified", utils::FormatISO8601(object.lastModified)},
            {"content_type", nullptr}
        });
    }
    writeJSON(resp, 200, {{"objects", items}});
    return Error();
}

Error HeadObjectHandler(const Context& ctx, Response& resp) {
    std::string bucket = param(ctx, "bucket");
    std::string key = objectKeyOf(ctx);
    Error err = checkObjectRequest(ctx, bucket, key);
    if (!err.ok()) {
        return err;
    }

    auto head = ctx.store->HeadObject(bucket, key);
    if (!head.ok()) {
        return Error::FromStoreError(head.error());
    }

    const auto& info = head.value();
    std::string lastModified = utils::FormatISO8601(info.lastModified);
    writeJSON(resp, 200, {
        {"key", info.key},
        {"size", info.size},
        {"last_modified", lastModified},
        {"content_type", info.contentType},
        {"metadata", info.metadata},
        {"etag", info.etag}
    });
    resp.headers["Content-Type"] = info.contentType;
    resp.headers["Content-Length"] = std::to_string(info.size);
    resp.headers["ETag"] = info.etag;
    resp.headers["Last-Modified"] = utils::FormatHttpDate(info.lastModified);
    return Error();
}

Error GetObjectMetadataHandler(const Context& ctx, Response& resp) {
    std::string bucket = param(ctx, "bucket");
    std::string key = objectKeyOf(ctx);
    Error err = checkObjectRequest(ctx, bucket, key);
    if (!err.ok()) {
        return err;
    }

    auto metadata = ctx.store->GetObjectMetadata(bucket, key);
    if (!metadata.ok()) {
        return Error::FromStoreError(metadata.error());
    }
    writeJSON(resp, 200, {{"metadata", metadata.value()}});
    return Error();
}

Error GetObjectHandler(const Context& ctx, Response& resp) {
    std::string bucket = param(ctx, "bucket");
    std::string key = objectKeyOf(ctx);
    if (key.empty() && !ctx.request.Query("object_key")) {
        return Error::ErrInvalidArgument.WithDetail("Missing query parameter 'object_key'");
    }
    Error err = checkObjectRequest(ctx, bucket, key);
    if (!err.ok()) {
        return err;
    }

    // 零长度读取只检查对象是否存在且可读
    auto probe = ctx.store->StreamObject(bucket, key, 0, 0,
        [](const char*, size_t) { return true; });
    if (!probe.ok()) {
        return Error::FromStoreError(probe.error());
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(ctx.store->Resolver().ObjectPath(bucket, key), ec);
    if (ec) {
        return Error::ErrNotFound.WithDetail(
            "Object '" + key + "' not found in bucket '" + bucket + "'");
    }

    utils::GetLogger().Debug("开始下载对象",
        utils::LogContext()
            .With("bucket", bucket)
            .With("key", key)
            .With("size", std::to_string(size)));

    storage::ObjectStore* store = ctx.store;
    resp.status = 200;
    resp.headers["Content-Type"] = utils::GuessContentType(key);
    resp.headers["Content-Disposition"] = contentDisposition(key);
    resp.contentLength = static_cast<uint64_t>(size);
    resp.contentProvider = [store, bucket, key](uint64_t offset, uint64_t length,
                                                const storage::ChunkSink& sink) {
        auto streamed = store->StreamObject(bucket, key, offset, length, sink);
        if (!streamed.ok()) {
            utils::GetLogger().Error("对象读取失败",
                utils::LogContext()
                    .With("bucket", bucket)
                    .With("key", key)
                    .With("error", streamed.error().what()));
            return false;
        }
        // 文件在下载期间被截断时提前结束, 否则 httplib 会以同一偏移反复调用
        if (streamed.value() < length) {
            utils::GetLogger().Warn("对象在下载期间被截断",
                utils::LogContext()
                    .With("bucket", bucket)
                    .With("key", key)
                    .With("offset", std::to_string(offset))
                    .With("expected", std::to_string(length))
                    .With("read", std::to_string(streamed.value())));
            return false;
        }
        return true;
    };
    return Error();
}

Error DeleteObjectHandler(const Context& ctx, Response& resp) {
    std::string bucket = param(ctx, "bucket");
    std::string key = objectKeyOf(ctx);
    Error err = checkObjectRequest(ctx, bucket, key);
    if (!err.ok()) {
        return err;
    }

    auto deleteErr = ctx.store->DeleteObject(bucket, key);
    if (deleteErr.hasError()) {
        return Error::FromStoreError(deleteErr);
    }

    writeJSON(resp, 200, {
        {"message", "Object '" + key + "' deleted successfully from bucket '" + bucket + "'"},
        {"bucket", bucket},
        {"key", key}
    });
    return Error();
}

} // namespace handlers
} // namespace server
} // namespace opens3
