#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace opens3 {

using json = nlohmann::json;

// 目录标记文件名
const std::string DIRECTORY_MARKER = ".directory";
// 元数据 sidecar 文件后缀
const std::string METADATA_SUFFIX  = ".metadata";
// 未知类型时的默认内容类型
const std::string DEFAULT_CONTENT_TYPE = "application/octet-stream";

// 错误类别
enum class ErrorCode : int {
    OK = 0,
    NotFound,
    AlreadyExists,
    NotEmpty,
    IOFailure,
    PermissionDenied,
    InvalidArgument,
    MetadataDecodeFailure
};

std::string ErrorCodeToString(ErrorCode code);

// 错误类型
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    explicit Error(const std::string& message) : code_(ErrorCode::IOFailure), message_(message) {}
    Error(ErrorCode code, const std::string& message) : code_(code), message_(message) {}

    const std::string& what() const { return message_; }
    ErrorCode code() const { return code_; }
    bool ok() const { return code_ == ErrorCode::OK; }
    bool hasError() const { return code_ != ErrorCode::OK; }

    static Error NotFound(const std::string& msg) { return Error(ErrorCode::NotFound, msg); }
    static Error AlreadyExists(const std::string& msg) { return Error(ErrorCode::AlreadyExists, msg); }
    static Error NotEmpty(const std::string& msg) { return Error(ErrorCode::NotEmpty, msg); }
    static Error IOFailure(const std::string& msg) { return Error(ErrorCode::IOFailure, msg); }
    static Error PermissionDenied(const std::string& msg) { return Error(ErrorCode::PermissionDenied, msg); }
    static Error InvalidArgument(const std::string& msg) { return Error(ErrorCode::InvalidArgument, msg); }

private:
    ErrorCode code_;
    std::string message_;
};

// 结果类型
template<typename T>
class Result {
public:
    Result() : error_(ErrorCode::IOFailure, "uninitialized result"), hasError_(true) {}
    Result(const T& value) : value_(value), hasError_(false) {}
    Result(T&& value) : value_(std::move(value)), hasError_(false) {}
    Result(const Error& error) : error_(error), hasError_(true) {}

    bool ok() const { return !hasError_; }
    const T& value() const & { return value_; }
    T& value() & { return value_; }
    T&& value() && { return std::move(value_); }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasError_;
};

using TimePoint = std::chrono::system_clock::time_point;

// 存储桶描述
struct BucketInfo {
    std::string name;
    TimePoint creationDate;
};

// 列表条目
struct ObjectInfo {
    std::string key;
    uint64_t size = 0;
    TimePoint lastModified;
};

// HEAD 请求返回的对象信息
struct ObjectHead {
    std::string key;
    uint64_t size = 0;
    TimePoint lastModified;
    std::string contentType;
    std::string etag;
    json metadata = json::object();
};

// 上传结果
struct PutResult {
    std::string bucket;
    std::string key;
    uint64_t size = 0;
    std::string contentType;
    json metadata = json::object();
    bool directoryMarker = false;
};

// 目录创建结果
struct DirectoryInfo {
    std::string bucket;
    std::string directory;   // 规范化后的目录路径, 以 '/' 结尾
    TimePoint creationDate;
};

} // namespace opens3
