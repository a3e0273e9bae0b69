#pragma once

#include <string>
#include <utility>
#include "opens3/types.hpp"

namespace opens3 {
namespace server {

class Error {
public:
    Error() : code_(0), detail_("") {}
    Error(int code, std::string detail) : code_(code), detail_(std::move(detail)) {}

    int Code() const { return code_; }
    const std::string& Detail() const { return detail_; }
    bool ok() const { return code_ == 0; }

    Error WithDetail(const std::string& detail) const {
        return Error(code_, detail);
    }

    int HTTPStatusCode() const {
        switch (code_) {
            case 0: // NoError
                return 200;
            case 1: // ErrNotFound
            case 2: // ErrNoRoute
                return 404;
            case 3: // ErrAlreadyExists
            case 4: // ErrNotEmpty
                return 409;
            case 5: // ErrInvalidArgument
            case 6: // ErrMalformedUpload
            case 7: // ErrMalformedJSON
                return 400;
            case 8: // ErrUnauthorized
                return 401;
            case 9: // ErrPermissionDenied
            case 10: // ErrNoStorage
            case 11: // ErrInternal
            default:
                return 500;
        }
    }

    // 将存储层错误映射为带 HTTP 状态的服务端错误, 保留原始消息
    static Error FromStoreError(const opens3::Error& err);

    // 静态错误定义
    static const Error Success;
    static const Error ErrNotFound;
    static const Error ErrNoRoute;
    static const Error ErrAlreadyExists;
    static const Error ErrNotEmpty;
    static const Error ErrInvalidArgument;
    static const Error ErrMalformedUpload;
    static const Error ErrMalformedJSON;
    static const Error ErrUnauthorized;
    static const Error ErrPermissionDenied;
    static const Error ErrNoStorage;
    static const Error ErrInternal;

private:
    int code_;
    std::string detail_;
};

} // namespace server
} // namespace opens3
