#pragma once

#include <string>
#include "opens3/server/errors.hpp"

namespace opens3 {
namespace server {
namespace handlers {

// 存储桶名: 非空, 不含 '/' 或 '\\', 不是 "." 或 ".."
Error ValidateBucketName(const std::string& bucket);

// 对象键: 非空, 不以 '/' 开头, 不含 ".." 路径段
Error ValidateObjectKey(const std::string& key);

// 查询参数中的布尔值, 接受 true/false/1/0 (不区分大小写)
bool ParseBoolFlag(const std::string& value, bool& out);

} // namespace handlers
} // namespace server
} // namespace opens3
