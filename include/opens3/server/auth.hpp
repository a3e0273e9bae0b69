#pragma once

#include <string>
#include <optional>
#include <utility>
#include "opens3/config.hpp"
#include "opens3/server/errors.hpp"

namespace opens3 {
namespace server {

// 解析 "Basic <base64(user:pass)>", 在第一个 ':' 处切分
// 格式不对或无法解码时返回 nullopt
std::optional<std::pair<std::string, std::string>> ParseBasicAuth(const std::string& header);

// 校验 Authorization 头, 失败返回 ErrUnauthorized
Error Authenticate(const std::string& authorization, const Credentials& credentials);

} // namespace server
} // namespace opens3
