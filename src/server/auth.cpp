#include "opens3/server/auth.hpp"
#include <cctype>
#include "opens3/utils/logger.hpp"
#include "opens3/utils/tools.hpp"

namespace opens3 {
namespace server {

std::optional<std::pair<std::string, std::string>> ParseBasicAuth(const std::string& header) {
    const std::string scheme = "Basic ";
    std::string value = utils::TrimSpace(header);
    if (value.size() <= scheme.size()) {
        return std::nullopt;
    }
    // 方案名不区分大小写
    for (size_t i = 0; i < scheme.size() - 1; ++i) {
        if (std::tolower(static_cast<unsigned char>(value[i])) !=
            std::tolower(static_cast<unsigned char>(scheme[i]))) {
            return std::nullopt;
        }
    }
    if (value[scheme.size() - 1] != ' ') {
        return std::nullopt;
    }

    auto decoded = utils::Base64Decode(utils::TrimSpace(value.substr(scheme.size())));
    if (!decoded.ok()) {
        return std::nullopt;
    }

    const std::string& pair = decoded.value();
    size_t colon = pair.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(pair.substr(0, colon), pair.substr(colon + 1));
}

Error Authenticate(const std::string& authorization, const Credentials& credentials) {
    if (authorization.empty()) {
        utils::GetLogger().Debug("请求缺少Authorization头");
        return Error::ErrUnauthorized;
    }

    auto parsed = ParseBasicAuth(authorization);
    if (!parsed) {
        utils::GetLogger().Warn("Basic认证头格式错误");
        return Error::ErrUnauthorized;
    }

    // 两项都比较, 不短路
    bool userOk = utils::ConstantTimeEquals(parsed->first, credentials.accessKey);
    bool passOk = utils::ConstantTimeEquals(parsed->second, credentials.secretKey);
    if (!(userOk && passOk)) {
        utils::GetLogger().Warn("认证失败");
        return Error::ErrUnauthorized;
    }
    return Error();
}

} // namespace server
} // namespace opens3
