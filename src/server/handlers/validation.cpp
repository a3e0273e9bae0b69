#include "opens3/server/handlers/validation.hpp"
#include <algorithm>
#include <cctype>
#include "opens3/utils/tools.hpp"

namespace opens3 {
namespace server {
namespace handlers {

Error ValidateBucketName(const std::string& bucket) {
    if (bucket.empty()) {
        return Error::ErrInvalidArgument.WithDetail("Bucket name must not be empty");
    }
    if (bucket == "." || bucket == "..") {
        return Error::ErrInvalidArgument.WithDetail("Invalid bucket name '" + bucket + "'");
    }
    if (bucket.find('/') != std::string::npos || bucket.find('\\') != std::string::npos) {
        return Error::ErrInvalidArgument.WithDetail(
            "Bucket name '" + bucket + "' must not contain path separators");
    }
    return Error();
}

Error ValidateObjectKey(const std::string& key) {
    if (key.empty()) {
        return Error::ErrInvalidArgument.WithDetail("Object key must not be empty");
    }
    if (key[0] == '/') {
        return Error::ErrInvalidArgument.WithDetail(
            "Object key '" + key + "' must not start with '/'");
    }
    for (const auto& segment : utils::SplitString(key, '/')) {
        if (segment == "..") {
            return Error::ErrInvalidArgument.WithDetail(
                "Object key '" + key + "' must not contain '..' segments");
        }
    }
    return Error();
}

bool ParseBoolFlag(const std::string& value, bool& out) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes") {
        out = true;
        return true;
    }
    if (lower == "false" || lower == "0" || lower == "no") {
        out = false;
        return true;
    }
    return false;
}

} // namespace handlers
} // namespace server
} // namespace opens3
