#include "opens3/utils/tools.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <map>
#include <memory>
#include <sstream>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace opens3 {
namespace utils {

bool StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> SplitString(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : str) {
        if (c == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::string TrimSpace(const std::string& str) {
    auto begin = std::find_if_not(str.begin(), str.end(),
        [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
        [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) {
        return "";
    }
    return std::string(begin, end);
}

std::string HexEncode(const std::vector<uint8_t>& data) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t byte : data) {
        ss << std::setw(2) << static_cast<int>(byte);
    }
    return ss.str();
}

Result<std::string> Base64Decode(const std::string& base64) {
    if (base64.empty()) {
        return Result<std::string>(std::string());
    }

    std::vector<char> decoded(base64.length());

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO* bio = BIO_new_mem_buf(base64.data(), static_cast<int>(base64.length()));
    bio = BIO_push(b64, bio);

    int decodedLen = BIO_read(bio, decoded.data(), static_cast<int>(base64.length()));
    BIO_free_all(bio);

    if (decodedLen <= 0) {
        return Result<std::string>(Error::InvalidArgument("Base64 decode failed"));
    }
    return Result<std::string>(std::string(decoded.data(), static_cast<size_t>(decodedLen)));
}

Result<std::string> CalculateFileMD5(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>(Error::IOFailure("Cannot open file for hashing: " + path));
    }

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        return Result<std::string>(Error::IOFailure("Failed to initialize MD5 context"));
    }

    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = file.gcount();
        if (n > 0 && EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(n)) != 1) {
            return Result<std::string>(Error::IOFailure("Failed to update MD5 digest"));
        }
    }
    if (file.bad()) {
        return Result<std::string>(Error::IOFailure("Failed to read file for hashing: " + path));
    }

    std::vector<uint8_t> digest(EVP_MAX_MD_SIZE);
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLen) != 1) {
        return Result<std::string>(Error::IOFailure("Failed to finalize MD5 digest"));
    }
    digest.resize(digestLen);
    return Result<std::string>(HexEncode(digest));
}

bool ConstantTimeEquals(const std::string& a, const std::string& b) {
    // 长度不同也要做一次完整比较
    if (a.size() != b.size()) {
        CRYPTO_memcmp(a.data(), a.data(), a.size());
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string FormatISO8601(const TimePoint& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    localtime_r(&t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

std::string FormatHttpDate(const TimePoint& tp) {
    static const char* kDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
    static const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    gmtime_r(&t, &tm);

    // 不依赖 locale
    std::stringstream ss;
    ss << kDays[tm.tm_wday] << ", "
       << std::setfill('0') << std::setw(2) << tm.tm_mday << ' '
       << kMonths[tm.tm_mon] << ' '
       << (tm.tm_year + 1900) << ' '
       << std::setw(2) << tm.tm_hour << ':'
       << std::setw(2) << tm.tm_min << ':'
       << std::setw(2) << tm.tm_sec << " GMT";
    return ss.str();
}

std::string FormatHumanTime(const TimePoint& tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    std::tm tm;
    localtime_r(&t, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

std::string GuessContentType(const std::string& path) {
    static const std::map<std::string, std::string> kTypes = {
        {".txt", "text/plain"},
        {".csv", "text/csv"},
        {".htm", "text/html"},
        {".html", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".md", "text/markdown"},
        {".xml", "application/xml"},
        {".json", "application/json"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".parquet", "application/vnd.apache.parquet"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},
        {".mp4", "video/mp4"},
    };

    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return DEFAULT_CONTENT_TYPE;
    }

    std::string ext = name.substr(dot);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto it = kTypes.find(ext);
    if (it == kTypes.end()) {
        return DEFAULT_CONTENT_TYPE;
    }
    return it->second;
}

} // namespace utils
} // namespace opens3
