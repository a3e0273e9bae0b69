#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "opens3/types.hpp"

namespace opens3 {
namespace utils {

// 字符串前缀/后缀判断
bool StartsWith(const std::string& str, const std::string& prefix);
bool EndsWith(const std::string& str, const std::string& suffix);

// 按分隔符切分, 保留空段
std::vector<std::string> SplitString(const std::string& str, char delimiter);

// 去掉首尾空白
std::string TrimSpace(const std::string& str);

// 将字节数组转换为十六进制字符串
std::string HexEncode(const std::vector<uint8_t>& data);

// Base64解码 (OpenSSL BIO)
Result<std::string> Base64Decode(const std::string& base64);

// 流式计算文件内容的MD5, 返回十六进制字符串
Result<std::string> CalculateFileMD5(const std::string& path);

// 常量时间比较, 比较耗时与首个不同字节的位置无关
bool ConstantTimeEquals(const std::string& a, const std::string& b);

// ISO 8601 本地时间, 例如 2024-01-01T12:00:00
std::string FormatISO8601(const TimePoint& tp);

// RFC 7231 HTTP 日期, 例如 Mon, 01 Jan 2024 12:00:00 GMT
std::string FormatHttpDate(const TimePoint& tp);

// 人类可读的本地时间, 例如 2024-01-01 12:00:00.123
std::string FormatHumanTime(const TimePoint& tp);

// 根据扩展名猜测内容类型, 未知时返回 application/octet-stream
std::string GuessContentType(const std::string& path);

} // namespace utils
} // namespace opens3
