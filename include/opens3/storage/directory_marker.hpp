#pragma once

#include <string>
#include <filesystem>
#include "opens3/types.hpp"

namespace opens3 {
namespace storage {

// S3 风格的 "文件夹" 键 (以 '/' 结尾) 在磁盘上表示为目录加 .directory 标记文件
class DirectoryMarker {
public:
    // key 以 '/' 结尾
    static bool IsDirectoryMarkerKey(const std::string& key);

    // 为上传的目录键创建目录链并写入带时间戳的标记; 重复调用不报错
    // 返回标记文件所在目录
    static Result<std::filesystem::path> Materialize(const std::filesystem::path& bucketPath,
                                                     const std::string& key);

    // 显式建目录接口: 按 '/' 逐段创建, 在叶子目录写入空标记
    // 返回规范化后以 '/' 结尾的目录路径
    static Result<std::string> CreateDirectoryPath(const std::filesystem::path& bucketPath,
                                                   const std::string& directoryPath);

    // 目录下是否有标记文件
    static bool HasMarker(const std::filesystem::path& directory);
};

} // namespace storage
} // namespace opens3
