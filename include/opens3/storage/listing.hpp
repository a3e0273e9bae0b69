#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "opens3/types.hpp"

namespace opens3 {
namespace storage {

// 把存储桶目录树展开成扁平的 key 列表
//
// 前缀过滤在目录边界上双向判断: 目录前缀 "a/" 虽然不以过滤串 "a/b" 开头,
// 但过滤串以它开头, 仍需进入. 结果不保证顺序.
// 使用显式栈遍历, 不跟随指向目录的符号链接.
class ListingEngine {
public:
    static std::vector<ObjectInfo> List(const std::filesystem::path& bucketPath,
                                        const std::optional<std::string>& prefix);

    // 列表中应跳过的内部文件: .directory 和 *.metadata
    static bool IsInternalEntry(const std::string& name);

    // 子目录前缀 childPrefix 是否可能包含匹配 prefix 的键
    static bool ShouldDescend(const std::string& childPrefix, const std::string& prefix);
};

} // namespace storage
} // namespace opens3
