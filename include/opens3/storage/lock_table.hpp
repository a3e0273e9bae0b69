#pragma once

#include <string>
#include <map>
#include <memory>
#include <mutex>

namespace opens3 {
namespace storage {

// 按路径加锁, 不同路径互不阻塞
// 条目在最后一个持有者释放后回收
class PathLockTable {
public:
    class Guard {
    public:
        Guard() = default;
        Guard(PathLockTable* table, std::string path);
        ~Guard();

        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        bool owns() const { return table_ != nullptr; }

    private:
        void release();

        PathLockTable* table_ = nullptr;
        std::string path_;
    };

    PathLockTable() = default;
    PathLockTable(const PathLockTable&) = delete;
    PathLockTable& operator=(const PathLockTable&) = delete;

    // 阻塞直到获得 path 的锁
    Guard Acquire(const std::string& path);

    // 当前表中的条目数, 供测试使用
    size_t Size() const;

private:
    struct Entry {
        std::mutex mutex;
        size_t refs = 0;
    };

    void unlock(const std::string& path);

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

} // namespace storage
} // namespace opens3
