#include "opens3/storage/lock_table.hpp"
#include <utility>

namespace opens3 {
namespace storage {

PathLockTable::Guard::Guard(PathLockTable* table, std::string path)
    : table_(table), path_(std::move(path)) {}

PathLockTable::Guard::~Guard() {
    release();
}

PathLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), path_(std::move(other.path_)) {
    other.table_ = nullptr;
}

PathLockTable::Guard& PathLockTable::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        table_ = other.table_;
        path_ = std::move(other.path_);
        other.table_ = nullptr;
    }
    return *this;
}

void PathLockTable::Guard::release() {
    if (table_) {
        table_->unlock(path_);
        table_ = nullptr;
    }
}

PathLockTable::Guard PathLockTable::Acquire(const std::string& path) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = entries_[path];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        slot->refs++;
        entry = slot;
    }
    // 表锁之外等待, 避免阻塞其他路径
    entry->mutex.lock();
    return Guard(this, path);
}

void PathLockTable::unlock(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return;
    }
    it->second->mutex.unlock();
    if (--it->second->refs == 0) {
        entries_.erase(it);
    }
}

size_t PathLockTable::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace storage
} // namespace opens3
