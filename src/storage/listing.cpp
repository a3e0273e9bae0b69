#include "opens3/storage/listing.hpp"
#include <stack>
#include <utility>
#include <system_error>
#include <sys/stat.h>
#include "opens3/utils/logger.hpp"
#include "opens3/utils/tools.hpp"

namespace opens3 {
namespace storage {

namespace fs = std::filesystem;

bool ListingEngine::IsInternalEntry(const std::string& name) {
    return name == DIRECTORY_MARKER || utils::EndsWith(name, METADATA_SUFFIX);
}

bool ListingEngine::ShouldDescend(const std::string& childPrefix, const std::string& prefix) {
    if (prefix.empty()) {
        return true;
    }
    return utils::StartsWith(childPrefix, prefix) || utils::StartsWith(prefix, childPrefix);
}

std::vector<ObjectInfo> ListingEngine::List(const fs::path& bucketPath,
                                            const std::optional<std::string>& prefix) {
    std::vector<ObjectInfo> objects;
    const std::string filter = prefix.value_or("");

    std::error_code ec;
    if (!fs::is_directory(bucketPath, ec)) {
        utils::GetLogger().Warn("Listing requested for missing bucket directory",
            utils::LogContext().With("path", bucketPath.string()));
        return objects;
    }

    // (目录, 累积前缀)
    std::stack<std::pair<fs::path, std::string>> pending;
    pending.push({bucketPath, ""});

    while (!pending.empty()) {
        auto [directory, accumulated] = pending.top();
        pending.pop();

        fs::directory_iterator it(directory, ec);
        if (ec) {
            // 目录可能在遍历过程中被删除
            utils::GetLogger().Debug("Skipping unreadable directory",
                utils::LogContext()
                    .With("path", directory.string())
                    .With("error", ec.message()));
            continue;
        }

        for (fs::directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                break;
            }
            const fs::directory_entry& entry = *it;
            std::string name = entry.path().filename().string();

            if (IsInternalEntry(name)) {
                continue;
            }

            std::error_code statEc;
            if (entry.is_regular_file(statEc)) {
                std::string candidateKey = accumulated + name;
                if (!filter.empty() && !utils::StartsWith(candidateKey, filter)) {
                    continue;
                }

                struct stat info;
                if (stat(entry.path().c_str(), &info) != 0) {
                    utils::GetLogger().Debug("Skipping entry that vanished during listing",
                        utils::LogContext().With("key", candidateKey));
                    continue;
                }

                ObjectInfo object;
                object.key = candidateKey;
                object.size = static_cast<uint64_t>(info.st_size);
                object.lastModified = std::chrono::system_clock::from_time_t(info.st_mtime);
                objects.push_back(std::move(object));
                continue;
            }

            if (entry.is_directory(statEc) && !entry.is_symlink(statEc) && name[0] != '.') {
                std::string childPrefix = accumulated + name + "/";
                if (!ShouldDescend(childPrefix, filter)) {
                    continue;
                }
                pending.push({entry.path(), childPrefix});
            }
        }

        if (ec) {
            utils::GetLogger().Debug("Directory iteration stopped early",
                utils::LogContext()
                    .With("path", directory.string())
                    .With("error", ec.message()));
            ec.clear();
        }
    }

    utils::GetLogger().Debug("Listing completed",
        utils::LogContext()
            .With("path", bucketPath.string())
            .With("prefix", filter)
            .With("count", std::to_string(objects.size())));
    return objects;
}

} // namespace storage
} // namespace opens3
