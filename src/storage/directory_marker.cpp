#include "opens3/storage/directory_marker.hpp"
#include <fstream>
#include <system_error>
#include "opens3/utils/logger.hpp"
#include "opens3/utils/tools.hpp"

namespace opens3 {
namespace storage {

namespace fs = std::filesystem;

namespace {

Error writeMarker(const fs::path& directory, const std::string& content) {
    fs::path markerPath = directory / DIRECTORY_MARKER;
    std::ofstream marker(markerPath, std::ios::binary | std::ios::trunc);
    if (!marker) {
        return Error::IOFailure("Failed to create directory marker: " + markerPath.string());
    }
    marker << content;
    if (!marker) {
        return Error::IOFailure("Failed to write directory marker: " + markerPath.string());
    }
    return Error();
}

} // namespace

bool DirectoryMarker::IsDirectoryMarkerKey(const std::string& key) {
    return !key.empty() && key.back() == '/';
}

Result<fs::path> DirectoryMarker::Materialize(const fs::path& bucketPath, const std::string& key) {
    std::string stripped = key;
    while (!stripped.empty() && stripped.back() == '/') {
        stripped.pop_back();
    }

    fs::path dirPath = bucketPath;
    if (!stripped.empty()) {
        dirPath = fs::path(bucketPath.string() + "/" + stripped);
    }

    std::error_code ec;
    fs::create_directories(dirPath, ec);
    if (ec) {
        return Result<fs::path>(Error::IOFailure(
            "Failed to create directory for key '" + key + "': " + ec.message()));
    }

    auto err = writeMarker(dirPath,
        "S3-style directory marker created on " +
        utils::FormatHumanTime(std::chrono::system_clock::now()));
    if (err.hasError()) {
        return Result<fs::path>(err);
    }

    utils::GetLogger().Debug("Created S3-style directory marker",
        utils::LogContext()
            .With("key", key)
            .With("path", dirPath.string()));
    return Result<fs::path>(dirPath);
}

Result<std::string> DirectoryMarker::CreateDirectoryPath(const fs::path& bucketPath,
                                                         const std::string& directoryPath) {
    std::string normalized = directoryPath;
    if (!IsDirectoryMarkerKey(normalized)) {
        normalized += '/';
    }

    fs::path current = bucketPath;
    bool hasSegment = false;
    for (const auto& part : utils::SplitString(normalized, '/')) {
        if (part.empty()) {
            continue;
        }
        hasSegment = true;
        current /= part;

        std::error_code ec;
        if (fs::is_directory(current, ec)) {
            continue;
        }
        fs::create_directory(current, ec);
        if (ec) {
            return Result<std::string>(Error::IOFailure(
                "Failed to create directory '" + current.string() + "': " + ec.message()));
        }
    }

    if (!hasSegment) {
        return Result<std::string>(Error::InvalidArgument(
            "Directory path '" + directoryPath + "' has no path segments"));
    }

    auto err = writeMarker(current, "");
    if (err.hasError()) {
        return Result<std::string>(err);
    }
    return Result<std::string>(normalized);
}

bool DirectoryMarker::HasMarker(const fs::path& directory) {
    std::error_code ec;
    return fs::is_regular_file(directory / DIRECTORY_MARKER, ec);
}

} // namespace storage
} // namespace opens3
