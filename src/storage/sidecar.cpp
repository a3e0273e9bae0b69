#include "opens3/storage/sidecar.hpp"
#include <fstream>
#include <system_error>
#include "opens3/storage/path_resolver.hpp"
#include "opens3/utils/logger.hpp"

namespace opens3 {
namespace storage {

namespace fs = std::filesystem;

Error MetadataSidecar::Write(const fs::path& objectPath, const json& metadata) {
    fs::path metadataPath = PathResolver::MetadataPath(objectPath);

    std::string data;
    try {
        data = metadata.dump();
    } catch (const json::exception& e) {
        return Error::IOFailure("Failed to serialize metadata for " +
                                objectPath.string() + ": " + e.what());
    }

    std::ofstream file(metadataPath, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error::IOFailure("Failed to open metadata file for writing: " + metadataPath.string());
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!file) {
        return Error::IOFailure("Failed to write metadata file: " + metadataPath.string());
    }

    utils::GetLogger().Debug("Metadata sidecar written",
        utils::LogContext().With("path", metadataPath.string()));
    return Error();
}

json MetadataSidecar::Read(const fs::path& objectPath) {
    fs::path metadataPath = PathResolver::MetadataPath(objectPath);

    std::error_code ec;
    if (!fs::exists(metadataPath, ec)) {
        return json::object();
    }

    std::ifstream file(metadataPath, std::ios::binary);
    if (!file) {
        utils::GetLogger().Warn("Metadata sidecar is not readable",
            utils::LogContext().With("path", metadataPath.string()));
        return json{{"error", "Error accessing metadata: cannot open " + metadataPath.filename().string()}};
    }

    json data = json::parse(file, nullptr, false);
    if (data.is_discarded()) {
        utils::GetLogger().Warn("Metadata sidecar contains invalid JSON",
            utils::LogContext()
                .With("path", metadataPath.string())
                .With("code", ErrorCodeToString(ErrorCode::MetadataDecodeFailure)));
        return json{{"error", "Metadata file exists but contains invalid JSON format"}};
    }
    return data;
}

Error MetadataSidecar::Remove(const fs::path& objectPath) {
    fs::path metadataPath = PathResolver::MetadataPath(objectPath);

    std::error_code ec;
    fs::remove(metadataPath, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Error::IOFailure("Failed to remove metadata file " +
                                metadataPath.string() + ": " + ec.message());
    }
    return Error();
}

std::optional<json> MetadataSidecar::ExtractEnvelope(const std::string& raw) {
    if (raw.empty()) {
        return std::nullopt;
    }

    json document = json::parse(raw, nullptr, false);
    if (document.is_discarded()) {
        utils::GetLogger().Warn("Invalid JSON in upload metadata field, ignoring it");
        return std::nullopt;
    }
    if (!document.is_object() || !document.contains("metadata")) {
        return std::nullopt;
    }
    return document["metadata"];
}

} // namespace storage
} // namespace opens3
