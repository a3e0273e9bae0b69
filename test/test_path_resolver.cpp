#include <catch2/catch_test_macros.hpp>
#include "opens3/storage/existence.hpp"
#include "opens3/storage/path_resolver.hpp"
#include "test_helpers.hpp"

using namespace opens3::storage;
using opens3::test::TempDir;
using opens3::test::WriteFile;

TEST_CASE("PathResolver - Path mapping", "[resolver]") {
    PathResolver resolver("/data/storage");

    SECTION("Bucket path is a child of the root") {
        REQUIRE(resolver.BucketPath("photos") == std::filesystem::path("/data/storage/photos"));
    }

    SECTION("Slashes in keys become directory separators") {
        REQUIRE(resolver.ObjectPath("photos", "2024/01/cat.png") ==
                std::filesystem::path("/data/storage/photos/2024/01/cat.png"));
    }

    SECTION("Keys are joined verbatim") {
        REQUIRE(resolver.ObjectPath("b", "/abs").string() == "/data/storage/b//abs");
    }

    SECTION("Metadata path appends the suffix") {
        auto objectPath = resolver.ObjectPath("b", "docs/report.pdf");
        REQUIRE(PathResolver::MetadataPath(objectPath).string() ==
                "/data/storage/b/docs/report.pdf.metadata");
    }
}

TEST_CASE("ExistenceOracle - Buckets and objects", "[existence]") {
    TempDir dir;
    PathResolver resolver(dir.path());
    ExistenceOracle oracle(resolver);

    std::filesystem::create_directories(dir.path() / "bucket");
    WriteFile(dir.path() / "bucket" / "docs" / "a.txt", "hello");
    WriteFile(dir.path() / "plainfile", "x");

    SECTION("Bucket is a directory under the root") {
        REQUIRE(oracle.BucketExists("bucket"));
        REQUIRE_FALSE(oracle.BucketExists("missing"));
        REQUIRE_FALSE(oracle.BucketExists("plainfile"));
        REQUIRE_FALSE(oracle.BucketExists(""));
    }

    SECTION("Object is a regular file") {
        REQUIRE(oracle.ObjectExists("bucket", "docs/a.txt"));
        REQUIRE_FALSE(oracle.ObjectExists("bucket", "docs"));
        REQUIRE_FALSE(oracle.ObjectExists("bucket", "docs/b.txt"));
        REQUIRE_FALSE(oracle.ObjectExists("bucket", ""));
    }

    SECTION("Missing parent directory means the object does not exist") {
        REQUIRE_FALSE(oracle.ObjectExists("bucket", "nested/deeper/a.txt"));
        REQUIRE_FALSE(oracle.ObjectExists("missing", "a.txt"));
    }
}
