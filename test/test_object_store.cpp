#include <catch2/catch_test_macros.hpp>
#include "opens3/storage/object_store.hpp"
#include "test_helpers.hpp"

using namespace opens3;
using namespace opens3::storage;
using opens3::test::TempDir;
using opens3::test::WriteFile;

namespace {

StoreConfig configFor(const TempDir& dir) {
    StoreConfig config;
    config.root = (dir.path() / "root").string();
    return config;
}

} // namespace

TEST_CASE("ObjectStore - Bucket lifecycle", "[store][bucket]") {
    TempDir dir;
    ObjectStore store(configFor(dir));

    SECTION("Storage root is created on construction") {
        REQUIRE(std::filesystem::is_directory(dir.path() / "root"));
    }

    SECTION("Create then create again") {
        auto created = store.CreateBucket("photos");
        REQUIRE(created.ok());
        REQUIRE(created.value().name == "photos");
        REQUIRE(store.Oracle().BucketExists("photos"));

        auto again = store.CreateBucket("photos");
        REQUIRE_FALSE(again.ok());
        REQUIRE(again.error().code() == ErrorCode::AlreadyExists);
    }

    SECTION("List and head buckets") {
        REQUIRE(store.CreateBucket("a").ok());
        REQUIRE(store.CreateBucket("b").ok());
        WriteFile(dir.path() / "root" / "stray.txt", "not a bucket");

        auto buckets = store.ListBuckets();
        REQUIRE(buckets.ok());
        REQUIRE(buckets.value().size() == 2);

        REQUIRE_FALSE(store.HeadBucket("a").hasError());
        REQUIRE(store.HeadBucket("zzz").code() == ErrorCode::NotFound);
    }

    SECTION("Delete missing bucket") {
        REQUIRE(store.DeleteBucket("missing", false).code() == ErrorCode::NotFound);
    }

    SECTION("Delete empty bucket") {
        REQUIRE(store.CreateBucket("empty").ok());
        REQUIRE_FALSE(store.DeleteBucket("empty", false).hasError());
        REQUIRE_FALSE(store.Oracle().BucketExists("empty"));
    }

    SECTION("Top-level sidecars and markers do not count as content") {
        REQUIRE(store.CreateBucket("meta").ok());
        WriteFile(dir.path() / "root" / "meta" / "gone.txt.metadata", "{}");
        WriteFile(dir.path() / "root" / "meta" / ".directory", "");
        REQUIRE_FALSE(store.DeleteBucket("meta", false).hasError());
        REQUIRE_FALSE(std::filesystem::exists(dir.path() / "root" / "meta"));
    }

    SECTION("Non-empty bucket requires force") {
        REQUIRE(store.CreateBucket("full").ok());
        REQUIRE(store.PutObject("full", "x/y/z.txt", "data").ok());
        REQUIRE(store.PutObject("full", "top.txt", "data").ok());

        REQUIRE(store.DeleteBucket("full", false).code() == ErrorCode::NotEmpty);
        REQUIRE(store.Oracle().ObjectExists("full", "top.txt"));

        REQUIRE_FALSE(store.DeleteBucket("full", true).hasError());
        REQUIRE_FALSE(std::filesystem::exists(dir.path() / "root" / "full"));
    }

    SECTION("A subdirectory alone counts as content") {
        REQUIRE(store.CreateBucket("dirs").ok());
        REQUIRE(store.CreateDirectory("dirs", "only/").ok());
        REQUIRE(store.DeleteBucket("dirs", false).code() == ErrorCode::NotEmpty);
    }
}

TEST_CASE("ObjectStore - Object lifecycle", "[store][object]") {
    TempDir dir;
    ObjectStore store(configFor(dir));
    REQUIRE(store.CreateBucket("docs").ok());

    SECTION("Put then get returns the bytes") {
        auto put = store.PutObject("docs", "notes.txt", "hello world");
        REQUIRE(put.ok());
        REQUIRE(put.value().size == 11);
        REQUIRE_FALSE(put.value().directoryMarker);

        auto got = store.GetObject("docs", "notes.txt");
        REQUIRE(got.ok());
        REQUIRE(got.value() == "hello world");
    }

    SECTION("Overwrite replaces the content") {
        REQUIRE(store.PutObject("docs", "notes.txt", "first version").ok());
        REQUIRE(store.PutObject("docs", "notes.txt", "v2").ok());
        REQUIRE(store.GetObject("docs", "notes.txt").value() == "v2");
    }

    SECTION("Overwrite without metadata drops the previous sidecar") {
        REQUIRE(store.PutObject("docs", "k.txt", "old", json{{"owner", "alice"}}).ok());
        REQUIRE(store.PutObject("docs", "k.txt", "new-content").ok());

        auto head = store.HeadObject("docs", "k.txt");
        REQUIRE(head.ok());
        REQUIRE(head.value().size == 11);
        REQUIRE(head.value().metadata == json::object());
        REQUIRE(store.GetObjectMetadata("docs", "k.txt").value().empty());
        REQUIRE_FALSE(std::filesystem::exists(dir.path() / "root" / "docs" / "k.txt.metadata"));
    }

    SECTION("Put into a missing bucket") {
        auto put = store.PutObject("missing", "a.txt", "x");
        REQUIRE_FALSE(put.ok());
        REQUIRE(put.error().code() == ErrorCode::NotFound);
    }

    SECTION("Empty key is rejected") {
        auto put = store.PutObject("docs", "", "x");
        REQUIRE_FALSE(put.ok());
        REQUIRE(put.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("Marker key creates a directory, not an object") {
        auto put = store.PutObject("docs", "folder/", "ignored");
        REQUIRE(put.ok());
        REQUIRE(put.value().directoryMarker);
        REQUIRE(put.value().size == 0);
        REQUIRE_FALSE(store.Oracle().ObjectExists("docs", "folder/"));
        REQUIRE(std::filesystem::is_regular_file(dir.path() / "root" / "docs" / "folder" / ".directory"));
        REQUIRE(store.ListObjects("docs", std::nullopt).value().empty());
    }

    SECTION("Metadata is stored beside the object") {
        json metadata = {{"author", "alice"}};
        auto put = store.PutObject("docs", "r.pdf", "PDF", metadata, "application/pdf");
        REQUIRE(put.ok());
        REQUIRE(put.value().metadata == metadata);
        REQUIRE(put.value().contentType == "application/pdf");

        auto read = store.GetObjectMetadata("docs", "r.pdf");
        REQUIRE(read.ok());
        REQUIRE(read.value() == metadata);
    }

    SECTION("Metadata of an object without a sidecar is empty") {
        REQUIRE(store.PutObject("docs", "plain.txt", "x").ok());
        auto read = store.GetObjectMetadata("docs", "plain.txt");
        REQUIRE(read.ok());
        REQUIRE(read.value().empty());
        REQUIRE(store.GetObjectMetadata("docs", "nope.txt").error().code() == ErrorCode::NotFound);
    }

    SECTION("Head reports size, type, metadata and a quoted MD5 etag") {
        REQUIRE(store.PutObject("docs", "hello.txt", "hello", json{{"k", "v"}}).ok());
        auto head = store.HeadObject("docs", "hello.txt");
        REQUIRE(head.ok());
        REQUIRE(head.value().size == 5);
        REQUIRE(head.value().contentType == "text/plain");
        REQUIRE(head.value().metadata["k"] == "v");
        REQUIRE(head.value().etag == "\"5d41402abc4b2a76b9719d911017c592\"");
    }

    SECTION("Head of a missing object") {
        REQUIRE(store.HeadObject("docs", "missing.bin").error().code() == ErrorCode::NotFound);
        REQUIRE(store.HeadObject("nobucket", "a").error().code() == ErrorCode::NotFound);
    }

    SECTION("Streaming honours offset and length") {
        REQUIRE(store.PutObject("docs", "digits.txt", "0123456789").ok());
        std::string collected;
        auto read = store.StreamObject("docs", "digits.txt", 3, 4,
            [&collected](const char* data, size_t size) {
                collected.append(data, size);
                return true;
            });
        REQUIRE(read.ok());
        REQUIRE(read.value() == 4);
        REQUIRE(collected == "3456");
    }

    SECTION("Delete removes the object and its sidecar; second delete fails") {
        REQUIRE(store.PutObject("docs", "a/b.txt", "x", json{{"k", 1}}).ok());
        REQUIRE_FALSE(store.DeleteObject("docs", "a/b.txt").hasError());
        REQUIRE_FALSE(store.Oracle().ObjectExists("docs", "a/b.txt"));
        REQUIRE_FALSE(std::filesystem::exists(dir.path() / "root" / "docs" / "a" / "b.txt.metadata"));
        REQUIRE(store.DeleteObject("docs", "a/b.txt").code() == ErrorCode::NotFound);
    }

    SECTION("Get of a missing object") {
        REQUIRE(store.GetObject("docs", "missing").error().code() == ErrorCode::NotFound);
    }
}

TEST_CASE("ObjectStore - Nested object scenario", "[store][scenario]") {
    TempDir dir;
    ObjectStore store(configFor(dir));

    REQUIRE(store.CreateBucket("docs").ok());
    REQUIRE(store.PutObject("docs", "a/b/report.pdf", "PDF-DATA").ok());

    auto listed = store.ListObjects("docs", std::string("a/"));
    REQUIRE(listed.ok());
    REQUIRE(listed.value().size() == 1);
    REQUIRE(listed.value()[0].key == "a/b/report.pdf");
    REQUIRE(listed.value()[0].size == 8);

    REQUIRE(store.GetObject("docs", "a/b/report.pdf").value() == "PDF-DATA");
    REQUIRE_FALSE(store.DeleteObject("docs", "a/b/report.pdf").hasError());

    auto after = store.ListObjects("docs", std::string("a/"));
    REQUIRE(after.ok());
    REQUIRE(after.value().empty());

    REQUIRE(store.ListObjects("missing", std::nullopt).error().code() == ErrorCode::NotFound);
}

TEST_CASE("ObjectStore - Explicit directories", "[store][directory]") {
    TempDir dir;
    ObjectStore store(configFor(dir));
    REQUIRE(store.CreateBucket("b").ok());

    SECTION("Returns the normalized path") {
        auto created = store.CreateDirectory("b", "x/y");
        REQUIRE(created.ok());
        REQUIRE(created.value().directory == "x/y/");
        REQUIRE(created.value().bucket == "b");
    }

    SECTION("Missing bucket") {
        REQUIRE(store.CreateDirectory("nope", "x").error().code() == ErrorCode::NotFound);
    }

    SECTION("Path locks disabled still works") {
        StoreConfig config = configFor(dir);
        config.lockPaths = false;
        ObjectStore unlocked(config);
        REQUIRE(unlocked.PutObject("b", "k.txt", "v").ok());
        REQUIRE(unlocked.GetObject("b", "k.txt").value() == "v");
    }
}
