#include <catch2/catch_test_macros.hpp>
#include "opens3/utils/tools.hpp"
#include "test_helpers.hpp"

using namespace opens3::utils;
using opens3::test::TempDir;
using opens3::test::WriteFile;

TEST_CASE("Tools - String helpers", "[tools]") {
    REQUIRE(StartsWith("a/b/c", "a/"));
    REQUIRE_FALSE(StartsWith("a", "a/"));
    REQUIRE(EndsWith("x.metadata", ".metadata"));
    REQUIRE(SplitString("a//b", '/') == std::vector<std::string>{"a", "", "b"});
    REQUIRE(TrimSpace("  key = value \t") == "key = value");
    REQUIRE(TrimSpace("   ").empty());
    REQUIRE(HexEncode({0x00, 0xab, 0x10}) == "00ab10");
}

TEST_CASE("Tools - Base64 decoding", "[tools]") {
    SECTION("Valid input") {
        auto decoded = Base64Decode("YWRtaW46cGFzc3dvcmQ=");
        REQUIRE(decoded.ok());
        REQUIRE(decoded.value() == "admin:password");
    }

    SECTION("Garbage input fails") {
        REQUIRE_FALSE(Base64Decode("!!!!").ok());
    }
}

TEST_CASE("Tools - File MD5", "[tools]") {
    TempDir dir;
    WriteFile(dir.path() / "empty", "");
    WriteFile(dir.path() / "hello", "hello");

    REQUIRE(CalculateFileMD5((dir.path() / "empty").string()).value() == "d41d8cd98f00b204e9800998ecf8427e");
    REQUIRE(CalculateFileMD5((dir.path() / "hello").string()).value() == "5d41402abc4b2a76b9719d911017c592");
    REQUIRE_FALSE(CalculateFileMD5((dir.path() / "missing").string()).ok());
}

TEST_CASE("Tools - Constant time comparison", "[tools]") {
    REQUIRE(ConstantTimeEquals("secret", "secret"));
    REQUIRE_FALSE(ConstantTimeEquals("secret", "secreT"));
    REQUIRE_FALSE(ConstantTimeEquals("secret", "secret2"));
    REQUIRE(ConstantTimeEquals("", ""));
}

TEST_CASE("Tools - Content types", "[tools]") {
    REQUIRE(GuessContentType("a/b/report.pdf") == "application/pdf");
    REQUIRE(GuessContentType("notes.TXT") == "text/plain");
    REQUIRE(GuessContentType("data.json") == "application/json");
    REQUIRE(GuessContentType("archive.unknownext") == "application/octet-stream");
    REQUIRE(GuessContentType("dir.v2/noext") == "application/octet-stream");
    REQUIRE(GuessContentType(".hidden") == "application/octet-stream");
}

TEST_CASE("Tools - HTTP dates", "[tools]") {
    auto epoch = std::chrono::system_clock::from_time_t(0);
    REQUIRE(FormatHttpDate(epoch) == "Thu, 01 Jan 1970 00:00:00 GMT");
}
