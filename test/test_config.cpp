#include <catch2/catch_test_macros.hpp>
#include "opens3/config.hpp"
#include "test_helpers.hpp"

using namespace opens3;
using opens3::test::TempDir;
using opens3::test::WriteFile;

namespace {

EnvLookup fromMap(std::map<std::string, std::string> values) {
    return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
        auto it = values.find(name);
        if (it == values.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

} // namespace

TEST_CASE("Config - Defaults", "[config]") {
    Config config;
    REQUIRE(config.credentials.accessKey == "admin");
    REQUIRE(config.credentials.secretKey == "password");
    REQUIRE(config.storage.root == "./storage");
    REQUIRE(config.storage.lockPaths);
    REQUIRE(config.addr == "0.0.0.0:8001");
    REQUIRE(config.logging.level == "info");
    REQUIRE_FALSE(ValidateConfig(config).hasError());
}

TEST_CASE("Config - Environment", "[config]") {
    Config config;

    SECTION("Preferred variable names win over legacy ones") {
        ApplyEnvironment(config, fromMap({
            {"OPENS3_ACCESS_KEY", "alice"}, {"S3_USERNAME", "legacy"},
            {"OPENS3_SECRET_KEY", "s3cret"},
            {"BASE_DIR", "/srv/objects"}, {"OPENS3_ADDR", "127.0.0.1:9000"}}));
        REQUIRE(config.credentials.accessKey == "alice");
        REQUIRE(config.credentials.secretKey == "s3cret");
        REQUIRE(config.storage.root == "/srv/objects");
        REQUIRE(config.addr == "127.0.0.1:9000");
    }

    SECTION("Legacy variable names are accepted") {
        ApplyEnvironment(config, fromMap({{"S3_USERNAME", "bob"}, {"S3_PASSWORD", "pw"}}));
        REQUIRE(config.credentials.accessKey == "bob");
        REQUIRE(config.credentials.secretKey == "pw");
    }

    SECTION("Unset variables keep defaults") {
        ApplyEnvironment(config, fromMap({}));
        REQUIRE(config.credentials.accessKey == "admin");
        REQUIRE(config.storage.root == "./storage");
    }
}

TEST_CASE("Config - Env file", "[config]") {
    TempDir dir;
    auto path = dir.path() / ".env";
    WriteFile(path,
        "# comment\n"
        "OPENS3_TEST_ACCESS=fromfile\n"
        "export OPENS3_TEST_QUOTED=\"with spaces\"\n"
        "OPENS3_TEST_SINGLE='single'\n"
        "not a pair\n"
        "\n");

    auto values = LoadEnvFile(path.string());
    REQUIRE(values.ok());
    REQUIRE(values.value().at("OPENS3_TEST_ACCESS") == "fromfile");
    REQUIRE(values.value().at("OPENS3_TEST_QUOTED") == "with spaces");
    REQUIRE(values.value().at("OPENS3_TEST_SINGLE") == "single");
    REQUIRE(values.value().size() == 3);

    auto env = ProcessEnvironment(values.value());
    REQUIRE(env("OPENS3_TEST_ACCESS").value() == "fromfile");
    REQUIRE_FALSE(env("OPENS3_TEST_UNSET_VARIABLE").has_value());

    auto missing = LoadEnvFile((dir.path() / "nope.env").string());
    REQUIRE_FALSE(missing.ok());
    REQUIRE(missing.error().code() == ErrorCode::NotFound);
}

TEST_CASE("Config - JSON config file", "[config]") {
    TempDir dir;
    auto path = dir.path() / "opens3.json";
    Config config;

    SECTION("All sections are applied") {
        WriteFile(path, R"({
            "storage": {"root": "/var/lib/opens3", "lockPaths": false},
            "auth": {"accessKey": "ak", "secretKey": "sk"},
            "server": {"addr": ":9100"},
            "logging": {"level": "debug", "format": "text"}
        })");
        REQUIRE_FALSE(ApplyConfigFile(config, path.string()).hasError());
        REQUIRE(config.storage.root == "/var/lib/opens3");
        REQUIRE_FALSE(config.storage.lockPaths);
        REQUIRE(config.credentials.accessKey == "ak");
        REQUIRE(config.credentials.secretKey == "sk");
        REQUIRE(config.addr == ":9100");
        REQUIRE(config.logging.level == "debug");
        REQUIRE(config.logging.format == "text");
        REQUIRE(config.logging.output == "console");
    }

    SECTION("Wrong field type is rejected") {
        WriteFile(path, R"({"storage": {"root": 42}})");
        REQUIRE(ApplyConfigFile(config, path.string()).code() == ErrorCode::InvalidArgument);
    }

    SECTION("Unparsable file is rejected") {
        WriteFile(path, "{oops");
        REQUIRE(ApplyConfigFile(config, path.string()).code() == ErrorCode::InvalidArgument);
    }

    SECTION("Missing file") {
        REQUIRE(ApplyConfigFile(config, (dir.path() / "none.json").string()).code() == ErrorCode::NotFound);
    }
}

TEST_CASE("Config - Validation and addresses", "[config]") {
    SECTION("Address forms") {
        auto full = ParseAddress("127.0.0.1:8080");
        REQUIRE(full.ok());
        REQUIRE(full.value().first == "127.0.0.1");
        REQUIRE(full.value().second == 8080);

        auto portOnly = ParseAddress("9000");
        REQUIRE(portOnly.ok());
        REQUIRE(portOnly.value().first == "0.0.0.0");

        REQUIRE(ParseAddress(":7000").value().first == "0.0.0.0");
        REQUIRE_FALSE(ParseAddress("host:").ok());
        REQUIRE_FALSE(ParseAddress("host:abc").ok());
        REQUIRE_FALSE(ParseAddress("host:70000").ok());
    }

    SECTION("Invalid configurations") {
        Config config;
        config.storage.root = "";
        REQUIRE(ValidateConfig(config).code() == ErrorCode::InvalidArgument);

        config = Config();
        config.logging.format = "xml";
        REQUIRE(ValidateConfig(config).hasError());

        config = Config();
        config.addr = "nowhere";
        REQUIRE(ValidateConfig(config).hasError());
    }
}
