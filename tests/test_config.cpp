#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace tracesdk;

TEST_CASE("Config: full SDK config", "[config]") {
    const std::string toml = R"(
[client]
dsn = "https://abc@localhost:9000/42"
environment = "production"
release = "my-app@1.0.0"
traces_sample_rate = 0.25
max_spans = 50
debug = true

[logging]
level = "warn"

[transport]
file = "/tmp/out.log"
flush_each_request = false
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.client.dsn == "https://abc@localhost:9000/42");
    CHECK(result.config.client.environment == "production");
    CHECK(result.config.client.release == "my-app@1.0.0");
    CHECK(result.config.client.traces_sample_rate == 0.25);
    CHECK(result.config.client.max_spans == 50);
    CHECK(result.config.client.debug);
    CHECK(result.config.logging.level == "warn");
    CHECK(result.config.transport.file == "/tmp/out.log");
    CHECK_FALSE(result.config.transport.flush_each_request);
}

TEST_CASE("Config: defaults for an empty document", "[config]") {
    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.client.dsn.empty());
    CHECK(result.config.client.traces_sample_rate.is_null());
    CHECK(result.config.client.max_spans == kDefaultMaxSpans);
    CHECK_FALSE(result.config.client.debug);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.transport.file == "envelopes.log");
}

TEST_CASE("Config: sample rate keeps its TOML type", "[config]") {
    auto as_bool = ConfigLoader::load_from_string("[client]\ntraces_sample_rate = true\n");
    REQUIRE(as_bool.success);
    CHECK(as_bool.config.client.traces_sample_rate.is_boolean());

    auto as_int = ConfigLoader::load_from_string("[client]\ntraces_sample_rate = 1\n");
    REQUIRE(as_int.success);
    CHECK(as_int.config.client.traces_sample_rate == 1);

    // Out of range is rejected at sampling time, not at load time
    auto out_of_range = ConfigLoader::load_from_string("[client]\ntraces_sample_rate = 1.5\n");
    REQUIRE(out_of_range.success);
    CHECK(out_of_range.config.client.traces_sample_rate == 1.5);

    auto as_array = ConfigLoader::load_from_string("[client]\ntraces_sample_rate = [1]\n");
    CHECK_FALSE(as_array.success);
    CHECK(as_array.error_message.find("traces_sample_rate") != std::string::npos);
}

TEST_CASE("Config: expand env var in dsn", "[config][env]") {
    ::setenv("TRACE_SDK_TEST_KEY", "s3cret", 1);

    const std::string toml = R"(
[client]
dsn = "https://${TRACE_SDK_TEST_KEY}@localhost/7"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.client.dsn == "https://s3cret@localhost/7");

    ::unsetenv("TRACE_SDK_TEST_KEY");
}

TEST_CASE("Config: missing env var expands to empty", "[config][env]") {
    ::unsetenv("TRACE_SDK_NONEXISTENT_VAR_12345");

    auto result = ConfigLoader::load_from_string(
        "[client]\nrelease = \"app@${TRACE_SDK_NONEXISTENT_VAR_12345}\"\n");
    REQUIRE(result.success);
    CHECK(result.config.client.release == "app@");
}

TEST_CASE("Config: unclosed ${ is parse error", "[config][env]") {
    auto result = ConfigLoader::load_from_string("[client]\nrelease = \"app@${UNCLOSED\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("Config: invalid TOML is a parse error", "[config]") {
    auto result = ConfigLoader::load_from_string("[client\ndsn = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Failed to parse config") != std::string::npos);
}

TEST_CASE("ConfigValidation: invalid dsn fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[client]\ndsn = \"not a dsn\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("client.dsn") != std::string::npos);
}

TEST_CASE("ConfigValidation: max_spans must be positive", "[config][validation]") {
    auto zero = ConfigLoader::load_from_string("[client]\nmax_spans = 0\n");
    CHECK_FALSE(zero.success);
    CHECK(zero.error_message.find("max_spans") != std::string::npos);

    auto negative = ConfigLoader::load_from_string("[client]\nmax_spans = -5\n");
    CHECK_FALSE(negative.success);
}

TEST_CASE("ConfigValidation: unknown log level fails", "[config][validation]") {
    auto result = ConfigLoader::load_from_string("[logging]\nlevel = \"chatty\"\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("ConfigValidation: all errors are reported together", "[config][validation]") {
    const std::string toml = R"(
[client]
dsn = "nope"
max_spans = 0

[logging]
level = "loud"
)";
    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE_FALSE(result.success);
    CHECK(result.error_message.find("Config validation failed:") == 0);
    CHECK(result.error_message.find("client.dsn") != std::string::npos);
    CHECK(result.error_message.find("client.max_spans") != std::string::npos);
    CHECK(result.error_message.find("logging.level") != std::string::npos);
}

TEST_CASE("Config: load from file", "[config]") {
    const std::string path = "test_trace_sdk_config.toml";
    {
        std::ofstream out(path);
        out << "[client]\nrelease = \"from-file\"\n";
    }

    auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.client.release == "from-file");
    std::remove(path.c_str());

    auto missing = ConfigLoader::load_from_file("does-not-exist.toml");
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.find("Failed to load config") != std::string::npos);
}
