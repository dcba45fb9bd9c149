#include <catch2/catch_test_macros.hpp>

#include <reso_client/config/config_loader.hpp>

#include <cstdlib>
#include <string>

using namespace reso_client;

namespace {

void SetEnv(const char* name, const char* value) {
    setenv(name, value, 1);
}

void UnsetEnv(const char* name) {
    unsetenv(name);
}

void ClearResoEnv() {
    UnsetEnv("RESO_BASE_URL");
    UnsetEnv("RESO_TOKEN");
    UnsetEnv("RESO_DATASET_ID");
    UnsetEnv("RESO_TIMEOUT");
    UnsetEnv("RESO_TEST_TOKEN_VAR");
}

// Tests run from the build directory; derive testdata from this file's path.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));     // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));      // .../test
    return test_root + "/testdata/" + filename;
}

ClientConfig ValidClientConfig() {
    ClientConfig config;
    config.base_url = "https://reso.example.com/odata";
    config.token = "t";
    return config;
}

} // anonymous namespace

// ===========================================================================
// Environment
// ===========================================================================

TEST_CASE("LoadFromEnv: reads all variables", "[config][env]") {
    ClearResoEnv();
    SetEnv("RESO_BASE_URL", "https://api.example.com/odata//");
    SetEnv("RESO_TOKEN", "env-token");
    SetEnv("RESO_DATASET_ID", "ds1");
    SetEnv("RESO_TIMEOUT", "60");

    auto result = LoadFromEnv();
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.base_url == "https://api.example.com/odata");
    CHECK(config.token == "env-token");
    CHECK(config.dataset_id == std::optional<std::string>("ds1"));
    CHECK(config.Timeout() == 60);

    ClearResoEnv();
}

TEST_CASE("LoadFromEnv: base URL is required", "[config][env]") {
    ClearResoEnv();
    SetEnv("RESO_TOKEN", "env-token");

    auto result = LoadFromEnv();
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Config);
    CHECK(result.Error().message == "RESO_BASE_URL not set");

    ClearResoEnv();
}

TEST_CASE("LoadFromEnv: token is required", "[config][env]") {
    ClearResoEnv();
    SetEnv("RESO_BASE_URL", "https://api.example.com");

    auto result = LoadFromEnv();
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "RESO_TOKEN not set");

    ClearResoEnv();
}

TEST_CASE("LoadFromEnv: unparsable timeout falls back to default", "[config][env]") {
    ClearResoEnv();
    SetEnv("RESO_BASE_URL", "https://api.example.com");
    SetEnv("RESO_TOKEN", "t");
    SetEnv("RESO_TIMEOUT", "soon");

    auto result = LoadFromEnv();
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().timeout_seconds.has_value());
    CHECK(result.Value().Timeout() == kDefaultTimeoutSeconds);
    CHECK_FALSE(result.Value().dataset_id.has_value());

    ClearResoEnv();
}

TEST_CASE("ReadEnvironment: empty environment gives empty config", "[config][env]") {
    ClearResoEnv();
    auto config = ReadEnvironment();
    CHECK(config.base_url.empty());
    CHECK(config.token.empty());
    CHECK_FALSE(config.dataset_id.has_value());
}

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: valid full config", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("valid_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.connection.base_url ==
          "https://api.bridgedataoutput.com/api/v2/OData");
    CHECK(config.connection.token.empty());
    CHECK(config.connection.token_env == std::optional<std::string>("RESO_TEST_TOKEN_VAR"));
    CHECK(config.connection.dataset_id == std::optional<std::string>("actris_ref"));
    CHECK(config.connection.Timeout() == 45);
    CHECK(config.connection.insecure);
    CHECK(config.log_file == std::optional<std::string>("/tmp/reso-client.log"));
    CHECK(config.log_level == std::optional<std::string>("debug"));
    CHECK(config.json_output);
    CHECK(config.verbose);
    CHECK_FALSE(config.quiet);
}

TEST_CASE("LoadFromYaml: minimal config leaves defaults", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("minimal_config.yaml"));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();

    CHECK(config.connection.base_url == "https://reso.example.com/odata");
    CHECK(config.connection.token == "yaml-token");
    CHECK_FALSE(config.connection.timeout_seconds.has_value());
    CHECK_FALSE(config.connection.insecure);
    CHECK_FALSE(config.log_file.has_value());
    CHECK_FALSE(config.json_output);
}

TEST_CASE("LoadFromYaml: missing file is a Config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Config);
    CHECK(result.Error().message.find("does_not_exist.yaml") != std::string::npos);
}

TEST_CASE("LoadFromYaml: malformed YAML is a Config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("invalid_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Config);
    CHECK(result.Error().message.rfind("Failed to parse YAML file", 0) == 0);
}

TEST_CASE("LoadFromYaml: wrong value type is a Config error", "[config][yaml]") {
    auto result = LoadFromYaml(TestDataPath("bad_types_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Config);
}

// ===========================================================================
// MergeConfigs
// ===========================================================================

TEST_CASE("MergeConfigs: override fields win", "[config][merge]") {
    AppConfig base;
    base.connection.base_url = "https://base.example.com";
    base.connection.token = "base-token";
    base.connection.dataset_id = "base-ds";
    base.connection.timeout_seconds = 10;
    base.log_level = "info";

    AppConfig overrides;
    overrides.connection.base_url = "https://cli.example.com";
    overrides.connection.timeout_seconds = 90;
    overrides.json_output = true;

    auto merged = MergeConfigs(base, overrides);
    CHECK(merged.connection.base_url == "https://cli.example.com");
    CHECK(merged.connection.token == "base-token");
    CHECK(merged.connection.dataset_id == std::optional<std::string>("base-ds"));
    CHECK(merged.connection.Timeout() == 90);
    CHECK(merged.log_level == std::optional<std::string>("info"));
    CHECK(merged.json_output);
}

TEST_CASE("MergeConfigs: token_env replaces a lower-layer token", "[config][merge]") {
    AppConfig base;
    base.connection.token = "env-token";

    AppConfig overrides;
    overrides.connection.token_env = "MY_TOKEN";

    auto merged = MergeConfigs(base, overrides);
    CHECK(merged.connection.token.empty());
    CHECK(merged.connection.token_env == std::optional<std::string>("MY_TOKEN"));
}

// ===========================================================================
// ResolveTokenEnv
// ===========================================================================

TEST_CASE("ResolveTokenEnv: reads the named variable", "[config][token]") {
    ClearResoEnv();
    SetEnv("RESO_TEST_TOKEN_VAR", "from-env");

    ClientConfig config;
    config.token_env = "RESO_TEST_TOKEN_VAR";
    auto result = ResolveTokenEnv(config);
    REQUIRE(result.IsOk());
    CHECK(result.Value().token == "from-env");

    ClearResoEnv();
}

TEST_CASE("ResolveTokenEnv: explicit token is kept", "[config][token]") {
    ClearResoEnv();
    ClientConfig config;
    config.token = "literal";
    config.token_env = "RESO_TEST_TOKEN_VAR";
    auto result = ResolveTokenEnv(config);
    REQUIRE(result.IsOk());
    CHECK(result.Value().token == "literal");
}

TEST_CASE("ResolveTokenEnv: unset variable is a Config error", "[config][token]") {
    ClearResoEnv();
    ClientConfig config;
    config.token_env = "RESO_TEST_TOKEN_VAR";
    auto result = ResolveTokenEnv(config);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message ==
          "Environment variable 'RESO_TEST_TOKEN_VAR' not set (specified by token_env)");
}

// ===========================================================================
// ValidateConfig
// ===========================================================================

TEST_CASE("ValidateConfig: valid config passes", "[config][validate]") {
    CHECK(ValidateConfig(ValidClientConfig()).IsOk());
}

TEST_CASE("ValidateConfig: rejects bad fields", "[config][validate]") {
    SECTION("missing base_url") {
        auto config = ValidClientConfig();
        config.base_url.clear();
        auto result = ValidateConfig(config);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("base_url") != std::string::npos);
    }
    SECTION("base_url without scheme") {
        auto config = ValidClientConfig();
        config.base_url = "reso.example.com";
        auto result = ValidateConfig(config);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("http://") != std::string::npos);
    }
    SECTION("missing token") {
        auto config = ValidClientConfig();
        config.token.clear();
        auto result = ValidateConfig(config);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message.find("token") != std::string::npos);
    }
    SECTION("zero timeout") {
        auto config = ValidClientConfig();
        config.timeout_seconds = 0;
        auto result = ValidateConfig(config);
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "Invalid timeout: 0 (must be positive)");
    }
}

TEST_CASE("ClientConfig: Describe redacts the token", "[config]") {
    auto config = ValidClientConfig();
    config.token = "super-secret";
    config.dataset_id = "ds";
    auto text = config.Describe();
    CHECK(text.find("super-secret") == std::string::npos);
    CHECK(text.find("<redacted>") != std::string::npos);
    CHECK(text.find("dataset_id=ds") != std::string::npos);
    CHECK(text.find("timeout=30s") != std::string::npos);
}

// ===========================================================================
// LoadLayeredConfig
// ===========================================================================

TEST_CASE("LoadLayeredConfig: env < YAML < CLI", "[config][layered]") {
    ClearResoEnv();
    SetEnv("RESO_BASE_URL", "https://env.example.com");
    SetEnv("RESO_TOKEN", "env-token");
    SetEnv("RESO_DATASET_ID", "env-ds");

    AppConfig cli;
    cli.connection.dataset_id = "cli-ds";

    auto result = LoadLayeredConfig(TestDataPath("minimal_config.yaml"), cli);
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    CHECK(config.connection.base_url == "https://reso.example.com/odata");
    CHECK(config.connection.token == "yaml-token");
    CHECK(config.connection.dataset_id == std::optional<std::string>("cli-ds"));

    ClearResoEnv();
}

TEST_CASE("LoadLayeredConfig: token_env from YAML is resolved", "[config][layered]") {
    ClearResoEnv();
    SetEnv("RESO_TOKEN", "env-token");
    SetEnv("RESO_TEST_TOKEN_VAR", "indirect-token");

    auto result = LoadLayeredConfig(TestDataPath("valid_config.yaml"), AppConfig{});
    REQUIRE(result.IsOk());
    CHECK(result.Value().connection.token == "indirect-token");

    ClearResoEnv();
}

TEST_CASE("LoadLayeredConfig: YAML errors propagate", "[config][layered]") {
    ClearResoEnv();
    auto result = LoadLayeredConfig(TestDataPath("invalid_config.yaml"), AppConfig{});
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Config);
}

TEST_CASE("LoadLayeredConfig: env alone without YAML", "[config][layered]") {
    ClearResoEnv();
    SetEnv("RESO_BASE_URL", "https://env.example.com/");
    SetEnv("RESO_TOKEN", "env-token");

    auto result = LoadLayeredConfig(std::nullopt, AppConfig{});
    REQUIRE(result.IsOk());
    CHECK(result.Value().connection.base_url == "https://env.example.com");
    CHECK(result.Value().connection.token == "env-token");

    ClearResoEnv();
}

// ===========================================================================
// ResolveLogLevel
// ===========================================================================

namespace {

LogLevel ResolveOk(const AppConfig& merged, const AppConfig& cli, int verbosity) {
    auto level = ResolveLogLevel(merged, cli, verbosity);
    REQUIRE(level.IsOk());
    return level.Value();
}

} // anonymous namespace

TEST_CASE("ResolveLogLevel: defaults to warn", "[config][log_level]") {
    CHECK(ResolveOk(AppConfig{}, AppConfig{}, 0) == LogLevel::Warn);
}

TEST_CASE("ResolveLogLevel: -v and -vv beat a YAML log_level", "[config][log_level]") {
    AppConfig merged;
    merged.log_level = "error";

    CHECK(ResolveOk(merged, AppConfig{}, 2) == LogLevel::Debug);
    CHECK(ResolveOk(merged, AppConfig{}, 1) == LogLevel::Info);
}

TEST_CASE("ResolveLogLevel: -q beats a YAML log_level", "[config][log_level]") {
    AppConfig merged;
    merged.log_level = "debug";
    AppConfig cli;
    cli.quiet = true;

    CHECK(ResolveOk(merged, cli, 0) == LogLevel::Error);
}

TEST_CASE("ResolveLogLevel: --log-level beats the verbosity flags", "[config][log_level]") {
    AppConfig cli;
    cli.log_level = "warn";
    cli.quiet = true;
    AppConfig merged = cli;

    CHECK(ResolveOk(merged, cli, 2) == LogLevel::Warn);
}

TEST_CASE("ResolveLogLevel: YAML log_level beats YAML verbose and quiet", "[config][log_level]") {
    AppConfig merged;
    merged.log_level = "error";
    merged.verbose = true;

    CHECK(ResolveOk(merged, AppConfig{}, 0) == LogLevel::Error);
}

TEST_CASE("ResolveLogLevel: YAML verbose and quiet without a log_level", "[config][log_level]") {
    AppConfig verbose;
    verbose.verbose = true;
    CHECK(ResolveOk(verbose, AppConfig{}, 0) == LogLevel::Info);

    AppConfig quiet;
    quiet.quiet = true;
    CHECK(ResolveOk(quiet, AppConfig{}, 0) == LogLevel::Error);
}

TEST_CASE("ResolveLogLevel: an unknown level is a Config error", "[config][log_level]") {
    AppConfig merged;
    merged.log_level = "chatty";

    auto level = ResolveLogLevel(merged, AppConfig{}, 0);
    REQUIRE(level.IsErr());
    CHECK(level.Error().kind == ErrorKind::Config);

    // A bad YAML value is not consulted once a flag decides.
    CHECK(ResolveOk(merged, AppConfig{}, 1) == LogLevel::Info);
}

TEST_CASE("ResolveLogLevel: -q over a layered YAML log_level", "[config][log_level]") {
    ClearResoEnv();
    SetEnv("RESO_TEST_TOKEN_VAR", "indirect-token");
    AppConfig cli;
    cli.quiet = true;

    auto layered = LoadLayeredConfig(TestDataPath("valid_config.yaml"), cli);
    REQUIRE(layered.IsOk());
    REQUIRE(layered.Value().log_level == std::optional<std::string>("debug"));
    CHECK(ResolveOk(layered.Value(), cli, 0) == LogLevel::Error);

    ClearResoEnv();
}
