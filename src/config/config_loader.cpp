#include <reso_client/config/config_loader.hpp>

#include <reso_client/core/url.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>

namespace reso_client {

namespace {

constexpr const char* kEnvBaseUrl = "RESO_BASE_URL";
constexpr const char* kEnvToken = "RESO_TOKEN";
constexpr const char* kEnvDatasetId = "RESO_DATASET_ID";
constexpr const char* kEnvTimeout = "RESO_TIMEOUT";

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

std::optional<int> ParseSeconds(const std::string& text) {
    try {
        size_t consumed = 0;
        const long value = std::stol(text, &consumed);
        if (consumed != text.size() || value < 0 || value > 86400) {
            return std::nullopt;
        }
        return static_cast<int>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ClientConfig::Describe
// ---------------------------------------------------------------------------
std::string ClientConfig::Describe() const {
    std::ostringstream oss;
    oss << "ClientConfig{base_url=" << base_url
        << ", token=" << (token.empty() ? "<unset>" : "<redacted>");
    if (token_env.has_value()) {
        oss << ", token_env=" << *token_env;
    }
    oss << ", dataset_id=" << dataset_id.value_or("<none>")
        << ", timeout=" << Timeout() << "s";
    if (insecure) {
        oss << ", insecure";
    }
    oss << '}';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Environment
// ---------------------------------------------------------------------------
ClientConfig ReadEnvironment() {
    ClientConfig config;
    if (auto val = GetEnv(kEnvBaseUrl)) {
        config.base_url = TrimTrailingSlashes(*val);
    }
    if (auto val = GetEnv(kEnvToken)) {
        config.token = *val;
    }
    if (auto val = GetEnv(kEnvDatasetId)) {
        config.dataset_id = *val;
    }
    if (auto val = GetEnv(kEnvTimeout)) {
        config.timeout_seconds = ParseSeconds(*val);
    }
    return config;
}

Result<ClientConfig, Error> LoadFromEnv() {
    if (!GetEnv(kEnvBaseUrl).has_value()) {
        return Result<ClientConfig, Error>::Err(
            Error::Config(std::string(kEnvBaseUrl) + " not set"));
    }
    if (!GetEnv(kEnvToken).has_value()) {
        return Result<ClientConfig, Error>::Err(
            Error::Config(std::string(kEnvToken) + " not set"));
    }
    return Result<ClientConfig, Error>::Ok(ReadEnvironment());
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        const YAML::Node root = YAML::LoadFile(std::string(file_path));

        if (const auto conn = root["connection"]) {
            if (conn["base_url"]) {
                config.connection.base_url =
                    TrimTrailingSlashes(conn["base_url"].as<std::string>());
            }
            if (conn["token"]) {
                config.connection.token = conn["token"].as<std::string>();
            }
            if (conn["token_env"]) {
                config.connection.token_env = conn["token_env"].as<std::string>();
            }
            if (conn["dataset_id"]) {
                config.connection.dataset_id = conn["dataset_id"].as<std::string>();
            }
            if (conn["timeout"]) {
                config.connection.timeout_seconds = conn["timeout"].as<int>();
            }
            if (conn["insecure"]) {
                config.connection.insecure = conn["insecure"].as<bool>();
            }
        }

        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["log_level"]) {
            config.log_level = root["log_level"].as<std::string>();
        }
        if (root["json_output"]) {
            config.json_output = root["json_output"].as<bool>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }
        if (root["quiet"]) {
            config.quiet = root["quiet"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(Error::Config(
            "Failed to parse YAML file '" + std::string(file_path) + "': " + e.what()));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides) {
    AppConfig merged = base;

    const auto& over = overrides.connection;
    if (!over.base_url.empty()) {
        merged.connection.base_url = over.base_url;
    }
    if (!over.token.empty()) {
        merged.connection.token = over.token;
    }
    if (over.token_env.has_value()) {
        merged.connection.token_env = over.token_env;
        // A token_env in a higher layer beats a literal token from a lower one.
        if (over.token.empty()) {
            merged.connection.token.clear();
        }
    }
    if (over.dataset_id.has_value()) {
        merged.connection.dataset_id = over.dataset_id;
    }
    if (over.timeout_seconds.has_value()) {
        merged.connection.timeout_seconds = over.timeout_seconds;
    }
    if (over.insecure) {
        merged.connection.insecure = true;
    }

    if (overrides.log_file.has_value()) {
        merged.log_file = overrides.log_file;
    }
    if (overrides.log_level.has_value()) {
        merged.log_level = overrides.log_level;
    }
    if (overrides.json_output) {
        merged.json_output = true;
    }
    if (overrides.verbose) {
        merged.verbose = true;
    }
    if (overrides.quiet) {
        merged.quiet = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ResolveTokenEnv
// ---------------------------------------------------------------------------
Result<ClientConfig, Error> ResolveTokenEnv(ClientConfig config) {
    if (config.token.empty() && config.token_env.has_value()) {
        const auto& env_var = *config.token_env;
        auto value = GetEnv(env_var.c_str());
        if (!value.has_value()) {
            return Result<ClientConfig, Error>::Err(Error::Config(
                "Environment variable '" + env_var +
                "' not set (specified by token_env)"));
        }
        config.token = std::move(*value);
    }
    return Result<ClientConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const ClientConfig& config) {
    if (config.base_url.empty()) {
        return Result<void, Error>::Err(
            Error::Config("Missing required field: base_url (set RESO_BASE_URL or --base-url)"));
    }
    if (config.base_url.rfind("http://", 0) != 0 &&
        config.base_url.rfind("https://", 0) != 0) {
        return Result<void, Error>::Err(Error::Config(
            "base_url must start with http:// or https://: " + config.base_url));
    }
    if (config.token.empty()) {
        return Result<void, Error>::Err(
            Error::Config("Missing required field: token (set RESO_TOKEN or --token)"));
    }
    if (config.Timeout() <= 0) {
        return Result<void, Error>::Err(Error::Config(
            "Invalid timeout: " + std::to_string(config.Timeout()) +
            " (must be positive)"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveLogLevel
// ---------------------------------------------------------------------------
Result<LogLevel, Error> ResolveLogLevel(const AppConfig& merged,
                                        const AppConfig& cli_overrides,
                                        int verbosity) {
    if (cli_overrides.log_level.has_value()) {
        return ParseLogLevel(*cli_overrides.log_level);
    }
    if (verbosity >= 2) return Result<LogLevel, Error>::Ok(LogLevel::Debug);
    if (verbosity == 1) return Result<LogLevel, Error>::Ok(LogLevel::Info);
    if (cli_overrides.quiet) return Result<LogLevel, Error>::Ok(LogLevel::Error);

    if (merged.log_level.has_value()) {
        return ParseLogLevel(*merged.log_level);
    }
    if (merged.verbose) return Result<LogLevel, Error>::Ok(LogLevel::Info);
    if (merged.quiet) return Result<LogLevel, Error>::Ok(LogLevel::Error);
    return Result<LogLevel, Error>::Ok(LogLevel::Warn);
}

// ---------------------------------------------------------------------------
// LoadLayeredConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadLayeredConfig(const std::optional<std::string>& yaml_path,
                                           const AppConfig& cli_overrides) {
    AppConfig config;
    config.connection = ReadEnvironment();

    if (yaml_path.has_value()) {
        auto yaml = LoadFromYaml(*yaml_path);
        if (yaml.IsErr()) {
            return Result<AppConfig, Error>::Err(yaml.Error());
        }
        config = MergeConfigs(config, yaml.Value());
    }
    config = MergeConfigs(config, cli_overrides);

    auto resolved = ResolveTokenEnv(config.connection);
    if (resolved.IsErr()) {
        return Result<AppConfig, Error>::Err(resolved.Error());
    }
    config.connection = std::move(resolved).Value();
    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // namespace reso_client
