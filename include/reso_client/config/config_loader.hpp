#pragma once

#include <reso_client/config/client_config.hpp>
#include <reso_client/core/log.hpp>
#include <reso_client/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace reso_client {

// Read RESO_BASE_URL, RESO_TOKEN, RESO_DATASET_ID and RESO_TIMEOUT.
// Unset variables leave their fields empty; an unparsable RESO_TIMEOUT
// is ignored.
ClientConfig ReadEnvironment();

// Like ReadEnvironment(), but RESO_BASE_URL and RESO_TOKEN are required.
[[nodiscard]] Result<ClientConfig, Error> LoadFromEnv();

// Parse a YAML config file into an AppConfig.
[[nodiscard]] Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Merge two configs: fields set in overrides replace those in base.
AppConfig MergeConfigs(const AppConfig& base, const AppConfig& overrides);

// If token is empty and token_env is set, read the token from that
// environment variable.
[[nodiscard]] Result<ClientConfig, Error> ResolveTokenEnv(ClientConfig config);

// Check required fields and value ranges.
[[nodiscard]] Result<void, Error> ValidateConfig(const ClientConfig& config);

// Layer the sources, lowest precedence first: environment, the YAML file
// (when given), then command-line overrides. token_env is resolved last.
[[nodiscard]] Result<AppConfig, Error> LoadLayeredConfig(
    const std::optional<std::string>& yaml_path, const AppConfig& cli_overrides);

// Pick the log level, highest precedence first: --log-level, then -vv/-v/-q
// from the command line, then log_level from YAML, then verbose/quiet from
// YAML. The default is Warn. merged is the layered config; cli_overrides
// and verbosity come straight from the command line.
[[nodiscard]] Result<LogLevel, Error> ResolveLogLevel(const AppConfig& merged,
                                                      const AppConfig& cli_overrides,
                                                      int verbosity);

} // namespace reso_client
