#pragma once

#include <optional>
#include <string>

namespace reso_client {

constexpr int kDefaultTimeoutSeconds = 30;

// ---------------------------------------------------------------------------
// ClientConfig: everything ResoClient needs to reach one RESO server.
// ---------------------------------------------------------------------------
struct ClientConfig {
    std::string base_url;                    // trailing '/' removed
    std::string token;                       // OAuth bearer token
    std::optional<std::string> token_env;    // env var to read the token from
    std::optional<std::string> dataset_id;   // inserted between base_url and path
    std::optional<int> timeout_seconds;      // unset: kDefaultTimeoutSeconds
    bool insecure = false;                   // skip TLS certificate checks

    [[nodiscard]] int Timeout() const {
        return timeout_seconds.value_or(kDefaultTimeoutSeconds);
    }

    /// One-line description with the token redacted.
    [[nodiscard]] std::string Describe() const;
};

// ---------------------------------------------------------------------------
// AppConfig: ClientConfig plus the command-line tool's own settings.
// ---------------------------------------------------------------------------
struct AppConfig {
    ClientConfig connection;
    std::optional<std::string> log_file;
    std::optional<std::string> log_level;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
};

} // namespace reso_client
