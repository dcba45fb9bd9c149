#pragma once

#include <reso_client/config/client_config.hpp>
#include <reso_client/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reso_client {

enum class CommandKind {
    None,       // --help / --version / no command
    Query,
    Get,
    Count,
    Metadata,
    Replicate,
};

// ---------------------------------------------------------------------------
// CommandArgs: the positional arguments and options of one subcommand.
// Which fields are meaningful depends on CommandKind.
// ---------------------------------------------------------------------------
struct CommandArgs {
    std::string resource;
    std::string key;                            // get
    std::optional<std::string> filter;          // query, count, replicate
    std::optional<std::string> apply;           // query
    std::optional<std::string> order_by;        // query: field name
    bool descending = false;                    // query: --desc
    std::vector<std::string> select;            // query, get, replicate
    std::vector<std::string> expand;            // query, get
    std::optional<uint32_t> top;                // query, replicate
    std::optional<uint32_t> skip;               // query
    bool with_count = false;                    // query: --count
    bool raw = false;                           // metadata: print the EDMX
    std::optional<std::string> generate;        // metadata: entity to emit as a struct
    uint32_t max_pages = 0;                     // replicate: 0 = follow all
};

// ---------------------------------------------------------------------------
// CliInvocation: a parsed command line.
// ---------------------------------------------------------------------------
struct CliInvocation {
    CommandKind command = CommandKind::None;
    CommandArgs args;
    AppConfig overrides;                        // flags that override env/YAML
    std::optional<std::string> config_path;     // -c/--config
    int verbosity = 0;                          // -v = 1, -vv = 2
    int color_choice = -1;                      // 1 --color, 0 --no-color, -1 auto
    bool show_version = false;
    std::optional<std::string> help_text;       // set when --help was requested
};

/// Parse argv. Global flags are accepted before or after the subcommand.
/// Usage errors are Config errors.
[[nodiscard]] Result<CliInvocation, Error> ParseCommandLine(int argc, const char* const* argv);

/// Comma-separated list to fields, whitespace trimmed, empties dropped.
std::vector<std::string> SplitFieldList(const std::string& text);

} // namespace reso_client
