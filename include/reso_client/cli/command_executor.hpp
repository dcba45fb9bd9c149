#pragma once

#include <reso_client/cli/command_line.hpp>
#include <reso_client/cli/output_formatter.hpp>
#include <reso_client/client/reso_client.hpp>
#include <reso_client/core/result.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace reso_client {

constexpr int kExitSuccess = 0;

// ---------------------------------------------------------------------------
// Query construction from CLI arguments. Builder validation errors surface
// here, before any request is made.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<Query, Error> BuildQueryFromArgs(const CommandArgs& args);
[[nodiscard]] Result<Query, Error> BuildKeyQueryFromArgs(const CommandArgs& args);
[[nodiscard]] Result<Query, Error> BuildCountQueryFromArgs(const CommandArgs& args);
[[nodiscard]] Result<ReplicationQuery, Error> BuildReplicationQueryFromArgs(
    const CommandArgs& args);

// ---------------------------------------------------------------------------
// ReplicationWalk: totals of a finished replication walk. Records are not
// kept; each page goes to the page handler and is released before the next
// one is fetched. next_link is set when the walk stopped at max_pages with
// pages left.
// ---------------------------------------------------------------------------
struct ReplicationWalk {
    size_t pages = 0;
    size_t records = 0;
    std::optional<std::string> next_link;
};

/// Called once per page with the page and its 1-based number.
using ReplicationPageHandler =
    std::function<void(const ReplicationResponse& page, size_t page_number)>;

/// Follow next links one page at a time until the server has no more or
/// max_pages (0 = unlimited) is reached. A failed page aborts the walk;
/// pages already handed to on_page stay delivered.
[[nodiscard]] Result<ReplicationWalk, Error> WalkReplication(
    ResoClient& client, const ReplicationQuery& query, uint32_t max_pages,
    const ReplicationPageHandler& on_page);

// ---------------------------------------------------------------------------
// Subcommands. Each prints its result through the formatter and returns the
// first error unprinted.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<void, Error> RunQueryCommand(ResoClient& client, const CommandArgs& args,
                                                  const OutputFormatter& fmt);
[[nodiscard]] Result<void, Error> RunGetCommand(ResoClient& client, const CommandArgs& args,
                                                const OutputFormatter& fmt);
[[nodiscard]] Result<void, Error> RunCountCommand(ResoClient& client, const CommandArgs& args,
                                                  const OutputFormatter& fmt);
[[nodiscard]] Result<void, Error> RunMetadataCommand(ResoClient& client, const CommandArgs& args,
                                                     const OutputFormatter& fmt);
[[nodiscard]] Result<void, Error> RunReplicateCommand(ResoClient& client, const CommandArgs& args,
                                                      const OutputFormatter& fmt);

/// Dispatch a parsed invocation. Prints any error and returns the exit code.
int ExecuteCommand(CommandKind command, const CommandArgs& args,
                   ResoClient& client, const OutputFormatter& fmt);

} // namespace reso_client
