#include <reso_client/cli/command_executor.hpp>

#include <reso_client/core/log.hpp>
#include <reso_client/metadata/metadata_parser.hpp>

namespace reso_client {

namespace {

std::vector<nlohmann::json> ValueArray(const nlohmann::json& doc) {
    if (doc.is_object()) {
        auto it = doc.find("value");
        if (it != doc.end() && it->is_array()) {
            return {it->begin(), it->end()};
        }
    }
    return {};
}

void PrintRecords(const OutputFormatter& fmt,
                  const std::vector<nlohmann::json>& records,
                  const std::vector<std::string>& select) {
    const auto columns = RecordColumns(records, select);
    fmt.PrintTable(columns, RecordRows(records, columns));
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Query construction
// ---------------------------------------------------------------------------
Result<Query, Error> BuildQueryFromArgs(const CommandArgs& args) {
    QueryBuilder builder(args.resource);
    if (args.filter) builder.Filter(*args.filter);
    if (args.apply) builder.Apply(*args.apply);
    if (args.order_by) builder.OrderBy(*args.order_by, args.descending ? "desc" : "asc");
    if (!args.select.empty()) builder.Select(args.select);
    if (!args.expand.empty()) builder.Expand(args.expand);
    if (args.top) builder.Top(*args.top);
    if (args.skip) builder.Skip(*args.skip);
    if (args.with_count) builder.WithCount();
    return builder.Build();
}

Result<Query, Error> BuildKeyQueryFromArgs(const CommandArgs& args) {
    auto builder = QueryBuilder::ByKey(args.resource, args.key);
    if (!args.select.empty()) builder.Select(args.select);
    if (!args.expand.empty()) builder.Expand(args.expand);
    return builder.Build();
}

Result<Query, Error> BuildCountQueryFromArgs(const CommandArgs& args) {
    QueryBuilder builder(args.resource);
    if (args.filter) builder.Filter(*args.filter);
    builder.Count();
    return builder.Build();
}

Result<ReplicationQuery, Error> BuildReplicationQueryFromArgs(const CommandArgs& args) {
    ReplicationQueryBuilder builder(args.resource);
    if (args.filter) builder.Filter(*args.filter);
    if (!args.select.empty()) builder.Select(args.select);
    if (args.top) builder.Top(*args.top);
    return builder.Build();
}

// ---------------------------------------------------------------------------
// Replication walk
// ---------------------------------------------------------------------------
Result<ReplicationWalk, Error> WalkReplication(ResoClient& client,
                                               const ReplicationQuery& query,
                                               uint32_t max_pages,
                                               const ReplicationPageHandler& on_page) {
    ReplicationWalk walk;

    auto page = client.ExecuteReplication(query);
    while (true) {
        if (page.IsErr()) {
            return Result<ReplicationWalk, Error>::Err(page.Error());
        }
        const auto& current = page.Value();
        ++walk.pages;
        walk.records += current.RecordCount();
        LogInfo("replicate", "Page " + std::to_string(walk.pages) + ": " +
                                 std::to_string(current.RecordCount()) + " records");
        on_page(current, walk.pages);

        if (!current.HasMore()) {
            break;
        }
        std::string next(*current.NextLink());
        if (max_pages != 0 && walk.pages >= max_pages) {
            walk.next_link = std::move(next);
            break;
        }
        page = client.ExecuteNextLink(next);
    }
    return Result<ReplicationWalk, Error>::Ok(std::move(walk));
}

// ---------------------------------------------------------------------------
// Subcommands
// ---------------------------------------------------------------------------
Result<void, Error> RunQueryCommand(ResoClient& client, const CommandArgs& args,
                                    const OutputFormatter& fmt) {
    auto query = BuildQueryFromArgs(args);
    if (query.IsErr()) {
        return Result<void, Error>::Err(query.Error());
    }
    auto doc = client.Execute(query.Value());
    if (doc.IsErr()) {
        return Result<void, Error>::Err(doc.Error());
    }

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(doc.Value());
        return Result<void, Error>::Ok();
    }

    PrintRecords(fmt, ValueArray(doc.Value()), args.select);
    auto count = doc.Value().find("@odata.count");
    if (count != doc.Value().end()) {
        fmt.PrintSuccess("Total count: " + CellText(*count));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> RunGetCommand(ResoClient& client, const CommandArgs& args,
                                  const OutputFormatter& fmt) {
    auto query = BuildKeyQueryFromArgs(args);
    if (query.IsErr()) {
        return Result<void, Error>::Err(query.Error());
    }
    auto doc = client.ExecuteByKey(query.Value());
    if (doc.IsErr()) {
        return Result<void, Error>::Err(doc.Error());
    }

    if (fmt.IsJsonMode() || !doc.Value().is_object()) {
        fmt.PrintJson(doc.Value());
        return Result<void, Error>::Ok();
    }

    std::vector<std::pair<std::string, std::string>> fields;
    for (const auto& item : doc.Value().items()) {
        if (item.key().find("@odata.") != std::string::npos) continue;
        fields.emplace_back(item.key(), CellText(item.value()));
    }
    fmt.PrintFields(args.resource + "('" + args.key + "')", fields);
    return Result<void, Error>::Ok();
}

Result<void, Error> RunCountCommand(ResoClient& client, const CommandArgs& args,
                                    const OutputFormatter& fmt) {
    auto query = BuildCountQueryFromArgs(args);
    if (query.IsErr()) {
        return Result<void, Error>::Err(query.Error());
    }
    auto count = client.ExecuteCount(query.Value());
    if (count.IsErr()) {
        return Result<void, Error>::Err(count.Error());
    }

    if (fmt.IsJsonMode()) {
        fmt.PrintJson(nlohmann::json{{"resource", args.resource}, {"count", count.Value()}});
    } else {
        fmt.PrintRaw(std::to_string(count.Value()));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> RunMetadataCommand(ResoClient& client, const CommandArgs& args,
                                       const OutputFormatter& fmt) {
    auto xml = client.FetchMetadata();
    if (xml.IsErr()) {
        return Result<void, Error>::Err(xml.Error());
    }
    if (args.raw) {
        fmt.PrintRaw(xml.Value());
        return Result<void, Error>::Ok();
    }

    auto schema = ParseMetadata(xml.Value());
    if (schema.IsErr()) {
        return Result<void, Error>::Err(
            schema.Error().WithContext("FetchMetadata", client.BuildUrl("$metadata")));
    }
    const auto& s = schema.Value();

    if (args.generate) {
        const auto* entity = s.FindEntity(*args.generate);
        if (entity == nullptr) {
            return Result<void, Error>::Err(Error::Config(
                "Entity type '" + *args.generate + "' not found in metadata"));
        }
        if (fmt.IsJsonMode()) {
            fmt.PrintJson(nlohmann::json{{"entity_type", entity->name},
                                         {"code", GenerateStruct(*entity)}});
        } else {
            fmt.PrintRaw(GenerateStruct(*entity));
        }
        return Result<void, Error>::Ok();
    }

    const auto resources = FindResoResources(s);

    if (fmt.IsJsonMode()) {
        nlohmann::json entities = nlohmann::json::array();
        for (const auto& entity : s.entity_types) {
            entities.push_back({{"name", entity.name},
                                {"properties", entity.properties.size()}});
        }
        fmt.PrintJson(nlohmann::json{
            {"namespace", s.namespace_name},
            {"entity_types", std::move(entities)},
            {"reso_resources", resources},
            {"edm_types", EdmTypeNames(s)},
        });
        return Result<void, Error>::Ok();
    }

    fmt.PrintFields("Metadata", {
        {"Namespace", s.namespace_name},
        {"Entity types", std::to_string(s.entity_types.size())},
        {"RESO resources", std::to_string(resources.size())},
    });

    std::vector<std::vector<std::string>> rows;
    for (const auto& name : resources) {
        const auto* entity = s.FindEntity(name);
        rows.push_back({name, std::to_string(entity ? entity->properties.size() : 0)});
    }
    fmt.PrintTable({"Resource", "Properties"}, rows);
    return Result<void, Error>::Ok();
}

Result<void, Error> RunReplicateCommand(ResoClient& client, const CommandArgs& args,
                                        const OutputFormatter& fmt) {
    auto query = BuildReplicationQueryFromArgs(args);
    if (query.IsErr()) {
        return Result<void, Error>::Err(query.Error());
    }

    // JSON mode writes one line per page, then a summary line.
    auto walk = WalkReplication(
        client, query.Value(), args.max_pages,
        [&](const ReplicationResponse& page, size_t page_number) {
            if (fmt.IsJsonMode()) {
                fmt.PrintJson(nlohmann::json{{"page", page_number},
                                             {"records", page.Records()}});
            } else {
                PrintRecords(fmt, page.Records(), args.select);
            }
        });
    if (walk.IsErr()) {
        return Result<void, Error>::Err(walk.Error());
    }
    const auto& w = walk.Value();

    if (fmt.IsJsonMode()) {
        nlohmann::json summary{
            {"record_count", w.records},
            {"pages", w.pages},
        };
        summary["next_link"] = w.next_link ? nlohmann::json(*w.next_link) : nlohmann::json();
        fmt.PrintJson(summary);
        return Result<void, Error>::Ok();
    }

    fmt.PrintSuccess("Fetched " + std::to_string(w.records) + " records in " +
                     std::to_string(w.pages) + (w.pages == 1 ? " page" : " pages"));
    if (w.next_link) {
        fmt.PrintSuccess("More records available: " + *w.next_link);
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------
int ExecuteCommand(CommandKind command, const CommandArgs& args,
                   ResoClient& client, const OutputFormatter& fmt) {
    Result<void, Error> result = Result<void, Error>::Ok();
    switch (command) {
        case CommandKind::Query:     result = RunQueryCommand(client, args, fmt); break;
        case CommandKind::Get:       result = RunGetCommand(client, args, fmt); break;
        case CommandKind::Count:     result = RunCountCommand(client, args, fmt); break;
        case CommandKind::Metadata:  result = RunMetadataCommand(client, args, fmt); break;
        case CommandKind::Replicate: result = RunReplicateCommand(client, args, fmt); break;
        case CommandKind::None:
            return kExitSuccess;
    }

    if (result.IsErr()) {
        LogDebug("cli", "Command failed: " + result.Error().ToString());
        fmt.PrintError(result.Error());
        return result.Error().ExitCode();
    }
    return kExitSuccess;
}

} // namespace reso_client
