#include <reso_client/cli/command_line.hpp>

#include <reso_client/core/url.hpp>
#include <reso_client/core/version.hpp>

#include <argparse/argparse.hpp>

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>
#include <string_view>

namespace reso_client {

namespace {

constexpr const char* kProgramName = "reso-client";

constexpr std::array<const char*, 5> kCommandNames = {
    "query", "get", "count", "metadata", "replicate"};

Error MakeUsageError(const std::string& message) {
    return Error::Config("CLI parse error: " + message);
}

// Flags shared by every parser so they may appear on either side of the
// subcommand name.
void AddGlobalFlags(argparse::ArgumentParser& parser) {
    parser.add_argument("-c", "--config")
        .help("Path to YAML config file");
    parser.add_argument("--base-url")
        .help("RESO Web API base URL (overrides RESO_BASE_URL)");
    parser.add_argument("--token")
        .help("OAuth bearer token (overrides RESO_TOKEN)");
    parser.add_argument("--token-env")
        .help("Environment variable containing the bearer token");
    parser.add_argument("--dataset-id")
        .help("Dataset id inserted between base URL and resource");
    parser.add_argument("--timeout")
        .help("HTTP timeout in seconds")
        .scan<'i', int>();
    parser.add_argument("--insecure")
        .help("Skip TLS certificate verification")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("--log-file")
        .help("Append JSON log lines to this file");
    parser.add_argument("--log-level")
        .help("Log level: debug, info, warn, error");
    parser.add_argument("-v", "--verbose")
        .help("Verbose output (-vv for debug)")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("-q", "--quiet")
        .help("Only print results and errors")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("-h", "--help")
        .help("Show help")
        .default_value(false)
        .implicit_value(true);
    parser.add_argument("--version")
        .help("Print version")
        .default_value(false)
        .implicit_value(true);
}

void ReadGlobalFlags(const argparse::ArgumentParser& parser, CliInvocation& inv) {
    auto& conn = inv.overrides.connection;
    if (auto val = parser.present("--config")) {
        inv.config_path = *val;
    }
    if (auto val = parser.present("--base-url")) {
        conn.base_url = TrimTrailingSlashes(*val);
    }
    if (auto val = parser.present("--token")) {
        conn.token = *val;
    }
    if (auto val = parser.present("--token-env")) {
        conn.token_env = *val;
    }
    if (auto val = parser.present("--dataset-id")) {
        conn.dataset_id = *val;
    }
    if (auto val = parser.present<int>("--timeout")) {
        conn.timeout_seconds = *val;
    }
    if (parser.get<bool>("--insecure")) {
        conn.insecure = true;
    }
    if (parser.get<bool>("--json")) {
        inv.overrides.json_output = true;
    }
    if (parser.get<bool>("--color")) {
        inv.color_choice = 1;
    }
    if (parser.get<bool>("--no-color")) {
        inv.color_choice = 0;
    }
    if (auto val = parser.present("--log-file")) {
        inv.overrides.log_file = *val;
    }
    if (auto val = parser.present("--log-level")) {
        inv.overrides.log_level = *val;
    }
    if (parser.get<bool>("--verbose")) {
        inv.verbosity = std::max(inv.verbosity, 1);
        inv.overrides.verbose = true;
    }
    if (parser.get<bool>("--quiet")) {
        inv.overrides.quiet = true;
    }
    if (parser.get<bool>("--version")) {
        inv.show_version = true;
    }
}

uint32_t ToCount(long long value, const char* flag) {
    if (value < 0) {
        throw std::runtime_error(std::string(flag) + " must not be negative");
    }
    if (value > static_cast<long long>(std::numeric_limits<uint32_t>::max())) {
        throw std::runtime_error(std::string(flag) + " is out of range (max " +
                                 std::to_string(std::numeric_limits<uint32_t>::max()) + ")");
    }
    return static_cast<uint32_t>(value);
}

std::string FindCommandName(const std::vector<std::string>& args) {
    for (size_t i = 1; i < args.size(); ++i) {
        if (std::find(kCommandNames.begin(), kCommandNames.end(), args[i]) !=
            kCommandNames.end()) {
            return args[i];
        }
    }
    return {};
}

bool WantsHelp(const std::vector<std::string>& args) {
    return std::any_of(args.begin() + 1, args.end(), [](const std::string& a) {
        return a == "-h" || a == "--help";
    });
}

} // anonymous namespace

std::vector<std::string> SplitFieldList(const std::string& text) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        if (comma == std::string::npos) comma = text.size();
        auto field = text.substr(start, comma - start);
        auto first = field.find_first_not_of(" \t");
        auto last = field.find_last_not_of(" \t");
        if (first != std::string::npos) {
            fields.push_back(field.substr(first, last - first + 1));
        }
        start = comma + 1;
    }
    return fields;
}

Result<CliInvocation, Error> ParseCommandLine(int argc, const char* const* argv) {
    // "-vv" is expanded here; argparse has no counting flags.
    CliInvocation inv;
    std::vector<std::string> args;
    args.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if (i > 0 && arg == "-vv") {
            inv.verbosity = 2;
            inv.overrides.verbose = true;
            continue;
        }
        args.emplace_back(arg);
    }
    if (args.empty()) {
        args.emplace_back(kProgramName);
    }

    argparse::ArgumentParser program(kProgramName, kVersion,
                                     argparse::default_arguments::none);
    program.add_description("Query a RESO Web API (OData) server.");
    AddGlobalFlags(program);

    argparse::ArgumentParser query_cmd("query", kVersion, argparse::default_arguments::none);
    query_cmd.add_description("Query a resource collection");
    query_cmd.add_argument("resource").help("Resource name, e.g. Property");
    query_cmd.add_argument("--filter").help("OData $filter expression");
    query_cmd.add_argument("--select").help("Comma-separated fields");
    query_cmd.add_argument("--expand").help("Comma-separated navigation properties");
    query_cmd.add_argument("--orderby").help("Field to order by");
    query_cmd.add_argument("--desc")
        .help("Descending order")
        .default_value(false)
        .implicit_value(true);
    query_cmd.add_argument("--top").help("Maximum records").scan<'i', long long>();
    query_cmd.add_argument("--skip").help("Records to skip").scan<'i', long long>();
    query_cmd.add_argument("--count")
        .help("Include the total count ($count=true)")
        .default_value(false)
        .implicit_value(true);
    query_cmd.add_argument("--apply").help("OData $apply aggregation");
    AddGlobalFlags(query_cmd);

    argparse::ArgumentParser get_cmd("get", kVersion, argparse::default_arguments::none);
    get_cmd.add_description("Fetch one record by key");
    get_cmd.add_argument("resource").help("Resource name");
    get_cmd.add_argument("key").help("Record key, e.g. a ListingKey");
    get_cmd.add_argument("--select").help("Comma-separated fields");
    get_cmd.add_argument("--expand").help("Comma-separated navigation properties");
    AddGlobalFlags(get_cmd);

    argparse::ArgumentParser count_cmd("count", kVersion, argparse::default_arguments::none);
    count_cmd.add_description("Count records (Resource/$count)");
    count_cmd.add_argument("resource").help("Resource name");
    count_cmd.add_argument("--filter").help("OData $filter expression");
    AddGlobalFlags(count_cmd);

    argparse::ArgumentParser metadata_cmd("metadata", kVersion,
                                          argparse::default_arguments::none);
    metadata_cmd.add_description("Fetch $metadata and summarize entity types");
    metadata_cmd.add_argument("--raw")
        .help("Print the EDMX document instead of a summary")
        .default_value(false)
        .implicit_value(true);
    metadata_cmd.add_argument("--generate")
        .help("Print a C++ struct for this entity type");
    AddGlobalFlags(metadata_cmd);

    argparse::ArgumentParser replicate_cmd("replicate", kVersion,
                                           argparse::default_arguments::none);
    replicate_cmd.add_description("Bulk-fetch a resource through the replication endpoint");
    replicate_cmd.add_argument("resource").help("Resource name");
    replicate_cmd.add_argument("--filter").help("OData $filter expression");
    replicate_cmd.add_argument("--select").help("Comma-separated fields");
    replicate_cmd.add_argument("--top").help("Page size (max 2000)").scan<'i', long long>();
    replicate_cmd.add_argument("--max-pages")
        .help("Stop after this many pages (0 = all)")
        .scan<'i', long long>();
    AddGlobalFlags(replicate_cmd);

    program.add_subparser(query_cmd);
    program.add_subparser(get_cmd);
    program.add_subparser(count_cmd);
    program.add_subparser(metadata_cmd);
    program.add_subparser(replicate_cmd);

    // Help is answered before parsing so missing positionals do not fail it.
    if (WantsHelp(args)) {
        const auto name = FindCommandName(args);
        if (name == "query") inv.help_text = query_cmd.help().str();
        else if (name == "get") inv.help_text = get_cmd.help().str();
        else if (name == "count") inv.help_text = count_cmd.help().str();
        else if (name == "metadata") inv.help_text = metadata_cmd.help().str();
        else if (name == "replicate") inv.help_text = replicate_cmd.help().str();
        else inv.help_text = program.help().str();
        return Result<CliInvocation, Error>::Ok(std::move(inv));
    }

    try {
        program.parse_args(args);
        ReadGlobalFlags(program, inv);

        auto& a = inv.args;
        if (program.is_subcommand_used(query_cmd)) {
            inv.command = CommandKind::Query;
            ReadGlobalFlags(query_cmd, inv);
            a.resource = query_cmd.get<std::string>("resource");
            a.filter = query_cmd.present("--filter");
            a.apply = query_cmd.present("--apply");
            a.order_by = query_cmd.present("--orderby");
            a.descending = query_cmd.get<bool>("--desc");
            if (auto val = query_cmd.present("--select")) a.select = SplitFieldList(*val);
            if (auto val = query_cmd.present("--expand")) a.expand = SplitFieldList(*val);
            if (auto val = query_cmd.present<long long>("--top")) a.top = ToCount(*val, "--top");
            if (auto val = query_cmd.present<long long>("--skip")) a.skip = ToCount(*val, "--skip");
            a.with_count = query_cmd.get<bool>("--count");
        } else if (program.is_subcommand_used(get_cmd)) {
            inv.command = CommandKind::Get;
            ReadGlobalFlags(get_cmd, inv);
            a.resource = get_cmd.get<std::string>("resource");
            a.key = get_cmd.get<std::string>("key");
            if (auto val = get_cmd.present("--select")) a.select = SplitFieldList(*val);
            if (auto val = get_cmd.present("--expand")) a.expand = SplitFieldList(*val);
        } else if (program.is_subcommand_used(count_cmd)) {
            inv.command = CommandKind::Count;
            ReadGlobalFlags(count_cmd, inv);
            a.resource = count_cmd.get<std::string>("resource");
            a.filter = count_cmd.present("--filter");
        } else if (program.is_subcommand_used(metadata_cmd)) {
            inv.command = CommandKind::Metadata;
            ReadGlobalFlags(metadata_cmd, inv);
            a.raw = metadata_cmd.get<bool>("--raw");
            a.generate = metadata_cmd.present("--generate");
        } else if (program.is_subcommand_used(replicate_cmd)) {
            inv.command = CommandKind::Replicate;
            ReadGlobalFlags(replicate_cmd, inv);
            a.resource = replicate_cmd.get<std::string>("resource");
            a.filter = replicate_cmd.present("--filter");
            if (auto val = replicate_cmd.present("--select")) a.select = SplitFieldList(*val);
            if (auto val = replicate_cmd.present<long long>("--top")) a.top = ToCount(*val, "--top");
            if (auto val = replicate_cmd.present<long long>("--max-pages")) {
                a.max_pages = ToCount(*val, "--max-pages");
            }
        }
    } catch (const std::exception& e) {
        return Result<CliInvocation, Error>::Err(MakeUsageError(e.what()));
    }

    if (inv.command == CommandKind::None && !inv.show_version) {
        inv.help_text = program.help().str();
    }
    return Result<CliInvocation, Error>::Ok(std::move(inv));
}

} // namespace reso_client
