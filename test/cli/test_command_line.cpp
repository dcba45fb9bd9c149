#include <catch2/catch_test_macros.hpp>

#include <reso_client/cli/command_line.hpp>

#include <string>
#include <vector>

using namespace reso_client;

namespace {

Result<CliInvocation, Error> Parse(std::vector<const char*> args) {
    args.insert(args.begin(), "reso-client");
    return ParseCommandLine(static_cast<int>(args.size()), args.data());
}

CliInvocation ParseOk(std::vector<const char*> args) {
    auto result = Parse(std::move(args));
    if (result.IsErr()) {
        FAIL(result.Error().ToString());
    }
    return result.Value();
}

} // anonymous namespace

// ===========================================================================
// Subcommands
// ===========================================================================

TEST_CASE("ParseCommandLine: query with every option", "[cli][args]") {
    auto inv = ParseOk({"query", "Property",
                        "--filter", "City eq 'Austin'",
                        "--select", "ListingKey, City,,ListPrice",
                        "--expand", "Media",
                        "--orderby", "ListPrice", "--desc",
                        "--top", "10", "--skip", "20",
                        "--count", "--apply", "groupby((City))"});

    CHECK(inv.command == CommandKind::Query);
    const auto& a = inv.args;
    CHECK(a.resource == "Property");
    CHECK(a.filter == std::optional<std::string>("City eq 'Austin'"));
    CHECK(a.select == std::vector<std::string>{"ListingKey", "City", "ListPrice"});
    CHECK(a.expand == std::vector<std::string>{"Media"});
    CHECK(a.order_by == std::optional<std::string>("ListPrice"));
    CHECK(a.descending);
    CHECK(a.top == std::optional<uint32_t>(10));
    CHECK(a.skip == std::optional<uint32_t>(20));
    CHECK(a.with_count);
    CHECK(a.apply == std::optional<std::string>("groupby((City))"));
}

TEST_CASE("ParseCommandLine: get takes resource and key", "[cli][args]") {
    auto inv = ParseOk({"get", "Member", "M-42", "--select", "MemberKey"});
    CHECK(inv.command == CommandKind::Get);
    CHECK(inv.args.resource == "Member");
    CHECK(inv.args.key == "M-42");
    CHECK(inv.args.select == std::vector<std::string>{"MemberKey"});
}

TEST_CASE("ParseCommandLine: count with filter", "[cli][args]") {
    auto inv = ParseOk({"count", "Property", "--filter", "ListPrice gt 100000"});
    CHECK(inv.command == CommandKind::Count);
    CHECK(inv.args.filter == std::optional<std::string>("ListPrice gt 100000"));
}

TEST_CASE("ParseCommandLine: metadata raw flag", "[cli][args]") {
    CHECK_FALSE(ParseOk({"metadata"}).args.raw);
    CHECK(ParseOk({"metadata", "--raw"}).args.raw);
}

TEST_CASE("ParseCommandLine: metadata --generate names an entity type", "[cli][args]") {
    CHECK_FALSE(ParseOk({"metadata"}).args.generate.has_value());
    auto inv = ParseOk({"metadata", "--generate", "Property"});
    CHECK(inv.command == CommandKind::Metadata);
    CHECK(inv.args.generate == std::optional<std::string>("Property"));
}

TEST_CASE("ParseCommandLine: replicate options", "[cli][args]") {
    auto inv = ParseOk({"replicate", "Property", "--top", "2000", "--max-pages", "3"});
    CHECK(inv.command == CommandKind::Replicate);
    CHECK(inv.args.top == std::optional<uint32_t>(2000));
    CHECK(inv.args.max_pages == 3u);
}

TEST_CASE("ParseCommandLine: counts above INT_MAX fit in uint32", "[cli][args]") {
    auto inv = ParseOk({"query", "Property", "--top", "3000000000", "--skip", "4294967295"});
    CHECK(inv.args.top == std::optional<uint32_t>(3000000000u));
    CHECK(inv.args.skip == std::optional<uint32_t>(4294967295u));

    auto rep = ParseOk({"replicate", "Property", "--max-pages", "3000000000"});
    CHECK(rep.args.max_pages == 3000000000u);
}

TEST_CASE("ParseCommandLine: counts outside uint32 are Config errors", "[cli][args]") {
    auto too_big = Parse({"query", "Property", "--top", "5000000000"});
    REQUIRE(too_big.IsErr());
    CHECK(too_big.Error().kind == ErrorKind::Config);
    CHECK(too_big.Error().message.find("--top is out of range") != std::string::npos);

    auto pages = Parse({"replicate", "Property", "--max-pages", "4294967296"});
    REQUIRE(pages.IsErr());
    CHECK(pages.Error().message.find("--max-pages is out of range") != std::string::npos);

    auto negative = Parse({"query", "Property", "--skip", "-1"});
    REQUIRE(negative.IsErr());
    CHECK(negative.Error().kind == ErrorKind::Config);
}

TEST_CASE("ParseCommandLine: missing positional is a Config error", "[cli][args]") {
    auto result = Parse({"get", "Property"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Config);
    CHECK(result.Error().message.rfind("CLI parse error: ", 0) == 0);
}

TEST_CASE("ParseCommandLine: unknown option is a Config error", "[cli][args]") {
    auto result = Parse({"query", "Property", "--frobnicate"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Config);
}

// ===========================================================================
// Global flags
// ===========================================================================

TEST_CASE("ParseCommandLine: global flags before the subcommand", "[cli][args]") {
    auto inv = ParseOk({"--base-url", "https://api.example.com/odata/",
                        "--token", "tok", "--dataset-id", "ds",
                        "--timeout", "15", "--insecure", "--json",
                        "-c", "reso.yaml", "count", "Property"});
    const auto& conn = inv.overrides.connection;
    CHECK(conn.base_url == "https://api.example.com/odata");
    CHECK(conn.token == "tok");
    CHECK(conn.dataset_id == std::optional<std::string>("ds"));
    CHECK(conn.timeout_seconds == std::optional<int>(15));
    CHECK(conn.insecure);
    CHECK(inv.overrides.json_output);
    CHECK(inv.config_path == std::optional<std::string>("reso.yaml"));
    CHECK(inv.command == CommandKind::Count);
}

TEST_CASE("ParseCommandLine: global flags after the subcommand", "[cli][args]") {
    auto inv = ParseOk({"metadata", "--json", "--token-env", "MY_TOKEN",
                        "--log-file", "/tmp/reso.log", "--log-level", "debug"});
    CHECK(inv.overrides.json_output);
    CHECK(inv.overrides.connection.token_env == std::optional<std::string>("MY_TOKEN"));
    CHECK(inv.overrides.log_file == std::optional<std::string>("/tmp/reso.log"));
    CHECK(inv.overrides.log_level == std::optional<std::string>("debug"));
}

TEST_CASE("ParseCommandLine: verbosity levels", "[cli][args]") {
    CHECK(ParseOk({"metadata"}).verbosity == 0);
    CHECK(ParseOk({"-v", "metadata"}).verbosity == 1);
    CHECK(ParseOk({"-vv", "metadata"}).verbosity == 2);
    CHECK(ParseOk({"metadata", "-vv"}).overrides.verbose);
    CHECK(ParseOk({"-q", "metadata"}).overrides.quiet);
}

TEST_CASE("ParseCommandLine: color choice", "[cli][args]") {
    CHECK(ParseOk({"metadata"}).color_choice == -1);
    CHECK(ParseOk({"--color", "metadata"}).color_choice == 1);
    CHECK(ParseOk({"metadata", "--no-color"}).color_choice == 0);
}

TEST_CASE("ParseCommandLine: defaults leave overrides unset", "[cli][args]") {
    auto inv = ParseOk({"query", "Property"});
    CHECK(inv.overrides.connection.base_url.empty());
    CHECK_FALSE(inv.overrides.connection.timeout_seconds.has_value());
    CHECK_FALSE(inv.overrides.json_output);
    CHECK_FALSE(inv.config_path.has_value());
    CHECK_FALSE(inv.args.top.has_value());
    CHECK_FALSE(inv.args.filter.has_value());
}

// ===========================================================================
// Help and version
// ===========================================================================

TEST_CASE("ParseCommandLine: no arguments yields top-level help", "[cli][args]") {
    auto inv = ParseOk({});
    CHECK(inv.command == CommandKind::None);
    REQUIRE(inv.help_text.has_value());
    CHECK(inv.help_text->find("replicate") != std::string::npos);
}

TEST_CASE("ParseCommandLine: subcommand help", "[cli][args]") {
    auto inv = ParseOk({"get", "--help"});
    REQUIRE(inv.help_text.has_value());
    CHECK(inv.help_text->find("key") != std::string::npos);
    CHECK(inv.help_text->find("--expand") != std::string::npos);
}

TEST_CASE("ParseCommandLine: --version", "[cli][args]") {
    auto inv = ParseOk({"--version"});
    CHECK(inv.show_version);
    CHECK_FALSE(inv.help_text.has_value());
}

// ===========================================================================
// SplitFieldList
// ===========================================================================

TEST_CASE("SplitFieldList: trims and drops empties", "[cli][args]") {
    CHECK(SplitFieldList("A,B") == std::vector<std::string>{"A", "B"});
    CHECK(SplitFieldList(" A , ,B ") == std::vector<std::string>{"A", "B"});
    CHECK(SplitFieldList("").empty());
}
