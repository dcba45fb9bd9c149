#include <reso_client/client/reso_client.hpp>

#include <reso_client/core/log.hpp>
#include <reso_client/core/url.hpp>

#include <cctype>
#include <limits>

namespace reso_client {

namespace {

constexpr const char* kAcceptJson = "application/json";
constexpr const char* kAcceptText = "text/plain";
constexpr const char* kAcceptXml = "application/xml";

// Preferred continuation header first.
constexpr const char* kNextLinkHeaders[] = {"next", "link"};

std::optional<std::string> ExtractNextLink(const HttpHeaders& headers) {
    for (const auto* name : kNextLinkHeaders) {
        if (auto value = FindHeaderCi(headers, name)) {
            return value;
        }
    }
    return std::nullopt;
}

std::string_view Trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

Result<nlohmann::json, Error> ParseJsonBody(const std::string& body) {
    try {
        return Result<nlohmann::json, Error>::Ok(nlohmann::json::parse(body));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json, Error>::Err(
            Error::Parse("Failed to parse JSON: " + std::string(e.what())));
    }
}

Result<uint64_t, Error> ParseCount(const std::string& body) {
    const auto text = Trim(body);
    auto fail = [&body](const std::string& why) {
        return Result<uint64_t, Error>::Err(
            Error::Parse("Failed to parse count '" + body + "': " + why));
    };

    if (text.empty()) {
        return fail("empty response");
    }
    uint64_t value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return fail("invalid digit");
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return fail("number too large");
        }
        value = value * 10 + digit;
    }
    return Result<uint64_t, Error>::Ok(value);
}

size_t CountValueRecords(const nlohmann::json& doc) {
    if (!doc.is_object()) return 0;
    auto it = doc.find("value");
    if (it == doc.end() || !it->is_array()) return 0;
    return it->size();
}

} // anonymous namespace

ResoClient::ResoClient(ClientConfig config, IHttpTransport& transport)
    : config_(std::move(config)), transport_(transport) {
    config_.base_url = TrimTrailingSlashes(config_.base_url);
}

std::string ResoClient::BuildUrl(std::string_view path) const {
    if (config_.dataset_id.has_value()) {
        return JoinUrl(JoinUrl(config_.base_url, *config_.dataset_id), path);
    }
    return JoinUrl(config_.base_url, path);
}

// ---------------------------------------------------------------------------
// Request plumbing
// ---------------------------------------------------------------------------
Result<HttpResponse, Error> ResoClient::SendAuthenticated(std::string_view operation,
                                                          const std::string& url,
                                                          const char* accept) {
    HttpHeaders headers;
    headers.emplace("Authorization", "Bearer " + config_.token);
    headers.emplace("Accept", accept);

    auto response = transport_.Get(url, headers);
    if (response.IsErr()) {
        const auto& err = response.Error();
        return Result<HttpResponse, Error>::Err(
            err.operation.empty() ? err.WithContext(std::string(operation), url) : err);
    }

    auto http = std::move(response).Value();
    if (!http.IsSuccess()) {
        auto err = Error::FromHttpStatus(http.status_code, http.body)
                       .WithContext(std::string(operation), url);
        LogDebug("client", err.ToString());
        return Result<HttpResponse, Error>::Err(std::move(err));
    }
    return Result<HttpResponse, Error>::Ok(std::move(http));
}

Result<nlohmann::json, Error> ResoClient::FetchJson(std::string_view operation,
                                                    const std::string& url) {
    auto response = SendAuthenticated(operation, url, kAcceptJson);
    if (response.IsErr()) {
        return Result<nlohmann::json, Error>::Err(response.Error());
    }
    auto parsed = ParseJsonBody(response.Value().body);
    if (parsed.IsErr()) {
        return Result<nlohmann::json, Error>::Err(
            parsed.Error().WithContext(std::string(operation), url));
    }
    return parsed;
}

Result<ReplicationResponse, Error> ResoClient::FetchReplicationPage(
    std::string_view operation, const std::string& url) {
    auto response = SendAuthenticated(operation, url, kAcceptJson);
    if (response.IsErr()) {
        return Result<ReplicationResponse, Error>::Err(response.Error());
    }

    // Headers are read before the body is decoded.
    auto next_link = ExtractNextLink(response.Value().headers);
    LogDebug("client", "Next link from headers: " + next_link.value_or("<none>"));

    auto parsed = ParseJsonBody(response.Value().body);
    if (parsed.IsErr()) {
        return Result<ReplicationResponse, Error>::Err(
            parsed.Error().WithContext(std::string(operation), url));
    }

    std::vector<nlohmann::json> records;
    const auto& doc = parsed.Value();
    if (doc.is_object()) {
        auto it = doc.find("value");
        if (it != doc.end() && it->is_array()) {
            records.assign(it->begin(), it->end());
        }
    }
    LogDebug("client", "Retrieved " + std::to_string(records.size()) + " records");

    return Result<ReplicationResponse, Error>::Ok(
        ReplicationResponse(std::move(records), std::move(next_link)));
}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> ResoClient::Execute(const Query& query) {
    const auto url = BuildUrl(query.ToODataString());
    LogInfo("client", "Executing query: " + url);

    auto result = FetchJson("Execute", url);
    if (result.IsOk()) {
        LogDebug("client", "Query result: " +
                               std::to_string(CountValueRecords(result.Value())) +
                               " records");
    }
    return result;
}

Result<nlohmann::json, Error> ResoClient::ExecuteByKey(const Query& query) {
    const auto url = BuildUrl(query.ToODataString());
    LogInfo("client", "Executing key access query: " + url);
    return FetchJson("ExecuteByKey", url);
}

Result<uint64_t, Error> ResoClient::ExecuteCount(const Query& query) {
    const auto url = BuildUrl(query.ToODataString());
    LogInfo("client", "Executing count query: " + url);

    auto response = SendAuthenticated("ExecuteCount", url, kAcceptText);
    if (response.IsErr()) {
        return Result<uint64_t, Error>::Err(response.Error());
    }

    auto count = ParseCount(response.Value().body);
    if (count.IsErr()) {
        return Result<uint64_t, Error>::Err(
            count.Error().WithContext("ExecuteCount", url));
    }
    LogInfo("client", "Count result: " + std::to_string(count.Value()));
    return count;
}

Result<std::string, Error> ResoClient::FetchMetadata() {
    const auto url = BuildUrl("$metadata");
    LogInfo("client", "Fetching metadata from: " + url);

    auto response = SendAuthenticated("FetchMetadata", url, kAcceptXml);
    if (response.IsErr()) {
        return Result<std::string, Error>::Err(response.Error());
    }
    return Result<std::string, Error>::Ok(std::move(response).Value().body);
}

Result<ReplicationResponse, Error> ResoClient::ExecuteReplication(
    const ReplicationQuery& query) {
    const auto url = BuildUrl(query.ToODataString());
    LogInfo("client", "Executing replication query: " + url);
    return FetchReplicationPage("ExecuteReplication", url);
}

Result<ReplicationResponse, Error> ResoClient::ExecuteNextLink(std::string_view next_link) {
    const std::string url(next_link);
    LogInfo("client", "Executing next link: " + url);
    return FetchReplicationPage("ExecuteNextLink", url);
}

} // namespace reso_client
