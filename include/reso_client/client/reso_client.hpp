#pragma once

#include <reso_client/client/i_http_transport.hpp>
#include <reso_client/config/client_config.hpp>
#include <reso_client/core/result.hpp>
#include <reso_client/odata/query.hpp>
#include <reso_client/odata/replication.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace reso_client {

// ---------------------------------------------------------------------------
// ResoClient: authenticated RESO Web API calls over an IHttpTransport.
//
// Every request carries "Authorization: Bearer <token>" and an Accept
// header. Non-2xx responses are classified with Error::FromHttpStatus and
// annotated with the operation and URL. The transport must outlive the
// client.
// ---------------------------------------------------------------------------
class ResoClient {
public:
    ResoClient(ClientConfig config, IHttpTransport& transport);

    [[nodiscard]] const std::string& BaseUrl() const noexcept { return config_.base_url; }
    [[nodiscard]] const ClientConfig& Config() const noexcept { return config_; }

    /// base_url/path, or base_url/dataset_id/path with a dataset id.
    [[nodiscard]] std::string BuildUrl(std::string_view path) const;

    /// Collection query; returns the decoded JSON envelope.
    [[nodiscard]] Result<nlohmann::json, Error> Execute(const Query& query);

    /// Key-access query; returns the single entity object.
    [[nodiscard]] Result<nlohmann::json, Error> ExecuteByKey(const Query& query);

    /// Count-only query (Resource/$count).
    [[nodiscard]] Result<uint64_t, Error> ExecuteCount(const Query& query);

    /// Raw EDMX document from $metadata.
    [[nodiscard]] Result<std::string, Error> FetchMetadata();

    /// First page of a replication walk.
    [[nodiscard]] Result<ReplicationResponse, Error> ExecuteReplication(
        const ReplicationQuery& query);

    /// Following page; next_link is requested verbatim.
    [[nodiscard]] Result<ReplicationResponse, Error> ExecuteNextLink(
        std::string_view next_link);

private:
    Result<HttpResponse, Error> SendAuthenticated(std::string_view operation,
                                                  const std::string& url,
                                                  const char* accept);
    Result<nlohmann::json, Error> FetchJson(std::string_view operation,
                                            const std::string& url);
    Result<ReplicationResponse, Error> FetchReplicationPage(std::string_view operation,
                                                            const std::string& url);

    ClientConfig config_;
    IHttpTransport& transport_;
};

} // namespace reso_client
