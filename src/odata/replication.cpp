#include <reso_client/odata/replication.hpp>

#include <reso_client/core/url.hpp>

namespace reso_client {

// ---------------------------------------------------------------------------
// ReplicationQuery
// ---------------------------------------------------------------------------
ReplicationQuery::ReplicationQuery(std::string resource)
    : resource_(std::move(resource)) {}

std::string ReplicationQuery::ToODataString() const {
    std::string out = resource_ + "/replication";

    std::vector<std::string> params;
    if (filter_.has_value()) {
        params.push_back("$filter=" + UrlEncode(*filter_));
    }
    if (select_.has_value()) {
        params.push_back("$select=" + JoinList(*select_, ','));
    }
    if (top_.has_value()) {
        params.push_back("$top=" + std::to_string(*top_));
    }

    if (!params.empty()) {
        out += '?';
        out += JoinList(params, '&');
    }
    return out;
}

// ---------------------------------------------------------------------------
// ReplicationQueryBuilder
// ---------------------------------------------------------------------------
ReplicationQueryBuilder::ReplicationQueryBuilder(std::string resource)
    : query_(std::move(resource)) {}

ReplicationQueryBuilder& ReplicationQueryBuilder::Filter(std::string expression) {
    query_.filter_ = std::move(expression);
    return *this;
}

ReplicationQueryBuilder& ReplicationQueryBuilder::Select(std::vector<std::string> fields) {
    query_.select_ = std::move(fields);
    return *this;
}

ReplicationQueryBuilder& ReplicationQueryBuilder::Top(uint32_t n) {
    query_.top_ = n;
    return *this;
}

Result<ReplicationQuery, Error> ReplicationQueryBuilder::Build() const {
    if (query_.resource_.empty()) {
        return Result<ReplicationQuery, Error>::Err(
            Error::InvalidQuery("Resource name cannot be empty"));
    }
    if (query_.top_.has_value() && *query_.top_ > kMaxReplicationTop) {
        return Result<ReplicationQuery, Error>::Err(Error::InvalidQuery(
            "Replication queries support a maximum of " +
            std::to_string(kMaxReplicationTop) + " records per request, got " +
            std::to_string(*query_.top_)));
    }
    return Result<ReplicationQuery, Error>::Ok(query_);
}

// ---------------------------------------------------------------------------
// ReplicationResponse
// ---------------------------------------------------------------------------
ReplicationResponse::ReplicationResponse(std::vector<nlohmann::json> records,
                                         std::optional<std::string> next_link)
    : records_(std::move(records)),
      next_link_(std::move(next_link)),
      record_count_(records_.size()) {}

std::optional<std::string_view> ReplicationResponse::NextLink() const noexcept {
    if (!next_link_.has_value()) return std::nullopt;
    return std::string_view(*next_link_);
}

} // namespace reso_client
