#pragma once

#include <reso_client/core/result.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reso_client {

/// Largest page size the replication endpoint accepts.
constexpr uint32_t kMaxReplicationTop = 2000;

// ---------------------------------------------------------------------------
// ReplicationQuery: bulk-transfer request. Only $filter, $select and $top
// exist; key access, $skip, $orderby, $apply and $count are not part of
// the replication protocol.
// ---------------------------------------------------------------------------
class ReplicationQuery {
public:
    explicit ReplicationQuery(std::string resource);

    [[nodiscard]] const std::string& Resource() const noexcept { return resource_; }
    [[nodiscard]] const std::optional<std::string>& Filter() const noexcept { return filter_; }
    [[nodiscard]] const std::optional<std::vector<std::string>>& Select() const noexcept {
        return select_;
    }
    [[nodiscard]] std::optional<uint32_t> Top() const noexcept { return top_; }

    /// Resource/replication?$filter=<enc>&$select=a,b&$top=N
    [[nodiscard]] std::string ToODataString() const;

private:
    friend class ReplicationQueryBuilder;

    std::string resource_;
    std::optional<std::string> filter_;
    std::optional<std::vector<std::string>> select_;
    std::optional<uint32_t> top_;
};

class ReplicationQueryBuilder {
public:
    explicit ReplicationQueryBuilder(std::string resource);

    ReplicationQueryBuilder& Filter(std::string expression);
    ReplicationQueryBuilder& Select(std::vector<std::string> fields);
    ReplicationQueryBuilder& Top(uint32_t n);

    /// Fails with InvalidQuery when Top exceeds kMaxReplicationTop.
    [[nodiscard]] Result<ReplicationQuery, Error> Build() const;

private:
    ReplicationQuery query_;
};

// ---------------------------------------------------------------------------
// ReplicationResponse: one page of a replication walk.
//
// The next link is an opaque absolute URL taken from the response headers;
// it is handed back verbatim to fetch the following page. HasMore() is true
// exactly when a next link is present.
// ---------------------------------------------------------------------------
class ReplicationResponse {
public:
    ReplicationResponse(std::vector<nlohmann::json> records,
                        std::optional<std::string> next_link);

    [[nodiscard]] const std::vector<nlohmann::json>& Records() const noexcept { return records_; }
    [[nodiscard]] size_t RecordCount() const noexcept { return record_count_; }
    [[nodiscard]] bool HasMore() const noexcept { return next_link_.has_value(); }
    [[nodiscard]] std::optional<std::string_view> NextLink() const noexcept;

private:
    std::vector<nlohmann::json> records_;
    std::optional<std::string> next_link_;
    size_t record_count_;
};

} // namespace reso_client
