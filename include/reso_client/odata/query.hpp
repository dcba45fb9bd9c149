#pragma once

#include <reso_client/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reso_client {

// ---------------------------------------------------------------------------
// Query: the parameters of one non-bulk OData request.
//
// Immutable once produced by QueryBuilder::Build(). A default Query (built
// through the public constructor) carries only the resource name.
// ---------------------------------------------------------------------------
class Query {
public:
    explicit Query(std::string resource);

    [[nodiscard]] const std::string& Resource() const noexcept { return resource_; }
    [[nodiscard]] const std::optional<std::string>& Key() const noexcept { return key_; }
    [[nodiscard]] const std::optional<std::string>& Filter() const noexcept { return filter_; }
    [[nodiscard]] const std::optional<std::vector<std::string>>& Select() const noexcept {
        return select_;
    }
    [[nodiscard]] const std::optional<std::vector<std::string>>& Expand() const noexcept {
        return expand_;
    }
    [[nodiscard]] const std::optional<std::string>& OrderBy() const noexcept { return order_by_; }
    [[nodiscard]] std::optional<uint32_t> Top() const noexcept { return top_; }
    [[nodiscard]] std::optional<uint32_t> Skip() const noexcept { return skip_; }
    [[nodiscard]] bool WithCount() const noexcept { return count_; }
    [[nodiscard]] bool CountOnly() const noexcept { return count_only_; }
    [[nodiscard]] const std::optional<std::string>& Apply() const noexcept { return apply_; }

    [[nodiscard]] bool IsKeyAccess() const noexcept { return key_.has_value(); }

    /// Serialize to the OData path + query string, relative to the service
    /// root. Never fails for a query that passed Build().
    ///   Resource('<key>')?$select=..&$expand=..
    ///   Resource/$count?$filter=..
    ///   Resource?$apply=..&$filter=..&$select=..&$expand=..&$orderby=..&$top=N&$skip=N&$count=true
    [[nodiscard]] std::string ToODataString() const;

private:
    friend class QueryBuilder;

    std::string resource_;
    std::optional<std::string> key_;
    std::optional<std::string> filter_;
    std::optional<std::vector<std::string>> select_;
    std::optional<std::vector<std::string>> expand_;
    std::optional<std::string> order_by_;
    std::optional<uint32_t> top_;
    std::optional<uint32_t> skip_;
    bool count_ = false;
    bool count_only_ = false;
    std::optional<std::string> apply_;
};

// ---------------------------------------------------------------------------
// QueryBuilder: fluent, last-write-wins accumulation of query parameters.
//
//   auto query = QueryBuilder("Property")
//                    .Filter("City eq 'Austin'")
//                    .Select({"ListingKey", "ListPrice"})
//                    .OrderBy("ListPrice", "desc")
//                    .Top(10)
//                    .Build();
//
// Key-access conflicts are detected once, in Build(), regardless of the
// order in which setters were called.
// ---------------------------------------------------------------------------
class QueryBuilder {
public:
    explicit QueryBuilder(std::string resource);

    /// Start a key-access (single entity) query.
    static QueryBuilder ByKey(std::string resource, std::string key);

    /// Opaque OData boolean expression, percent-encoded on output.
    QueryBuilder& Filter(std::string expression);
    /// Opaque aggregation expression for $apply.
    QueryBuilder& Apply(std::string expression);
    /// Stored as "<field> <direction>". The direction is not validated.
    QueryBuilder& OrderBy(std::string_view field, std::string_view direction);
    QueryBuilder& Select(std::vector<std::string> fields);
    QueryBuilder& Expand(std::vector<std::string> fields);
    QueryBuilder& Top(uint32_t n);
    QueryBuilder& Skip(uint32_t n);
    /// Embed the total count alongside the records ($count=true).
    QueryBuilder& WithCount();
    /// Request the /$count endpoint instead of records.
    QueryBuilder& Count();

    [[nodiscard]] Result<Query, Error> Build() const;

private:
    Query query_;
};

} // namespace reso_client
