#include <reso_client/odata/query.hpp>

#include <reso_client/core/url.hpp>

namespace reso_client {

namespace {

Error KeyConflict(const char* option) {
    return Error::InvalidQuery(
        std::string("Key access cannot be used with ") + option);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Query
// ---------------------------------------------------------------------------
Query::Query(std::string resource) : resource_(std::move(resource)) {}

std::string Query::ToODataString() const {
    if (key_.has_value()) {
        std::string out = resource_ + "('" + UrlEncode(*key_) + "')";
        std::vector<std::string> params;
        if (select_.has_value()) {
            params.push_back("$select=" + JoinList(*select_, ','));
        }
        if (expand_.has_value()) {
            params.push_back("$expand=" + JoinList(*expand_, ','));
        }
        if (!params.empty()) {
            out += '?';
            out += JoinList(params, '&');
        }
        return out;
    }

    // Count-only: everything except the filter is ignored.
    if (count_only_) {
        std::string out = resource_ + "/$count";
        if (filter_.has_value()) {
            out += "?$filter=" + UrlEncode(*filter_);
        }
        return out;
    }

    std::vector<std::string> params;
    if (apply_.has_value()) {
        params.push_back("$apply=" + UrlEncode(*apply_));
    }
    if (filter_.has_value()) {
        params.push_back("$filter=" + UrlEncode(*filter_));
    }
    if (select_.has_value()) {
        params.push_back("$select=" + JoinList(*select_, ','));
    }
    if (expand_.has_value()) {
        params.push_back("$expand=" + JoinList(*expand_, ','));
    }
    if (order_by_.has_value()) {
        params.push_back("$orderby=" + UrlEncode(*order_by_));
    }
    if (top_.has_value()) {
        params.push_back("$top=" + std::to_string(*top_));
    }
    if (skip_.has_value()) {
        params.push_back("$skip=" + std::to_string(*skip_));
    }
    if (count_) {
        params.push_back("$count=true");
    }

    if (params.empty()) {
        return resource_;
    }
    return resource_ + "?" + JoinList(params, '&');
}

// ---------------------------------------------------------------------------
// QueryBuilder
// ---------------------------------------------------------------------------
QueryBuilder::QueryBuilder(std::string resource) : query_(std::move(resource)) {}

QueryBuilder QueryBuilder::ByKey(std::string resource, std::string key) {
    QueryBuilder builder(std::move(resource));
    builder.query_.key_ = std::move(key);
    return builder;
}

QueryBuilder& QueryBuilder::Filter(std::string expression) {
    query_.filter_ = std::move(expression);
    return *this;
}

QueryBuilder& QueryBuilder::Apply(std::string expression) {
    query_.apply_ = std::move(expression);
    return *this;
}

QueryBuilder& QueryBuilder::OrderBy(std::string_view field, std::string_view direction) {
    std::string order(field);
    order += ' ';
    order += direction;
    query_.order_by_ = std::move(order);
    return *this;
}

QueryBuilder& QueryBuilder::Select(std::vector<std::string> fields) {
    query_.select_ = std::move(fields);
    return *this;
}

QueryBuilder& QueryBuilder::Expand(std::vector<std::string> fields) {
    query_.expand_ = std::move(fields);
    return *this;
}

QueryBuilder& QueryBuilder::Top(uint32_t n) {
    query_.top_ = n;
    return *this;
}

QueryBuilder& QueryBuilder::Skip(uint32_t n) {
    query_.skip_ = n;
    return *this;
}

QueryBuilder& QueryBuilder::WithCount() {
    query_.count_ = true;
    return *this;
}

QueryBuilder& QueryBuilder::Count() {
    query_.count_only_ = true;
    return *this;
}

Result<Query, Error> QueryBuilder::Build() const {
    if (query_.resource_.empty()) {
        return Result<Query, Error>::Err(
            Error::InvalidQuery("Resource name cannot be empty"));
    }

    if (query_.key_.has_value()) {
        if (query_.filter_.has_value()) {
            return Result<Query, Error>::Err(KeyConflict("$filter"));
        }
        if (query_.top_.has_value()) {
            return Result<Query, Error>::Err(KeyConflict("$top"));
        }
        if (query_.skip_.has_value()) {
            return Result<Query, Error>::Err(KeyConflict("$skip"));
        }
        if (query_.order_by_.has_value()) {
            return Result<Query, Error>::Err(KeyConflict("$orderby"));
        }
        if (query_.apply_.has_value()) {
            return Result<Query, Error>::Err(KeyConflict("$apply"));
        }
        if (query_.count_ || query_.count_only_) {
            return Result<Query, Error>::Err(KeyConflict("$count"));
        }
    }

    return Result<Query, Error>::Ok(query_);
}

} // namespace reso_client
