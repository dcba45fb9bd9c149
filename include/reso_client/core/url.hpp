#pragma once

#include <reso_client/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace reso_client {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// ---------------------------------------------------------------------------
// UrlParts: an absolute http(s) URL split for the HTTP transport.
//   "https://api.mls.com:8443/odata/Property?$top=1"
//     origin = "https://api.mls.com:8443"   target = "/odata/Property?$top=1"
// ---------------------------------------------------------------------------
struct UrlParts {
    std::string scheme;  // "http" or "https"
    std::string host;
    int port = 0;        // explicit port, or 80 / 443 by scheme
    std::string target;  // path + query, always starts with '/'

    [[nodiscard]] std::string Origin() const;
};

// Split an absolute URL. Only http and https are accepted.
[[nodiscard]] Result<UrlParts, Error> ParseAbsoluteUrl(std::string_view url);

// Remove every trailing '/' from a base URL.
std::string TrimTrailingSlashes(std::string_view url);

// Join parts with a single separator: ',' for $select/$expand field lists,
// '&' for query options. Empty parts are kept.
std::string JoinList(const std::vector<std::string>& parts, char separator);

// Join a base URL and a relative path with exactly one '/' between them.
std::string JoinUrl(std::string_view base, std::string_view path);

} // namespace reso_client
