#pragma once

#include <reso_client/core/result.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reso_client {

// ---------------------------------------------------------------------------
// HttpHeaders: header name/value pairs. Names keep the server's spelling;
// look them up with FindHeaderCi. A header the server repeats (several
// Link lines, say) keeps one entry per occurrence, in arrival order.
// ---------------------------------------------------------------------------
using HttpHeaders = std::multimap<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: status, headers and body of one completed request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;

    [[nodiscard]] bool IsSuccess() const noexcept {
        return status_code >= 200 && status_code <= 299;
    }
};

/// Case-insensitive header lookup. Returns the first occurrence.
[[nodiscard]] std::optional<std::string> FindHeaderCi(const HttpHeaders& headers,
                                                      std::string_view name);

/// Every value of a header, case-insensitively, in arrival order.
[[nodiscard]] std::vector<std::string> FindHeadersCi(const HttpHeaders& headers,
                                                     std::string_view name);

// ---------------------------------------------------------------------------
// IHttpTransport: the one seam between ResoClient and the network.
//
// Get() takes an absolute URL. It returns Err(Network) only when no HTTP
// status was obtained; every received response, including 4xx/5xx, comes
// back as Ok so the caller can classify it. Tests use MockHttpTransport.
// ---------------------------------------------------------------------------
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    IHttpTransport(const IHttpTransport&) = delete;
    IHttpTransport& operator=(const IHttpTransport&) = delete;
    IHttpTransport(IHttpTransport&&) = delete;
    IHttpTransport& operator=(IHttpTransport&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view url,
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpTransport() = default;
};

} // namespace reso_client
