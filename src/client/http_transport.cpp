#include <reso_client/client/http_transport.hpp>

#include <reso_client/core/log.hpp>
#include <reso_client/core/url.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace reso_client {

namespace {

constexpr size_t kMaxBodyLog = 2000;

bool IEquals(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i) {
        const auto lc = static_cast<unsigned char>(lhs[i]);
        const auto rc = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(lc) != std::tolower(rc)) {
            return false;
        }
    }
    return true;
}

bool IsSensitiveHeader(std::string_view key) {
    return IEquals(key, "authorization") ||
           IEquals(key, "cookie") ||
           IEquals(key, "set-cookie");
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result.emplace(key, value);
    }
    return result;
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& headers) {
    httplib::Headers hdrs;
    for (const auto& [key, value] : headers) {
        hdrs.emplace(key, value);
    }
    return hdrs;
}

void LogRequestHeaders(const httplib::Headers& hdrs) {
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  > " + k + ": <redacted>");
        } else {
            LogDebug("http", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const httplib::Headers& hdrs, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  < " + k + ": <redacted>");
        } else {
            LogDebug("http", "  < " + k + ": " + v);
        }
    }
    if (status >= 400 && !body.empty()) {
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

std::optional<std::string> FindHeaderCi(const HttpHeaders& headers,
                                        std::string_view name) {
    for (const auto& [k, v] : headers) {
        if (IEquals(k, name)) {
            return v;
        }
    }
    return std::nullopt;
}

std::vector<std::string> FindHeadersCi(const HttpHeaders& headers,
                                       std::string_view name) {
    std::vector<std::string> values;
    for (const auto& [k, v] : headers) {
        if (IEquals(k, name)) {
            values.push_back(v);
        }
    }
    return values;
}

// ---------------------------------------------------------------------------
// Impl: one httplib::Client per origin.
// ---------------------------------------------------------------------------
struct HttplibTransport::Impl {
    HttpTransportOptions options;
    std::map<std::string, std::unique_ptr<httplib::Client>> clients;

    explicit Impl(const HttpTransportOptions& opts) : options(opts) {}

    httplib::Client& ClientFor(const UrlParts& parts) {
        const auto origin = parts.Origin();
        auto it = clients.find(origin);
        if (it != clients.end()) {
            return *it->second;
        }

        auto client = std::make_unique<httplib::Client>(origin);
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_follow_location(true);
        if (parts.scheme == "https" && options.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
        LogDebug("http", "new connection to " + origin);
        auto& ref = *client;
        clients.emplace(origin, std::move(client));
        return ref;
    }
};

HttplibTransport::HttplibTransport(const HttpTransportOptions& options)
    : impl_(std::make_unique<Impl>(options)) {}

HttplibTransport::~HttplibTransport() = default;

Result<HttpResponse, Error> HttplibTransport::Get(std::string_view url,
                                                  const HttpHeaders& headers) {
    auto parts = ParseAbsoluteUrl(url);
    if (parts.IsErr()) {
        return Result<HttpResponse, Error>::Err(parts.Error());
    }

    auto& client = impl_->ClientFor(parts.Value());
    auto hdrs = ToHttplibHeaders(headers);

    LogInfo("http", "GET " + std::string(url));
    LogRequestHeaders(hdrs);

    auto res = client.Get(parts.Value().target, hdrs);
    if (!res) {
        return Result<HttpResponse, Error>::Err(
            Error::Network("HTTP request failed: " + httplib::to_string(res.error()))
                .WithContext("GET", std::string(url)));
    }

    LogResponse(res->status, res->headers, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace reso_client
