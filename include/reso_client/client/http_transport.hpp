#pragma once

#include <reso_client/client/i_http_transport.hpp>

#include <chrono>
#include <memory>

namespace reso_client {

// ---------------------------------------------------------------------------
// HttpTransportOptions
// ---------------------------------------------------------------------------
struct HttpTransportOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{30};
    bool disable_tls_verify = false;
};

// ---------------------------------------------------------------------------
// HttplibTransport: IHttpTransport over cpp-httplib.
//
// Absolute URLs are split into origin and target; one httplib::Client is
// kept per origin so a replication walk reuses its connection even when
// the server hands out next links on another host. httplib stays out of
// this header (pimpl).
// ---------------------------------------------------------------------------
class HttplibTransport : public IHttpTransport {
public:
    explicit HttplibTransport(const HttpTransportOptions& options = {});
    ~HttplibTransport() override;

    HttplibTransport(const HttplibTransport&) = delete;
    HttplibTransport& operator=(const HttplibTransport&) = delete;
    HttplibTransport(HttplibTransport&&) = delete;
    HttplibTransport& operator=(HttplibTransport&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view url,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace reso_client
