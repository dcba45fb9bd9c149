#pragma once

#include <reso_client/client/i_http_transport.hpp>

#include <deque>
#include <string>
#include <vector>

namespace reso_client {
namespace testing {

// ---------------------------------------------------------------------------
// MockHttpTransport: hand-written mock for offline unit testing.
//
// Usage:
//   MockHttpTransport mock;
//   mock.EnqueueGet(Result<HttpResponse, Error>::Ok({200, {}, R"({"value":[]})"}));
//   auto result = mock.Get("https://api.mls.com/odata/Property", {});
//   CHECK(mock.GetCallCount() == 1);
//   CHECK(mock.GetCalls()[0].url == "https://api.mls.com/odata/Property");
//
// Responses are consumed FIFO. An empty queue yields a Network error naming
// the URL instead of crashing.
// ---------------------------------------------------------------------------

struct GetCall {
    std::string url;
    HttpHeaders headers;
};

class MockHttpTransport : public IHttpTransport {
public:
    MockHttpTransport() = default;

    void EnqueueGet(Result<HttpResponse, Error> response) {
        responses_.push_back(std::move(response));
    }

    // Shorthand for a received response.
    void EnqueueResponse(int status, std::string body, HttpHeaders headers = {}) {
        responses_.push_back(Result<HttpResponse, Error>::Ok(
            HttpResponse{status, std::move(headers), std::move(body)}));
    }

    [[nodiscard]] const std::vector<GetCall>& GetCalls() const noexcept {
        return calls_;
    }
    [[nodiscard]] size_t GetCallCount() const noexcept {
        return calls_.size();
    }
    [[nodiscard]] size_t PendingResponses() const noexcept {
        return responses_.size();
    }

    void Reset() {
        responses_.clear();
        calls_.clear();
    }

    Result<HttpResponse, Error> Get(std::string_view url,
                                    const HttpHeaders& headers) override {
        calls_.push_back({std::string(url), headers});
        if (responses_.empty()) {
            return Result<HttpResponse, Error>::Err(Error::Network(
                "MockHttpTransport: no responses enqueued for " + std::string(url)));
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

private:
    std::deque<Result<HttpResponse, Error>> responses_;
    std::vector<GetCall> calls_;
};

} // namespace testing
} // namespace reso_client
