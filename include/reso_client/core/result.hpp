#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace reso_client {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }

    // -- Access (const&) ----------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    // -- Access (&&) --------------------------------------------------------

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorKind: the closed set of failures a RESO client call can produce.
// ---------------------------------------------------------------------------
enum class ErrorKind {
    Config,
    Network,
    Unauthorized,  // 401
    Forbidden,     // 403
    NotFound,      // 404
    RateLimited,   // 429
    ServerError,   // 5xx
    ODataError,    // any other non-success status
    Parse,
    InvalidQuery,
};

// ---------------------------------------------------------------------------
// Error: structured error for RESO Web API operations.
//
// The status-carrying kinds (Unauthorized .. ODataError) always have
// status_code set; Config, Network, Parse and InvalidQuery never do.
// operation/endpoint are optional context and do not affect the kind.
// ---------------------------------------------------------------------------
struct Error {
    ErrorKind kind = ErrorKind::Config;
    std::string message;
    std::optional<int> status_code;
    std::string operation;
    std::string endpoint;

    // -- Factories ----------------------------------------------------------

    static Error Config(std::string message);
    static Error Network(std::string message);
    static Error Parse(std::string message);
    static Error InvalidQuery(std::string message);

    /// Classify a non-success HTTP response. The message comes from an
    /// OData error envelope when the body is one, otherwise from the raw
    /// (possibly truncated) body.
    static Error FromHttpStatus(int status_code, const std::string& response_body);

    /// Extract a human-readable message from an error response body.
    ///   {"error":{"code":"X","message":"Y"}}  ->  "Y (code: X)"
    ///   {"error":{"message":"Y"}}             ->  "Y"
    ///   anything else                         ->  body, cut at 500 bytes
    static std::string ParseErrorBody(const std::string& body);

    // -- Context ------------------------------------------------------------

    /// Return a copy annotated with the failing operation and endpoint.
    [[nodiscard]] Error WithContext(std::string op, std::string ep) const;

    // -- Presentation -------------------------------------------------------

    [[nodiscard]] int ExitCode() const;
    [[nodiscard]] std::string KindName() const;
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return kind == other.kind &&
               message == other.message &&
               status_code == other.status_code &&
               operation == other.operation &&
               endpoint == other.endpoint;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace reso_client
