#include <reso_client/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace reso_client {

namespace {

constexpr std::size_t kMaxRawBodyMessage = 500;
constexpr const char* kTruncatedSuffix = "... (truncated)";

Error MakeError(ErrorKind kind, std::string message,
                std::optional<int> status_code = std::nullopt) {
    Error error;
    error.kind = kind;
    error.message = std::move(message);
    error.status_code = status_code;
    return error;
}

// Parse the OData error envelope {"error": {"code"?: "...", "message": "..."}}.
// Returns nullopt when the body is not JSON or does not have that shape.
std::optional<std::string> ExtractODataErrorMessage(const std::string& body) {
    auto doc = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) return std::nullopt;

    auto error_it = doc.find("error");
    if (error_it == doc.end() || !error_it->is_object()) return std::nullopt;

    auto message_it = error_it->find("message");
    if (message_it == error_it->end() || !message_it->is_string()) {
        return std::nullopt;
    }

    std::string code;
    auto code_it = error_it->find("code");
    if (code_it != error_it->end()) {
        if (!code_it->is_string()) return std::nullopt;
        code = code_it->get<std::string>();
    }

    auto message = message_it->get<std::string>();
    if (!code.empty()) {
        return message + " (code: " + code + ")";
    }
    return message;
}

// Cut at max_bytes without splitting a UTF-8 multi-byte sequence.
std::string TruncateBody(const std::string& body, std::size_t max_bytes) {
    if (body.size() <= max_bytes) return body;
    std::size_t cut = max_bytes;
    while (cut > 0 &&
           (static_cast<unsigned char>(body[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return body.substr(0, cut) + kTruncatedSuffix;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Factories
// ---------------------------------------------------------------------------
Error Error::Config(std::string message) {
    return MakeError(ErrorKind::Config, std::move(message));
}

Error Error::Network(std::string message) {
    return MakeError(ErrorKind::Network, std::move(message));
}

Error Error::Parse(std::string message) {
    return MakeError(ErrorKind::Parse, std::move(message));
}

Error Error::InvalidQuery(std::string message) {
    return MakeError(ErrorKind::InvalidQuery, std::move(message));
}

std::string Error::ParseErrorBody(const std::string& body) {
    if (auto message = ExtractODataErrorMessage(body)) {
        return *message;
    }
    return TruncateBody(body, kMaxRawBodyMessage);
}

Error Error::FromHttpStatus(int status_code, const std::string& response_body) {
    auto message = ParseErrorBody(response_body);

    ErrorKind kind;
    switch (status_code) {
        case 401: kind = ErrorKind::Unauthorized; break;
        case 403: kind = ErrorKind::Forbidden;    break;
        case 404: kind = ErrorKind::NotFound;     break;
        case 429: kind = ErrorKind::RateLimited;  break;
        default:
            kind = (status_code >= 500 && status_code <= 599)
                ? ErrorKind::ServerError
                : ErrorKind::ODataError;
            break;
    }

    return MakeError(kind, std::move(message), status_code);
}

Error Error::WithContext(std::string op, std::string ep) const {
    Error copy = *this;
    copy.operation = std::move(op);
    copy.endpoint = std::move(ep);
    return copy;
}

// ---------------------------------------------------------------------------
// Presentation
// ---------------------------------------------------------------------------
int Error::ExitCode() const {
    switch (kind) {
        case ErrorKind::Config:       return 2;
        case ErrorKind::Network:      return 3;
        case ErrorKind::Unauthorized: return 4;
        case ErrorKind::Forbidden:    return 4;
        case ErrorKind::NotFound:     return 5;
        case ErrorKind::RateLimited:  return 6;
        case ErrorKind::ServerError:  return 7;
        case ErrorKind::ODataError:   return 8;
        case ErrorKind::Parse:        return 9;
        case ErrorKind::InvalidQuery: return 10;
    }
    return 99;
}

std::string Error::KindName() const {
    switch (kind) {
        case ErrorKind::Config:       return "config";
        case ErrorKind::Network:      return "network";
        case ErrorKind::Unauthorized: return "unauthorized";
        case ErrorKind::Forbidden:    return "forbidden";
        case ErrorKind::NotFound:     return "not_found";
        case ErrorKind::RateLimited:  return "rate_limited";
        case ErrorKind::ServerError:  return "server_error";
        case ErrorKind::ODataError:   return "odata_error";
        case ErrorKind::Parse:        return "parse";
        case ErrorKind::InvalidQuery: return "invalid_query";
    }
    return "unknown";
}

std::string Error::ToString() const {
    const int status = status_code.value_or(0);
    std::ostringstream oss;
    switch (kind) {
        case ErrorKind::Config:
            oss << "Configuration error: " << message;
            break;
        case ErrorKind::Network:
            oss << "Network error: " << message;
            break;
        case ErrorKind::Unauthorized:
            oss << "Unauthorized (" << status << "): " << message;
            break;
        case ErrorKind::Forbidden:
            oss << "Forbidden (" << status << "): " << message;
            break;
        case ErrorKind::NotFound:
            oss << "Not Found (" << status << "): " << message;
            break;
        case ErrorKind::RateLimited:
            oss << "Rate Limited (" << status << "): " << message;
            break;
        case ErrorKind::ServerError:
            oss << "Server Error (" << status << "): " << message;
            break;
        case ErrorKind::ODataError:
            oss << "OData error (" << status << "): " << message;
            break;
        case ErrorKind::Parse:
            oss << "Parse error: " << message;
            break;
        case ErrorKind::InvalidQuery:
            oss << "Invalid query: " << message;
            break;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json detail;
    detail["kind"] = KindName();
    detail["message"] = message;
    if (status_code.has_value()) {
        detail["status_code"] = *status_code;
    }
    if (!operation.empty()) {
        detail["operation"] = operation;
    }
    if (!endpoint.empty()) {
        detail["endpoint"] = endpoint;
    }
    detail["exit_code"] = ExitCode();
    return nlohmann::json{{"error", detail}}.dump();
}

} // namespace reso_client
