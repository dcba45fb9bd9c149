#include <reso_client/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace reso_client {

std::string UrlEncode(std::string_view value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string UrlParts::Origin() const {
    const bool default_port = (scheme == "http" && port == 80) ||
                              (scheme == "https" && port == 443);
    std::string origin = scheme + "://" + host;
    if (!default_port) {
        origin += ":" + std::to_string(port);
    }
    return origin;
}

Result<UrlParts, Error> ParseAbsoluteUrl(std::string_view url) {
    auto invalid = [&](const std::string& why) {
        return Result<UrlParts, Error>::Err(
            Error::Config("Invalid URL (" + why + "): " + std::string(url)));
    };

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return invalid("missing scheme");
    }

    UrlParts parts;
    parts.scheme = std::string(url.substr(0, scheme_end));
    for (auto& c : parts.scheme) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (parts.scheme != "http" && parts.scheme != "https") {
        return invalid("unsupported scheme '" + parts.scheme + "'");
    }

    const auto host_start = scheme_end + 3;
    const auto target_start = url.find_first_of("/?", host_start);

    std::string_view authority;
    if (target_start == std::string_view::npos) {
        authority = url.substr(host_start);
        parts.target = "/";
    } else {
        authority = url.substr(host_start, target_start - host_start);
        parts.target = std::string(url.substr(target_start));
        if (parts.target.front() == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    const auto colon = authority.rfind(':');
    if (colon == std::string_view::npos) {
        parts.host = std::string(authority);
        parts.port = parts.scheme == "https" ? 443 : 80;
    } else {
        parts.host = std::string(authority.substr(0, colon));
        const auto port_text = authority.substr(colon + 1);
        if (port_text.empty() || port_text.size() > 5) {
            return invalid("bad port");
        }
        int port = 0;
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return invalid("bad port");
            }
            port = port * 10 + (c - '0');
        }
        if (port == 0 || port > 65535) {
            return invalid("bad port");
        }
        parts.port = port;
    }

    if (parts.host.empty()) {
        return invalid("empty host");
    }
    return Result<UrlParts, Error>::Ok(std::move(parts));
}

std::string TrimTrailingSlashes(std::string_view url) {
    auto end = url.find_last_not_of('/');
    if (end == std::string_view::npos) {
        return {};
    }
    return std::string(url.substr(0, end + 1));
}

std::string JoinList(const std::vector<std::string>& parts, char separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

std::string JoinUrl(std::string_view base, std::string_view path) {
    auto joined = TrimTrailingSlashes(base);
    while (!path.empty() && path.front() == '/') {
        path.remove_prefix(1);
    }
    joined += '/';
    joined += path;
    return joined;
}

} // namespace reso_client
