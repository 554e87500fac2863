#include <aion_mcp/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace aion_mcp {

namespace {

std::string ToLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool IsAllDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isdigit(c) != 0;
    });
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BackendUrl
// ---------------------------------------------------------------------------
Result<BackendUrl, std::string> BackendUrl::Create(std::string_view url) {
    using R = Result<BackendUrl, std::string>;

    if (url.empty()) {
        return R::Err("Backend URL must not be empty");
    }

    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return R::Err("Backend URL must start with http:// or https://");
    }
    const auto scheme = ToLower(url.substr(0, scheme_end));
    bool use_https = false;
    if (scheme == "https") {
        use_https = true;
    } else if (scheme != "http") {
        return R::Err("Unsupported backend URL scheme '" + scheme +
                      "' (expected http or https)");
    }

    auto rest = url.substr(scheme_end + 3);
    if (rest.find_first_of("?#") != std::string_view::npos) {
        return R::Err("Backend URL must not contain a query string or fragment");
    }

    const auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    std::string path = path_start == std::string_view::npos
        ? std::string()
        : std::string(rest.substr(path_start));
    while (!path.empty() && path.back() == '/') {
        path.pop_back();
    }

    if (authority.find('@') != std::string_view::npos) {
        return R::Err("Backend URL must not embed credentials; use the API key");
    }

    std::string host;
    uint16_t port = use_https ? 443 : 80;
    bool explicit_port = false;

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        // IPv6 literal: [::1]:8001
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return R::Err("Backend URL has an unterminated IPv6 host");
        }
        host = std::string(authority.substr(0, close + 1));
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return R::Err("Backend URL has garbage after the IPv6 host");
            }
            port_text = after.substr(1);
            explicit_port = true;
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = std::string(authority.substr(0, colon));
            port_text = authority.substr(colon + 1);
            explicit_port = true;
        } else {
            host = std::string(authority);
        }
    }

    if (host.empty()) {
        return R::Err("Backend URL must have a host");
    }

    if (explicit_port) {
        if (!IsAllDigits(port_text) || port_text.size() > 5) {
            return R::Err("Backend URL port must be numeric");
        }
        const auto value = std::stoul(std::string(port_text));
        if (value == 0 || value > 65535) {
            return R::Err("Backend URL port must be between 1 and 65535");
        }
        port = static_cast<uint16_t>(value);
    }

    std::string normalized = scheme + "://" + ToLower(host);
    if (explicit_port) {
        normalized += ":" + std::to_string(port);
    }
    normalized += path;

    return R::Ok(BackendUrl(std::move(normalized), use_https, ToLower(host),
                            port, std::move(path)));
}

std::string BackendUrl::Origin() const {
    return std::string(use_https_ ? "https://" : "http://") + host_ + ":" +
           std::to_string(port_);
}

// ---------------------------------------------------------------------------
// ApiKey
// ---------------------------------------------------------------------------
Result<ApiKey, std::string> ApiKey::Create(std::string_view key) {
    if (key.empty()) {
        return Result<ApiKey, std::string>::Err("API key must not be empty");
    }
    const bool printable = std::all_of(key.begin(), key.end(), [](unsigned char c) {
        return c > 0x20 && c < 0x7f;
    });
    if (!printable) {
        return Result<ApiKey, std::string>::Err(
            "API key must contain only printable ASCII without whitespace");
    }
    return Result<ApiKey, std::string>::Ok(ApiKey(std::string(key)));
}

std::string ApiKey::Redacted() const {
    if (value_.size() <= 8) {
        return "****";
    }
    return value_.substr(0, 4) + "...";
}

} // namespace aion_mcp
