#include <aion_mcp/backend/backend_session.hpp>

#include <aion_mcp/core/log.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace aion_mcp {

namespace {

ErrorCategory CategoryFromHttpTransportError(httplib::Error error) {
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
        case httplib::Error::Read:
            return ErrorCategory::Timeout;
        case httplib::Error::SSLConnection:
        case httplib::Error::SSLLoadingCerts:
        case httplib::Error::SSLServerVerification:
            return ErrorCategory::Tls;
        default:
            return ErrorCategory::Connection;
    }
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie" ||
           lower_key == "x-api-key";
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

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        constexpr size_t kMaxBodyLog = 2000;
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) +
                                 "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct BackendSession::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string base_path;
    BackendSessionOptions options;

    Impl(const BackendUrl& base_url, const BackendSessionOptions& opts)
        : base_path(base_url.BasePath()), options(opts) {
        client = std::make_unique<httplib::Client>(base_url.Origin());

        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_write_timeout(opts.write_timeout);
        client->set_keep_alive(true);

        if (opts.api_key.has_value()) {
            client->set_bearer_token_auth(opts.api_key->Value());
        }

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (base_url.UseHttps() && !opts.tls_verify) {
            client->enable_server_certificate_verification(false);
        }
#endif
    }

    std::string FullPath(std::string_view path) const {
        if (path.empty() || path.front() != '/') {
            return base_path + "/" + std::string(path);
        }
        return base_path + std::string(path);
    }

    httplib::Headers BuildHeaders(const HttpHeaders& extra) const {
        httplib::Headers hdrs;
        hdrs.emplace("Accept", "application/json");
        hdrs.emplace("User-Agent", options.user_agent);
        for (const auto& [key, value] : extra) {
            hdrs.emplace(key, value);
        }
        return hdrs;
    }

    Result<HttpResponse, Error> Finish(const char* operation,
                                       const std::string& path,
                                       const httplib::Result& res) {
        if (!res) {
            const auto http_error = res.error();
            return Result<HttpResponse, Error>::Err(Error{
                operation, path, std::nullopt,
                "HTTP request failed: " + httplib::to_string(http_error),
                std::nullopt,
                CategoryFromHttpTransportError(http_error)});
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }

    Result<HttpResponse, Error> DoGet(std::string_view path,
                                      const HttpHeaders& extra_headers) {
        const auto full_path = FullPath(path);
        auto hdrs = BuildHeaders(extra_headers);
        LogInfo("http", "GET " + full_path);
        LogRequestHeaders(hdrs);
        auto res = client->Get(full_path, hdrs);
        return Finish("Get", full_path, res);
    }

    Result<HttpResponse, Error> DoPost(std::string_view path,
                                       std::string_view body,
                                       std::string_view content_type,
                                       const HttpHeaders& extra_headers) {
        const auto full_path = FullPath(path);
        auto hdrs = BuildHeaders(extra_headers);
        LogInfo("http", "POST " + full_path);
        LogRequestHeaders(hdrs);
        auto res = client->Post(full_path, hdrs, std::string(body),
                                std::string(content_type));
        return Finish("Post", full_path, res);
    }
};

// ---------------------------------------------------------------------------
// BackendSession
// ---------------------------------------------------------------------------
BackendSession::BackendSession(const BackendUrl& base_url,
                               const BackendSessionOptions& options)
    : impl_(std::make_unique<Impl>(base_url, options)) {}

BackendSession::~BackendSession() = default;

Result<HttpResponse, Error> BackendSession::Get(std::string_view path,
                                                const HttpHeaders& headers) {
    return impl_->DoGet(path, headers);
}

Result<HttpResponse, Error> BackendSession::Post(std::string_view path,
                                                 std::string_view body,
                                                 std::string_view content_type,
                                                 const HttpHeaders& headers) {
    return impl_->DoPost(path, body, content_type, headers);
}

} // namespace aion_mcp
