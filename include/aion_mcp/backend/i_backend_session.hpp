#pragma once

#include <aion_mcp/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace aion_mcp {

// ---------------------------------------------------------------------------
// HttpHeaders: key-value pairs for HTTP headers. Header names are stored as
// received; callers compare case-insensitively where it matters.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request that reached the backend.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IBackendSession: abstract HTTP session to the backend API.
//
// Paths are relative to the configured backend base URL. A returned Err means
// the request never produced an HTTP response (connection refused, timeout,
// TLS failure); any HTTP status, including 4xx/5xx, is an Ok response.
//
// Methods return Result<T, Error> and never throw on expected failures.
// ---------------------------------------------------------------------------
class IBackendSession {
public:
    virtual ~IBackendSession() = default;

    IBackendSession(const IBackendSession&) = delete;
    IBackendSession& operator=(const IBackendSession&) = delete;
    IBackendSession(IBackendSession&&) = delete;
    IBackendSession& operator=(IBackendSession&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

protected:
    IBackendSession() = default;
};

} // namespace aion_mcp
