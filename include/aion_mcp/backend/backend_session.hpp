#pragma once

#include <aion_mcp/backend/i_backend_session.hpp>
#include <aion_mcp/core/types.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace aion_mcp {

// ---------------------------------------------------------------------------
// BackendSessionOptions: transport configuration for the backend session.
// ---------------------------------------------------------------------------
struct BackendSessionOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{60};
    std::chrono::seconds write_timeout{60};
    bool tls_verify = true;
    std::optional<ApiKey> api_key;
    std::string user_agent = "aion-mcp";
};

// ---------------------------------------------------------------------------
// BackendSession: concrete IBackendSession using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header. One client is
// held for the process lifetime and reuses its connection (keep-alive).
//
// Features:
//   - Bearer auth on every request when an API key is configured
//   - Base path of the backend URL prepended to every request path
//   - Connect/read/write timeouts
//   - TLS: optional disable of certificate verification
// ---------------------------------------------------------------------------
class BackendSession : public IBackendSession {
public:
    BackendSession(const BackendUrl& base_url,
                   const BackendSessionOptions& options = {});

    ~BackendSession() override;

    BackendSession(const BackendSession&) = delete;
    BackendSession& operator=(const BackendSession&) = delete;
    BackendSession(BackendSession&&) = delete;
    BackendSession& operator=(BackendSession&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace aion_mcp
