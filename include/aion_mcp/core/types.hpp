#pragma once

#include <aion_mcp/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace aion_mcp {

// ---------------------------------------------------------------------------
// BackendUrl: validated base URL of the backend API.
//
// Rules:
//   - Scheme is http:// or https:// (case-insensitive)
//   - Non-empty host; optional numeric port in 1..65535
//   - Optional base path; a trailing '/' is stripped
//   - No query string or fragment
// ---------------------------------------------------------------------------
class BackendUrl {
public:
    static Result<BackendUrl, std::string> Create(std::string_view url);

    // Normalized form, e.g. "https://api.example.com:8443/aion".
    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    [[nodiscard]] bool UseHttps() const noexcept { return use_https_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }

    // Path prefix prepended to every endpoint ("" or "/something").
    [[nodiscard]] const std::string& BasePath() const noexcept { return base_path_; }

    // "scheme://host:port", the form cpp-httplib clients are built from.
    [[nodiscard]] std::string Origin() const;

    bool operator==(const BackendUrl& other) const { return value_ == other.value_; }
    bool operator!=(const BackendUrl& other) const { return value_ != other.value_; }

private:
    BackendUrl(std::string value, bool use_https, std::string host,
               uint16_t port, std::string base_path)
        : value_(std::move(value)), use_https_(use_https),
          host_(std::move(host)), port_(port),
          base_path_(std::move(base_path)) {}

    std::string value_;
    bool use_https_ = false;
    std::string host_;
    uint16_t port_ = 80;
    std::string base_path_;
};

// ---------------------------------------------------------------------------
// ApiKey: bearer credential for the backend. Non-empty, printable ASCII,
// no whitespace (it is placed verbatim into an HTTP header).
// ---------------------------------------------------------------------------
class ApiKey {
public:
    static Result<ApiKey, std::string> Create(std::string_view key);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    // Safe for logs: first four characters followed by "...".
    [[nodiscard]] std::string Redacted() const;

    bool operator==(const ApiKey& other) const { return value_ == other.value_; }
    bool operator!=(const ApiKey& other) const { return value_ != other.value_; }

private:
    explicit ApiKey(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace aion_mcp
