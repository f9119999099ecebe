#pragma once
// ============================================================================
// AEGIS TRADE CORE - REST Client
// ============================================================================
// Blocking HTTPS client for the exchange REST API
// Features: request signing, client-side rate limiting
// ============================================================================

#include "aegis/core/types.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace aegis::network {

// ============================================================================
// HTTP Types
// ============================================================================

enum class HttpMethod {
    GET,
    POST,
    DEL
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string path;
    // Futures endpoints take every parameter in the query string
    std::map<std::string, std::string> query_params;

    // Signed requests get timestamp, recvWindow and signature appended
    bool sign = false;
    int64_t recv_window = 5000;  // milliseconds
};

struct HttpResponse {
    int status_code = 0;  // -1 on transport failure, body holds the reason
    std::map<std::string, std::string> headers;
    std::string body;
    Timestamp received_at;

    int rate_limit_used = 0;

    [[nodiscard]] bool is_success() const { return status_code >= 200 && status_code < 300; }
    [[nodiscard]] bool is_rate_limited() const { return status_code == 429 || status_code == 418; }
};

// ============================================================================
// REST Client Configuration
// ============================================================================

struct RestClientConfig {
    std::string base_url = "https://fapi.binance.com";
    std::string api_key;
    std::string secret_key;

    int requests_per_minute = 1200;  // Binance weight limit
    std::chrono::seconds request_timeout{10};  // connect + write + read
    bool verify_tls = true;
    std::string user_agent = "AegisTradeCore/1.0";
};

// ============================================================================
// REST Client Interface
// ============================================================================

class IRestClient {
public:
    virtual ~IRestClient() = default;

    /// Execute request synchronously; transport failures come back as status -1
    [[nodiscard]] virtual HttpResponse request(const HttpRequest& request) = 0;

    [[nodiscard]] virtual int get_rate_limit_remaining() const = 0;
};

// ============================================================================
// REST Client Implementation
// ============================================================================

class RestClient : public IRestClient {
public:
    explicit RestClient(const RestClientConfig& config);
    ~RestClient() override;

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    [[nodiscard]] HttpResponse request(const HttpRequest& request) override;

    [[nodiscard]] int get_rate_limit_remaining() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Request helpers
// ============================================================================

/// RFC 3986 percent-encoding of a query component
[[nodiscard]] std::string url_encode(std::string_view value);

/// key=value pairs joined with '&' in map order
[[nodiscard]] std::string build_query_string(const std::map<std::string, std::string>& params);

// ============================================================================
// Rate Limiter
// ============================================================================

class RateLimiter {
public:
    RateLimiter(int max_requests, std::chrono::seconds window);
    ~RateLimiter();

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /// Try to acquire a permit. Returns true if allowed.
    [[nodiscard]] bool try_acquire();

    /// Wait until a permit is available, then acquire.
    void acquire();

    [[nodiscard]] int remaining() const;

    [[nodiscard]] std::chrono::milliseconds time_until_reset() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace aegis::network
