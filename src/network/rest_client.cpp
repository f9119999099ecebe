// ============================================================================
// AEGIS TRADE CORE - REST Client Implementation
// ============================================================================
// Boost.Beast HTTPS client with request signing
// ============================================================================

#include "aegis/network/rest_client.hpp"

#include "aegis/exchange/binance/client.hpp"
#include "aegis/utils/logger.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <atomic>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace aegis::network {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// ============================================================================
// Request helpers
// ============================================================================

std::string url_encode(std::string_view value) {
    std::ostringstream escaped;
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

std::string build_query_string(const std::map<std::string, std::string>& params) {
    std::ostringstream ss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) ss << '&';
        ss << url_encode(key) << '=' << url_encode(value);
        first = false;
    }
    return ss.str();
}

namespace {

std::string host_from_url(std::string url) {
    if (url.rfind("https://", 0) == 0) {
        url = url.substr(8);
    }
    const auto pos = url.find('/');
    if (pos != std::string::npos) {
        url = url.substr(0, pos);
    }
    return url;
}

http::verb to_verb(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return http::verb::get;
        case HttpMethod::POST: return http::verb::post;
        case HttpMethod::DEL: return http::verb::delete_;
    }
    return http::verb::get;
}

}  // namespace

// ============================================================================
// REST Client Implementation
// ============================================================================

struct RestClient::Impl {
    using http_stream = beast::ssl_stream<beast::tcp_stream>;

    explicit Impl(const RestClientConfig& config)
        : config_(config)
        , ssl_context_(ssl::context::tlsv12_client)
        , host_(host_from_url(config.base_url))
        , limiter_(config.requests_per_minute, std::chrono::seconds(60))
        , rate_limit_remaining_(config.requests_per_minute) {
        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(config_.verify_tls ? ssl::verify_peer : ssl::verify_none);
    }

    HttpResponse request(const HttpRequest& req) {
        limiter_.acquire();

        try {
            net::io_context io_context;
            tcp::resolver resolver(io_context);
            http_stream stream(io_context, ssl_context_);

            const auto results = resolver.resolve(host_, "443");
            beast::get_lowest_layer(stream).expires_after(config_.request_timeout);
            beast::get_lowest_layer(stream).connect(results);

            if (!SSL_set_tlsext_host_name(stream.native_handle(), host_.c_str())) {
                throw beast::system_error(
                    beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
            }
            stream.handshake(ssl::stream_base::client);

            http::request<http::string_body> http_req;
            http_req.version(11);
            http_req.method(to_verb(req.method));

            std::string target = req.path;
            auto params = req.query_params;

            if (req.sign) {
                params["timestamp"] = std::to_string(to_epoch_ms(now()));
                params["recvWindow"] = std::to_string(req.recv_window);
                params["signature"] = exchange::binance::generate_signature(
                    config_.secret_key, build_query_string(params));
            }

            if (!params.empty()) {
                target += "?" + build_query_string(params);
            }
            http_req.target(target);

            http_req.set(http::field::host, host_);
            http_req.set(http::field::user_agent, config_.user_agent);
            if (!config_.api_key.empty()) {
                http_req.set("X-MBX-APIKEY", config_.api_key);
            }

            http::write(stream, http_req);

            beast::flat_buffer buffer;
            http::response<http::string_body> http_res;
            http::read(stream, buffer, http_res);

            HttpResponse response;
            response.status_code = static_cast<int>(http_res.result_int());
            response.body = http_res.body();
            response.received_at = now();

            for (const auto& header : http_res) {
                response.headers[std::string(header.name_string())] = std::string(header.value());
            }

            const auto used_it = response.headers.find("X-MBX-USED-WEIGHT-1M");
            if (used_it != response.headers.end()) {
                response.rate_limit_used = std::stoi(used_it->second);
                rate_limit_remaining_ = config_.requests_per_minute - response.rate_limit_used;
                if (rate_limit_remaining_ < config_.requests_per_minute / 10) {
                    LOG_WARN("Request weight nearly exhausted: {}/{} used", response.rate_limit_used,
                             config_.requests_per_minute);
                }
            }

            // Servers often close without close_notify; that is not a request failure
            beast::error_code ec;
            stream.shutdown(ec);
            if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
                LOG_DEBUG("TLS shutdown for {} ended with {}", host_, ec.message());
            }

            if (response.is_rate_limited()) {
                LOG_WARN("Rate limited on {} (status {})", req.path, response.status_code);
            }
            return response;

        } catch (const std::exception& e) {
            LOG_ERROR("Transport failure on {}: {}", req.path, e.what());
            HttpResponse error_response;
            error_response.status_code = -1;
            error_response.body = e.what();
            error_response.received_at = now();
            return error_response;
        }
    }

    RestClientConfig config_;
    ssl::context ssl_context_;
    std::string host_;
    RateLimiter limiter_;
    std::atomic<int> rate_limit_remaining_;
};

// ============================================================================
// RestClient Public Interface
// ============================================================================

RestClient::RestClient(const RestClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

RestClient::~RestClient() = default;

HttpResponse RestClient::request(const HttpRequest& request) {
    return impl_->request(request);
}

int RestClient::get_rate_limit_remaining() const {
    return impl_->rate_limit_remaining_.load();
}

}  // namespace aegis::network
