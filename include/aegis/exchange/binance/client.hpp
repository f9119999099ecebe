#pragma once
// ============================================================================
// AEGIS TRADE CORE - Binance Futures Client
// ============================================================================
// USDT-M perpetual futures gateway over the Binance REST API
// Supports both Testnet and Mainnet environments
// ============================================================================

#include "aegis/exchange/gateway.hpp"
#include "aegis/network/rest_client.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace aegis::exchange::binance {

// ============================================================================
// Configuration
// ============================================================================

struct BinanceConfig {
    std::string api_key;
    std::string secret_key;
    bool testnet = true;

    std::string mainnet_rest_url = "https://fapi.binance.com";
    std::string testnet_rest_url = "https://testnet.binancefuture.com";

    int requests_per_minute = 1200;
    int64_t recv_window_ms = 5000;

    [[nodiscard]] const std::string& rest_url() const {
        return testnet ? testnet_rest_url : mainnet_rest_url;
    }
};

// ============================================================================
// Binance Client
// ============================================================================

/// Protection orders live on the algo order service; their ids carry this prefix
inline constexpr std::string_view ALGO_ORDER_PREFIX = "algo-";

class BinanceClient : public IExchangeGateway {
public:
    explicit BinanceClient(const BinanceConfig& config);

    /// Use a caller-supplied transport (replayed responses, proxies)
    BinanceClient(const BinanceConfig& config, std::unique_ptr<network::IRestClient> rest_client);

    ~BinanceClient() override;

    BinanceClient(const BinanceClient&) = delete;
    BinanceClient& operator=(const BinanceClient&) = delete;

    [[nodiscard]] Balance fetch_balance(std::string_view asset) override;
    [[nodiscard]] std::vector<LivePosition> fetch_positions(
        std::span<const Instrument> instruments) override;

    [[nodiscard]] Ticker fetch_ticker(Instrument instrument) override;
    [[nodiscard]] PriceSeries fetch_ohlcv(Instrument instrument,
                                          std::string_view timeframe,
                                          int limit) override;
    [[nodiscard]] OpenInterest fetch_open_interest(Instrument instrument) override;
    [[nodiscard]] FundingRate fetch_funding_rate(Instrument instrument) override;

    void set_leverage(Instrument instrument, int leverage) override;
    [[nodiscard]] OrderResult create_market_order(Instrument instrument,
                                                  Side side,
                                                  Quantity amount,
                                                  bool reduce_only) override;
    [[nodiscard]] OrderResult create_protection_order(Instrument instrument,
                                                      OrderType type,
                                                      Side side,
                                                      Price stop_price,
                                                      bool reduce_only) override;
    [[nodiscard]] std::vector<OpenOrder> fetch_open_orders(Instrument instrument) override;
    void cancel_order(const std::string& order_id, Instrument instrument) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Helpers
// ============================================================================

/// Decimal rendering without trailing zeros, as the API expects
[[nodiscard]] std::string format_number(double value);

// ============================================================================
// HMAC-SHA256 Signing Utility
// ============================================================================

/// Sign a message using HMAC-SHA256, hex encoded
[[nodiscard]] std::string hmac_sha256(std::string_view key, std::string_view message);

/// Generate signature for Binance API request
[[nodiscard]] std::string generate_signature(std::string_view secret_key,
                                             std::string_view query_string);

}  // namespace aegis::exchange::binance
