#pragma once
// ============================================================================
// AEGIS TRADE CORE - Exchange Gateway
// ============================================================================
// Narrow client-side contract the core depends on. Every call is blocking
// and reports failures by throwing GatewayError; no call returns a silent
// default.
// ============================================================================

#include "aegis/core/types.hpp"

#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace aegis::exchange {

// ============================================================================
// Errors
// ============================================================================

/// Network, rate-limit, validation or rejected-order failure from the exchange
class GatewayError : public std::runtime_error {
public:
    explicit GatewayError(const std::string& message, int status_code = 0)
        : std::runtime_error(message), status_code_(status_code) {}

    /// HTTP status, -1 for transport failures, 0 when not applicable
    [[nodiscard]] int status_code() const noexcept { return status_code_; }

    [[nodiscard]] bool is_rate_limited() const noexcept {
        return status_code_ == 429 || status_code_ == 418;
    }

private:
    int status_code_;
};

// ============================================================================
// Gateway Types
// ============================================================================

struct Balance {
    std::string asset;
    double free = 0.0;   // available for new margin
    double total = 0.0;  // wallet balance + unrealized P&L
};

struct LivePosition {
    Instrument instrument = Instrument::BTC;
    Side side = Side::Buy;
    double contracts = 0.0;  // absolute size
    double entry_price = 0.0;
    double mark_price = 0.0;
    double liquidation_price = 0.0;
    double notional = 0.0;
    double initial_margin = 0.0;
    double unrealized_pnl = 0.0;
    double leverage = 0.0;
};

struct Ticker {
    Instrument instrument = Instrument::BTC;
    double last = 0.0;
    Timestamp timestamp;
};

struct OpenInterest {
    Instrument instrument = Instrument::BTC;
    double amount = 0.0;
    Timestamp timestamp;
};

struct FundingRate {
    Instrument instrument = Instrument::BTC;
    double rate = 0.0;
    Timestamp next_funding_time;
};

struct OrderResult {
    std::string order_id;
    Instrument instrument = Instrument::BTC;
    Side side = Side::Buy;
    OrderType type = OrderType::Market;
    double average_price = 0.0;  // fill price for market orders
    double filled = 0.0;
    double stop_price = 0.0;     // trigger for protection orders
    bool reduce_only = false;
};

struct OpenOrder {
    std::string order_id;
    Instrument instrument = Instrument::BTC;
    Side side = Side::Buy;
    OrderType type = OrderType::Market;
    double stop_price = 0.0;
    double amount = 0.0;
    bool reduce_only = false;
};

// ============================================================================
// Gateway Interface
// ============================================================================

class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    // ========================================================================
    // Account
    // ========================================================================

    /// Futures wallet balance for a margin asset
    [[nodiscard]] virtual Balance fetch_balance(std::string_view asset) = 0;

    /// Non-empty exposures for the given instruments
    [[nodiscard]] virtual std::vector<LivePosition> fetch_positions(
        std::span<const Instrument> instruments) = 0;

    // ========================================================================
    // Market Data
    // ========================================================================

    [[nodiscard]] virtual Ticker fetch_ticker(Instrument instrument) = 0;

    /// Oldest-to-newest candles; timeframe uses exchange notation ("1m", "4h", "1d")
    [[nodiscard]] virtual PriceSeries fetch_ohlcv(Instrument instrument,
                                                  std::string_view timeframe,
                                                  int limit) = 0;

    [[nodiscard]] virtual OpenInterest fetch_open_interest(Instrument instrument) = 0;

    [[nodiscard]] virtual FundingRate fetch_funding_rate(Instrument instrument) = 0;

    // ========================================================================
    // Trading
    // ========================================================================

    virtual void set_leverage(Instrument instrument, int leverage) = 0;

    [[nodiscard]] virtual OrderResult create_market_order(Instrument instrument,
                                                          Side side,
                                                          Quantity amount,
                                                          bool reduce_only) = 0;

    /// STOP_MARKET or TAKE_PROFIT_MARKET trigger order closing the position
    [[nodiscard]] virtual OrderResult create_protection_order(Instrument instrument,
                                                              OrderType type,
                                                              Side side,
                                                              Price stop_price,
                                                              bool reduce_only) = 0;

    [[nodiscard]] virtual std::vector<OpenOrder> fetch_open_orders(Instrument instrument) = 0;

    virtual void cancel_order(const std::string& order_id, Instrument instrument) = 0;
};

}  // namespace aegis::exchange
