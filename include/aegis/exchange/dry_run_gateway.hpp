#pragma once
// ============================================================================
// AEGIS TRADE CORE - DRY_RUN Gateway
// ============================================================================
// Decorator that simulates every order-mutating call. Reads pass through to
// the wrapped gateway; market orders fill at its current ticker price and
// protection orders rest in a local simulated book.
// ============================================================================

#include "aegis/exchange/gateway.hpp"

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace aegis::exchange {

inline constexpr std::string_view DRY_RUN_PREFIX = "DRY_RUN_";

class DryRunGateway : public IExchangeGateway {
public:
    /// `inner` must outlive this decorator
    explicit DryRunGateway(IExchangeGateway& inner);

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

    /// Simulated resting orders only
    [[nodiscard]] std::vector<OpenOrder> fetch_open_orders(Instrument instrument) override;
    void cancel_order(const std::string& order_id, Instrument instrument) override;

private:
    /// DRY_RUN_<epoch ms>_<sequence>
    [[nodiscard]] std::string next_order_id();

    IExchangeGateway& inner_;

    std::mutex mutex_;
    uint64_t sequence_ = 0;
    std::vector<OpenOrder> book_;
};

}  // namespace aegis::exchange
