#pragma once
// ============================================================================
// AEGIS TRADE CORE - Buy Admission Guards
// ============================================================================
// Safety limits for opening a long position and the eleven ordered guards
// that enforce them. Limits at a boundary value pass within a 1e-9
// relative tolerance.
// ============================================================================

#include "aegis/execution/guard_pipeline.hpp"
#include "aegis/risk/account_profiler.hpp"

#include <optional>

namespace aegis::execution {

// ============================================================================
// Safety Limits
// ============================================================================

struct SafetyLimits {
    int min_leverage = 1;
    int max_leverage = 20;

    double min_trade_notional = 10.0;     // quote currency
    double cash_reserve_fraction = 0.25;  // of total equity, kept free after the debit
    double max_position_fraction = 0.5;   // margin of one position vs total equity

    double max_daily_loss_fraction = 0.05;
    double max_weekly_loss_fraction = 0.10;

    double max_portfolio_leverage = 5.0;
    double max_risk_per_trade = 0.03;
    double min_risk_reward = 1.5;

    double maintenance_margin_rate = 0.004;
    double min_liquidation_buffer = 0.15;
};

// ============================================================================
// Buy Context
// ============================================================================

/// Everything the buy guards look at, gathered before the pipeline runs
struct BuyContext {
    Instrument instrument = Instrument::BTC;

    double entry_price = 0.0;  // current ticker price
    double amount = 0.0;
    int leverage = 1;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;

    double total_equity = 0.0;
    double free_cash = 0.0;
    double open_notional = 0.0;

    bool has_open_position = false;
    size_t open_positions = 0;

    double daily_realized_pnl = 0.0;
    double weekly_realized_pnl = 0.0;

    risk::TradingMode trading_mode = risk::TradingMode::Normal;
    int mode_max_leverage = 5;
    double mode_max_risk = 0.02;
    int mode_max_positions = 3;

    [[nodiscard]] double notional() const noexcept { return amount * entry_price; }
    [[nodiscard]] double margin() const noexcept {
        return leverage > 0 ? notional() / leverage : notional();
    }
};

// ============================================================================
// Guards
// ============================================================================

inline constexpr double LIMIT_TOLERANCE = 1e-9;

/// value <= limit, allowing the relative tolerance
[[nodiscard]] bool within_upper(double value, double limit) noexcept;

/// value >= limit, allowing the relative tolerance
[[nodiscard]] bool within_lower(double value, double limit) noexcept;

/// Long-position approximation: entry * (1 - 1/leverage + maintenance rate)
[[nodiscard]] double liquidation_price(double entry, int leverage, double maintenance_margin_rate);

[[nodiscard]] std::vector<Guard<BuyContext>> make_buy_guards(const SafetyLimits& limits);

[[nodiscard]] inline GuardPipeline<BuyContext> make_buy_pipeline(const SafetyLimits& limits) {
    return GuardPipeline<BuyContext>(make_buy_guards(limits));
}

}  // namespace aegis::execution
