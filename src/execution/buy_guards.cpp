// ============================================================================
// AEGIS TRADE CORE - Buy Admission Guards Implementation
// ============================================================================

#include "aegis/execution/buy_guards.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>

namespace aegis::execution {

using Reason = std::optional<std::string>;

bool within_upper(double value, double limit) noexcept {
    return value <= limit + LIMIT_TOLERANCE * std::abs(limit);
}

bool within_lower(double value, double limit) noexcept {
    return value >= limit - LIMIT_TOLERANCE * std::abs(limit);
}

double liquidation_price(double entry, int leverage, double maintenance_margin_rate) {
    return entry * (1.0 - 1.0 / static_cast<double>(leverage) + maintenance_margin_rate);
}

std::vector<Guard<BuyContext>> make_buy_guards(const SafetyLimits& limits) {
    std::vector<Guard<BuyContext>> guards;
    guards.reserve(11);

    // 1
    guards.push_back({"single position", [](const BuyContext& ctx) -> Reason {
        if (ctx.has_open_position) {
            return fmt::format("Position already exists for {}", pair_name(ctx.instrument));
        }
        if (ctx.open_positions >= static_cast<size_t>(std::max(ctx.mode_max_positions, 0))) {
            return fmt::format("Open position limit reached: {} of {} in {} mode", ctx.open_positions,
                               ctx.mode_max_positions, risk::to_string(ctx.trading_mode));
        }
        return std::nullopt;
    }});

    // 2
    guards.push_back({"leverage bounds", [limits](const BuyContext& ctx) -> Reason {
        const int max = std::min(limits.max_leverage, ctx.mode_max_leverage);
        if (ctx.leverage < limits.min_leverage || ctx.leverage > max) {
            return fmt::format("Leverage {}x outside allowed range [{}x, {}x] ({} mode)", ctx.leverage,
                               limits.min_leverage, max, risk::to_string(ctx.trading_mode));
        }
        return std::nullopt;
    }});

    // 3
    guards.push_back({"minimum trade size", [limits](const BuyContext& ctx) -> Reason {
        if (!within_lower(ctx.notional(), limits.min_trade_notional)) {
            return fmt::format("Trade value ${:.2f} below minimum ${:.2f}", ctx.notional(),
                               limits.min_trade_notional);
        }
        return std::nullopt;
    }});

    // 4
    guards.push_back({"cash reserve", [limits](const BuyContext& ctx) -> Reason {
        const double remaining = ctx.free_cash - ctx.margin();
        const double reserve = limits.cash_reserve_fraction * ctx.total_equity;
        if (!within_lower(remaining, reserve)) {
            return fmt::format("Insufficient cash. Required margin ${:.2f}, free ${:.2f}, reserve ${:.2f}",
                               ctx.margin(), ctx.free_cash, reserve);
        }
        return std::nullopt;
    }});

    // 5
    guards.push_back({"position size", [limits](const BuyContext& ctx) -> Reason {
        const double cap = limits.max_position_fraction * ctx.total_equity;
        if (!within_upper(ctx.margin(), cap)) {
            return fmt::format("Position margin ${:.2f} exceeds {:.0f}% of equity (${:.2f})", ctx.margin(),
                               limits.max_position_fraction * 100.0, cap);
        }
        return std::nullopt;
    }});

    // 6
    guards.push_back({"protection levels", [](const BuyContext& ctx) -> Reason {
        if (ctx.stop_loss && *ctx.stop_loss >= ctx.entry_price) {
            return fmt::format("Stop-Loss ${:.2f} must be below entry price ${:.2f}", *ctx.stop_loss,
                               ctx.entry_price);
        }
        if (ctx.take_profit && *ctx.take_profit <= ctx.entry_price) {
            return fmt::format("Take-Profit ${:.2f} must be above entry price ${:.2f}", *ctx.take_profit,
                               ctx.entry_price);
        }
        return std::nullopt;
    }});

    // 7
    guards.push_back({"loss limits", [limits](const BuyContext& ctx) -> Reason {
        const double daily_floor = -limits.max_daily_loss_fraction * ctx.total_equity;
        if (!within_lower(ctx.daily_realized_pnl, daily_floor)) {
            return fmt::format("Daily loss limit hit: ${:.2f} (max: -${:.2f})", ctx.daily_realized_pnl,
                               -daily_floor);
        }
        const double weekly_floor = -limits.max_weekly_loss_fraction * ctx.total_equity;
        if (!within_lower(ctx.weekly_realized_pnl, weekly_floor)) {
            return fmt::format("Weekly loss limit hit: ${:.2f} (max: -${:.2f})", ctx.weekly_realized_pnl,
                               -weekly_floor);
        }
        return std::nullopt;
    }});

    // 8
    guards.push_back({"portfolio leverage", [limits](const BuyContext& ctx) -> Reason {
        if (ctx.total_equity <= 0.0) {
            return fmt::format("Total equity ${:.2f} is not positive", ctx.total_equity);
        }
        const double leverage = (ctx.open_notional + ctx.notional()) / ctx.total_equity;
        if (!within_upper(leverage, limits.max_portfolio_leverage)) {
            return fmt::format("Portfolio leverage {:.2f}x would exceed {:.2f}x", leverage,
                               limits.max_portfolio_leverage);
        }
        return std::nullopt;
    }});

    // 9
    guards.push_back({"risk per trade", [limits](const BuyContext& ctx) -> Reason {
        if (!ctx.stop_loss) return std::nullopt;
        const double max_risk = std::min(limits.max_risk_per_trade, ctx.mode_max_risk);
        const double risk = std::abs(ctx.entry_price - *ctx.stop_loss) * ctx.amount * ctx.leverage;
        const double fraction = risk / ctx.total_equity;
        if (!within_upper(fraction, max_risk)) {
            return fmt::format("Risk {:.2f}% (${:.2f}) exceeds maximum {:.2f}% ({} mode)", fraction * 100.0,
                               risk, max_risk * 100.0, risk::to_string(ctx.trading_mode));
        }
        return std::nullopt;
    }});

    // 10
    guards.push_back({"risk reward", [limits](const BuyContext& ctx) -> Reason {
        if (!ctx.stop_loss || !ctx.take_profit) return std::nullopt;
        const double risk = std::abs(ctx.entry_price - *ctx.stop_loss);
        const double reward = std::abs(*ctx.take_profit - ctx.entry_price);
        if (risk <= 0.0) return "Stop-Loss equals entry price";
        const double ratio = reward / risk;
        if (!within_lower(ratio, limits.min_risk_reward)) {
            return fmt::format("Risk/Reward ratio {:.2f} below minimum {:.2f}", ratio, limits.min_risk_reward);
        }
        return std::nullopt;
    }});

    // 11
    guards.push_back({"liquidation buffer", [limits](const BuyContext& ctx) -> Reason {
        const double liquidation =
            liquidation_price(ctx.entry_price, ctx.leverage, limits.maintenance_margin_rate);
        if (ctx.stop_loss && *ctx.stop_loss <= liquidation) {
            return fmt::format("Stop-Loss ${:.2f} is at or below liquidation price ${:.2f}", *ctx.stop_loss,
                               liquidation);
        }
        const double buffer = (ctx.entry_price - liquidation) / ctx.entry_price;
        if (buffer <= limits.min_liquidation_buffer) {
            return fmt::format("Liquidation buffer {:.1f}% not above minimum {:.1f}%", buffer * 100.0,
                               limits.min_liquidation_buffer * 100.0);
        }
        return std::nullopt;
    }});

    return guards;
}

}  // namespace aegis::execution
