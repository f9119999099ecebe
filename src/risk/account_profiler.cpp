// ============================================================================
// AEGIS TRADE CORE - Account Risk Profiler Implementation
// ============================================================================

#include "aegis/risk/account_profiler.hpp"

#include "aegis/utils/logger.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace aegis::risk {

// ============================================================================
// Trading Mode
// ============================================================================

std::string_view to_string(TradingMode mode) noexcept {
    switch (mode) {
        case TradingMode::Survival: return "SURVIVAL";
        case TradingMode::Defensive: return "DEFENSIVE";
        case TradingMode::Normal: return "NORMAL";
        case TradingMode::Offensive: return "OFFENSIVE";
        case TradingMode::Aggressive: return "AGGRESSIVE";
    }
    return "NORMAL";
}

std::optional<TradingMode> parse_trading_mode(std::string_view text) noexcept {
    for (auto mode : {TradingMode::Survival, TradingMode::Defensive, TradingMode::Normal,
                      TradingMode::Offensive, TradingMode::Aggressive}) {
        if (to_string(mode) == text) return mode;
    }
    return std::nullopt;
}

const TradingModeTable& default_trading_modes() {
    static const TradingModeTable table = {
        {TradingMode::Survival, -0.10, 0.005, 2, 1},
        {TradingMode::Defensive, -0.05, 0.015, 3, 2},
        {TradingMode::Normal, 0.10, 0.02, 5, 3},
        {TradingMode::Offensive, 0.20, 0.025, 7, 4},
        {TradingMode::Aggressive, std::numeric_limits<double>::infinity(), 0.03, 10, 5},
    };
    return table;
}

const TradingModeRule& determine_trading_mode(double current_return, const TradingModeTable& table) {
    if (table.empty()) {
        throw std::invalid_argument("trading mode table is empty");
    }
    for (const auto& rule : table) {
        if (current_return < rule.return_upper_bound) return rule;
    }
    return table.back();
}

// ============================================================================
// Sharpe
// ============================================================================

double compute_sharpe(std::span<const ledger::Position> closed, double initial_capital,
                      const SharpePolicy& policy) {
    if (closed.size() < policy.min_trades) return 0.0;

    std::vector<double> returns;
    returns.reserve(closed.size());
    double running_capital = initial_capital;
    for (const auto& position : closed) {
        if (running_capital <= 0.0) continue;
        returns.push_back(position.realized_pnl / running_capital);
        running_capital += position.realized_pnl;
    }
    if (returns.size() < policy.min_trades) return 0.0;

    const double n = static_cast<double>(returns.size());
    const double mean = std::accumulate(returns.begin(), returns.end(), 0.0) / n;
    double variance = 0.0;
    for (double r : returns) variance += (r - mean) * (r - mean);
    variance /= n;

    const double std_dev = std::sqrt(variance);
    if (std_dev == 0.0) return 0.0;

    return (mean - policy.risk_free_rate) / std_dev * std::sqrt(policy.trades_per_year);
}

// ============================================================================
// Performance
// ============================================================================

PerformanceMetrics compute_performance(std::span<const ledger::Position> closed, double initial_capital) {
    PerformanceMetrics m;
    m.total_trades = static_cast<int>(closed.size());
    if (closed.empty()) return m;

    double gross_win = 0.0;
    double gross_loss = 0.0;
    int win_streak = 0;
    int loss_streak = 0;

    double equity = initial_capital;
    double peak = initial_capital;

    for (const auto& position : closed) {
        const double pnl = position.realized_pnl;
        if (pnl > 0.0) {
            ++m.winning_trades;
            gross_win += pnl;
            m.largest_win = std::max(m.largest_win, pnl);
            ++win_streak;
            loss_streak = 0;
            m.consecutive_wins = std::max(m.consecutive_wins, win_streak);
        } else if (pnl < 0.0) {
            ++m.losing_trades;
            gross_loss += -pnl;
            m.largest_loss = std::max(m.largest_loss, -pnl);
            ++loss_streak;
            win_streak = 0;
            m.consecutive_losses = std::max(m.consecutive_losses, loss_streak);
        }

        equity += pnl;
        peak = std::max(peak, equity);
        if (peak > 0.0) {
            m.max_drawdown = std::max(m.max_drawdown, (peak - equity) / peak);
        }
    }

    m.current_drawdown = peak > 0.0 ? (peak - equity) / peak : 0.0;
    m.win_rate = static_cast<double>(m.winning_trades) / static_cast<double>(m.total_trades);
    m.profit_factor = gross_loss > 0.0 ? gross_win / gross_loss : 0.0;
    m.average_win = m.winning_trades > 0 ? gross_win / m.winning_trades : 0.0;
    m.average_loss = m.losing_trades > 0 ? gross_loss / m.losing_trades : 0.0;
    return m;
}

// ============================================================================
// Exposure
// ============================================================================

std::string_view to_string(LiquidationRisk risk) noexcept {
    switch (risk) {
        case LiquidationRisk::Low: return "low";
        case LiquidationRisk::Medium: return "medium";
        case LiquidationRisk::High: return "high";
    }
    return "low";
}

RiskMetrics compute_risk_metrics(std::span<const exchange::LivePosition> positions, double total_equity) {
    RiskMetrics m;
    double margin_used = 0.0;
    for (const auto& position : positions) {
        m.total_notional += std::abs(position.notional);
        margin_used += position.initial_margin;
    }

    m.portfolio_leverage = total_equity > 0.0 ? m.total_notional / total_equity : 0.0;
    m.margin_used_pct = total_equity > 0.0 ? margin_used / total_equity : 0.0;
    m.available_margin_pct = 1.0 - m.margin_used_pct;

    if (m.portfolio_leverage > 5.0) {
        m.liquidation_risk = LiquidationRisk::High;
    } else if (m.portfolio_leverage > 3.0) {
        m.liquidation_risk = LiquidationRisk::Medium;
    }

    for (const auto& position : positions) {
        if (position.mark_price <= 0.0 || position.liquidation_price <= 0.0) continue;
        const double distance =
            std::abs(position.mark_price - position.liquidation_price) / position.mark_price;
        if (distance < 0.1) {
            m.liquidation_risk = LiquidationRisk::High;
        } else if (distance < 0.2 && m.liquidation_risk != LiquidationRisk::High) {
            m.liquidation_risk = LiquidationRisk::Medium;
        }
    }
    return m;
}

// ============================================================================
// AccountRiskProfiler
// ============================================================================

AccountRiskProfiler::AccountRiskProfiler(exchange::IExchangeGateway& gateway,
                                         ledger::ILedgerStore& ledger,
                                         ProfilerConfig config)
    : gateway_(gateway), ledger_(ledger), config_(std::move(config)) {
    if (!(config_.initial_capital > 0.0)) {
        throw std::invalid_argument("initial capital must be positive");
    }
    if (config_.modes.empty()) {
        throw std::invalid_argument("trading mode table is empty");
    }
}

AccountRiskProfile AccountRiskProfiler::profile(std::span<const Instrument> instruments) const {
    SCOPED_TIMER("account profile");

    AccountRiskProfile profile;
    profile.positions = gateway_.fetch_positions(instruments);
    const auto balance = gateway_.fetch_balance(config_.margin_asset);
    profile.total_equity = balance.total;
    profile.free_cash = balance.free;

    for (const auto& position : profile.positions) {
        profile.current_positions_value += position.initial_margin + position.unrealized_pnl;
        profile.contract_value += position.contracts;
    }

    profile.current_return = (profile.total_equity - config_.initial_capital) / config_.initial_capital;

    const auto& rule = determine_trading_mode(profile.current_return, config_.modes);
    profile.trading_mode = rule.mode;
    profile.max_risk_pct = rule.max_risk_pct;
    profile.max_leverage = rule.max_leverage;
    profile.max_positions = rule.max_positions;

    const auto closed = ledger_.closed_positions();
    profile.sharpe_ratio = compute_sharpe(closed, config_.initial_capital, config_.sharpe);
    profile.performance = compute_performance(closed, config_.initial_capital);
    profile.risk = compute_risk_metrics(profile.positions, profile.total_equity);

    LOG_INFO("Account equity={:.2f} free={:.2f} return={:.2f}% mode={} sharpe={:.2f} "
             "leverage={:.2f}x liquidation risk={}",
             profile.total_equity, profile.free_cash, profile.current_return * 100.0,
             to_string(profile.trading_mode), profile.sharpe_ratio, profile.risk.portfolio_leverage,
             to_string(profile.risk.liquidation_risk));
    return profile;
}

}  // namespace aegis::risk
