#pragma once
// ============================================================================
// AEGIS TRADE CORE - Account Risk Profiler
// ============================================================================
// Trading mode, Sharpe ratio, performance and exposure metrics from the
// closed-position history and the live account state
// ============================================================================

#include "aegis/exchange/gateway.hpp"
#include "aegis/ledger/ledger_store.hpp"

#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace aegis::risk {

// ============================================================================
// Trading Mode
// ============================================================================

enum class TradingMode : uint8_t {
    Survival,
    Defensive,
    Normal,
    Offensive,
    Aggressive
};

[[nodiscard]] std::string_view to_string(TradingMode mode) noexcept;

/// Accepts "SURVIVAL" .. "AGGRESSIVE"
[[nodiscard]] std::optional<TradingMode> parse_trading_mode(std::string_view text) noexcept;

struct TradingModeRule {
    TradingMode mode = TradingMode::Normal;
    double return_upper_bound = std::numeric_limits<double>::infinity();  // exclusive
    double max_risk_pct = 0.02;  // fraction of equity
    int max_leverage = 5;
    int max_positions = 3;
};

/// Ordered, first rule whose bound exceeds the return wins
using TradingModeTable = std::vector<TradingModeRule>;

[[nodiscard]] const TradingModeTable& default_trading_modes();

/// Throws std::invalid_argument on an empty table; falls back to the last rule
[[nodiscard]] const TradingModeRule& determine_trading_mode(double current_return,
                                                            const TradingModeTable& table);

// ============================================================================
// Statistics
// ============================================================================

/// Per-trade Sharpe is scaled by sqrt of this trade count per year
inline constexpr double SHARPE_TRADES_PER_YEAR = 100.0;

struct SharpePolicy {
    size_t min_trades = 5;
    double risk_free_rate = 0.0001;  // per trade
    double trades_per_year = SHARPE_TRADES_PER_YEAR;
};

/// `closed` must be ordered by close time
[[nodiscard]] double compute_sharpe(std::span<const ledger::Position> closed,
                                    double initial_capital,
                                    const SharpePolicy& policy = SharpePolicy{});

struct PerformanceMetrics {
    double win_rate = 0.0;
    double profit_factor = 0.0;  // 0 when there are no losses
    double average_win = 0.0;
    double average_loss = 0.0;   // magnitude
    double largest_win = 0.0;
    double largest_loss = 0.0;   // magnitude
    int consecutive_wins = 0;    // longest streak
    int consecutive_losses = 0;  // longest streak
    double max_drawdown = 0.0;   // fraction of peak equity
    double current_drawdown = 0.0;
    int total_trades = 0;
    int winning_trades = 0;
    int losing_trades = 0;
};

[[nodiscard]] PerformanceMetrics compute_performance(std::span<const ledger::Position> closed,
                                                     double initial_capital);

enum class LiquidationRisk : uint8_t { Low, Medium, High };

[[nodiscard]] std::string_view to_string(LiquidationRisk risk) noexcept;

struct RiskMetrics {
    double total_notional = 0.0;
    double portfolio_leverage = 0.0;
    double margin_used_pct = 0.0;
    double available_margin_pct = 1.0;
    LiquidationRisk liquidation_risk = LiquidationRisk::Low;
};

[[nodiscard]] RiskMetrics compute_risk_metrics(std::span<const exchange::LivePosition> positions,
                                               double total_equity);

// ============================================================================
// Profile
// ============================================================================

struct AccountRiskProfile {
    TradingMode trading_mode = TradingMode::Normal;
    double max_risk_pct = 0.0;
    int max_leverage = 0;
    int max_positions = 0;
    double sharpe_ratio = 0.0;

    PerformanceMetrics performance;
    RiskMetrics risk;

    double total_equity = 0.0;
    double free_cash = 0.0;
    double current_return = 0.0;
    double current_positions_value = 0.0;  // initial margin + unrealized P&L
    double contract_value = 0.0;           // sum of contracts
    std::vector<exchange::LivePosition> positions;
};

struct ProfilerConfig {
    double initial_capital = 1000.0;
    std::string margin_asset = std::string(QUOTE_ASSET);
    TradingModeTable modes = default_trading_modes();
    SharpePolicy sharpe;
};

class AccountRiskProfiler {
public:
    /// Throws std::invalid_argument when initial capital is not positive
    AccountRiskProfiler(exchange::IExchangeGateway& gateway,
                        ledger::ILedgerStore& ledger,
                        ProfilerConfig config = ProfilerConfig{});

    /// Live balance + positions for the instruments and fresh ledger history
    [[nodiscard]] AccountRiskProfile profile(std::span<const Instrument> instruments) const;

private:
    exchange::IExchangeGateway& gateway_;
    ledger::ILedgerStore& ledger_;
    ProfilerConfig config_;
};

}  // namespace aegis::risk
