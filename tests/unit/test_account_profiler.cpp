// ============================================================================
// AEGIS TRADE CORE - Account Risk Profiler Unit Tests
// ============================================================================

#include "aegis/risk/account_profiler.hpp"
#include "support/fake_gateway.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace aegis;
using namespace aegis::risk;

namespace {

std::vector<ledger::Position> closed_history(std::initializer_list<double> pnls) {
    std::vector<ledger::Position> out;
    int64_t minute = 0;
    for (double pnl : pnls) {
        ledger::Position p;
        p.id = ledger::generate_record_id("pos");
        p.status = ledger::PositionStatus::Closed;
        p.entry_price = 100.0;
        p.entry_amount = 0.0;
        p.realized_pnl = pnl;
        p.opened_at = from_epoch_ms(minute * 60000);
        p.closed_at = from_epoch_ms((minute + 1) * 60000);
        out.push_back(p);
        minute += 2;
    }
    return out;
}

}  // namespace

// ============================================================================
// Trading Mode
// ============================================================================

TEST(TradingModeTest, DefaultTableBoundaries) {
    const auto& table = default_trading_modes();

    EXPECT_EQ(determine_trading_mode(-0.25, table).mode, TradingMode::Survival);
    EXPECT_EQ(determine_trading_mode(-0.10, table).mode, TradingMode::Defensive);
    EXPECT_EQ(determine_trading_mode(-0.05, table).mode, TradingMode::Normal);
    EXPECT_EQ(determine_trading_mode(0.0, table).mode, TradingMode::Normal);
    EXPECT_EQ(determine_trading_mode(0.10, table).mode, TradingMode::Offensive);
    EXPECT_EQ(determine_trading_mode(0.20, table).mode, TradingMode::Aggressive);
    EXPECT_EQ(determine_trading_mode(5.0, table).mode, TradingMode::Aggressive);
}

TEST(TradingModeTest, DefaultTableLimits) {
    const auto& survival = determine_trading_mode(-0.5, default_trading_modes());
    EXPECT_DOUBLE_EQ(survival.max_risk_pct, 0.005);
    EXPECT_EQ(survival.max_leverage, 2);
    EXPECT_EQ(survival.max_positions, 1);

    const auto& aggressive = determine_trading_mode(1.0, default_trading_modes());
    EXPECT_DOUBLE_EQ(aggressive.max_risk_pct, 0.03);
    EXPECT_EQ(aggressive.max_leverage, 10);
    EXPECT_EQ(aggressive.max_positions, 5);
}

TEST(TradingModeTest, FallsBackToLastRule) {
    TradingModeTable table = {
        {TradingMode::Defensive, 0.0, 0.01, 2, 1},
        {TradingMode::Normal, 0.5, 0.02, 4, 2},
    };
    EXPECT_EQ(determine_trading_mode(2.0, table).mode, TradingMode::Normal);
    EXPECT_THROW(static_cast<void>(determine_trading_mode(0.0, TradingModeTable{})), std::invalid_argument);
}

TEST(TradingModeTest, NamesRoundTrip) {
    for (auto mode : {TradingMode::Survival, TradingMode::Defensive, TradingMode::Normal,
                      TradingMode::Offensive, TradingMode::Aggressive}) {
        EXPECT_EQ(parse_trading_mode(to_string(mode)), mode);
    }
    EXPECT_FALSE(parse_trading_mode("normal").has_value());
}

// ============================================================================
// Sharpe
// ============================================================================

TEST(SharpeTest, ZeroBelowMinimumTrades) {
    const auto history = closed_history({10.0, 20.0, -5.0, 15.0});
    EXPECT_DOUBLE_EQ(compute_sharpe(history, 1000.0), 0.0);
}

TEST(SharpeTest, ZeroWithoutVariance) {
    const auto history = closed_history({0.0, 0.0, 0.0, 0.0, 0.0});
    EXPECT_DOUBLE_EQ(compute_sharpe(history, 1000.0), 0.0);
}

TEST(SharpeTest, SignFollowsExcessReturn) {
    const auto winners = closed_history({20.0, 10.0, 30.0, 15.0, 25.0});
    const auto losers = closed_history({-20.0, -10.0, -30.0, -15.0, -25.0});
    EXPECT_GT(compute_sharpe(winners, 1000.0), 0.0);
    EXPECT_LT(compute_sharpe(losers, 1000.0), 0.0);
}

TEST(SharpeTest, ScalesWithTradesPerYear) {
    const auto history = closed_history({20.0, -10.0, 30.0, 15.0, -5.0});
    SharpePolicy quarterly;
    quarterly.trades_per_year = 25.0;

    const double base = compute_sharpe(history, 1000.0);
    EXPECT_NEAR(compute_sharpe(history, 1000.0, quarterly), base / 2.0, 1e-9);
}

// ============================================================================
// Performance
// ============================================================================

TEST(PerformanceTest, EmptyHistory) {
    const auto m = compute_performance({}, 1000.0);
    EXPECT_EQ(m.total_trades, 0);
    EXPECT_DOUBLE_EQ(m.win_rate, 0.0);
    EXPECT_DOUBLE_EQ(m.max_drawdown, 0.0);
}

TEST(PerformanceTest, MixedHistory) {
    const auto history = closed_history({50.0, -100.0, 30.0, -20.0, -10.0});
    const auto m = compute_performance(history, 1000.0);

    EXPECT_EQ(m.total_trades, 5);
    EXPECT_EQ(m.winning_trades, 2);
    EXPECT_EQ(m.losing_trades, 3);
    EXPECT_DOUBLE_EQ(m.win_rate, 0.4);
    EXPECT_DOUBLE_EQ(m.profit_factor, 80.0 / 130.0);
    EXPECT_DOUBLE_EQ(m.average_win, 40.0);
    EXPECT_DOUBLE_EQ(m.average_loss, 130.0 / 3.0);
    EXPECT_DOUBLE_EQ(m.largest_win, 50.0);
    EXPECT_DOUBLE_EQ(m.largest_loss, 100.0);
    EXPECT_EQ(m.consecutive_wins, 1);
    EXPECT_EQ(m.consecutive_losses, 2);
    EXPECT_DOUBLE_EQ(m.max_drawdown, 100.0 / 1050.0);
    EXPECT_DOUBLE_EQ(m.current_drawdown, 100.0 / 1050.0);
}

TEST(PerformanceTest, DrawdownMeasuredFromInitialCapital) {
    const auto history = closed_history({-100.0, 50.0});
    const auto m = compute_performance(history, 1000.0);

    EXPECT_DOUBLE_EQ(m.max_drawdown, 0.1);
    EXPECT_DOUBLE_EQ(m.current_drawdown, 0.05);
    EXPECT_DOUBLE_EQ(m.profit_factor, 0.5);
}

TEST(PerformanceTest, NoLossesMeansZeroProfitFactor) {
    const auto m = compute_performance(closed_history({10.0, 20.0}), 1000.0);
    EXPECT_DOUBLE_EQ(m.profit_factor, 0.0);
    EXPECT_EQ(m.consecutive_wins, 2);
}

// ============================================================================
// Exposure
// ============================================================================

TEST(RiskMetricsTest, NoPositions) {
    const auto m = compute_risk_metrics({}, 500.0);
    EXPECT_DOUBLE_EQ(m.portfolio_leverage, 0.0);
    EXPECT_DOUBLE_EQ(m.available_margin_pct, 1.0);
    EXPECT_EQ(m.liquidation_risk, LiquidationRisk::Low);
}

TEST(RiskMetricsTest, LeverageBands) {
    exchange::LivePosition position;
    position.instrument = Instrument::BTC;
    position.notional = 2000.0;
    position.initial_margin = 400.0;

    std::vector<exchange::LivePosition> positions{position};
    auto m = compute_risk_metrics(positions, 500.0);
    EXPECT_DOUBLE_EQ(m.total_notional, 2000.0);
    EXPECT_DOUBLE_EQ(m.portfolio_leverage, 4.0);
    EXPECT_DOUBLE_EQ(m.margin_used_pct, 0.8);
    EXPECT_NEAR(m.available_margin_pct, 0.2, 1e-12);
    EXPECT_EQ(m.liquidation_risk, LiquidationRisk::Medium);

    positions[0].notional = -3000.0;
    m = compute_risk_metrics(positions, 500.0);
    EXPECT_DOUBLE_EQ(m.portfolio_leverage, 6.0);
    EXPECT_EQ(m.liquidation_risk, LiquidationRisk::High);
}

TEST(RiskMetricsTest, LiquidationDistanceBands) {
    exchange::LivePosition position;
    position.notional = 100.0;
    position.mark_price = 100.0;
    position.liquidation_price = 85.0;

    std::vector<exchange::LivePosition> positions{position};
    EXPECT_EQ(compute_risk_metrics(positions, 1000.0).liquidation_risk, LiquidationRisk::Medium);

    positions[0].liquidation_price = 95.0;
    EXPECT_EQ(compute_risk_metrics(positions, 1000.0).liquidation_risk, LiquidationRisk::High);

    positions[0].liquidation_price = 50.0;
    EXPECT_EQ(compute_risk_metrics(positions, 1000.0).liquidation_risk, LiquidationRisk::Low);
}

// ============================================================================
// AccountRiskProfiler
// ============================================================================

class AccountProfilerTest : public ::testing::Test {
protected:
    test::FakeGateway gateway;
    ledger::InMemoryLedgerStore ledger;
};

TEST_F(AccountProfilerTest, RejectsNonPositiveCapital) {
    ProfilerConfig config;
    config.initial_capital = 0.0;
    EXPECT_THROW({ AccountRiskProfiler profiler(gateway, ledger, config); }, std::invalid_argument);

    config.initial_capital = 1000.0;
    config.modes.clear();
    EXPECT_THROW({ AccountRiskProfiler profiler(gateway, ledger, config); }, std::invalid_argument);
}

TEST_F(AccountProfilerTest, ProfilesLiveAccount) {
    gateway.balance = exchange::Balance{"USDT", 900.0, 1150.0};

    exchange::LivePosition btc;
    btc.instrument = Instrument::BTC;
    btc.contracts = 0.01;
    btc.notional = 500.0;
    btc.initial_margin = 100.0;
    btc.unrealized_pnl = 12.5;
    exchange::LivePosition doge;
    doge.instrument = Instrument::DOGE;
    doge.contracts = 1000.0;
    doge.notional = 150.0;
    gateway.positions = {btc, doge};

    AccountRiskProfiler profiler(gateway, ledger);
    const std::vector<Instrument> instruments{Instrument::BTC, Instrument::ETH};
    const auto profile = profiler.profile(instruments);

    EXPECT_DOUBLE_EQ(profile.total_equity, 1150.0);
    EXPECT_DOUBLE_EQ(profile.free_cash, 900.0);
    EXPECT_NEAR(profile.current_return, 0.15, 1e-12);
    EXPECT_EQ(profile.trading_mode, TradingMode::Offensive);
    EXPECT_DOUBLE_EQ(profile.max_risk_pct, 0.025);
    EXPECT_EQ(profile.max_leverage, 7);
    EXPECT_EQ(profile.max_positions, 4);

    ASSERT_EQ(profile.positions.size(), 1u);
    EXPECT_DOUBLE_EQ(profile.current_positions_value, 112.5);
    EXPECT_DOUBLE_EQ(profile.contract_value, 0.01);
    EXPECT_DOUBLE_EQ(profile.risk.total_notional, 500.0);
    EXPECT_DOUBLE_EQ(profile.sharpe_ratio, 0.0);
}

TEST_F(AccountProfilerTest, UsesLedgerHistory) {
    gateway.balance = exchange::Balance{"USDT", 850.0, 850.0};
    for (const auto& position : closed_history({-50.0, -40.0, -30.0, -20.0, -10.0})) {
        ledger.create_position(position);
    }

    AccountRiskProfiler profiler(gateway, ledger);
    const auto profile = profiler.profile(ALL_INSTRUMENTS);

    EXPECT_EQ(profile.trading_mode, TradingMode::Survival);
    EXPECT_EQ(profile.performance.total_trades, 5);
    EXPECT_EQ(profile.performance.consecutive_losses, 5);
    EXPECT_LT(profile.sharpe_ratio, 0.0);
    EXPECT_DOUBLE_EQ(profile.performance.max_drawdown, 0.15);
}

TEST_F(AccountProfilerTest, CustomModeTable) {
    ProfilerConfig config;
    config.initial_capital = 500.0;
    config.modes = {{TradingMode::Defensive, 0.0, 0.01, 2, 1},
                    {TradingMode::Offensive, std::numeric_limits<double>::infinity(), 0.04, 8, 4}};
    gateway.balance = exchange::Balance{"USDT", 500.0, 500.0};

    AccountRiskProfiler profiler(gateway, ledger, config);
    const auto profile = profiler.profile(ALL_INSTRUMENTS);
    EXPECT_EQ(profile.trading_mode, TradingMode::Offensive);
    EXPECT_EQ(profile.max_leverage, 8);
}

TEST_F(AccountProfilerTest, GatewayFailurePropagates) {
    gateway.fail_account = true;
    AccountRiskProfiler profiler(gateway, ledger);
    EXPECT_THROW(static_cast<void>(profiler.profile(ALL_INSTRUMENTS)), exchange::GatewayError);
}
