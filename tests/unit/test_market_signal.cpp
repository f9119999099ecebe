// ============================================================================
// AEGIS TRADE CORE - Market Signal Aggregator Unit Tests
// ============================================================================

#include "aegis/strategy/market_signal.hpp"
#include "support/fake_gateway.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace aegis;
using namespace aegis::strategy;

namespace {

bool has_factor(const MarketSnapshot& snapshot, std::string_view text) {
    const auto& factors = snapshot.confluence.factors;
    return std::find(factors.begin(), factors.end(), text) != factors.end();
}

}  // namespace

// ============================================================================
// Snapshot Construction
// ============================================================================

TEST(BuildSnapshotTest, UptrendAcrossTimeframes) {
    const auto intraday = test::make_series(100, 100.0, 1.0);
    const auto swing = test::make_series(100, 100.0, 1.0);
    const auto daily = test::make_series(60, 100.0, 1.0);

    const auto snapshot = build_snapshot(Instrument::SOL, intraday, swing, daily, DerivativesData{1e6, 0.0001});

    EXPECT_EQ(snapshot.instrument, Instrument::SOL);
    EXPECT_DOUBLE_EQ(snapshot.price(), 199.0);
    EXPECT_GT(snapshot.swing.ema20, snapshot.swing.ema50);
    EXPECT_EQ(snapshot.daily.trend, DailyTrend::Up);
    EXPECT_DOUBLE_EQ(snapshot.swing.atr14, 2.0);
    EXPECT_DOUBLE_EQ(snapshot.open_interest, 1e6);
    EXPECT_DOUBLE_EQ(snapshot.funding_rate, 0.0001);

    EXPECT_EQ(snapshot.confluence.factors.front(), "4H Trend: Bullish (EMA20 > EMA50)");
    EXPECT_TRUE(has_factor(snapshot, "Daily Trend: Bullish"));
    EXPECT_FALSE(has_factor(snapshot, "Open interest unavailable"));
}

TEST(BuildSnapshotTest, PivotsFromPreviousCompletedBar) {
    const auto series = test::make_series(100, 100.0, 1.0);
    const auto snapshot = build_snapshot(Instrument::BTC, series, series, series, DerivativesData{});

    const auto& bar = series[series.size() - 2];
    const auto expected = pivot_points(bar.high, bar.low, bar.close);
    EXPECT_DOUBLE_EQ(snapshot.swing.pivots.pivot, expected.pivot);
    EXPECT_DOUBLE_EQ(snapshot.swing.pivots.s1, expected.s1);
    EXPECT_DOUBLE_EQ(snapshot.daily.pivots.r1, expected.r1);
}

TEST(BuildSnapshotTest, SeriesTailsAreTrimmed) {
    const auto series = test::make_series(100);
    MarketDataConfig config;
    config.series_tail = 10;

    const auto snapshot = build_snapshot(Instrument::BTC, series, series, series, DerivativesData{}, config);
    EXPECT_EQ(snapshot.intraday.prices.size(), 10u);
    EXPECT_EQ(snapshot.intraday.rsi7_series.size(), 10u);
    EXPECT_EQ(snapshot.swing.macd_series.size(), 10u);
    EXPECT_DOUBLE_EQ(snapshot.intraday.prices.back(), snapshot.price());
}

TEST(BuildSnapshotTest, LevelsBracketPrice) {
    const auto series = test::make_series(100, 100.0, 1.0);
    const auto snapshot = build_snapshot(Instrument::BTC, series, series, series, DerivativesData{});

    EXPECT_LT(snapshot.levels.stop_loss, snapshot.price());
    EXPECT_GT(snapshot.levels.take_profit, snapshot.price());
    const double reward = snapshot.levels.take_profit - snapshot.price();
    const double risk = snapshot.price() - snapshot.levels.stop_loss;
    EXPECT_GE(reward / risk, 1.5 - 1e-9);
}

TEST(BuildSnapshotTest, DowntrendIsBearish) {
    const auto series = test::make_series(100, 300.0, -1.0);
    const auto snapshot = build_snapshot(Instrument::ETH, series, series, series, DerivativesData{0.0, 0.0});

    EXPECT_LT(snapshot.swing.ema20, snapshot.swing.ema50);
    EXPECT_EQ(snapshot.daily.trend, DailyTrend::Down);
    EXPECT_GT(snapshot.confluence.bearish_points, 0.0);
}

TEST(BuildSnapshotTest, MissingDerivativesReported) {
    const auto series = test::make_series(60);
    const auto snapshot = build_snapshot(Instrument::BTC, series, series, series, DerivativesData{});

    EXPECT_DOUBLE_EQ(snapshot.open_interest, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.funding_rate, 0.0);
    EXPECT_TRUE(has_factor(snapshot, "Open interest unavailable"));
    EXPECT_TRUE(has_factor(snapshot, "Funding rate unavailable"));
}

TEST(BuildSnapshotTest, ShortHistoryDegradesToDefaults) {
    const auto series = test::make_series(5);
    const auto snapshot = build_snapshot(Instrument::BTC, series, series, series, DerivativesData{});

    EXPECT_DOUBLE_EQ(snapshot.swing.ema50, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.swing.rsi14, 50.0);
    EXPECT_DOUBLE_EQ(snapshot.price(), 104.0);
}

TEST(BuildSnapshotTest, RejectsEmptySeries) {
    const auto series = test::make_series(50);
    const PriceSeries one_bar = test::make_series(1);

    EXPECT_THROW(static_cast<void>(build_snapshot(Instrument::BTC, PriceSeries{}, series, series,
                                                  DerivativesData{})),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(build_snapshot(Instrument::BTC, series, one_bar, series, DerivativesData{})),
                 std::invalid_argument);
    EXPECT_THROW(static_cast<void>(build_snapshot(Instrument::BTC, series, series, one_bar, DerivativesData{})),
                 std::invalid_argument);
}

// ============================================================================
// Aggregator
// ============================================================================

class AggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        gateway.candles["1m"] = test::make_series(120, 100.0, 0.5);
        gateway.candles["4h"] = test::make_series(120, 100.0, 1.0);
        gateway.candles["1d"] = test::make_series(80, 100.0, 2.0);
    }

    test::FakeGateway gateway;
    MarketSignalAggregator aggregator{gateway};
};

TEST_F(AggregatorTest, FetchesConfiguredTimeframes) {
    const auto snapshot = aggregator.snapshot(Instrument::BNB);

    EXPECT_EQ(snapshot.instrument, Instrument::BNB);
    EXPECT_DOUBLE_EQ(snapshot.price(), gateway.candles["1m"].back().close);
    EXPECT_DOUBLE_EQ(snapshot.open_interest, gateway.open_interest);
    EXPECT_DOUBLE_EQ(snapshot.funding_rate, gateway.funding_rate);
}

TEST_F(AggregatorTest, OpenInterestFailureIsNotFatal) {
    gateway.fail_open_interest = true;
    const auto snapshot = aggregator.snapshot(Instrument::BTC);

    EXPECT_DOUBLE_EQ(snapshot.open_interest, 0.0);
    EXPECT_DOUBLE_EQ(snapshot.funding_rate, gateway.funding_rate);
    EXPECT_TRUE(has_factor(snapshot, "Open interest unavailable"));
    EXPECT_FALSE(has_factor(snapshot, "Funding rate unavailable"));
}

TEST_F(AggregatorTest, FundingFailureIsNotFatal) {
    gateway.fail_funding = true;
    const auto snapshot = aggregator.snapshot(Instrument::BTC);
    EXPECT_TRUE(has_factor(snapshot, "Funding rate unavailable"));
}

TEST_F(AggregatorTest, CandleFailurePropagates) {
    gateway.fail_ohlcv = true;
    EXPECT_THROW(static_cast<void>(aggregator.snapshot(Instrument::BTC)), exchange::GatewayError);
}

TEST_F(AggregatorTest, MissingTimeframePropagates) {
    gateway.candles.erase("1d");
    EXPECT_THROW(static_cast<void>(aggregator.snapshot(Instrument::BTC)), exchange::GatewayError);
}
