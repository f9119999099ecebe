// ============================================================================
// AEGIS TRADE CORE - Indicator Series and Pattern Unit Tests
// ============================================================================

#include "aegis/strategy/indicators/bollinger.hpp"
#include "aegis/strategy/indicators/patterns.hpp"
#include "aegis/strategy/indicators/series.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace aegis;
using namespace aegis::strategy;

namespace {

std::vector<double> ramp(size_t count, double start = 100.0, double step = 1.0) {
    std::vector<double> out;
    for (size_t i = 0; i < count; ++i) out.push_back(start + step * static_cast<double>(i));
    return out;
}

std::vector<double> zigzag(size_t count) {
    std::vector<double> out;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(100.0 + std::sin(static_cast<double>(i) * 0.7) * 5.0 + static_cast<double>(i) * 0.1);
    }
    return out;
}

}  // namespace

// ============================================================================
// Column Extraction
// ============================================================================

TEST(SeriesTest, ColumnsFollowCandleOrder) {
    PriceSeries series;
    series.push_back(Candle{from_epoch_ms(0), 1.0, 2.0, 0.5, 1.5, 10.0});
    series.push_back(Candle{from_epoch_ms(60000), 1.5, 3.0, 1.0, 2.5, 20.0});

    EXPECT_EQ(closes(series), (std::vector<double>{1.5, 2.5}));
    EXPECT_EQ(highs(series), (std::vector<double>{2.0, 3.0}));
    EXPECT_EQ(lows(series), (std::vector<double>{0.5, 1.0}));
    EXPECT_EQ(volumes(series), (std::vector<double>{10.0, 20.0}));
}

// ============================================================================
// Moving Averages
// ============================================================================

TEST(SeriesTest, SmaValues) {
    const std::vector<double> values = {1.0, 2.0, 3.0, 4.0, 5.0};
    const auto out = sma(values, 2);
    ASSERT_EQ(out.size(), 4u);
    EXPECT_DOUBLE_EQ(out[0], 1.5);
    EXPECT_DOUBLE_EQ(out[3], 4.5);
}

TEST(SeriesTest, EmaSeededBySma) {
    const std::vector<double> values = {2.0, 4.0, 6.0, 8.0};
    const auto out = ema(values, 3);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0], 4.0);
    // multiplier 2 / (3 + 1)
    EXPECT_DOUBLE_EQ(out[1], 6.0);
}

TEST(SeriesTest, EmaOfConstantIsConstant) {
    const std::vector<double> values(30, 42.0);
    const auto out = ema(values, 20);
    ASSERT_EQ(out.size(), 11u);
    for (double v : out) EXPECT_DOUBLE_EQ(v, 42.0);
}

TEST(SeriesTest, ZeroPeriodThrows) {
    const std::vector<double> values = {1.0, 2.0};
    EXPECT_THROW(static_cast<void>(ema(values, 0)), std::invalid_argument);
}

// ============================================================================
// Volatility
// ============================================================================

TEST(SeriesTest, AtrAndAdxLengths) {
    const auto close = zigzag(60);
    std::vector<double> high;
    std::vector<double> low;
    for (double c : close) {
        high.push_back(c + 1.0);
        low.push_back(c - 1.0);
    }

    EXPECT_EQ(atr(high, low, close, 14).size(), 60u - 14u);
    EXPECT_EQ(atr(high, low, close, 3).size(), 60u - 3u);
    EXPECT_EQ(adx(high, low, close, 14).size(), 60u - 28u + 1u);

    for (double v : adx(high, low, close, 14)) {
        EXPECT_GE(v, 0.0);
        EXPECT_LE(v, 100.0);
    }
}

TEST(SeriesTest, AtrOfConstantRangeBars) {
    const std::vector<double> close(20, 100.0);
    const std::vector<double> high(20, 101.0);
    const std::vector<double> low(20, 99.0);

    const auto out = atr(high, low, close, 14);
    ASSERT_FALSE(out.empty());
    EXPECT_DOUBLE_EQ(out.back(), 2.0);
}

TEST(SeriesTest, MismatchedColumnsYieldEmpty) {
    const std::vector<double> three = {1.0, 2.0, 3.0};
    const std::vector<double> two = {1.0, 2.0};
    EXPECT_TRUE(atr(three, two, three, 1).empty());
    EXPECT_TRUE(vwap(three, three, three, two).empty());
    EXPECT_TRUE(obv(three, two).empty());
}

TEST(SeriesTest, BollingerOfConstantSeries) {
    const std::vector<double> values(25, 10.0);
    const auto bands = bollinger(values, 20, 2.0);
    ASSERT_EQ(bands.size(), 6u);
    EXPECT_DOUBLE_EQ(bands.back().middle, 10.0);
    EXPECT_DOUBLE_EQ(bands.back().bandwidth, 0.0);
    EXPECT_DOUBLE_EQ(bands.back().percent_b, 0.5);
}

TEST(SeriesTest, BollingerOfInexactConstantSeries) {
    // 0.1 has no exact binary form, so the rolling mean carries rounding noise
    BollingerBands streaming(20, 2.0);
    for (int i = 0; i < 25; ++i) streaming.update(0.1);
    ASSERT_TRUE(streaming.is_ready());
    EXPECT_TRUE(streaming.is_flat());
    EXPECT_DOUBLE_EQ(streaming.percent_b(), 0.5);
    EXPECT_DOUBLE_EQ(streaming.band_width(), 0.0);

    const auto bands = bollinger(std::vector<double>(25, 0.3), 20, 2.0);
    ASSERT_FALSE(bands.empty());
    EXPECT_DOUBLE_EQ(bands.back().percent_b, 0.5);
}

TEST(SeriesTest, BollingerPercentBAboveUpperBand) {
    BollingerBands bands(5, 2.0);
    for (double p : {10.0, 10.0, 10.0, 10.0, 11.0}) bands.update(p);
    ASSERT_TRUE(bands.is_ready());
    EXPECT_GT(bands.upper_band(), bands.value());
    EXPECT_LT(bands.lower_band(), bands.value());
    EXPECT_GT(bands.percent_b(), 0.5);
}

// ============================================================================
// Momentum
// ============================================================================

TEST(SeriesTest, StochRsiStaysInRange) {
    const auto values = zigzag(80);
    const auto out = stoch_rsi(values);
    ASSERT_FALSE(out.empty());
    for (const auto& point : out) {
        EXPECT_GE(point.k, 0.0);
        EXPECT_LE(point.k, 100.0);
        EXPECT_GE(point.d, 0.0);
        EXPECT_LE(point.d, 100.0);
    }
}

// ============================================================================
// Volume
// ============================================================================

TEST(SeriesTest, VwapIsCumulative) {
    const std::vector<double> price = {10.0, 20.0};
    const std::vector<double> volume = {1.0, 1.0};
    const auto out = vwap(price, price, price, volume);
    ASSERT_EQ(out.size(), 2u);
    EXPECT_DOUBLE_EQ(out[0], 10.0);
    EXPECT_DOUBLE_EQ(out[1], 15.0);
}

TEST(SeriesTest, ObvAddsAndSubtractsVolume) {
    const std::vector<double> close = {10.0, 11.0, 10.0, 10.0};
    const std::vector<double> volume = {5.0, 6.0, 7.0, 8.0};
    EXPECT_EQ(obv(close, volume), (std::vector<double>{0.0, 6.0, -1.0, -1.0}));
}

// ============================================================================
// Pivot Levels
// ============================================================================

static_assert(pivot_points(100.0, 90.0, 95.0).pivot == 95.0);

TEST(PatternTest, FloorPivots) {
    const auto p = pivot_points(100.0, 90.0, 95.0);
    EXPECT_DOUBLE_EQ(p.pivot, 95.0);
    EXPECT_DOUBLE_EQ(p.r1, 100.0);
    EXPECT_DOUBLE_EQ(p.s1, 90.0);
    EXPECT_DOUBLE_EQ(p.r2, 105.0);
    EXPECT_DOUBLE_EQ(p.s2, 85.0);
}

TEST(PatternTest, AdaptivePivotsOffsetByAtr) {
    const auto p = adaptive_pivots(100.0, 90.0, 95.0, 2.0);
    EXPECT_DOUBLE_EQ(p.base.pivot, 95.0);
    EXPECT_DOUBLE_EQ(p.atr_r1, 97.0);
    EXPECT_DOUBLE_EQ(p.atr_r2, 99.0);
    EXPECT_DOUBLE_EQ(p.atr_s1, 93.0);
    EXPECT_DOUBLE_EQ(p.atr_s2, 91.0);
}

// ============================================================================
// Divergence
// ============================================================================

TEST(PatternTest, BullishDivergence) {
    const std::vector<double> prices = {105, 104, 103, 100, 103, 104, 105,
                                        104, 102, 99, 95, 98, 100, 101};
    const std::vector<double> rsi_values = {40, 38, 35, 30, 35, 38, 40,
                                            42, 41, 40, 40, 41, 43, 45};

    const auto d = detect_rsi_divergence(prices, rsi_values, 14);
    EXPECT_EQ(d.type, DivergenceType::Bullish);
    EXPECT_NEAR(d.strength, 0.3, 1e-9);
}

TEST(PatternTest, BearishDivergence) {
    const std::vector<double> prices = {100, 101, 102, 105, 102, 101, 100,
                                        101, 103, 106, 110, 107, 105, 104};
    const std::vector<double> rsi_values = {60, 62, 65, 75, 65, 62, 60,
                                            58, 60, 62, 65, 63, 60, 58};

    const auto d = detect_rsi_divergence(prices, rsi_values, 14);
    EXPECT_EQ(d.type, DivergenceType::Bearish);
    EXPECT_GT(d.strength, 0.0);
    EXPECT_LE(d.strength, 1.0);
}

TEST(PatternTest, DivergenceNeedsFullLookback) {
    const std::vector<double> prices = {1.0, 2.0, 3.0};
    const auto d = detect_rsi_divergence(prices, prices, 14);
    EXPECT_EQ(d.type, DivergenceType::None);
    EXPECT_DOUBLE_EQ(d.strength, 0.0);
}

// ============================================================================
// Classifiers
// ============================================================================

TEST(PatternTest, ObvTrendRising) {
    std::vector<double> obv_values;
    for (int i = 0; i < 20; ++i) obv_values.push_back(100.0 * i);
    EXPECT_EQ(obv_trend(obv_values), Trend::Rising);
}

TEST(PatternTest, ObvTrendFalling) {
    std::vector<double> obv_values;
    for (int i = 0; i < 20; ++i) obv_values.push_back(-100.0 * i);
    EXPECT_EQ(obv_trend(obv_values), Trend::Falling);
}

TEST(PatternTest, ObvTrendShortInputIsNeutral) {
    const std::vector<double> obv_values = {1.0, 2.0, 3.0};
    EXPECT_EQ(obv_trend(obv_values), Trend::Neutral);
}

TEST(PatternTest, VolatilityRegimes) {
    const std::vector<double> prices(14, 100.0);

    const std::vector<double> flat(14, 1.0);
    EXPECT_EQ(volatility_regime(flat, prices), VolatilityRegime::Normal);

    std::vector<double> spike(13, 1.0);
    spike.push_back(10.0);
    EXPECT_EQ(volatility_regime(spike, prices), VolatilityRegime::Extreme);

    std::vector<double> calm(13, 2.0);
    calm.push_back(0.1);
    EXPECT_EQ(volatility_regime(calm, prices), VolatilityRegime::Low);

    const std::vector<double> short_atr = {1.0};
    EXPECT_EQ(volatility_regime(short_atr, prices), VolatilityRegime::Normal);
}

TEST(PatternTest, BollingerSqueeze) {
    std::vector<BollingerPoint> bands(19, BollingerPoint{0.0, 0.0, 0.0, 0.1, 0.5});
    bands.push_back(BollingerPoint{0.0, 0.0, 0.0, 0.02, 0.5});

    const auto state = detect_bollinger_squeeze(bands);
    EXPECT_TRUE(state.is_squeeze);
    EXPECT_DOUBLE_EQ(state.percentile, 0.0);
}

TEST(PatternTest, NoSqueezeOnShortHistory) {
    const std::vector<BollingerPoint> bands(5);
    const auto state = detect_bollinger_squeeze(bands);
    EXPECT_FALSE(state.is_squeeze);
    EXPECT_DOUBLE_EQ(state.percentile, 50.0);
}

TEST(PatternTest, MomentumAccelerationLength) {
    const auto values = ramp(12, 40.0, 2.0);
    const auto out = momentum_acceleration(values, 5);
    ASSERT_EQ(out.size(), 7u);
    // constant slope 2: current change 2 minus 8 / 4
    EXPECT_DOUBLE_EQ(out.front(), 0.0);
}
