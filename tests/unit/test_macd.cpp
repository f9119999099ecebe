// ============================================================================
// AEGIS TRADE CORE - MACD Unit Tests
// ============================================================================

#include "aegis/strategy/indicators/macd.hpp"
#include "aegis/strategy/indicators/series.hpp"

#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace aegis::strategy;

TEST(MACDTest, InitiallyNotReady) {
    MACD macd;
    EXPECT_FALSE(macd.is_ready());
    EXPECT_FALSE(macd.is_line_ready());
}

TEST(MACDTest, FastMustBeShorterThanSlow) {
    EXPECT_THROW({ MACD inverted(26, 12, 9); }, std::invalid_argument);
}

TEST(MACDTest, ReadyAfterSlowPlusSignalBars) {
    MACD macd;
    for (int i = 0; i < 33; ++i) macd.update(100.0 + i);
    EXPECT_TRUE(macd.is_line_ready());
    EXPECT_FALSE(macd.is_ready());
    macd.update(133.0);
    EXPECT_TRUE(macd.is_ready());
}

TEST(MACDTest, UptrendHasPositiveLine) {
    MACD macd;
    for (int i = 0; i < 60; ++i) macd.update(100.0 + i * 0.5);
    ASSERT_TRUE(macd.is_ready());
    EXPECT_GT(macd.value(), 0.0);
}

TEST(MACDTest, FlatSeriesIsZero) {
    MACD macd;
    for (int i = 0; i < 60; ++i) macd.update(50.0);
    EXPECT_NEAR(macd.value(), 0.0, 1e-12);
    EXPECT_NEAR(macd.histogram(), 0.0, 1e-12);
}

TEST(MACDSeriesTest, LengthStartsAtSignalReadiness) {
    std::vector<double> prices;
    for (int i = 0; i < 100; ++i) prices.push_back(100.0 + i);

    const auto rows = macd(prices);
    EXPECT_EQ(rows.size(), prices.size() - 26 - 9 + 2);
    for (const auto& row : rows) {
        EXPECT_NEAR(row.histogram, row.macd - row.signal, 1e-9);
    }
}
