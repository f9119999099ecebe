// ============================================================================
// AEGIS TRADE CORE - RSI Unit Tests
// ============================================================================

#include "aegis/strategy/indicators/rsi.hpp"
#include "aegis/strategy/indicators/series.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace aegis::strategy;

class RSITest : public ::testing::Test {
protected:
    RSI rsi{14};
};

TEST_F(RSITest, InitiallyNotReady) {
    EXPECT_FALSE(rsi.is_ready());
    EXPECT_DOUBLE_EQ(rsi.value(), 50.0);
}

TEST_F(RSITest, ReadyAfterPeriodChanges) {
    // 14 changes need 15 prices
    for (int i = 0; i < 14; ++i) {
        rsi.update(100.0 + i);
    }
    EXPECT_FALSE(rsi.is_ready());
    rsi.update(114.0);
    EXPECT_TRUE(rsi.is_ready());
}

TEST_F(RSITest, ValueInValidRange) {
    std::vector<double> prices = {
        44.0, 44.34, 44.09, 43.61, 44.33,
        44.83, 45.10, 45.42, 45.84, 46.08,
        45.89, 46.03, 45.61, 46.28, 46.28,
        46.00, 46.03, 46.41, 46.22, 45.64
    };

    for (double price : prices) {
        rsi.update(price);
    }

    ASSERT_TRUE(rsi.is_ready());
    EXPECT_GE(rsi.value(), 0.0);
    EXPECT_LE(rsi.value(), 100.0);
}

TEST_F(RSITest, AllGainsIsHundred) {
    double price = 100.0;
    for (int i = 0; i < 20; ++i) {
        price += 2.0;
        rsi.update(price);
    }

    ASSERT_TRUE(rsi.is_ready());
    EXPECT_DOUBLE_EQ(rsi.value(), 100.0);
    EXPECT_TRUE(rsi.is_overbought());
}

TEST_F(RSITest, OversoldDetection) {
    double price = 100.0;
    for (int i = 0; i < 20; ++i) {
        price -= 2.0;
        rsi.update(price);
    }

    ASSERT_TRUE(rsi.is_ready());
    EXPECT_LT(rsi.value(), 30.0);
    EXPECT_TRUE(rsi.is_oversold());
}

TEST_F(RSITest, Reset) {
    for (int i = 0; i < 20; ++i) {
        rsi.update(100.0 + i);
    }
    EXPECT_TRUE(rsi.is_ready());

    rsi.reset();
    EXPECT_FALSE(rsi.is_ready());
}

TEST(RSISeriesTest, MatchesStreamingIndicator) {
    std::vector<double> prices;
    for (int i = 0; i < 40; ++i) {
        prices.push_back(100.0 + (i % 5) * 1.5 - (i % 3));
    }

    const auto values = rsi(prices, 14);
    ASSERT_EQ(values.size(), prices.size() - 14);

    RSI streaming(14);
    for (double p : prices) streaming.update(p);
    EXPECT_NEAR(values.back(), streaming.value(), 1e-9);
}

TEST(RSISeriesTest, ShortInputIsEmpty) {
    const std::vector<double> prices = {1.0, 2.0, 3.0};
    EXPECT_TRUE(rsi(prices, 14).empty());
}
