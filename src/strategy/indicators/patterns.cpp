// ============================================================================
// AEGIS TRADE CORE - Indicator Patterns Implementation
// ============================================================================

#include "aegis/strategy/indicators/patterns.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace aegis::strategy {

namespace {

std::span<const double> tail(std::span<const double> values, size_t count) {
    return values.subspan(values.size() - count);
}

double min_of(std::span<const double> values) {
    return *std::min_element(values.begin(), values.end());
}

double max_of(std::span<const double> values) {
    return *std::max_element(values.begin(), values.end());
}

double mean_of(std::span<const double> values) {
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

}  // namespace

// ============================================================================
// RSI Divergence
// ============================================================================

Divergence detect_rsi_divergence(std::span<const double> prices,
                                 std::span<const double> rsi_values,
                                 size_t lookback) {
    if (lookback < 2 || prices.size() < lookback || rsi_values.size() < lookback) {
        return {};
    }

    const auto recent_prices = tail(prices, lookback);
    const auto recent_rsi = tail(rsi_values, lookback);
    const size_t half = lookback / 2;

    const auto first_prices = recent_prices.first(half);
    const auto second_prices = recent_prices.subspan(half);
    const auto first_rsi = recent_rsi.first(half);
    const auto second_rsi = recent_rsi.subspan(half);

    const double price_min1 = min_of(first_prices);
    const double price_min2 = min_of(second_prices);
    const double price_max1 = max_of(first_prices);
    const double price_max2 = max_of(second_prices);
    const double rsi_min1 = min_of(first_rsi);
    const double rsi_min2 = min_of(second_rsi);
    const double rsi_max1 = max_of(first_rsi);
    const double rsi_max2 = max_of(second_rsi);

    if (price_min2 < price_min1 && rsi_min2 > rsi_min1) {
        const double price_change = (price_min1 - price_min2) / price_min1;
        const double rsi_change = (rsi_min2 - rsi_min1) / 100.0;
        return {DivergenceType::Bullish, std::min(1.0, (price_change + rsi_change) * 2.0)};
    }

    if (price_max2 > price_max1 && rsi_max2 < rsi_max1) {
        const double price_change = (price_max2 - price_max1) / price_max1;
        const double rsi_change = (rsi_max1 - rsi_max2) / 100.0;
        return {DivergenceType::Bearish, std::min(1.0, (price_change + rsi_change) * 2.0)};
    }

    if (price_min2 > price_min1 && rsi_min2 < rsi_min1) {
        return {DivergenceType::HiddenBullish, std::min(1.0, std::abs(rsi_min1 - rsi_min2) / 20.0)};
    }

    if (price_max2 < price_max1 && rsi_max2 > rsi_max1) {
        return {DivergenceType::HiddenBearish, std::min(1.0, std::abs(rsi_max2 - rsi_max1) / 20.0)};
    }

    return {};
}

// ============================================================================
// Volume / volatility classifiers
// ============================================================================

Trend obv_trend(std::span<const double> obv_values, size_t ema_period) {
    if (obv_values.size() < ema_period + 1) return Trend::Neutral;

    const auto smoothed = ema(obv_values, ema_period);
    if (smoothed.size() < 2) return Trend::Neutral;

    const double current = smoothed[smoothed.size() - 1];
    const double previous = smoothed[smoothed.size() - 2];
    const double base = previous != 0.0 ? std::abs(previous) : 1.0;
    const double change = (current - previous) / base;

    if (change > 0.01) return Trend::Rising;
    if (change < -0.01) return Trend::Falling;
    return Trend::Neutral;
}

VolatilityRegime volatility_regime(std::span<const double> atr_values,
                                   std::span<const double> prices,
                                   size_t lookback) {
    if (lookback == 0 || atr_values.size() < lookback || prices.size() < lookback) {
        return VolatilityRegime::Normal;
    }

    const auto recent_atr = tail(atr_values, lookback);
    const auto recent_prices = tail(prices, lookback);

    std::vector<double> atr_pct;
    atr_pct.reserve(lookback);
    for (size_t i = 0; i < lookback; ++i) {
        if (recent_prices[i] <= 0.0) return VolatilityRegime::Normal;
        atr_pct.push_back(recent_atr[i] / recent_prices[i] * 100.0);
    }

    const double current = atr_pct.back();
    const double average = mean_of(atr_pct);
    if (average <= 0.0) return VolatilityRegime::Normal;

    if (current < average * 0.5) return VolatilityRegime::Low;
    if (current < average * 1.2) return VolatilityRegime::Normal;
    if (current < average * 2.0) return VolatilityRegime::High;
    return VolatilityRegime::Extreme;
}

SqueezeState detect_bollinger_squeeze(std::span<const BollingerPoint> bands, size_t lookback) {
    if (lookback == 0 || bands.size() < lookback) {
        return {};
    }

    std::vector<double> widths;
    widths.reserve(lookback);
    for (const auto& point : bands.subspan(bands.size() - lookback)) {
        widths.push_back(point.bandwidth);
    }

    const double current = widths.back();
    const double average = mean_of(widths);

    std::vector<double> sorted = widths;
    std::sort(sorted.begin(), sorted.end());
    const auto rank = std::lower_bound(sorted.begin(), sorted.end(), current) - sorted.begin();

    return SqueezeState{
        .is_squeeze = current < average * 0.7,
        .percentile = static_cast<double>(rank) / static_cast<double>(sorted.size()) * 100.0,
    };
}

std::vector<double> momentum_acceleration(std::span<const double> rsi_values, size_t period) {
    std::vector<double> out;
    if (period < 2 || rsi_values.size() < period + 1) return out;

    const auto span_len = static_cast<double>(period - 1);
    for (size_t i = period; i < rsi_values.size(); ++i) {
        const double current_change = rsi_values[i] - rsi_values[i - 1];
        const double previous_change = rsi_values[i - 1] - rsi_values[i - period];
        out.push_back(current_change - previous_change / span_len);
    }
    return out;
}

// ============================================================================
// Names
// ============================================================================

std::string_view to_string(DivergenceType type) noexcept {
    switch (type) {
        case DivergenceType::None: return "none";
        case DivergenceType::Bullish: return "bullish";
        case DivergenceType::Bearish: return "bearish";
        case DivergenceType::HiddenBullish: return "hidden_bullish";
        case DivergenceType::HiddenBearish: return "hidden_bearish";
    }
    return "none";
}

std::string_view to_string(Trend trend) noexcept {
    switch (trend) {
        case Trend::Rising: return "rising";
        case Trend::Falling: return "falling";
        case Trend::Neutral: return "neutral";
    }
    return "neutral";
}

std::string_view to_string(VolatilityRegime regime) noexcept {
    switch (regime) {
        case VolatilityRegime::Low: return "low";
        case VolatilityRegime::Normal: return "normal";
        case VolatilityRegime::High: return "high";
        case VolatilityRegime::Extreme: return "extreme";
    }
    return "normal";
}

}  // namespace aegis::strategy
