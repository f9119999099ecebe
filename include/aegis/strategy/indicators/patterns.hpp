#pragma once
// ============================================================================
// AEGIS TRADE CORE - Indicator Patterns
// ============================================================================
// Detectors and classifiers built on top of indicator series:
// divergence, OBV trend, volatility regime, squeeze, pivot levels
// ============================================================================

#include "aegis/strategy/indicators/series.hpp"

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace aegis::strategy {

// ============================================================================
// RSI Divergence
// ============================================================================

enum class DivergenceType {
    None,
    Bullish,        // price lower low, RSI higher low
    Bearish,        // price higher high, RSI lower high
    HiddenBullish,  // price higher low, RSI lower low
    HiddenBearish   // price lower high, RSI higher high
};

struct Divergence {
    DivergenceType type = DivergenceType::None;
    double strength = 0.0;  // [0, 1]
};

/// Compares the two halves of the trailing `lookback` window of each series
[[nodiscard]] Divergence detect_rsi_divergence(std::span<const double> prices,
                                               std::span<const double> rsi_values,
                                               size_t lookback = 14);

// ============================================================================
// Volume / volatility classifiers
// ============================================================================

enum class Trend { Rising, Falling, Neutral };

/// Direction of a short EMA of OBV with a 1% deadband
[[nodiscard]] Trend obv_trend(std::span<const double> obv_values, size_t ema_period = 10);

enum class VolatilityRegime { Low, Normal, High, Extreme };

/// ATR as a percent of price against its own trailing average
[[nodiscard]] VolatilityRegime volatility_regime(std::span<const double> atr_values,
                                                 std::span<const double> prices,
                                                 size_t lookback = 14);

struct SqueezeState {
    bool is_squeeze = false;
    double percentile = 50.0;  // rank of current bandwidth within the window
};

[[nodiscard]] SqueezeState detect_bollinger_squeeze(std::span<const BollingerPoint> bands,
                                                    size_t lookback = 20);

/// RSI rate-of-change acceleration, length n - period
[[nodiscard]] std::vector<double> momentum_acceleration(std::span<const double> rsi_values,
                                                        size_t period = 5);

// ============================================================================
// Pivot levels
// ============================================================================

struct PivotPoints {
    double pivot = 0.0;
    double r1 = 0.0;
    double r2 = 0.0;
    double s1 = 0.0;
    double s2 = 0.0;
};

/// Classic floor pivots from a completed bar
[[nodiscard]] constexpr PivotPoints pivot_points(double high, double low, double close) noexcept {
    const double pivot = (high + low + close) / 3.0;
    return PivotPoints{
        .pivot = pivot,
        .r1 = 2.0 * pivot - low,
        .r2 = pivot + (high - low),
        .s1 = 2.0 * pivot - high,
        .s2 = pivot - (high - low),
    };
}

struct AdaptivePivots {
    PivotPoints base;
    double atr_r1 = 0.0;
    double atr_r2 = 0.0;
    double atr_s1 = 0.0;
    double atr_s2 = 0.0;
};

/// Pivot plus/minus one and two ATRs
[[nodiscard]] constexpr AdaptivePivots adaptive_pivots(double high, double low, double close,
                                                       double atr_value) noexcept {
    const PivotPoints base = pivot_points(high, low, close);
    return AdaptivePivots{
        .base = base,
        .atr_r1 = base.pivot + atr_value,
        .atr_r2 = base.pivot + 2.0 * atr_value,
        .atr_s1 = base.pivot - atr_value,
        .atr_s2 = base.pivot - 2.0 * atr_value,
    };
}

[[nodiscard]] std::string_view to_string(DivergenceType type) noexcept;
[[nodiscard]] std::string_view to_string(Trend trend) noexcept;
[[nodiscard]] std::string_view to_string(VolatilityRegime regime) noexcept;

}  // namespace aegis::strategy
