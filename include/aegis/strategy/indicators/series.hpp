#pragma once
// ============================================================================
// AEGIS TRADE CORE - Indicator Series
// ============================================================================
// Pure functions over OHLCV columns. Each output is aligned to the END of its
// input and is shorter by the indicator's warm-up window.
// ============================================================================

#include "aegis/core/types.hpp"

#include <cstddef>
#include <span>
#include <vector>

namespace aegis::strategy {

// ============================================================================
// Column extraction
// ============================================================================

[[nodiscard]] std::vector<double> closes(const PriceSeries& series);
[[nodiscard]] std::vector<double> highs(const PriceSeries& series);
[[nodiscard]] std::vector<double> lows(const PriceSeries& series);
[[nodiscard]] std::vector<double> volumes(const PriceSeries& series);

// ============================================================================
// Result rows
// ============================================================================

struct MacdPoint {
    double macd = 0.0;
    double signal = 0.0;
    double histogram = 0.0;
};

struct BollingerPoint {
    double upper = 0.0;
    double middle = 0.0;
    double lower = 0.0;
    double bandwidth = 0.0;
    double percent_b = 0.5;
};

struct StochRsiPoint {
    double stoch_rsi = 0.0;
    double k = 0.0;
    double d = 0.0;
};

// ============================================================================
// Trend and momentum
// ============================================================================

/// Length n - period + 1
[[nodiscard]] std::vector<double> ema(std::span<const double> values, size_t period);

/// Length n - period + 1
[[nodiscard]] std::vector<double> sma(std::span<const double> values, size_t period);

/// Rows start once the signal line is ready: length n - slow - signal + 2
[[nodiscard]] std::vector<MacdPoint> macd(std::span<const double> values,
                                          size_t fast_period = 12,
                                          size_t slow_period = 26,
                                          size_t signal_period = 9);

/// Wilder RSI, length n - period
[[nodiscard]] std::vector<double> rsi(std::span<const double> values, size_t period = 14);

[[nodiscard]] std::vector<StochRsiPoint> stoch_rsi(std::span<const double> values,
                                                   size_t rsi_period = 14,
                                                   size_t stoch_period = 14,
                                                   size_t k_period = 3,
                                                   size_t d_period = 3);

// ============================================================================
// Volatility
// ============================================================================

/// Wilder ATR, length n - period. Mismatched column lengths yield an empty result.
[[nodiscard]] std::vector<double> atr(std::span<const double> high,
                                      std::span<const double> low,
                                      std::span<const double> close,
                                      size_t period = 14);

/// Wilder ADX, length n - 2*period + 1
[[nodiscard]] std::vector<double> adx(std::span<const double> high,
                                      std::span<const double> low,
                                      std::span<const double> close,
                                      size_t period = 14);

[[nodiscard]] std::vector<BollingerPoint> bollinger(std::span<const double> values,
                                                    size_t period = 20,
                                                    double std_dev_multiplier = 2.0);

// ============================================================================
// Volume
// ============================================================================

/// Cumulative VWAP with no session reset; same length as the input
[[nodiscard]] std::vector<double> vwap(std::span<const double> high,
                                       std::span<const double> low,
                                       std::span<const double> close,
                                       std::span<const double> volume);

/// On-balance volume starting at 0; same length as the input (empty below 2 bars)
[[nodiscard]] std::vector<double> obv(std::span<const double> close,
                                      std::span<const double> volume);

}  // namespace aegis::strategy
