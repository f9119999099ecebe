#pragma once
// ============================================================================
// AEGIS TRADE CORE - Market Signal Aggregator
// ============================================================================
// Multi-timeframe indicator snapshot and the weighted confluence score.
// Intraday / swing / daily series come from the gateway; open interest and
// funding are best-effort and default to 0 when unavailable.
// ============================================================================

#include "aegis/exchange/gateway.hpp"
#include "aegis/strategy/indicators/patterns.hpp"
#include "aegis/strategy/indicators/series.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace aegis::strategy {

// ============================================================================
// Confluence
// ============================================================================

enum class Recommendation : uint8_t {
    StrongBuy,
    Buy,
    Neutral,
    Sell,
    StrongSell
};

[[nodiscard]] std::string_view to_string(Recommendation recommendation) noexcept;

enum class DailyTrend : uint8_t { Up, Down, Sideways };

[[nodiscard]] std::string_view to_string(DailyTrend trend) noexcept;

/// Rule weights and thresholds of the confluence score
struct ConfluencePolicy {
    double trend_weight = 2.0;
    double daily_trend_weight = 1.5;

    double adx_weight = 1.5;
    double adx_strong = 25.0;
    double adx_weak = 20.0;

    double rsi_weight = 1.0;
    double rsi_oversold = 30.0;
    double rsi_overbought = 70.0;
    double rsi_neutral_low = 40.0;
    double rsi_neutral_high = 60.0;

    double stoch_weight = 1.0;
    double stoch_oversold = 20.0;
    double stoch_overbought = 80.0;

    double volume_weight = 0.5;
    double volume_surge_ratio = 1.2;

    double funding_weight = 0.5;
    double funding_crowded_longs = 0.0005;
    double funding_shorts_paying = -0.0001;

    double divergence_weight = 1.5;

    // Price within (-0.5%, +1%) of a pivot level counts as "at" it
    double pivot_weight = 1.0;
    double pivot_band_upper = 0.01;
    double pivot_band_lower = -0.005;

    double percent_b_weight = 0.5;
    double percent_b_low = 0.2;
    double percent_b_high = 0.8;

    double strong_threshold = 5.0;
    double threshold = 2.0;
};

struct ConfluenceInputs {
    double price = 0.0;
    double ema20 = 0.0;  // swing timeframe
    double ema50 = 0.0;  // swing timeframe
    double adx = 0.0;
    double rsi = 50.0;
    double volume_ratio = 1.0;
    double funding_rate = 0.0;
    Divergence divergence;
    StochRsiPoint stoch_rsi{50.0, 50.0, 50.0};
    DailyTrend daily_trend = DailyTrend::Sideways;
    PivotPoints pivots;
    double percent_b = 0.5;
};

struct ConfluenceScore {
    double bullish_points = 0.0;
    double bearish_points = 0.0;
    std::vector<std::string> factors;  // in rule order
    Recommendation recommendation = Recommendation::Neutral;

    [[nodiscard]] double net() const noexcept { return bullish_points - bearish_points; }
};

[[nodiscard]] Recommendation classify_net_score(double net,
                                                const ConfluencePolicy& policy = ConfluencePolicy{});

[[nodiscard]] ConfluenceScore compute_confluence(const ConfluenceInputs& inputs,
                                                 const ConfluencePolicy& policy = ConfluencePolicy{});

struct SuggestedLevels {
    double stop_loss = 0.0;
    double take_profit = 0.0;
};

/// SL = the closer of S1 and price - 1.5 ATR; TP keeps at least 1.5:1 reward
[[nodiscard]] SuggestedLevels suggest_levels(double price, double atr14, const PivotPoints& pivots);

// ============================================================================
// Market Snapshot
// ============================================================================

enum class VwapPosition : uint8_t { Above, Below, At };

[[nodiscard]] std::string_view to_string(VwapPosition position) noexcept;

struct IntradayView {
    double price = 0.0;
    double ema20 = 0.0;
    double macd = 0.0;
    double rsi7 = 50.0;
    // Trailing values, oldest first
    std::vector<double> prices;
    std::vector<double> ema20_series;
    std::vector<double> macd_series;
    std::vector<double> rsi7_series;
    std::vector<double> rsi14_series;
};

struct SwingView {
    double ema20 = 0.0;
    double ema50 = 0.0;
    double atr3 = 0.0;
    double atr14 = 0.0;
    double adx14 = 0.0;
    double rsi14 = 50.0;
    std::vector<double> macd_series;
    std::vector<double> rsi14_series;

    MacdPoint macd;
    Trend histogram_trend = Trend::Neutral;
    BollingerPoint bands;
    SqueezeState squeeze;
    VolatilityRegime volatility = VolatilityRegime::Normal;
    StochRsiPoint stoch_rsi{50.0, 50.0, 50.0};
    Divergence divergence;

    double vwap = 0.0;
    VwapPosition price_vs_vwap = VwapPosition::At;
    double obv = 0.0;
    Trend obv_trend = Trend::Neutral;

    double current_volume = 0.0;
    double average_volume = 0.0;
    double volume_ratio = 1.0;

    PivotPoints pivots;  // from the previous completed bar
};

struct DailyView {
    DailyTrend trend = DailyTrend::Sideways;
    double ema20 = 0.0;
    double ema50 = 0.0;
    double adx = 0.0;
    PivotPoints pivots;
};

struct MarketSnapshot {
    Instrument instrument = Instrument::BTC;
    Timestamp taken_at;

    IntradayView intraday;
    SwingView swing;
    DailyView daily;

    double open_interest = 0.0;
    double funding_rate = 0.0;

    ConfluenceScore confluence;
    SuggestedLevels levels;

    [[nodiscard]] double price() const noexcept { return intraday.price; }
};

// ============================================================================
// Configuration
// ============================================================================

struct TimeframeSpec {
    std::string timeframe;
    int limit = 100;
};

struct MarketDataConfig {
    TimeframeSpec intraday{"1m", 100};
    TimeframeSpec swing{"4h", 100};
    TimeframeSpec daily{"1d", 50};
    size_t series_tail = 10;  // trailing values kept in snapshot series
};

/// Optional market inputs; absent values are reported as unavailable
struct DerivativesData {
    std::optional<double> open_interest;
    std::optional<double> funding_rate;
};

/// Pure snapshot construction from already-fetched series.
/// Throws std::invalid_argument when a series is too short to evaluate.
[[nodiscard]] MarketSnapshot build_snapshot(Instrument instrument,
                                            const PriceSeries& intraday,
                                            const PriceSeries& swing,
                                            const PriceSeries& daily,
                                            const DerivativesData& derivatives,
                                            const MarketDataConfig& config = MarketDataConfig{},
                                            const ConfluencePolicy& policy = ConfluencePolicy{});

// ============================================================================
// Aggregator
// ============================================================================

/// Raised between fetches once the caller's deadline has passed
class DeadlineExceeded : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MarketSignalAggregator {
public:
    MarketSignalAggregator(exchange::IExchangeGateway& gateway,
                           MarketDataConfig config = MarketDataConfig{},
                           ConfluencePolicy policy = ConfluencePolicy{});

    /// Fetches all timeframes; candle fetch failures propagate as GatewayError
    [[nodiscard]] MarketSnapshot snapshot(Instrument instrument) const;

    /// Same, but throws DeadlineExceeded instead of starting a fetch after
    /// `deadline`. A request already in flight runs to its own timeout.
    [[nodiscard]] MarketSnapshot snapshot(Instrument instrument,
                                          std::chrono::steady_clock::time_point deadline) const;

    [[nodiscard]] const MarketDataConfig& config() const noexcept { return config_; }
    [[nodiscard]] const ConfluencePolicy& policy() const noexcept { return policy_; }

private:
    exchange::IExchangeGateway& gateway_;
    MarketDataConfig config_;
    ConfluencePolicy policy_;
};

}  // namespace aegis::strategy
