// ============================================================================
// AEGIS TRADE CORE - Market Signal Aggregator Implementation
// ============================================================================

#include "aegis/strategy/market_signal.hpp"

#include "aegis/utils/logger.hpp"

#include <numeric>
#include <stdexcept>

namespace aegis::strategy {

namespace {

double last_or(const std::vector<double>& values, double fallback) {
    return values.empty() ? fallback : values.back();
}

std::vector<double> tail(const std::vector<double>& values, size_t count) {
    if (values.size() <= count) return values;
    return {values.end() - static_cast<std::ptrdiff_t>(count), values.end()};
}

std::vector<double> macd_lines(const std::vector<MacdPoint>& rows) {
    std::vector<double> out;
    out.reserve(rows.size());
    for (const auto& row : rows) out.push_back(row.macd);
    return out;
}

/// Floor pivots of the bar before the newest (still forming) one
PivotPoints previous_bar_pivots(const PriceSeries& series) {
    const auto& bar = series[series.size() - 2];
    return pivot_points(bar.high, bar.low, bar.close);
}

void require_bars(const PriceSeries& series, size_t minimum, std::string_view name) {
    if (series.size() < minimum) {
        throw std::invalid_argument(fmt::format("{} series has {} candles, need at least {}", name,
                                                series.size(), minimum));
    }
}

IntradayView build_intraday(const PriceSeries& series, size_t keep) {
    const auto close = closes(series);
    const auto ema20 = ema(close, 20);
    const auto macd_rows = macd_lines(macd(close));
    const auto rsi7 = rsi(close, 7);
    const auto rsi14 = rsi(close, 14);

    IntradayView view;
    view.price = close.back();
    view.ema20 = last_or(ema20, 0.0);
    view.macd = last_or(macd_rows, 0.0);
    view.rsi7 = last_or(rsi7, 50.0);
    view.prices = tail(close, keep);
    view.ema20_series = tail(ema20, keep);
    view.macd_series = tail(macd_rows, keep);
    view.rsi7_series = tail(rsi7, keep);
    view.rsi14_series = tail(rsi14, keep);
    return view;
}

SwingView build_swing(const PriceSeries& series, double price, size_t keep) {
    const auto close = closes(series);
    const auto high = highs(series);
    const auto low = lows(series);
    const auto volume = volumes(series);

    SwingView view;
    view.ema20 = last_or(ema(close, 20), 0.0);
    view.ema50 = last_or(ema(close, 50), 0.0);
    view.atr3 = last_or(atr(high, low, close, 3), 0.0);

    const auto atr14 = atr(high, low, close, 14);
    view.atr14 = last_or(atr14, 0.0);
    view.adx14 = last_or(adx(high, low, close, 14), 0.0);

    const auto rsi14 = rsi(close, 14);
    view.rsi14 = last_or(rsi14, 50.0);
    view.rsi14_series = tail(rsi14, keep);

    const auto macd_rows = macd(close);
    view.macd_series = tail(macd_lines(macd_rows), keep);
    if (!macd_rows.empty()) {
        view.macd = macd_rows.back();
    }
    if (macd_rows.size() >= 2) {
        const double current = macd_rows[macd_rows.size() - 1].histogram;
        const double previous = macd_rows[macd_rows.size() - 2].histogram;
        view.histogram_trend = current > previous   ? Trend::Rising
                               : current < previous ? Trend::Falling
                                                    : Trend::Neutral;
    }

    const auto bands = bollinger(close, 20, 2.0);
    if (!bands.empty()) {
        view.bands = bands.back();
    }
    view.squeeze = detect_bollinger_squeeze(bands);
    view.volatility = volatility_regime(atr14, close);

    const auto stoch = stoch_rsi(close);
    if (!stoch.empty()) {
        view.stoch_rsi = stoch.back();
    }
    view.divergence = detect_rsi_divergence(close, rsi14, 14);

    view.vwap = last_or(vwap(high, low, close, volume), close.back());
    view.price_vs_vwap = price > view.vwap * 1.001   ? VwapPosition::Above
                         : price < view.vwap * 0.999 ? VwapPosition::Below
                                                     : VwapPosition::At;

    const auto obv_values = obv(close, volume);
    view.obv = last_or(obv_values, 0.0);
    view.obv_trend = obv_trend(obv_values);

    view.current_volume = volume.back();
    view.average_volume =
        std::accumulate(volume.begin(), volume.end(), 0.0) / static_cast<double>(volume.size());
    view.volume_ratio = view.average_volume > 0.0 ? view.current_volume / view.average_volume : 1.0;

    view.pivots = previous_bar_pivots(series);
    return view;
}

DailyView build_daily(const PriceSeries& series) {
    const auto close = closes(series);
    const auto high = highs(series);
    const auto low = lows(series);

    DailyView view;
    view.ema20 = last_or(ema(close, 20), 0.0);
    view.ema50 = last_or(ema(close, 50), 0.0);
    view.adx = last_or(adx(high, low, close, 14), 0.0);
    view.trend = view.ema20 > view.ema50 * 1.002   ? DailyTrend::Up
                 : view.ema20 < view.ema50 * 0.998 ? DailyTrend::Down
                                                   : DailyTrend::Sideways;
    view.pivots = previous_bar_pivots(series);
    return view;
}

}  // namespace

std::string_view to_string(VwapPosition position) noexcept {
    switch (position) {
        case VwapPosition::Above: return "above";
        case VwapPosition::Below: return "below";
        case VwapPosition::At: return "at";
    }
    return "at";
}

// ============================================================================
// Snapshot
// ============================================================================

MarketSnapshot build_snapshot(Instrument instrument,
                              const PriceSeries& intraday,
                              const PriceSeries& swing,
                              const PriceSeries& daily,
                              const DerivativesData& derivatives,
                              const MarketDataConfig& config,
                              const ConfluencePolicy& policy) {
    require_bars(intraday, 1, "intraday");
    require_bars(swing, 2, "swing");
    require_bars(daily, 2, "daily");

    MarketSnapshot snapshot;
    snapshot.instrument = instrument;
    snapshot.taken_at = now();
    snapshot.intraday = build_intraday(intraday, config.series_tail);
    snapshot.swing = build_swing(swing, snapshot.intraday.price, config.series_tail);
    snapshot.daily = build_daily(daily);
    snapshot.open_interest = derivatives.open_interest.value_or(0.0);
    snapshot.funding_rate = derivatives.funding_rate.value_or(0.0);

    ConfluenceInputs inputs;
    inputs.price = snapshot.intraday.price;
    inputs.ema20 = snapshot.swing.ema20;
    inputs.ema50 = snapshot.swing.ema50;
    inputs.adx = snapshot.swing.adx14;
    inputs.rsi = snapshot.swing.rsi14;
    inputs.volume_ratio = snapshot.swing.volume_ratio;
    inputs.funding_rate = snapshot.funding_rate;
    inputs.divergence = snapshot.swing.divergence;
    inputs.stoch_rsi = snapshot.swing.stoch_rsi;
    inputs.daily_trend = snapshot.daily.trend;
    inputs.pivots = snapshot.swing.pivots;
    inputs.percent_b = snapshot.swing.bands.percent_b;

    snapshot.confluence = compute_confluence(inputs, policy);
    if (!derivatives.open_interest) {
        snapshot.confluence.factors.emplace_back("Open interest unavailable");
    }
    if (!derivatives.funding_rate) {
        snapshot.confluence.factors.emplace_back("Funding rate unavailable");
    }

    snapshot.levels = suggest_levels(snapshot.intraday.price, snapshot.swing.atr14, snapshot.swing.pivots);
    return snapshot;
}

// ============================================================================
// Aggregator
// ============================================================================

MarketSignalAggregator::MarketSignalAggregator(exchange::IExchangeGateway& gateway,
                                               MarketDataConfig config,
                                               ConfluencePolicy policy)
    : gateway_(gateway), config_(std::move(config)), policy_(policy) {}

MarketSnapshot MarketSignalAggregator::snapshot(Instrument instrument) const {
    return snapshot(instrument, std::chrono::steady_clock::time_point::max());
}

MarketSnapshot MarketSignalAggregator::snapshot(Instrument instrument,
                                                std::chrono::steady_clock::time_point deadline) const {
    SCOPED_TIMER("market snapshot");

    const auto check_deadline = [&](std::string_view next) {
        if (std::chrono::steady_clock::now() >= deadline) {
            throw DeadlineExceeded(fmt::format("deadline passed before {} fetch for {}", next,
                                               pair_name(instrument)));
        }
    };

    check_deadline(config_.intraday.timeframe);
    const auto intraday = gateway_.fetch_ohlcv(instrument, config_.intraday.timeframe, config_.intraday.limit);
    check_deadline(config_.swing.timeframe);
    const auto swing = gateway_.fetch_ohlcv(instrument, config_.swing.timeframe, config_.swing.limit);
    check_deadline(config_.daily.timeframe);
    const auto daily = gateway_.fetch_ohlcv(instrument, config_.daily.timeframe, config_.daily.limit);

    DerivativesData derivatives;
    check_deadline("open interest");
    try {
        derivatives.open_interest = gateway_.fetch_open_interest(instrument).amount;
    } catch (const exchange::GatewayError& e) {
        LOG_WARN("Open interest unavailable for {}: {}", pair_name(instrument), e.what());
    }
    check_deadline("funding rate");
    try {
        derivatives.funding_rate = gateway_.fetch_funding_rate(instrument).rate;
    } catch (const exchange::GatewayError& e) {
        LOG_WARN("Funding rate unavailable for {}: {}", pair_name(instrument), e.what());
    }

    auto snapshot = build_snapshot(instrument, intraday, swing, daily, derivatives, config_, policy_);
    LOG_INFO("{} price={} confluence bull={:.2f} bear={:.2f} -> {}", pair_name(instrument),
             snapshot.price(), snapshot.confluence.bullish_points, snapshot.confluence.bearish_points,
             to_string(snapshot.confluence.recommendation));
    for (const auto& factor : snapshot.confluence.factors) {
        LOG_DEBUG("  {} factor: {}", pair_name(instrument), factor);
    }
    return snapshot;
}

}  // namespace aegis::strategy
