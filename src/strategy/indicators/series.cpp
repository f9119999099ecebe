// ============================================================================
// AEGIS TRADE CORE - Indicator Series Implementation
// ============================================================================
// Each series replays its input through the streaming indicator and keeps
// the values produced once the indicator is ready
// ============================================================================

#include "aegis/strategy/indicators/series.hpp"

#include "aegis/strategy/indicators/atr.hpp"
#include "aegis/strategy/indicators/bollinger.hpp"
#include "aegis/strategy/indicators/ema.hpp"
#include "aegis/strategy/indicators/macd.hpp"
#include "aegis/strategy/indicators/rsi.hpp"

namespace aegis::strategy {

namespace {

template <Indicator T>
std::vector<double> replay(T indicator, std::span<const double> values) {
    std::vector<double> out;
    for (const double value : values) {
        indicator.update(value);
        if (indicator.is_ready()) {
            out.push_back(indicator.value());
        }
    }
    return out;
}

template <BarIndicator T>
std::vector<double> replay_bars(T indicator,
                                std::span<const double> high,
                                std::span<const double> low,
                                std::span<const double> close) {
    std::vector<double> out;
    if (high.size() != low.size() || low.size() != close.size()) {
        return out;
    }
    for (size_t i = 0; i < close.size(); ++i) {
        indicator.update(high[i], low[i], close[i]);
        if (indicator.is_ready()) {
            out.push_back(indicator.value());
        }
    }
    return out;
}

template <typename Field>
std::vector<double> column(const PriceSeries& series, Field field) {
    std::vector<double> out;
    out.reserve(series.size());
    for (const auto& candle : series) {
        out.push_back(candle.*field);
    }
    return out;
}

}  // namespace

// ============================================================================
// Column extraction
// ============================================================================

std::vector<double> closes(const PriceSeries& series) { return column(series, &Candle::close); }
std::vector<double> highs(const PriceSeries& series) { return column(series, &Candle::high); }
std::vector<double> lows(const PriceSeries& series) { return column(series, &Candle::low); }
std::vector<double> volumes(const PriceSeries& series) { return column(series, &Candle::volume); }

// ============================================================================
// Trend and momentum
// ============================================================================

std::vector<double> ema(std::span<const double> values, size_t period) {
    return replay(EMA{period}, values);
}

std::vector<double> sma(std::span<const double> values, size_t period) {
    return replay(SMA{period}, values);
}

std::vector<MacdPoint> macd(std::span<const double> values,
                            size_t fast_period,
                            size_t slow_period,
                            size_t signal_period) {
    MACD indicator(fast_period, slow_period, signal_period);
    std::vector<MacdPoint> out;
    for (const double value : values) {
        indicator.update(value);
        if (indicator.is_ready()) {
            out.push_back({indicator.value(), indicator.signal_line(), indicator.histogram()});
        }
    }
    return out;
}

std::vector<double> rsi(std::span<const double> values, size_t period) {
    return replay(RSI{period}, values);
}

std::vector<StochRsiPoint> stoch_rsi(std::span<const double> values,
                                     size_t rsi_period,
                                     size_t stoch_period,
                                     size_t k_period,
                                     size_t d_period) {
    StochasticRSI indicator(rsi_period, stoch_period, k_period, d_period);
    std::vector<StochRsiPoint> out;
    for (const double value : values) {
        indicator.update(value);
        if (indicator.is_ready()) {
            out.push_back({indicator.raw(), indicator.k(), indicator.d()});
        }
    }
    return out;
}

// ============================================================================
// Volatility
// ============================================================================

std::vector<double> atr(std::span<const double> high,
                        std::span<const double> low,
                        std::span<const double> close,
                        size_t period) {
    return replay_bars(ATR{period}, high, low, close);
}

std::vector<double> adx(std::span<const double> high,
                        std::span<const double> low,
                        std::span<const double> close,
                        size_t period) {
    return replay_bars(ADX{period}, high, low, close);
}

std::vector<BollingerPoint> bollinger(std::span<const double> values,
                                      size_t period,
                                      double std_dev_multiplier) {
    BollingerBands bands(period, std_dev_multiplier);
    std::vector<BollingerPoint> out;
    for (const double value : values) {
        bands.update(value);
        if (bands.is_ready()) {
            out.push_back({bands.upper_band(), bands.value(), bands.lower_band(),
                           bands.band_width(), bands.percent_b()});
        }
    }
    return out;
}

// ============================================================================
// Volume
// ============================================================================

std::vector<double> vwap(std::span<const double> high,
                         std::span<const double> low,
                         std::span<const double> close,
                         std::span<const double> volume) {
    std::vector<double> out;
    if (high.size() != low.size() || low.size() != close.size() || close.size() != volume.size()) {
        return out;
    }

    out.reserve(close.size());
    double cumulative_pv = 0.0;
    double cumulative_volume = 0.0;
    for (size_t i = 0; i < close.size(); ++i) {
        const double typical = (high[i] + low[i] + close[i]) / 3.0;
        cumulative_pv += typical * volume[i];
        cumulative_volume += volume[i];
        out.push_back(cumulative_volume > 0.0 ? cumulative_pv / cumulative_volume : typical);
    }
    return out;
}

std::vector<double> obv(std::span<const double> close, std::span<const double> volume) {
    std::vector<double> out;
    if (close.size() != volume.size() || close.size() < 2) {
        return out;
    }

    out.reserve(close.size());
    out.push_back(0.0);
    for (size_t i = 1; i < close.size(); ++i) {
        double next = out.back();
        if (close[i] > close[i - 1]) {
            next += volume[i];
        } else if (close[i] < close[i - 1]) {
            next -= volume[i];
        }
        out.push_back(next);
    }
    return out;
}

}  // namespace aegis::strategy
