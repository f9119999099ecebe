#pragma once
// ============================================================================
// AEGIS TRADE CORE - MACD (Moving Average Convergence Divergence)
// ============================================================================
// Trend-following momentum indicator, EMA oscillator and EMA signal line
// Standard settings: 12/26/9
// ============================================================================

#include "ema.hpp"
#include "indicator_base.hpp"

#include <cmath>
#include <stdexcept>

namespace aegis::strategy {

class MACD : public IndicatorBase<MACD> {
public:
    MACD(size_t fast_period = 12, size_t slow_period = 26, size_t signal_period = 9)
        : fast_ema_(fast_period), slow_ema_(slow_period), signal_ema_(signal_period) {
        if (fast_period >= slow_period) {
            throw std::invalid_argument("MACD fast period must be less than slow period");
        }
        reset_impl();
    }

    void update_impl(double price) {
        fast_ema_.update(price);
        slow_ema_.update(price);

        if (slow_ema_.is_ready()) {
            macd_line_ = fast_ema_.value() - slow_ema_.value();
            signal_ema_.update(macd_line_);

            prev_histogram_ = histogram_;
            histogram_ = macd_line_ - signal_ema_.value();
        }
    }

    /// MACD line (fast EMA - slow EMA)
    [[nodiscard]] double value_impl() const { return macd_line_; }

    /// Signal line (EMA of MACD)
    [[nodiscard]] double signal_line() const { return signal_ema_.value(); }

    /// Histogram (MACD - Signal)
    [[nodiscard]] double histogram() const { return histogram_; }

    [[nodiscard]] bool is_line_ready() const { return slow_ema_.is_ready(); }

    [[nodiscard]] bool is_ready_impl() const { return signal_ema_.is_ready(); }

    void reset_impl() {
        macd_line_ = 0.0;
        histogram_ = 0.0;
        prev_histogram_ = 0.0;
        fast_ema_.reset();
        slow_ema_.reset();
        signal_ema_.reset();
    }

    [[nodiscard]] size_t period_impl() const { return slow_ema_.period() + signal_ema_.period() - 1; }

    /// Histogram expanding (momentum increasing)
    [[nodiscard]] bool is_momentum_increasing() const {
        return is_ready_impl() && std::abs(histogram_) > std::abs(prev_histogram_);
    }

private:
    EMA fast_ema_;
    EMA slow_ema_;
    EMA signal_ema_;

    double macd_line_ = 0.0;
    double histogram_ = 0.0;
    double prev_histogram_ = 0.0;
};

}  // namespace aegis::strategy
