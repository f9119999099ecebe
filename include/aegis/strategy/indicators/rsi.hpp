#pragma once
// ============================================================================
// AEGIS TRADE CORE - RSI (Relative Strength Index) and Stochastic RSI
// ============================================================================
// Momentum oscillators, range 0-100, overbought > 70, oversold < 30
// ============================================================================

#include "ema.hpp"
#include "indicator_base.hpp"

#include <algorithm>
#include <cmath>

namespace aegis::strategy {

/// RSI with Wilder's smoothing, seeded by the mean of the first `period` changes
class RSI : public IndicatorBase<RSI> {
public:
    static constexpr double OVERBOUGHT = 70.0;
    static constexpr double OVERSOLD = 30.0;

    explicit RSI(size_t period = 14) : period_(require_period(period)) { reset_impl(); }

    void update_impl(double price) {
        if (!has_prev_) {
            prev_price_ = price;
            has_prev_ = true;
            return;
        }

        const double change = price - prev_price_;
        prev_price_ = price;
        ++changes_;

        const double gain = std::max(change, 0.0);
        const double loss = std::max(-change, 0.0);
        const auto n = static_cast<double>(period_);

        if (changes_ <= period_) {
            gain_sum_ += gain;
            loss_sum_ += loss;
            if (changes_ == period_) {
                avg_gain_ = gain_sum_ / n;
                avg_loss_ = loss_sum_ / n;
            }
        } else {
            avg_gain_ = (avg_gain_ * (n - 1.0) + gain) / n;
            avg_loss_ = (avg_loss_ * (n - 1.0) + loss) / n;
        }
    }

    [[nodiscard]] double value_impl() const {
        if (!is_ready_impl()) return 50.0;  // Neutral value if not ready
        if (avg_loss_ == 0.0) return 100.0;  // All gains, max RSI

        const double rs = avg_gain_ / avg_loss_;
        return 100.0 - (100.0 / (1.0 + rs));
    }

    [[nodiscard]] bool is_ready_impl() const { return changes_ >= period_; }

    void reset_impl() {
        has_prev_ = false;
        changes_ = 0;
        prev_price_ = 0.0;
        gain_sum_ = 0.0;
        loss_sum_ = 0.0;
        avg_gain_ = 0.0;
        avg_loss_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return period_; }

    [[nodiscard]] bool is_overbought() const { return is_ready_impl() && value_impl() > OVERBOUGHT; }
    [[nodiscard]] bool is_oversold() const { return is_ready_impl() && value_impl() < OVERSOLD; }

private:
    size_t period_;
    bool has_prev_ = false;
    size_t changes_ = 0;
    double prev_price_ = 0.0;
    double gain_sum_ = 0.0;
    double loss_sum_ = 0.0;
    double avg_gain_ = 0.0;
    double avg_loss_ = 0.0;
};

/// Stochastic RSI: %K = SMA(k) of raw stoch RSI, %D = SMA(d) of %K
class StochasticRSI : public IndicatorBase<StochasticRSI> {
public:
    StochasticRSI(size_t rsi_period = 14, size_t stoch_period = 14,
                  size_t k_period = 3, size_t d_period = 3)
        : rsi_(rsi_period), rsi_window_(stoch_period), k_(k_period), d_(d_period) {}

    void update_impl(double price) {
        rsi_.update(price);
        if (!rsi_.is_ready()) return;

        rsi_window_.push(rsi_.value());
        if (!rsi_window_.is_full()) return;

        const double lowest = rsi_window_.min();
        const double highest = rsi_window_.max();
        // A flat RSI window has no range to scale against
        raw_ = highest > lowest ? (rsi_window_.newest() - lowest) / (highest - lowest) * 100.0 : 0.0;

        k_.update(raw_);
        if (k_.is_ready()) {
            d_.update(k_.value());
        }
    }

    /// %K line
    [[nodiscard]] double value_impl() const { return k_.value(); }

    [[nodiscard]] double raw() const { return raw_; }
    [[nodiscard]] double k() const { return k_.value(); }
    [[nodiscard]] double d() const { return d_.value(); }

    [[nodiscard]] bool is_ready_impl() const { return d_.is_ready(); }

    void reset_impl() {
        rsi_.reset();
        rsi_window_.reset();
        k_.reset();
        d_.reset();
        raw_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const {
        return rsi_.period() + rsi_window_.capacity() + k_.period() + d_.period() - 2;
    }

private:
    RSI rsi_;
    RollingWindow rsi_window_;
    SMA k_;
    SMA d_;
    double raw_ = 0.0;
};

}  // namespace aegis::strategy
