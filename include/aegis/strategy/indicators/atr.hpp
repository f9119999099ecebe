#pragma once
// ============================================================================
// AEGIS TRADE CORE - ATR / ADX (Wilder)
// ============================================================================
// Bar indicators fed with high/low/close
// ADX > 25 denotes a strong trend, < 20 a range-bound market
// ============================================================================

#include "indicator_base.hpp"

#include <algorithm>
#include <cmath>

namespace aegis::strategy {

/// True range against the previous close
[[nodiscard]] inline double true_range(double high, double low, double prev_close) noexcept {
    return std::max({high - low, std::abs(high - prev_close), std::abs(low - prev_close)});
}

/// Average True Range, seeded by the mean of the first `period` true ranges
class ATR {
public:
    explicit ATR(size_t period = 14) : period_(require_period(period)) {}

    void update(double high, double low, double close) {
        if (!has_prev_) {
            prev_close_ = close;
            has_prev_ = true;
            return;
        }

        const double tr = true_range(high, low, prev_close_);
        prev_close_ = close;
        ++count_;

        const auto n = static_cast<double>(period_);
        if (count_ <= period_) {
            tr_sum_ += tr;
            if (count_ == period_) atr_ = tr_sum_ / n;
        } else {
            atr_ = (atr_ * (n - 1.0) + tr) / n;
        }
    }

    [[nodiscard]] double value() const { return atr_; }
    [[nodiscard]] bool is_ready() const { return count_ >= period_; }
    [[nodiscard]] size_t period() const { return period_; }

private:
    size_t period_;
    bool has_prev_ = false;
    size_t count_ = 0;
    double prev_close_ = 0.0;
    double tr_sum_ = 0.0;
    double atr_ = 0.0;
};

/// Average Directional Index with Wilder smoothing of TR, +DM, -DM and DX
class ADX {
public:
    static constexpr double STRONG_TREND = 25.0;
    static constexpr double RANGE_BOUND = 20.0;

    explicit ADX(size_t period = 14) : period_(require_period(period)) {}

    void update(double high, double low, double close) {
        if (!has_prev_) {
            prev_high_ = high;
            prev_low_ = low;
            prev_close_ = close;
            has_prev_ = true;
            return;
        }

        const double up_move = high - prev_high_;
        const double down_move = prev_low_ - low;
        const double plus_dm = (up_move > down_move && up_move > 0.0) ? up_move : 0.0;
        const double minus_dm = (down_move > up_move && down_move > 0.0) ? down_move : 0.0;
        const double tr = true_range(high, low, prev_close_);

        prev_high_ = high;
        prev_low_ = low;
        prev_close_ = close;
        ++bars_;

        const auto n = static_cast<double>(period_);
        if (bars_ <= period_) {
            smoothed_tr_ += tr;
            smoothed_plus_dm_ += plus_dm;
            smoothed_minus_dm_ += minus_dm;
            if (bars_ < period_) return;
        } else {
            smoothed_tr_ = smoothed_tr_ - smoothed_tr_ / n + tr;
            smoothed_plus_dm_ = smoothed_plus_dm_ - smoothed_plus_dm_ / n + plus_dm;
            smoothed_minus_dm_ = smoothed_minus_dm_ - smoothed_minus_dm_ / n + minus_dm;
        }

        plus_di_ = smoothed_tr_ > 0.0 ? 100.0 * smoothed_plus_dm_ / smoothed_tr_ : 0.0;
        minus_di_ = smoothed_tr_ > 0.0 ? 100.0 * smoothed_minus_dm_ / smoothed_tr_ : 0.0;
        const double di_sum = plus_di_ + minus_di_;
        const double dx = di_sum > 0.0 ? 100.0 * std::abs(plus_di_ - minus_di_) / di_sum : 0.0;

        ++dx_count_;
        if (dx_count_ <= period_) {
            dx_sum_ += dx;
            if (dx_count_ == period_) adx_ = dx_sum_ / n;
        } else {
            adx_ = (adx_ * (n - 1.0) + dx) / n;
        }
    }

    [[nodiscard]] double value() const { return adx_; }
    [[nodiscard]] double plus_di() const { return plus_di_; }
    [[nodiscard]] double minus_di() const { return minus_di_; }
    [[nodiscard]] bool is_ready() const { return dx_count_ >= period_; }
    [[nodiscard]] size_t period() const { return period_; }

private:
    size_t period_;
    bool has_prev_ = false;
    size_t bars_ = 0;
    size_t dx_count_ = 0;
    double prev_high_ = 0.0;
    double prev_low_ = 0.0;
    double prev_close_ = 0.0;
    double smoothed_tr_ = 0.0;
    double smoothed_plus_dm_ = 0.0;
    double smoothed_minus_dm_ = 0.0;
    double plus_di_ = 0.0;
    double minus_di_ = 0.0;
    double dx_sum_ = 0.0;
    double adx_ = 0.0;
};

}  // namespace aegis::strategy
