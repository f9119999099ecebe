#pragma once
// ============================================================================
// AEGIS TRADE CORE - Bollinger Bands
// ============================================================================
// Volatility indicator using population standard deviation bands
// Default: 20-period SMA with 2 standard deviation bands
// ============================================================================

#include "indicator_base.hpp"

#include <cmath>

namespace aegis::strategy {

class BollingerBands : public IndicatorBase<BollingerBands> {
public:
    explicit BollingerBands(size_t period = 20, double std_dev_multiplier = 2.0)
        : window_(period), multiplier_(std_dev_multiplier) {}

    void update_impl(double price) {
        window_.push(price);
        latest_price_ = price;

        if (window_.is_full()) {
            middle_ = window_.mean();
            std_dev_ = window_.std_dev();
            upper_ = middle_ + multiplier_ * std_dev_;
            lower_ = middle_ - multiplier_ * std_dev_;
        }
    }

    /// Middle band (SMA)
    [[nodiscard]] double value_impl() const { return middle_; }

    [[nodiscard]] double upper_band() const { return upper_; }
    [[nodiscard]] double lower_band() const { return lower_; }

    /// (upper - lower) / middle, 0 for a non-positive middle band or flat bands
    [[nodiscard]] double band_width() const {
        if (middle_ <= 0.0 || is_flat()) return 0.0;
        return (upper_ - lower_) / middle_;
    }

    /// %B: 0 = at lower band, 0.5 = middle (or flat bands), 1 = at upper band
    [[nodiscard]] double percent_b() const {
        if (is_flat()) return 0.5;
        return (latest_price_ - lower_) / (upper_ - lower_);
    }

    /// Band range is rounding noise relative to the middle band
    [[nodiscard]] bool is_flat() const {
        return upper_ - lower_ <= std::abs(middle_) * FLAT_TOLERANCE;
    }

    [[nodiscard]] bool is_ready_impl() const { return window_.is_full(); }

    void reset_impl() {
        window_.reset();
        middle_ = 0.0;
        upper_ = 0.0;
        lower_ = 0.0;
        std_dev_ = 0.0;
        latest_price_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return window_.capacity(); }

private:
    static constexpr double FLAT_TOLERANCE = 1e-9;

    RollingWindow window_;
    double multiplier_;
    double middle_ = 0.0;
    double upper_ = 0.0;
    double lower_ = 0.0;
    double std_dev_ = 0.0;
    double latest_price_ = 0.0;
};

}  // namespace aegis::strategy
