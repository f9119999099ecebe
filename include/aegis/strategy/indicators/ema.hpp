#pragma once
// ============================================================================
// AEGIS TRADE CORE - EMA / SMA (Moving Averages)
// ============================================================================
// Foundation indicators for MACD, OBV trend and Stochastic RSI
// ============================================================================

#include "indicator_base.hpp"

namespace aegis::strategy {

/// EMA seeded with the SMA of the first `period` values
class EMA : public IndicatorBase<EMA> {
public:
    explicit EMA(size_t period)
        : period_(require_period(period))
        , multiplier_(2.0 / (static_cast<double>(period_) + 1.0)) {
        reset_impl();
    }

    void update_impl(double price) {
        if (count_ < period_) {
            // Still building initial SMA
            sum_ += price;
            ema_ = sum_ / static_cast<double>(count_ + 1);
        } else {
            ema_ = (price - ema_) * multiplier_ + ema_;
        }
        ++count_;
    }

    [[nodiscard]] double value_impl() const { return ema_; }

    [[nodiscard]] bool is_ready_impl() const { return count_ >= period_; }

    void reset_impl() {
        count_ = 0;
        ema_ = 0.0;
        sum_ = 0.0;
    }

    [[nodiscard]] size_t period_impl() const { return period_; }

private:
    size_t period_;
    double multiplier_;
    size_t count_ = 0;
    double ema_ = 0.0;
    double sum_ = 0.0;
};

/// SMA Indicator (Simple Moving Average)
class SMA : public IndicatorBase<SMA> {
public:
    explicit SMA(size_t period) : window_(period) {}

    void update_impl(double price) { window_.push(price); }

    [[nodiscard]] double value_impl() const { return window_.mean(); }

    [[nodiscard]] bool is_ready_impl() const { return window_.is_full(); }

    void reset_impl() { window_.reset(); }

    [[nodiscard]] size_t period_impl() const { return window_.capacity(); }

private:
    RollingWindow window_;
};

}  // namespace aegis::strategy
