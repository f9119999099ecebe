#pragma once
// ============================================================================
// AEGIS TRADE CORE - Indicator Base Class
// ============================================================================
// CRTP pattern for zero-overhead polymorphism
// Streaming indicators are driven bar by bar; the series functions in
// series.hpp replay a whole PriceSeries through them
// ============================================================================

#include <algorithm>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace aegis::strategy {

// ============================================================================
// Indicator Concepts
// ============================================================================

/// Single-input indicator (close, RSI value, OBV...)
template <typename T>
concept Indicator = requires(T indicator, double value) {
    { indicator.update(value) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
    { indicator.reset() } -> std::same_as<void>;
};

/// High/low/close indicator (ATR, ADX)
template <typename T>
concept BarIndicator = requires(T indicator, double high, double low, double close) {
    { indicator.update(high, low, close) } -> std::same_as<void>;
    { indicator.value() } -> std::convertible_to<double>;
    { indicator.is_ready() } -> std::convertible_to<bool>;
};

// ============================================================================
// CRTP Base Class
// ============================================================================

template <typename Derived>
class IndicatorBase {
public:
    /// Update indicator with new price data
    void update(double value) {
        static_cast<Derived*>(this)->update_impl(value);
    }

    /// Get current indicator value
    [[nodiscard]] double value() const {
        return static_cast<const Derived*>(this)->value_impl();
    }

    /// Check if indicator has enough data
    [[nodiscard]] bool is_ready() const {
        return static_cast<const Derived*>(this)->is_ready_impl();
    }

    /// Reset indicator state
    void reset() {
        static_cast<Derived*>(this)->reset_impl();
    }

    /// Get indicator period
    [[nodiscard]] size_t period() const {
        return static_cast<const Derived*>(this)->period_impl();
    }

protected:
    IndicatorBase() = default;
    ~IndicatorBase() = default;
};

/// Periods are runtime policy values; zero is a programming error
inline size_t require_period(size_t period) {
    if (period == 0) {
        throw std::invalid_argument("indicator period must be positive");
    }
    return period;
}

// ============================================================================
// Rolling Window for Historical Data
// ============================================================================

class RollingWindow {
public:
    explicit RollingWindow(size_t capacity)
        : buffer_(require_period(capacity), 0.0), size_(0), index_(0) {}

    void push(double value) {
        buffer_[index_] = value;
        index_ = (index_ + 1) % buffer_.size();
        if (size_ < buffer_.size()) {
            ++size_;
        }
    }

    [[nodiscard]] double operator[](size_t i) const {
        // i=0 is the most recent value
        if (i >= size_) return 0.0;
        return buffer_[(index_ + buffer_.size() - 1 - i) % buffer_.size()];
    }

    [[nodiscard]] double newest() const { return (*this)[0]; }

    [[nodiscard]] size_t size() const { return size_; }
    [[nodiscard]] size_t capacity() const { return buffer_.size(); }
    [[nodiscard]] bool is_full() const { return size_ == buffer_.size(); }

    void reset() {
        size_ = 0;
        index_ = 0;
    }

    [[nodiscard]] double sum() const {
        double s = 0.0;
        for (size_t i = 0; i < size_; ++i) {
            s += buffer_[i];
        }
        return s;
    }

    [[nodiscard]] double mean() const {
        if (size_ == 0) return 0.0;
        return sum() / static_cast<double>(size_);
    }

    /// Population standard deviation
    [[nodiscard]] double std_dev() const {
        if (size_ < 2) return 0.0;
        const double m = mean();
        double variance = 0.0;
        for (size_t i = 0; i < size_; ++i) {
            const double diff = buffer_[i] - m;
            variance += diff * diff;
        }
        return std::sqrt(variance / static_cast<double>(size_));
    }

    [[nodiscard]] double min() const {
        if (size_ == 0) return 0.0;
        return *std::min_element(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(size_));
    }

    [[nodiscard]] double max() const {
        if (size_ == 0) return 0.0;
        return *std::max_element(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(size_));
    }

private:
    std::vector<double> buffer_;
    size_t size_;
    size_t index_;
};

}  // namespace aegis::strategy
