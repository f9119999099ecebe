#pragma once
// ============================================================================
// AEGIS TRADE CORE - Core Types
// ============================================================================
// Fundamental type definitions shared by every component
// Fixed-point Price/Quantity for exchange wire values, doubles for analytics
// ============================================================================

#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aegis {

// ============================================================================
// Time Types
// ============================================================================

/// Nanosecond precision timestamp
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::nanoseconds>;

/// Duration in nanoseconds
using Duration = std::chrono::nanoseconds;

/// Get current timestamp with nanosecond precision
[[nodiscard]] inline Timestamp now() noexcept {
    return std::chrono::time_point_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now());
}

/// Convert timestamp to Unix epoch milliseconds (exchange format)
[[nodiscard]] inline int64_t to_epoch_ms(Timestamp ts) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

/// Convert Unix epoch milliseconds to Timestamp
[[nodiscard]] inline Timestamp from_epoch_ms(int64_t epoch_ms) noexcept {
    return Timestamp{std::chrono::milliseconds{epoch_ms}};
}

// ============================================================================
// Price and Quantity Types (Fixed-Point Arithmetic)
// ============================================================================

/// Price with 8 decimal places precision (matches Binance)
/// 1 Price unit = 0.00000001 actual price
class Price {
public:
    static constexpr int64_t PRECISION = 100000000LL;  // 10^8
    static constexpr int DECIMAL_PLACES = 8;

    constexpr Price() noexcept : value_(0) {}
    constexpr explicit Price(int64_t raw_value) noexcept : value_(raw_value) {}

    /// Create from double, rounded to the nearest unit
    [[nodiscard]] static Price from_double(double price) noexcept {
        if (!std::isfinite(price)) return Price{0};
        return Price{std::llround(price * PRECISION)};
    }

    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(value_) / PRECISION;
    }

    [[nodiscard]] constexpr int64_t raw() const noexcept { return value_; }

    constexpr Price operator+(Price other) const noexcept { return Price{value_ + other.value_}; }
    constexpr Price operator-(Price other) const noexcept { return Price{value_ - other.value_}; }

    constexpr auto operator<=>(const Price&) const noexcept = default;

    /// Check if price is valid (non-zero, non-negative)
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ > 0; }

private:
    int64_t value_;
};

/// Quantity with 8 decimal places precision
class Quantity {
public:
    static constexpr int64_t PRECISION = 100000000LL;  // 10^8
    static constexpr int DECIMAL_PLACES = 8;

    constexpr Quantity() noexcept : value_(0) {}
    constexpr explicit Quantity(int64_t raw_value) noexcept : value_(raw_value) {}

    [[nodiscard]] static Quantity from_double(double qty) noexcept {
        if (!std::isfinite(qty)) return Quantity{0};
        // Clamp to prevent overflow
        if (qty > 9.2e10) return Quantity{std::numeric_limits<int64_t>::max()};
        if (qty < -9.2e10) return Quantity{std::numeric_limits<int64_t>::min() + 1};
        return Quantity{std::llround(qty * PRECISION)};
    }

    [[nodiscard]] constexpr double to_double() const noexcept {
        return static_cast<double>(value_) / PRECISION;
    }

    [[nodiscard]] constexpr int64_t raw() const noexcept { return value_; }

    constexpr Quantity operator+(Quantity other) const noexcept {
        return Quantity{value_ + other.value_};
    }
    constexpr Quantity operator-(Quantity other) const noexcept {
        return Quantity{value_ - other.value_};
    }

    constexpr auto operator<=>(const Quantity&) const noexcept = default;

    [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ > 0; }

private:
    int64_t value_;
};

// ============================================================================
// Trading Types
// ============================================================================

/// Order side
enum class Side : uint8_t {
    Buy = 0,
    Sell = 1
};

/// Order types the core submits
enum class OrderType : uint8_t {
    Market = 0,
    StopMarket = 1,
    TakeProfitMarket = 2
};

[[nodiscard]] constexpr std::string_view to_string(Side side) noexcept {
    return side == Side::Buy ? "BUY" : "SELL";
}

[[nodiscard]] constexpr std::string_view to_string(OrderType type) noexcept {
    switch (type) {
        case OrderType::Market: return "MARKET";
        case OrderType::StopMarket: return "STOP_MARKET";
        case OrderType::TakeProfitMarket: return "TAKE_PROFIT_MARKET";
    }
    return "MARKET";
}

// ============================================================================
// Instrument Type
// ============================================================================

/// Closed set of tradable perpetuals, all quoted in USDT.
/// Parsed once at the system boundary; everything inside works with the enum.
enum class Instrument : uint8_t {
    BTC = 0,
    ETH = 1,
    BNB = 2,
    SOL = 3,
    DOGE = 4
};

inline constexpr std::array<Instrument, 5> ALL_INSTRUMENTS = {
    Instrument::BTC, Instrument::ETH, Instrument::BNB, Instrument::SOL, Instrument::DOGE
};

inline constexpr std::string_view QUOTE_ASSET = "USDT";

[[nodiscard]] constexpr std::string_view base_asset(Instrument instrument) noexcept {
    switch (instrument) {
        case Instrument::BTC: return "BTC";
        case Instrument::ETH: return "ETH";
        case Instrument::BNB: return "BNB";
        case Instrument::SOL: return "SOL";
        case Instrument::DOGE: return "DOGE";
    }
    return "BTC";
}

/// Unified pair name, e.g. "BTC/USDT"
[[nodiscard]] inline std::string pair_name(Instrument instrument) {
    std::string name(base_asset(instrument));
    name += '/';
    name += QUOTE_ASSET;
    return name;
}

/// Exchange symbol, e.g. "BTCUSDT"
[[nodiscard]] inline std::string exchange_symbol(Instrument instrument) {
    std::string name(base_asset(instrument));
    name += QUOTE_ASSET;
    return name;
}

/// Accepts "BTC/USDT", "BTCUSDT" or "BTC"
[[nodiscard]] inline std::optional<Instrument> parse_instrument(std::string_view text) noexcept {
    std::string_view base = text;
    if (const auto slash = text.find('/'); slash != std::string_view::npos) {
        if (text.substr(slash + 1) != QUOTE_ASSET) return std::nullopt;
        base = text.substr(0, slash);
    } else if (text.size() > QUOTE_ASSET.size() &&
               text.substr(text.size() - QUOTE_ASSET.size()) == QUOTE_ASSET) {
        base = text.substr(0, text.size() - QUOTE_ASSET.size());
    }

    for (const auto instrument : ALL_INSTRUMENTS) {
        if (base_asset(instrument) == base) return instrument;
    }
    return std::nullopt;
}

// ============================================================================
// Market Data
// ============================================================================

/// OHLCV candle, oldest-to-newest inside a PriceSeries
struct Candle {
    Timestamp open_time;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
};

/// Immutable once fetched
using PriceSeries = std::vector<Candle>;

}  // namespace aegis
