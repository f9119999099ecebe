// ============================================================================
// AEGIS TRADE CORE - Confluence Score
// ============================================================================
// Ten weighted rules over the swing timeframe, daily trend and derivatives
// ============================================================================

#include "aegis/strategy/market_signal.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace aegis::strategy {

std::string_view to_string(Recommendation recommendation) noexcept {
    switch (recommendation) {
        case Recommendation::StrongBuy: return "STRONG_BUY";
        case Recommendation::Buy: return "BUY";
        case Recommendation::Neutral: return "NEUTRAL";
        case Recommendation::Sell: return "SELL";
        case Recommendation::StrongSell: return "STRONG_SELL";
    }
    return "NEUTRAL";
}

std::string_view to_string(DailyTrend trend) noexcept {
    switch (trend) {
        case DailyTrend::Up: return "up";
        case DailyTrend::Down: return "down";
        case DailyTrend::Sideways: return "sideways";
    }
    return "sideways";
}

Recommendation classify_net_score(double net, const ConfluencePolicy& policy) {
    if (net >= policy.strong_threshold) return Recommendation::StrongBuy;
    if (net >= policy.threshold) return Recommendation::Buy;
    if (net <= -policy.strong_threshold) return Recommendation::StrongSell;
    if (net <= -policy.threshold) return Recommendation::Sell;
    return Recommendation::Neutral;
}

ConfluenceScore compute_confluence(const ConfluenceInputs& in, const ConfluencePolicy& policy) {
    ConfluenceScore score;
    auto& bullish = score.bullish_points;
    auto& bearish = score.bearish_points;
    auto& factors = score.factors;

    const bool uptrend = in.ema20 > in.ema50;

    // 1. Swing trend alignment
    if (in.ema20 > in.ema50) {
        bullish += policy.trend_weight;
        factors.emplace_back("4H Trend: Bullish (EMA20 > EMA50)");
    } else if (in.ema20 < in.ema50) {
        bearish += policy.trend_weight;
        factors.emplace_back("4H Trend: Bearish (EMA20 < EMA50)");
    }

    // 2. Daily trend confirmation
    if (in.daily_trend == DailyTrend::Up) {
        bullish += policy.daily_trend_weight;
        factors.emplace_back("Daily Trend: Bullish");
    } else if (in.daily_trend == DailyTrend::Down) {
        bearish += policy.daily_trend_weight;
        factors.emplace_back("Daily Trend: Bearish");
    }

    // 3. ADX strength backs the EMA side
    if (in.adx > policy.adx_strong) {
        (uptrend ? bullish : bearish) += policy.adx_weight;
        factors.push_back(fmt::format("ADX: {:.1f} (Strong {} trend)", in.adx,
                                      uptrend ? "bullish" : "bearish"));
    } else if (in.adx < policy.adx_weak) {
        factors.push_back(fmt::format("ADX: {:.1f} (Weak/Range-bound)", in.adx));
    }

    // 4. RSI zones
    if (in.rsi < policy.rsi_oversold) {
        bullish += policy.rsi_weight;
        factors.push_back(fmt::format("RSI: {:.1f} (Oversold - Bullish)", in.rsi));
    } else if (in.rsi > policy.rsi_overbought) {
        bearish += policy.rsi_weight;
        factors.push_back(fmt::format("RSI: {:.1f} (Overbought - Bearish)", in.rsi));
    } else if (in.rsi >= policy.rsi_neutral_low && in.rsi <= policy.rsi_neutral_high) {
        factors.push_back(fmt::format("RSI: {:.1f} (Neutral zone)", in.rsi));
    }

    // 5. StochRSI crossovers at the extremes
    if (in.stoch_rsi.k < policy.stoch_oversold && in.stoch_rsi.k > in.stoch_rsi.d) {
        bullish += policy.stoch_weight;
        factors.emplace_back("StochRSI: Bullish crossover from oversold");
    } else if (in.stoch_rsi.k > policy.stoch_overbought && in.stoch_rsi.k < in.stoch_rsi.d) {
        bearish += policy.stoch_weight;
        factors.emplace_back("StochRSI: Bearish crossover from overbought");
    }

    // 6. Volume surge backs the EMA side
    if (in.volume_ratio > policy.volume_surge_ratio) {
        factors.push_back(fmt::format("Volume: {:.0f}% of average (Surge)", in.volume_ratio * 100.0));
        (uptrend ? bullish : bearish) += policy.volume_weight;
    }

    // 7. Funding
    if (in.funding_rate > policy.funding_crowded_longs) {
        bearish += policy.funding_weight;
        factors.push_back(fmt::format("Funding: {:.3f}% (Crowded longs)", in.funding_rate * 100.0));
    } else if (in.funding_rate < policy.funding_shorts_paying) {
        bullish += policy.funding_weight;
        factors.push_back(fmt::format("Funding: {:.3f}% (Shorts paying)", in.funding_rate * 100.0));
    }

    // 8. Regular divergence, scaled by strength
    if (in.divergence.type == DivergenceType::Bullish) {
        bullish += policy.divergence_weight * in.divergence.strength;
        factors.push_back(fmt::format("Divergence: Bullish (strength: {:.0f}%)",
                                      in.divergence.strength * 100.0));
    } else if (in.divergence.type == DivergenceType::Bearish) {
        bearish += policy.divergence_weight * in.divergence.strength;
        factors.push_back(fmt::format("Divergence: Bearish (strength: {:.0f}%)",
                                      in.divergence.strength * 100.0));
    }

    // 9. Price at support / resistance
    if (in.price > 0.0) {
        const double to_s1 = (in.price - in.pivots.s1) / in.price;
        const double to_r1 = (in.pivots.r1 - in.price) / in.price;
        const auto near = [&](double distance) {
            return distance < policy.pivot_band_upper && distance > policy.pivot_band_lower;
        };

        if (near(to_s1)) {
            bullish += policy.pivot_weight;
            factors.push_back(fmt::format("Price at Support S1: ${:.2f}", in.pivots.s1));
        } else if (near(to_r1)) {
            bearish += policy.pivot_weight;
            factors.push_back(fmt::format("Price at Resistance R1: ${:.2f}", in.pivots.r1));
        }
    }

    // 10. Bollinger %B
    if (in.percent_b < policy.percent_b_low) {
        bullish += policy.percent_b_weight;
        factors.emplace_back("Price near lower Bollinger Band (Oversold)");
    } else if (in.percent_b > policy.percent_b_high) {
        bearish += policy.percent_b_weight;
        factors.emplace_back("Price near upper Bollinger Band (Overbought)");
    }

    score.recommendation = classify_net_score(score.net(), policy);
    return score;
}

SuggestedLevels suggest_levels(double price, double atr14, const PivotPoints& pivots) {
    const double stop_loss = std::max(pivots.s1, price - atr14 * 1.5);
    const double min_take_profit = price + (price - stop_loss) * 1.5;
    const double take_profit = std::max(min_take_profit, std::min(pivots.r1, price + atr14 * 2.0));
    return SuggestedLevels{stop_loss, take_profit};
}

}  // namespace aegis::strategy
