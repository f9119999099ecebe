#pragma once
// ============================================================================
// AEGIS TRADE CORE - Advisor
// ============================================================================
// Source of trading decisions. The core only consumes the raw decision
// JSON; how it is produced is up to the implementation.
// ============================================================================

#include "aegis/risk/account_profiler.hpp"
#include "aegis/strategy/market_signal.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace aegis::engine {

/// The advisor could not produce a decision
class AdvisorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class IAdvisor {
public:
    virtual ~IAdvisor() = default;

    /// Raw decision JSON for one instrument
    [[nodiscard]] virtual std::string advise(Instrument instrument,
                                             const strategy::MarketSnapshot& snapshot,
                                             const risk::AccountRiskProfile& profile) = 0;
};

/// Reads decisions from a JSON object keyed by pair ("BTC/USDT") or symbol
/// ("BTCUSDT"). The file is re-read on every call; an instrument without an
/// entry gets a plain Hold.
class DecisionFileAdvisor : public IAdvisor {
public:
    explicit DecisionFileAdvisor(std::filesystem::path path);

    [[nodiscard]] std::string advise(Instrument instrument,
                                     const strategy::MarketSnapshot& snapshot,
                                     const risk::AccountRiskProfile& profile) override;

private:
    std::filesystem::path path_;
};

}  // namespace aegis::engine
