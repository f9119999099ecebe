#pragma once
// ============================================================================
// AEGIS TRADE CORE - Trading Cycle
// ============================================================================
// One evaluation pass over the configured instruments:
//   1. account risk profile, once
//   2. market snapshots, fetched concurrently
//   3. decision + execution per instrument, serialized, under one budget
// A symbol's failure is confined to that symbol. Symbols not started
// before the deadline get a CANCELED Trade. Snapshot fetches stop at the
// deadline; run() returns within one gateway request timeout after it.
// ============================================================================

#include "aegis/engine/advisor.hpp"
#include "aegis/execution/execution_engine.hpp"
#include "aegis/risk/account_profiler.hpp"
#include "aegis/strategy/market_signal.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace aegis::engine {

struct CycleConfig {
    std::vector<Instrument> instruments{ALL_INSTRUMENTS.begin(), ALL_INSTRUMENTS.end()};
    std::chrono::seconds deadline{300};
};

enum class OutcomeKind : uint8_t {
    Executed,  // Trade FILLED
    Rejected,  // Trade FAILED by a guard or gateway fault
    Skipped,   // decision input rejected
    Failed,    // fault before execution
    Canceled   // deadline passed
};

[[nodiscard]] std::string_view to_string(OutcomeKind kind) noexcept;

struct SymbolOutcome {
    Instrument instrument = Instrument::BTC;
    OutcomeKind kind = OutcomeKind::Failed;
    std::optional<execution::ExecutionResult> result;
    std::string trade_id;  // empty when no Trade was recorded
    std::string error;
};

struct CycleReport {
    Timestamp started_at;
    Timestamp finished_at;
    std::optional<risk::AccountRiskProfile> profile;  // absent when profiling failed
    std::vector<SymbolOutcome> outcomes;

    [[nodiscard]] size_t count(OutcomeKind kind) const noexcept;
};

class TradingCycle {
public:
    TradingCycle(strategy::MarketSignalAggregator& aggregator,
                 risk::AccountRiskProfiler& profiler,
                 execution::ExecutionEngine& engine,
                 IAdvisor& advisor,
                 CycleConfig config = CycleConfig{});

    /// Runs to completion; never throws for a single symbol's failure
    CycleReport run();

private:
    SymbolOutcome process(Instrument instrument,
                          const strategy::MarketSnapshot& snapshot,
                          const risk::AccountRiskProfile& profile,
                          execution::CycleBudget& budget);

    SymbolOutcome record_failure(Instrument instrument, OutcomeKind kind, std::string reason);

    strategy::MarketSignalAggregator& aggregator_;
    risk::AccountRiskProfiler& profiler_;
    execution::ExecutionEngine& engine_;
    IAdvisor& advisor_;
    CycleConfig config_;
    std::mutex execution_mutex_;
};

}  // namespace aegis::engine
