// ============================================================================
// AEGIS TRADE CORE - Trading Cycle Implementation
// ============================================================================

#include "aegis/engine/trading_cycle.hpp"

#include "aegis/utils/logger.hpp"

#include <algorithm>
#include <future>

namespace aegis::engine {

std::string_view to_string(OutcomeKind kind) noexcept {
    switch (kind) {
        case OutcomeKind::Executed: return "executed";
        case OutcomeKind::Rejected: return "rejected";
        case OutcomeKind::Skipped: return "skipped";
        case OutcomeKind::Failed: return "failed";
        case OutcomeKind::Canceled: return "canceled";
    }
    return "failed";
}

size_t CycleReport::count(OutcomeKind kind) const noexcept {
    return static_cast<size_t>(std::count_if(outcomes.begin(), outcomes.end(),
                                             [kind](const SymbolOutcome& o) { return o.kind == kind; }));
}

TradingCycle::TradingCycle(strategy::MarketSignalAggregator& aggregator,
                           risk::AccountRiskProfiler& profiler,
                           execution::ExecutionEngine& engine,
                           IAdvisor& advisor,
                           CycleConfig config)
    : aggregator_(aggregator)
    , profiler_(profiler)
    , engine_(engine)
    , advisor_(advisor)
    , config_(std::move(config)) {}

// ============================================================================
// Cycle
// ============================================================================

CycleReport TradingCycle::run() {
    SCOPED_TIMER("trading cycle");

    CycleReport report;
    report.started_at = now();
    const auto deadline = std::chrono::steady_clock::now() + config_.deadline;

    LOG_INFO("Cycle started for {} instruments, deadline {}s", config_.instruments.size(),
             config_.deadline.count());

    try {
        report.profile = profiler_.profile(config_.instruments);
    } catch (const std::exception& e) {
        LOG_ERROR("Account profile unavailable, no symbol will trade: {}", e.what());
        for (const auto instrument : config_.instruments) {
            report.outcomes.push_back(record_failure(
                instrument, OutcomeKind::Failed, fmt::format("Account profile unavailable: {}", e.what())));
        }
        report.finished_at = now();
        return report;
    }
    const auto& profile = *report.profile;
    auto budget = execution::CycleBudget::from_profile(profile);

    // Fetches stop at the deadline, so run() returns at most one gateway
    // request timeout after it.
    std::vector<std::future<strategy::MarketSnapshot>> snapshots;
    snapshots.reserve(config_.instruments.size());
    for (const auto instrument : config_.instruments) {
        snapshots.push_back(std::async(std::launch::async, [this, instrument, deadline] {
            return aggregator_.snapshot(instrument, deadline);
        }));
    }

    for (size_t i = 0; i < config_.instruments.size(); ++i) {
        const auto instrument = config_.instruments[i];
        auto& pending = snapshots[i];

        if (pending.wait_until(deadline) == std::future_status::timeout ||
            std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("Cycle deadline passed before {} started", pair_name(instrument));
            report.outcomes.push_back(
                record_failure(instrument, OutcomeKind::Canceled, "Cycle deadline passed before execution"));
            continue;
        }

        strategy::MarketSnapshot snapshot;
        try {
            snapshot = pending.get();
        } catch (const strategy::DeadlineExceeded& e) {
            LOG_WARN("Cycle deadline passed while fetching {}: {}", pair_name(instrument), e.what());
            report.outcomes.push_back(
                record_failure(instrument, OutcomeKind::Canceled, "Cycle deadline passed before execution"));
            continue;
        } catch (const std::exception& e) {
            LOG_ERROR("Market data for {} failed: {}", pair_name(instrument), e.what());
            report.outcomes.push_back(record_failure(instrument, OutcomeKind::Failed,
                                                     fmt::format("Market data unavailable: {}", e.what())));
            continue;
        }

        std::lock_guard<std::mutex> lock(execution_mutex_);
        report.outcomes.push_back(process(instrument, snapshot, profile, budget));
    }

    report.finished_at = now();
    LOG_INFO("Cycle finished: {} executed, {} rejected, {} skipped, {} failed, {} canceled",
             report.count(OutcomeKind::Executed), report.count(OutcomeKind::Rejected),
             report.count(OutcomeKind::Skipped), report.count(OutcomeKind::Failed),
             report.count(OutcomeKind::Canceled));
    return report;
}

// ============================================================================
// Per-Symbol Pipeline
// ============================================================================

SymbolOutcome TradingCycle::process(Instrument instrument,
                                    const strategy::MarketSnapshot& snapshot,
                                    const risk::AccountRiskProfile& profile,
                                    execution::CycleBudget& budget) {
    SymbolOutcome outcome;
    outcome.instrument = instrument;
    bool trade_started = false;

    try {
        const auto raw = advisor_.advise(instrument, snapshot, profile);

        execution::Decision decision;
        try {
            decision = execution::parse_decision(raw);
        } catch (const execution::DecisionInputError& e) {
            LOG_ERROR("Decision for {} failed validation: {}", pair_name(instrument), e.what());
            return record_failure(instrument, OutcomeKind::Skipped,
                                  fmt::format("Decision rejected: {}", e.what()));
        }
        LOG_INFO("{} decision: {} ({})", pair_name(instrument), ledger::to_string(decision.operation),
                 decision.chat);

        trade_started = true;
        auto result = engine_.execute(decision, instrument, profile, budget);
        outcome.kind = result.success ? OutcomeKind::Executed : OutcomeKind::Rejected;
        outcome.trade_id = result.trade_id;
        if (result.error) outcome.error = *result.error;
        outcome.result = std::move(result);

    } catch (const execution::DecisionInputError& e) {
        LOG_ERROR("Skipping {}: {}", pair_name(instrument), e.what());
        outcome.kind = OutcomeKind::Skipped;
        outcome.error = e.what();
    } catch (const std::exception& e) {
        LOG_ERROR("Symbol {} failed: {}", pair_name(instrument), e.what());
        // The engine has already settled its own Trade
        if (!trade_started) {
            return record_failure(instrument, OutcomeKind::Failed, e.what());
        }
        outcome.kind = OutcomeKind::Failed;
        outcome.error = e.what();
    }
    return outcome;
}

SymbolOutcome TradingCycle::record_failure(Instrument instrument, OutcomeKind kind, std::string reason) {
    SymbolOutcome outcome;
    outcome.instrument = instrument;
    outcome.kind = kind;

    try {
        outcome.trade_id = kind == OutcomeKind::Canceled ? engine_.record_canceled(instrument, reason)
                                                         : engine_.record_failed(instrument, reason);
    } catch (const ledger::LedgerError& e) {
        LOG_ERROR("Could not record {} trade for {}: {}", to_string(kind), pair_name(instrument), e.what());
    }
    outcome.error = std::move(reason);
    return outcome;
}

}  // namespace aegis::engine
