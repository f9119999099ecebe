// ============================================================================
// AEGIS TRADE CORE - Cycle Runner
// ============================================================================
// Runs one trading cycle over the configured instruments and exits.
// Scheduling is left to the caller (cron, systemd timer).
//
// Usage: aegis_cycle [config.yaml]
// ============================================================================

#include "aegis/core/config.hpp"
#include "aegis/engine/advisor.hpp"
#include "aegis/engine/trading_cycle.hpp"
#include "aegis/exchange/binance/client.hpp"
#include "aegis/exchange/dry_run_gateway.hpp"
#include "aegis/execution/execution_engine.hpp"
#include "aegis/ledger/journal_store.hpp"
#include "aegis/risk/account_profiler.hpp"
#include "aegis/strategy/market_signal.hpp"
#include "aegis/utils/logger.hpp"

#include <iostream>
#include <memory>
#include <string>

using namespace aegis;

namespace {

void log_report(const engine::CycleReport& report) {
    if (report.profile) {
        const auto& profile = *report.profile;
        LOG_INFO("Account: equity ${:.2f}, free ${:.2f}, return {:+.2f}%, mode {}, sharpe {:.2f}",
                 profile.total_equity, profile.free_cash, profile.current_return * 100.0,
                 risk::to_string(profile.trading_mode), profile.sharpe_ratio);
    }
    for (const auto& outcome : report.outcomes) {
        if (outcome.error.empty()) {
            LOG_INFO("  {:<10} {:<9} trade {}", pair_name(outcome.instrument), engine::to_string(outcome.kind),
                     outcome.trade_id.empty() ? "-" : outcome.trade_id);
        } else {
            LOG_INFO("  {:<10} {:<9} trade {}: {}", pair_name(outcome.instrument),
                     engine::to_string(outcome.kind), outcome.trade_id.empty() ? "-" : outcome.trade_id,
                     outcome.error);
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string config_path = argc > 1 ? argv[1] : "config/aegis.yaml";

    AppConfig config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }

    if (config.exchange.api_key.empty() || config.exchange.secret_key.empty()) {
        std::cerr << "[ERROR] API keys not configured\n";
        std::cerr << "[HINT] Set exchange.api_key / exchange.secret_key in " << config_path
                  << " or export AEGIS_API_KEY / AEGIS_SECRET_KEY\n";
        return 1;
    }

    utils::Logger::initialize(config.logging);
    LOG_INFO("AEGIS cycle runner ({}, {})", config.exchange.testnet ? "testnet" : "MAINNET",
             config.trading.dry_run ? "DRY_RUN" : "LIVE");

    int exit_code = 0;
    try {
        exchange::binance::BinanceClient client(config.exchange);

        std::unique_ptr<exchange::DryRunGateway> simulated;
        exchange::IExchangeGateway* gateway = &client;
        if (config.trading.dry_run) {
            simulated = std::make_unique<exchange::DryRunGateway>(client);
            gateway = simulated.get();
        }

        ledger::JournalLedgerStore ledger(config.ledger_path);

        strategy::MarketSignalAggregator aggregator(*gateway, config.market_data, config.confluence);
        risk::AccountRiskProfiler profiler(*gateway, ledger, config.profiler);
        execution::ExecutionEngine engine(*gateway, ledger, config.execution);
        engine::DecisionFileAdvisor advisor(config.trading.decisions_file);

        engine::CycleConfig cycle_config;
        cycle_config.instruments = config.trading.instruments;
        cycle_config.deadline = config.trading.cycle_deadline;

        engine::TradingCycle cycle(aggregator, profiler, engine, advisor, cycle_config);
        const auto report = cycle.run();
        log_report(report);

    } catch (const std::exception& e) {
        LOG_CRITICAL("Cycle aborted: {}", e.what());
        exit_code = 1;
    }

    utils::Logger::shutdown();
    return exit_code;
}
