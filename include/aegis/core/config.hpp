#pragma once
// ============================================================================
// AEGIS TRADE CORE - Application Configuration
// ============================================================================
// YAML configuration for the cycle runner. Every key is optional and falls
// back to the defaults of the component it configures.
// ============================================================================

#include "aegis/exchange/binance/client.hpp"
#include "aegis/execution/execution_engine.hpp"
#include "aegis/risk/account_profiler.hpp"
#include "aegis/strategy/market_signal.hpp"
#include "aegis/utils/logger.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace aegis {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct TradingSettings {
    std::vector<Instrument> instruments{ALL_INSTRUMENTS.begin(), ALL_INSTRUMENTS.end()};
    bool dry_run = true;
    std::chrono::seconds cycle_deadline{300};
    std::string decisions_file = "config/decisions.json";
};

struct AppConfig {
    exchange::binance::BinanceConfig exchange;
    TradingSettings trading;
    risk::ProfilerConfig profiler;
    execution::ExecutionConfig execution;
    strategy::ConfluencePolicy confluence;
    strategy::MarketDataConfig market_data;
    std::string ledger_path = "data/ledger.journal";
    utils::LogConfig logging;
};

/// Parse YAML text; throws ConfigError on syntax errors or invalid values
[[nodiscard]] AppConfig parse_config(std::string_view yaml);

/// Load a YAML file and apply AEGIS_API_KEY / AEGIS_SECRET_KEY overrides
[[nodiscard]] AppConfig load_config(const std::string& path);

/// Throws ConfigError describing the first invalid value
void validate_config(const AppConfig& config);

}  // namespace aegis
