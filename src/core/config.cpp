// ============================================================================
// AEGIS TRADE CORE - Application Configuration Loader
// ============================================================================

#include "aegis/core/config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace aegis {

namespace {

void load_exchange(const YAML::Node& node, exchange::binance::BinanceConfig& out) {
    if (!node) return;
    out.api_key = node["api_key"].as<std::string>(out.api_key);
    out.secret_key = node["secret_key"].as<std::string>(out.secret_key);
    out.testnet = node["environment"].as<std::string>(out.testnet ? "testnet" : "mainnet") == "testnet";
    out.requests_per_minute = node["requests_per_minute"].as<int>(out.requests_per_minute);
    out.recv_window_ms = node["recv_window_ms"].as<int64_t>(out.recv_window_ms);
}

void load_trading(const YAML::Node& node, TradingSettings& trading, risk::ProfilerConfig& profiler) {
    if (!node) return;
    if (const auto symbols = node["symbols"]) {
        trading.instruments.clear();
        for (const auto& symbol : symbols) {
            const auto text = symbol.as<std::string>();
            const auto instrument = parse_instrument(text);
            if (!instrument) {
                throw ConfigError("trading.symbols: unknown symbol '" + text + "'");
            }
            trading.instruments.push_back(*instrument);
        }
    }
    trading.dry_run = node["dry_run"].as<bool>(trading.dry_run);
    trading.cycle_deadline =
        std::chrono::seconds(node["cycle_deadline_s"].as<int64_t>(trading.cycle_deadline.count()));
    trading.decisions_file = node["decisions_file"].as<std::string>(trading.decisions_file);

    profiler.initial_capital = node["initial_capital"].as<double>(profiler.initial_capital);
    profiler.margin_asset = node["margin_asset"].as<std::string>(profiler.margin_asset);
}

void load_limits(const YAML::Node& node, execution::SafetyLimits& limits) {
    if (!node) return;
    limits.min_leverage = node["min_leverage"].as<int>(limits.min_leverage);
    limits.max_leverage = node["max_leverage"].as<int>(limits.max_leverage);
    limits.min_trade_notional = node["min_trade_notional"].as<double>(limits.min_trade_notional);
    limits.cash_reserve_fraction = node["cash_reserve"].as<double>(limits.cash_reserve_fraction);
    limits.max_position_fraction = node["max_position_fraction"].as<double>(limits.max_position_fraction);
    limits.max_daily_loss_fraction = node["max_daily_loss"].as<double>(limits.max_daily_loss_fraction);
    limits.max_weekly_loss_fraction = node["max_weekly_loss"].as<double>(limits.max_weekly_loss_fraction);
    limits.max_portfolio_leverage = node["max_portfolio_leverage"].as<double>(limits.max_portfolio_leverage);
    limits.max_risk_per_trade = node["max_risk_per_trade"].as<double>(limits.max_risk_per_trade);
    limits.min_risk_reward = node["min_risk_reward"].as<double>(limits.min_risk_reward);
    limits.maintenance_margin_rate =
        node["maintenance_margin_rate"].as<double>(limits.maintenance_margin_rate);
    limits.min_liquidation_buffer = node["liquidation_buffer"].as<double>(limits.min_liquidation_buffer);
}

void load_modes(const YAML::Node& node, risk::TradingModeTable& modes) {
    if (!node) return;
    if (!node.IsSequence()) throw ConfigError("trading_modes must be a list");

    modes.clear();
    for (const auto& row : node) {
        const auto name = row["mode"].as<std::string>("");
        const auto mode = risk::parse_trading_mode(name);
        if (!mode) throw ConfigError("trading_modes: unknown mode '" + name + "'");

        risk::TradingModeRule rule;
        rule.mode = *mode;
        if (row["return_below"]) {
            rule.return_upper_bound = row["return_below"].as<double>();
        }
        rule.max_risk_pct = row["max_risk"].as<double>(rule.max_risk_pct);
        rule.max_leverage = row["max_leverage"].as<int>(rule.max_leverage);
        rule.max_positions = row["max_positions"].as<int>(rule.max_positions);
        modes.push_back(rule);
    }
}

void load_confluence(const YAML::Node& node, strategy::ConfluencePolicy& policy) {
    if (!node) return;
    policy.trend_weight = node["trend_weight"].as<double>(policy.trend_weight);
    policy.daily_trend_weight = node["daily_trend_weight"].as<double>(policy.daily_trend_weight);
    policy.adx_weight = node["adx_weight"].as<double>(policy.adx_weight);
    policy.adx_strong = node["adx_strong"].as<double>(policy.adx_strong);
    policy.adx_weak = node["adx_weak"].as<double>(policy.adx_weak);
    policy.rsi_weight = node["rsi_weight"].as<double>(policy.rsi_weight);
    policy.rsi_oversold = node["rsi_oversold"].as<double>(policy.rsi_oversold);
    policy.rsi_overbought = node["rsi_overbought"].as<double>(policy.rsi_overbought);
    policy.stoch_weight = node["stoch_weight"].as<double>(policy.stoch_weight);
    policy.volume_weight = node["volume_weight"].as<double>(policy.volume_weight);
    policy.volume_surge_ratio = node["volume_surge_ratio"].as<double>(policy.volume_surge_ratio);
    policy.funding_weight = node["funding_weight"].as<double>(policy.funding_weight);
    policy.divergence_weight = node["divergence_weight"].as<double>(policy.divergence_weight);
    policy.pivot_weight = node["pivot_weight"].as<double>(policy.pivot_weight);
    policy.percent_b_weight = node["percent_b_weight"].as<double>(policy.percent_b_weight);
    policy.strong_threshold = node["strong_threshold"].as<double>(policy.strong_threshold);
    policy.threshold = node["threshold"].as<double>(policy.threshold);
}

void load_timeframe(const YAML::Node& node, strategy::TimeframeSpec& spec) {
    if (!node) return;
    spec.timeframe = node["timeframe"].as<std::string>(spec.timeframe);
    spec.limit = node["limit"].as<int>(spec.limit);
}

void load_logging(const YAML::Node& node, utils::LogConfig& logging) {
    if (!node) return;
    logging.level = utils::parse_log_level(node["level"].as<std::string>("info"));
    logging.log_file = node["file"].as<std::string>(logging.log_file);
    logging.pattern = node["pattern"].as<std::string>(logging.pattern);
    logging.async = node["async"].as<bool>(logging.async);
    logging.max_file_size_mb = node["max_file_size_mb"].as<size_t>(logging.max_file_size_mb);
    logging.max_files = node["max_files"].as<size_t>(logging.max_files);
}

}  // namespace

AppConfig parse_config(std::string_view text) {
    AppConfig config;

    try {
        const YAML::Node yaml = YAML::Load(std::string(text));

        load_exchange(yaml["exchange"], config.exchange);
        load_trading(yaml["trading"], config.trading, config.profiler);
        load_limits(yaml["safety_limits"], config.execution.limits);
        load_modes(yaml["trading_modes"], config.profiler.modes);
        load_confluence(yaml["confluence"], config.confluence);

        if (const auto market = yaml["market_data"]) {
            load_timeframe(market["intraday"], config.market_data.intraday);
            load_timeframe(market["swing"], config.market_data.swing);
            load_timeframe(market["daily"], config.market_data.daily);
            config.market_data.series_tail = market["series_tail"].as<size_t>(config.market_data.series_tail);
        }

        if (const auto ledger = yaml["ledger"]) {
            config.ledger_path = ledger["path"].as<std::string>(config.ledger_path);
        }
        load_logging(yaml["logging"], config.logging);

    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }

    validate_config(config);
    return config;
}

AppConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open configuration file " + path);
    }
    std::stringstream content;
    content << file.rdbuf();

    auto config = parse_config(content.str());

    if (const char* key = std::getenv("AEGIS_API_KEY"); key != nullptr && *key != '\0') {
        config.exchange.api_key = key;
    }
    if (const char* secret = std::getenv("AEGIS_SECRET_KEY"); secret != nullptr && *secret != '\0') {
        config.exchange.secret_key = secret;
    }
    return config;
}

void validate_config(const AppConfig& config) {
    const auto& limits = config.execution.limits;

    if (config.trading.instruments.empty()) {
        throw ConfigError("trading.symbols must list at least one symbol");
    }
    if (config.trading.cycle_deadline.count() <= 0) {
        throw ConfigError("trading.cycle_deadline_s must be positive");
    }
    if (config.profiler.initial_capital <= 0.0) {
        throw ConfigError("trading.initial_capital must be positive");
    }
    if (config.profiler.modes.empty()) {
        throw ConfigError("trading_modes must not be empty");
    }
    if (limits.min_leverage < 1 || limits.min_leverage > limits.max_leverage) {
        throw ConfigError("safety_limits: need 1 <= min_leverage <= max_leverage");
    }
    if (limits.cash_reserve_fraction < 0.0 || limits.cash_reserve_fraction >= 1.0) {
        throw ConfigError("safety_limits.cash_reserve must be in [0, 1)");
    }
    if (limits.max_position_fraction <= 0.0 || limits.max_risk_per_trade <= 0.0 ||
        limits.max_portfolio_leverage <= 0.0) {
        throw ConfigError("safety_limits: position, risk and leverage ceilings must be positive");
    }
    for (const auto& spec : {config.market_data.intraday, config.market_data.swing, config.market_data.daily}) {
        if (spec.timeframe.empty() || spec.limit < 2) {
            throw ConfigError("market_data: each timeframe needs a name and a limit of at least 2");
        }
    }
}

}  // namespace aegis
