// ============================================================================
// AEGIS TRADE CORE - Configuration Unit Tests
// ============================================================================

#include "aegis/core/config.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace aegis;

namespace {

constexpr std::string_view FULL_CONFIG = R"(
exchange:
  environment: mainnet
  api_key: key-from-file
  secret_key: secret-from-file
  requests_per_minute: 600
  recv_window_ms: 3000

trading:
  symbols: [BTC/USDT, ETHUSDT, SOL]
  dry_run: false
  initial_capital: 500.0
  margin_asset: USDC
  cycle_deadline_s: 120
  decisions_file: /tmp/decisions.json

safety_limits:
  max_leverage: 10
  cash_reserve: 0.3
  max_daily_loss: 0.04
  liquidation_buffer: 0.2

trading_modes:
  - { mode: DEFENSIVE, return_below: 0.0, max_risk: 0.01, max_leverage: 2, max_positions: 1 }
  - { mode: NORMAL, max_risk: 0.02, max_leverage: 4, max_positions: 2 }

confluence:
  trend_weight: 3.0
  threshold: 2.5

market_data:
  intraday: { timeframe: 5m, limit: 60 }
  daily: { limit: 30 }
  series_tail: 20

ledger:
  path: /var/lib/aegis/ledger.journal

logging:
  level: debug
  file: ""
  async: false
  max_files: 3
)";

}  // namespace

TEST(ConfigTest, DefaultsForEmptyDocument) {
    const auto config = parse_config("{}");

    EXPECT_EQ(config.trading.instruments.size(), ALL_INSTRUMENTS.size());
    EXPECT_TRUE(config.trading.dry_run);
    EXPECT_EQ(config.trading.cycle_deadline, std::chrono::seconds(300));
    EXPECT_TRUE(config.exchange.testnet);
    EXPECT_DOUBLE_EQ(config.profiler.initial_capital, 1000.0);
    EXPECT_EQ(config.profiler.modes.size(), 5u);
    EXPECT_EQ(config.execution.limits.max_leverage, 20);
    EXPECT_DOUBLE_EQ(config.execution.limits.cash_reserve_fraction, 0.25);
    EXPECT_EQ(config.market_data.intraday.timeframe, "1m");
    EXPECT_EQ(config.market_data.daily.limit, 50);
    EXPECT_EQ(config.logging.level, utils::LogLevel::Info);
}

TEST(ConfigTest, ParsesEverySection) {
    const auto config = parse_config(FULL_CONFIG);

    EXPECT_FALSE(config.exchange.testnet);
    EXPECT_EQ(config.exchange.rest_url(), "https://fapi.binance.com");
    EXPECT_EQ(config.exchange.api_key, "key-from-file");
    EXPECT_EQ(config.exchange.requests_per_minute, 600);
    EXPECT_EQ(config.exchange.recv_window_ms, 3000);

    const std::vector<Instrument> expected{Instrument::BTC, Instrument::ETH, Instrument::SOL};
    EXPECT_EQ(config.trading.instruments, expected);
    EXPECT_FALSE(config.trading.dry_run);
    EXPECT_EQ(config.trading.cycle_deadline, std::chrono::seconds(120));
    EXPECT_EQ(config.trading.decisions_file, "/tmp/decisions.json");
    EXPECT_DOUBLE_EQ(config.profiler.initial_capital, 500.0);
    EXPECT_EQ(config.profiler.margin_asset, "USDC");

    const auto& limits = config.execution.limits;
    EXPECT_EQ(limits.max_leverage, 10);
    EXPECT_EQ(limits.min_leverage, 1);
    EXPECT_DOUBLE_EQ(limits.cash_reserve_fraction, 0.3);
    EXPECT_DOUBLE_EQ(limits.max_daily_loss_fraction, 0.04);
    EXPECT_DOUBLE_EQ(limits.max_weekly_loss_fraction, 0.10);
    EXPECT_DOUBLE_EQ(limits.min_liquidation_buffer, 0.2);

    ASSERT_EQ(config.profiler.modes.size(), 2u);
    EXPECT_EQ(config.profiler.modes[0].mode, risk::TradingMode::Defensive);
    EXPECT_DOUBLE_EQ(config.profiler.modes[0].return_upper_bound, 0.0);
    EXPECT_EQ(config.profiler.modes[1].max_leverage, 4);
    EXPECT_TRUE(std::isinf(config.profiler.modes[1].return_upper_bound));

    EXPECT_DOUBLE_EQ(config.confluence.trend_weight, 3.0);
    EXPECT_DOUBLE_EQ(config.confluence.threshold, 2.5);
    EXPECT_DOUBLE_EQ(config.confluence.strong_threshold, 5.0);

    EXPECT_EQ(config.market_data.intraday.timeframe, "5m");
    EXPECT_EQ(config.market_data.intraday.limit, 60);
    EXPECT_EQ(config.market_data.swing.timeframe, "4h");
    EXPECT_EQ(config.market_data.daily.timeframe, "1d");
    EXPECT_EQ(config.market_data.daily.limit, 30);
    EXPECT_EQ(config.market_data.series_tail, 20u);

    EXPECT_EQ(config.ledger_path, "/var/lib/aegis/ledger.journal");
    EXPECT_EQ(config.logging.level, utils::LogLevel::Debug);
    EXPECT_TRUE(config.logging.log_file.empty());
    EXPECT_FALSE(config.logging.async);
    EXPECT_EQ(config.logging.max_files, 3u);
}

TEST(ConfigTest, RejectsUnknownSymbol) {
    EXPECT_THROW(static_cast<void>(parse_config("trading: { symbols: [BTC/USDT, XRP/USDT] }")), ConfigError);
}

TEST(ConfigTest, RejectsUnknownMode) {
    EXPECT_THROW(static_cast<void>(parse_config("trading_modes: [ { mode: YOLO } ]")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("trading_modes: { mode: NORMAL }")), ConfigError);
}

TEST(ConfigTest, RejectsMalformedYaml) {
    EXPECT_THROW(static_cast<void>(parse_config("trading: [unclosed")), ConfigError);
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(static_cast<void>(parse_config("trading: { symbols: [] }")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("trading: { cycle_deadline_s: 0 }")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("trading: { initial_capital: -5 }")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("trading_modes: []")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("safety_limits: { min_leverage: 0 }")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("safety_limits: { min_leverage: 5, max_leverage: 3 }")),
                 ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("safety_limits: { cash_reserve: 1.0 }")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("safety_limits: { max_risk_per_trade: 0 }")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("market_data: { swing: { limit: 1 } }")), ConfigError);
    EXPECT_THROW(static_cast<void>(parse_config("market_data: { daily: { timeframe: '' } }")), ConfigError);
}

TEST(ConfigTest, ValidateAcceptsDefaults) {
    EXPECT_NO_THROW(validate_config(AppConfig{}));
}

// ============================================================================
// File Loading
// ============================================================================

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = std::filesystem::temp_directory_path() /
               ("aegis_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                ".yaml");
        std::ofstream out(path);
        out << FULL_CONFIG;
    }

    void TearDown() override {
        ::unsetenv("AEGIS_API_KEY");
        ::unsetenv("AEGIS_SECRET_KEY");
        std::filesystem::remove(path);
    }

    std::filesystem::path path;
};

TEST_F(ConfigFileTest, LoadsFile) {
    const auto config = load_config(path.string());
    EXPECT_EQ(config.exchange.api_key, "key-from-file");
    EXPECT_EQ(config.exchange.secret_key, "secret-from-file");
    EXPECT_EQ(config.trading.instruments.size(), 3u);
}

TEST_F(ConfigFileTest, EnvironmentOverridesKeys) {
    ::setenv("AEGIS_API_KEY", "key-from-env", 1);
    ::setenv("AEGIS_SECRET_KEY", "secret-from-env", 1);

    const auto config = load_config(path.string());
    EXPECT_EQ(config.exchange.api_key, "key-from-env");
    EXPECT_EQ(config.exchange.secret_key, "secret-from-env");
}

TEST_F(ConfigFileTest, EmptyEnvironmentValueIsIgnored) {
    ::setenv("AEGIS_API_KEY", "", 1);
    const auto config = load_config(path.string());
    EXPECT_EQ(config.exchange.api_key, "key-from-file");
}

TEST_F(ConfigFileTest, MissingFileThrows) {
    EXPECT_THROW(static_cast<void>(load_config((path.parent_path() / "aegis_missing.yaml").string())),
                 ConfigError);
}
