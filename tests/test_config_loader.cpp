#include "trader/config_loader/config_loader.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using OkxTrader::Config::SystemConfig;

namespace {

class ConfigLoaderTest : public ::testing::Test {
protected:
    std::string csv_path;

    void SetUp() override {
        csv_path = testing::TempDir() + "okx_trader_config_loader_test.csv";
    }

    void TearDown() override {
        std::remove(csv_path.c_str());
    }

    void write_csv(const std::string& contents) {
        std::ofstream csv_stream(csv_path);
        csv_stream << contents;
    }
};

} // anonymous namespace

TEST_F(ConfigLoaderTest, ShippedConfigurationLoadsAndValidates) {
    SystemConfig config;
    ASSERT_EQ(load_system_config(config, OKX_TRADER_TEST_CONFIG_DIR), 0);
    EXPECT_EQ(config.stream.symbol, "BTC-USDT-SWAP");
    EXPECT_EQ(config.stream.timeframe, "30m");
    EXPECT_EQ(config.strategy.strategy_type, "COMBINED");
    EXPECT_EQ(config.execution.mode, "paper");
    EXPECT_EQ(config.timing.signal_queue_capacity, 16);
}

TEST_F(ConfigLoaderTest, ParsesKeyValueLinesAndSkipsComments) {
    write_csv("# comment\n\n  stream.symbol , ETH-USDT-SWAP \nstream.ping_interval_ms,15000\n"
              "execution.simulated_trading,TRUE\nstrategy.bb_deviation,2.5\nunknown.key,ignored\n");

    SystemConfig config;
    ASSERT_TRUE(load_config_from_csv(config, csv_path));
    EXPECT_EQ(config.stream.symbol, "ETH-USDT-SWAP");
    EXPECT_EQ(config.stream.ping_interval_ms, 15000);
    EXPECT_TRUE(config.execution.simulated_trading);
    EXPECT_DOUBLE_EQ(config.strategy.bb_deviation, 2.5);
}

TEST_F(ConfigLoaderTest, NumericParseErrorFailsTheLoad) {
    write_csv("stream.pong_timeout_ms,10s\n");
    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, csv_path));

    write_csv("strategy.ema_long_period,many\n");
    EXPECT_FALSE(load_config_from_csv(config, csv_path));
}

TEST_F(ConfigLoaderTest, MissingFileFailsTheLoad) {
    SystemConfig config;
    EXPECT_FALSE(load_config_from_csv(config, csv_path + ".missing"));
    EXPECT_EQ(load_system_config(config, testing::TempDir() + "no_such_config_dir"), 1);
}

TEST(ConfigValidationTest, DefaultsAreValid) {
    SystemConfig config;
    std::string error_message;
    EXPECT_TRUE(validate_config(config, error_message)) << error_message;
}

TEST(ConfigValidationTest, RejectsInconsistentSettings) {
    std::string error_message;

    SystemConfig plain_url_config;
    plain_url_config.stream.websocket_url = "ws://ws.okx.com:8443/ws/v5/public";
    EXPECT_FALSE(validate_config(plain_url_config, error_message));

    SystemConfig ema_order_config;
    ema_order_config.strategy.ema_short_period = 21;
    ema_order_config.strategy.ema_long_period = 9;
    EXPECT_FALSE(validate_config(ema_order_config, error_message));

    SystemConfig timeframe_config;
    timeframe_config.stream.timeframe = "30";
    EXPECT_FALSE(validate_config(timeframe_config, error_message));

    SystemConfig multiplier_config;
    multiplier_config.stream.reconnect_multiplier = 0.9;
    EXPECT_FALSE(validate_config(multiplier_config, error_message));

    SystemConfig history_config;
    history_config.strategy.max_bar_history = 10;
    EXPECT_FALSE(validate_config(history_config, error_message));

    SystemConfig strategy_config;
    strategy_config.strategy.strategy_type = "MACD";
    EXPECT_FALSE(validate_config(strategy_config, error_message));

    SystemConfig capacity_config;
    capacity_config.timing.signal_queue_capacity = 0;
    EXPECT_FALSE(validate_config(capacity_config, error_message));
}

TEST(ConfigValidationTest, LiveModeNeedsAllCredentials) {
    SystemConfig config;
    config.execution.mode = "live";
    config.execution.api_key = "key";
    config.execution.secret_key = "secret";

    std::string error_message;
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("OKX_PASSPHRASE"), std::string::npos);

    config.execution.passphrase = "passphrase";
    EXPECT_TRUE(validate_config(config, error_message)) << error_message;
}

TEST(ConfigValidationTest, CredentialsComeFromEnvironment) {
    setenv("OKX_API_KEY", "env-key", 1);
    setenv("OKX_SECRET_KEY", "env-secret", 1);
    setenv("OKX_PASSPHRASE", "env-pass", 1);

    SystemConfig config;
    load_credentials_from_environment(config);
    EXPECT_EQ(config.execution.api_key, "env-key");
    EXPECT_EQ(config.execution.secret_key, "env-secret");
    EXPECT_EQ(config.execution.passphrase, "env-pass");

    unsetenv("OKX_API_KEY");
    unsetenv("OKX_SECRET_KEY");
    unsetenv("OKX_PASSPHRASE");
}
