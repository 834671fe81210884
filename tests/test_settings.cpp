#include <gtest/gtest.h>
#include "config/settings.hpp"
#include "config/config.hpp"
#include "utils/uuid.hpp"
#include <filesystem>
#include <fstream>

using namespace updown;

class SettingsManagerTest : public ::testing::Test {
protected:
    std::string path_;

    void SetUp() override {
        path_ = "/tmp/test_settings_" + generate_uuid() + ".json";
    }

    void TearDown() override {
        std::filesystem::remove(path_);
        std::filesystem::remove_all(path_ + ".tmp");
    }
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(SettingsManagerTest, FactoryDefaults) {
    auto s = BotSettings::factory_defaults();

    ASSERT_EQ(s.assets.size(), 3u);
    EXPECT_TRUE(s.assets.at("btc").enabled);
    EXPECT_FALSE(s.assets.at("eth").enabled);
    EXPECT_FALSE(s.assets.at("sol").enabled);
    EXPECT_DOUBLE_EQ(s.assets.at("btc").bet_size, 90.0);
    EXPECT_DOUBLE_EQ(s.assets.at("btc").min_price, 0.90);
    EXPECT_DOUBLE_EQ(s.assets.at("btc").max_price, 0.94);

    EXPECT_EQ(s.trading_window.start_minute, 45);
    EXPECT_EQ(s.trading_window.end_minute, 59);
    EXPECT_FALSE(s.volatility.enabled);
    EXPECT_EQ(s.volatility.volatile_hours_et, (std::vector<int>{9, 10, 15, 16}));
    EXPECT_TRUE(s.stop_loss.enabled);
    EXPECT_DOUBLE_EQ(s.stop_loss.threshold, 0.70);
    EXPECT_EQ(s.auto_claim.interval_minutes, 60);
    EXPECT_EQ(s.auto_claim.days_back, 7);
    EXPECT_EQ(s.advanced.scan_interval_seconds, 5);
    EXPECT_EQ(s.advanced.gas_speed, GasSpeed::STANDARD);
    EXPECT_FALSE(s.global_bot_enabled);
    EXPECT_TRUE(s.validation_error().empty());
}

TEST_F(SettingsManagerTest, MissingFile_UsesDefaults) {
    SettingsManager mgr(path_);
    EXPECT_TRUE(mgr.get_all().assets.at("btc").enabled);
    EXPECT_FALSE(std::filesystem::exists(path_));
}

// ============================================================================
// Updates
// ============================================================================

TEST_F(SettingsManagerTest, PartialUpdate_DeepMerges) {
    SettingsManager mgr(path_);
    mgr.update({{"assets", {{"eth", {{"enabled", true}}}}}});

    auto s = mgr.get_all();
    EXPECT_TRUE(s.assets.at("eth").enabled);
    // Untouched fields of the same asset keep their values
    EXPECT_DOUBLE_EQ(s.assets.at("eth").bet_size, 90.0);
    EXPECT_TRUE(s.assets.at("btc").enabled);
}

TEST_F(SettingsManagerTest, InvalidUpdate_KeepsState) {
    SettingsManager mgr(path_);
    EXPECT_THROW(mgr.update({{"assets", {{"btc", {{"min_price", 0.95}, {"max_price", 0.90}}}}}}),
                 std::invalid_argument);
    EXPECT_DOUBLE_EQ(mgr.get_all().assets.at("btc").min_price, 0.90);

    EXPECT_THROW(mgr.update({{"trading_window", {{"start_minute", 75}}}}), std::invalid_argument);
    EXPECT_THROW(mgr.update({{"assets", {{"btc", {{"bet_size", "lots"}}}}}}), std::invalid_argument);
}

TEST_F(SettingsManagerTest, StopLossThresholdInCents_IsNormalized) {
    SettingsManager mgr(path_);
    mgr.update({{"stop_loss", {{"threshold", 65}}}});
    EXPECT_DOUBLE_EQ(mgr.get_all().stop_loss.threshold, 0.65);

    EXPECT_DOUBLE_EQ(normalize_threshold(0.7), 0.7);
    EXPECT_DOUBLE_EQ(normalize_threshold(70.0), 0.7);
}

TEST_F(SettingsManagerTest, Persists_AcrossInstances) {
    {
        SettingsManager mgr(path_);
        mgr.update({{"global_bot_enabled", true}, {"advanced", {{"gas_speed", "fast"}}}});
    }
    SettingsManager reloaded(path_);
    auto s = reloaded.get_all();
    EXPECT_TRUE(s.global_bot_enabled);
    EXPECT_EQ(s.advanced.gas_speed, GasSpeed::FAST);
}

TEST_F(SettingsManagerTest, Save_ReplacesFileWithoutLeavingTemp) {
    SettingsManager mgr(path_);
    mgr.update({{"global_bot_enabled", true}});
    mgr.update({{"assets", {{"btc", {{"bet_size", 25.0}}}}}});

    EXPECT_FALSE(std::filesystem::exists(path_ + ".tmp"));
    SettingsManager reloaded(path_);
    EXPECT_TRUE(reloaded.get_all().global_bot_enabled);
    EXPECT_DOUBLE_EQ(reloaded.get_all().assets.at("btc").bet_size, 25.0);
}

TEST_F(SettingsManagerTest, FailedSave_KeepsPreviousFileIntact) {
    SettingsManager mgr(path_);
    mgr.update({{"global_bot_enabled", true}, {"assets", {{"btc", {{"bet_size", 40.0}}}}}});

    // An unwritable temp path makes the next save fail before the rename
    std::filesystem::create_directory(path_ + ".tmp");
    EXPECT_THROW(mgr.update({{"assets", {{"btc", {{"bet_size", 70.0}}}}}}), std::runtime_error);
    EXPECT_DOUBLE_EQ(mgr.get_all().assets.at("btc").bet_size, 40.0);

    SettingsManager reloaded(path_);
    EXPECT_TRUE(reloaded.get_all().global_bot_enabled);
    EXPECT_DOUBLE_EQ(reloaded.get_all().assets.at("btc").bet_size, 40.0);
}

TEST_F(SettingsManagerTest, CorruptFile_FallsBackToDefaults) {
    {
        std::ofstream out(path_);
        out << "{ not json";
    }
    SettingsManager mgr(path_);
    EXPECT_DOUBLE_EQ(mgr.get_all().assets.at("btc").bet_size, 90.0);
}

TEST_F(SettingsManagerTest, Listeners_NotifiedOnChange) {
    SettingsManager mgr;
    int calls = 0;
    bool last_enabled = false;
    int id = mgr.on_change([&](const BotSettings& s) {
        calls++;
        last_enabled = s.global_bot_enabled;
    });

    mgr.update({{"global_bot_enabled", true}});
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(last_enabled);

    mgr.remove_listener(id);
    mgr.update({{"global_bot_enabled", false}});
    EXPECT_EQ(calls, 1);
}

// ============================================================================
// Export / import
// ============================================================================

TEST_F(SettingsManagerTest, ExportImport_RestoresEverything) {
    SettingsManager source;
    source.update({{"assets", {{"sol", {{"enabled", true}, {"bet_size", 25.0}}}}},
                   {"trading_window", {{"start_minute", 50}, {"end_minute", 58}}}});
    auto exported = source.export_json();

    SettingsManager target;
    target.import_json(exported);
    auto s = target.get_all();
    EXPECT_TRUE(s.assets.at("sol").enabled);
    EXPECT_DOUBLE_EQ(s.assets.at("sol").bet_size, 25.0);
    EXPECT_EQ(s.trading_window.start_minute, 50);
    EXPECT_EQ(s.trading_window.end_minute, 58);
}

TEST_F(SettingsManagerTest, ImportInvalid_ThrowsAndKeepsState) {
    SettingsManager mgr;
    mgr.update({{"global_bot_enabled", true}});

    EXPECT_THROW(mgr.import_json("[1, 2, 3]"), std::runtime_error);
    EXPECT_THROW(mgr.import_json("{\"stop_loss\": {\"threshold\": 0}}"), std::runtime_error);
    EXPECT_TRUE(mgr.get_all().global_bot_enabled);
}

TEST_F(SettingsManagerTest, Reset_RestoresFactory) {
    SettingsManager mgr;
    mgr.update({{"global_bot_enabled", true}, {"assets", {{"btc", {{"bet_size", 5.0}}}}}});
    mgr.reset_to_factory();
    EXPECT_FALSE(mgr.get_all().global_bot_enabled);
    EXPECT_DOUBLE_EQ(mgr.get_all().assets.at("btc").bet_size, 90.0);
}

// ============================================================================
// Config
// ============================================================================

TEST(ConfigTest, Defaults_AreValid) {
    Config config;
    EXPECT_TRUE(config.validate());
    EXPECT_EQ(config.chain.chain_id, 137);
    EXPECT_FALSE(config.chain.rpc_urls.empty());
    EXPECT_EQ(config.series_ids.at("eth"), "");
}

TEST(ConfigTest, SerializationOmitsSecrets) {
    Config config;
    config.private_key = "0xdeadbeef";
    config.api_secret = "secret";
    nlohmann::json j = config;
    auto text = j.dump();
    EXPECT_EQ(text.find("deadbeef"), std::string::npos);
    EXPECT_EQ(text.find("secret"), std::string::npos);
}

TEST(ConfigTest, PartialJson_KeepsDefaults) {
    auto j = nlohmann::json::parse(R"({"chain": {"rpc_urls": ["http://localhost:8545"]},
                                       "series_ids": {"eth": "999"}})");
    Config config = j.get<Config>();
    ASSERT_EQ(config.chain.rpc_urls.size(), 1u);
    EXPECT_EQ(config.series_ids.at("eth"), "999");
    EXPECT_EQ(config.series_ids.at("btc"), "10114");
    EXPECT_EQ(config.connection.clob_url, "https://clob.polymarket.com");
}
