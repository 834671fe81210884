#include "config/settings.hpp"
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace updown {

// ============================================================================
// JSON
// ============================================================================

void to_json(nlohmann::json& j, const AssetSettings& s) {
    j = nlohmann::json{
        {"enabled", s.enabled},
        {"bet_size", s.bet_size},
        {"min_price", s.min_price},
        {"max_price", s.max_price},
        {"auto_claim_enabled", s.auto_claim_enabled}
    };
}

void from_json(const nlohmann::json& j, AssetSettings& s) {
    if (j.contains("enabled")) j.at("enabled").get_to(s.enabled);
    if (j.contains("bet_size")) j.at("bet_size").get_to(s.bet_size);
    if (j.contains("min_price")) j.at("min_price").get_to(s.min_price);
    if (j.contains("max_price")) j.at("max_price").get_to(s.max_price);
    if (j.contains("auto_claim_enabled")) j.at("auto_claim_enabled").get_to(s.auto_claim_enabled);
}

void to_json(nlohmann::json& j, const TradingWindowSettings& s) {
    j = nlohmann::json{
        {"start_minute", s.start_minute},
        {"end_minute", s.end_minute}
    };
}

void from_json(const nlohmann::json& j, TradingWindowSettings& s) {
    if (j.contains("start_minute")) j.at("start_minute").get_to(s.start_minute);
    if (j.contains("end_minute")) j.at("end_minute").get_to(s.end_minute);
}

void to_json(nlohmann::json& j, const VolatilitySettings& s) {
    j = nlohmann::json{
        {"enabled", s.enabled},
        {"skip_volatile_hours", s.skip_volatile_hours},
        {"volatile_hours_et", s.volatile_hours_et},
        {"check_real_time_volatility", s.check_real_time_volatility},
        {"max_hourly_volatility_percent", s.max_hourly_volatility_percent},
        {"check_spread", s.check_spread},
        {"max_spread_cents", s.max_spread_cents},
        {"check_volume", s.check_volume},
        {"min_volume_usd", s.min_volume_usd},
        {"max_volume_usd", s.max_volume_usd}
    };
}

void from_json(const nlohmann::json& j, VolatilitySettings& s) {
    if (j.contains("enabled")) j.at("enabled").get_to(s.enabled);
    if (j.contains("skip_volatile_hours")) j.at("skip_volatile_hours").get_to(s.skip_volatile_hours);
    if (j.contains("volatile_hours_et")) j.at("volatile_hours_et").get_to(s.volatile_hours_et);
    if (j.contains("check_real_time_volatility")) j.at("check_real_time_volatility").get_to(s.check_real_time_volatility);
    if (j.contains("max_hourly_volatility_percent")) j.at("max_hourly_volatility_percent").get_to(s.max_hourly_volatility_percent);
    if (j.contains("check_spread")) j.at("check_spread").get_to(s.check_spread);
    if (j.contains("max_spread_cents")) j.at("max_spread_cents").get_to(s.max_spread_cents);
    if (j.contains("check_volume")) j.at("check_volume").get_to(s.check_volume);
    if (j.contains("min_volume_usd")) j.at("min_volume_usd").get_to(s.min_volume_usd);
    if (j.contains("max_volume_usd")) j.at("max_volume_usd").get_to(s.max_volume_usd);
}

void to_json(nlohmann::json& j, const StopLossSettings& s) {
    j = nlohmann::json{
        {"enabled", s.enabled},
        {"threshold", s.threshold},
        {"interval_seconds", s.interval_seconds}
    };
}

void from_json(const nlohmann::json& j, StopLossSettings& s) {
    if (j.contains("enabled")) j.at("enabled").get_to(s.enabled);
    if (j.contains("threshold")) s.threshold = normalize_threshold(j.at("threshold").get<double>());
    if (j.contains("interval_seconds")) j.at("interval_seconds").get_to(s.interval_seconds);
}

void to_json(nlohmann::json& j, const AutoClaimSettings& s) {
    j = nlohmann::json{
        {"enabled", s.enabled},
        {"interval_minutes", s.interval_minutes},
        {"days_back", s.days_back}
    };
}

void from_json(const nlohmann::json& j, AutoClaimSettings& s) {
    if (j.contains("enabled")) j.at("enabled").get_to(s.enabled);
    if (j.contains("interval_minutes")) j.at("interval_minutes").get_to(s.interval_minutes);
    if (j.contains("days_back")) j.at("days_back").get_to(s.days_back);
}

void to_json(nlohmann::json& j, const AdvancedSettings& s) {
    j = nlohmann::json{
        {"scan_interval_seconds", s.scan_interval_seconds},
        {"min_fetch_interval_seconds", s.min_fetch_interval_seconds},
        {"rpc_url", s.rpc_url},
        {"gas_speed", gas_speed_to_string(s.gas_speed)},
        {"order_delay_ms", s.order_delay_ms}
    };
}

void from_json(const nlohmann::json& j, AdvancedSettings& s) {
    if (j.contains("scan_interval_seconds")) j.at("scan_interval_seconds").get_to(s.scan_interval_seconds);
    if (j.contains("min_fetch_interval_seconds")) j.at("min_fetch_interval_seconds").get_to(s.min_fetch_interval_seconds);
    if (j.contains("rpc_url")) j.at("rpc_url").get_to(s.rpc_url);
    if (j.contains("gas_speed")) s.gas_speed = gas_speed_from_string(j.at("gas_speed").get<std::string>());
    if (j.contains("order_delay_ms")) j.at("order_delay_ms").get_to(s.order_delay_ms);
}

void to_json(nlohmann::json& j, const WinRateBand& b) {
    j = nlohmann::json{{"min_price", b.min_price}, {"win_rate", b.win_rate}};
}

void from_json(const nlohmann::json& j, WinRateBand& b) {
    j.at("min_price").get_to(b.min_price);
    j.at("win_rate").get_to(b.win_rate);
}

void to_json(nlohmann::json& j, const BotSettings& s) {
    j = nlohmann::json{
        {"assets", s.assets},
        {"trading_window", s.trading_window},
        {"volatility", s.volatility},
        {"stop_loss", s.stop_loss},
        {"auto_claim", s.auto_claim},
        {"advanced", s.advanced},
        {"win_rate_table", s.win_rate_table},
        {"global_bot_enabled", s.global_bot_enabled}
    };
}

void from_json(const nlohmann::json& j, BotSettings& s) {
    if (!j.is_object()) {
        throw std::invalid_argument("settings document must be a JSON object");
    }
    if (j.contains("assets")) {
        for (const auto& [id, asset_json] : j.at("assets").items()) {
            // Unknown assets start from a disabled default
            auto& asset = s.assets[id];
            from_json(asset_json, asset);
        }
    }
    if (j.contains("trading_window")) from_json(j.at("trading_window"), s.trading_window);
    if (j.contains("volatility")) from_json(j.at("volatility"), s.volatility);
    if (j.contains("stop_loss")) from_json(j.at("stop_loss"), s.stop_loss);
    if (j.contains("auto_claim")) from_json(j.at("auto_claim"), s.auto_claim);
    if (j.contains("advanced")) from_json(j.at("advanced"), s.advanced);
    if (j.contains("win_rate_table")) j.at("win_rate_table").get_to(s.win_rate_table);
    if (j.contains("global_bot_enabled")) j.at("global_bot_enabled").get_to(s.global_bot_enabled);
}

// ============================================================================
// BotSettings
// ============================================================================

double normalize_threshold(double threshold) {
    return threshold > 1.0 ? threshold / 100.0 : threshold;
}

BotSettings BotSettings::factory_defaults() {
    BotSettings s;

    AssetSettings btc;
    btc.enabled = true;
    s.assets["btc"] = btc;

    AssetSettings alt;
    alt.enabled = false;
    s.assets["eth"] = alt;
    s.assets["sol"] = alt;

    s.win_rate_table = {
        {0.80, 0.99},
        {0.70, 0.98},
        {0.60, 0.93},
        {0.50, 0.80}
    };

    return s;
}

std::string BotSettings::validation_error() const {
    for (const auto& [id, a] : assets) {
        if (a.bet_size <= 0) return "assets." + id + ".bet_size must be positive";
        if (a.min_price <= 0 || a.max_price > 1.0) return "assets." + id + " price band must lie in (0, 1]";
        if (a.min_price > a.max_price) return "assets." + id + ".min_price must be <= max_price";
    }
    if (trading_window.start_minute < 0 || trading_window.start_minute > 59 ||
        trading_window.end_minute < 0 || trading_window.end_minute > 59) {
        return "trading_window minutes must be within 0-59";
    }
    if (stop_loss.threshold <= 0 || stop_loss.threshold >= 1.0) {
        return "stop_loss.threshold must be within (0, 1)";
    }
    if (stop_loss.interval_seconds <= 0) return "stop_loss.interval_seconds must be positive";
    if (auto_claim.interval_minutes <= 0) return "auto_claim.interval_minutes must be positive";
    if (auto_claim.days_back <= 0) return "auto_claim.days_back must be positive";
    if (advanced.scan_interval_seconds <= 0) return "advanced.scan_interval_seconds must be positive";
    if (advanced.min_fetch_interval_seconds < 0) return "advanced.min_fetch_interval_seconds must be >= 0";
    for (int h : volatility.volatile_hours_et) {
        if (h < 0 || h > 23) return "volatility.volatile_hours_et entries must be within 0-23";
    }
    for (const auto& band : win_rate_table) {
        if (band.win_rate < 0 || band.win_rate > 1.0) return "win_rate_table rates must lie in [0, 1]";
    }
    return "";
}

const AssetSettings* BotSettings::asset(const std::string& id) const {
    auto it = assets.find(id);
    return it == assets.end() ? nullptr : &it->second;
}

// ============================================================================
// SettingsManager
// ============================================================================

SettingsManager::SettingsManager(std::string path)
    : path_(std::move(path))
{
    settings_ = load();
}

BotSettings SettingsManager::load() {
    BotSettings defaults = BotSettings::factory_defaults();
    if (path_.empty() || !std::filesystem::exists(path_)) {
        spdlog::info("Using factory default settings");
        return defaults;
    }

    try {
        std::ifstream file(path_);
        nlohmann::json j;
        file >> j;

        BotSettings merged = defaults;
        from_json(j, merged);
        auto err = merged.validation_error();
        if (!err.empty()) {
            throw std::invalid_argument(err);
        }
        spdlog::info("Loaded settings from {}", path_);
        return merged;
    } catch (const std::exception& e) {
        spdlog::warn("Failed to load settings from {}: {}, using factory defaults", path_, e.what());
        return defaults;
    }
}

BotSettings SettingsManager::get_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_;
}

BotSettings SettingsManager::update(const nlohmann::json& partial) {
    return modify([&partial](BotSettings& s) {
        try {
            from_json(partial, s);
        } catch (const nlohmann::json::exception& e) {
            throw std::invalid_argument(std::string("Invalid settings: ") + e.what());
        }
    });
}

BotSettings SettingsManager::modify(const std::function<void(BotSettings&)>& fn) {
    BotSettings next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        next = settings_;
        fn(next);
        auto err = next.validation_error();
        if (!err.empty()) {
            throw std::invalid_argument("Invalid settings: " + err);
        }
        save_locked(next);
        settings_ = next;
    }
    notify(next);
    return next;
}

BotSettings SettingsManager::reset_to_factory() {
    auto result = modify([](BotSettings& s) { s = BotSettings::factory_defaults(); });
    spdlog::info("Settings reset to factory defaults");
    return result;
}

std::string SettingsManager::export_json() const {
    nlohmann::json j = get_all();
    return j.dump(2);
}

BotSettings SettingsManager::import_json(const std::string& json_text) {
    BotSettings imported = BotSettings::factory_defaults();
    try {
        auto j = nlohmann::json::parse(json_text);
        from_json(j, imported);
    } catch (const std::exception& e) {
        spdlog::error("Failed to import settings: {}", e.what());
        throw std::runtime_error("Invalid settings format");
    }

    auto err = imported.validation_error();
    if (!err.empty()) {
        spdlog::error("Failed to import settings: {}", err);
        throw std::runtime_error("Invalid settings format");
    }

    auto result = modify([&imported](BotSettings& s) { s = imported; });
    spdlog::info("Settings imported successfully");
    return result;
}

int SettingsManager::on_change(Listener listener) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    int id = next_listener_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

void SettingsManager::remove_listener(int id) {
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    listeners_.erase(id);
}

void SettingsManager::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    save_locked(settings_);
}

void SettingsManager::save_locked(const BotSettings& s) const {
    if (path_.empty()) return;

    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    // Write to a temp file and rename over the old one
    std::string temp = path_ + ".tmp";
    {
        std::ofstream file(temp);
        if (!file.is_open()) {
            throw std::runtime_error("Failed to write settings file: " + temp);
        }
        nlohmann::json j = s;
        file << j.dump(2);
        file.close();
        if (!file) {
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            throw std::runtime_error("Failed to write settings file: " + temp);
        }
    }

    std::filesystem::rename(temp, path_);
}

void SettingsManager::notify(const BotSettings& current) {
    std::map<int, Listener> snapshot;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        snapshot = listeners_;
    }
    for (const auto& [id, listener] : snapshot) {
        try {
            listener(current);
        } catch (const std::exception& e) {
            spdlog::error("Settings listener {} failed: {}", id, e.what());
        }
    }
}

} // namespace updown
