#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <functional>
#include <optional>
#include <nlohmann/json.hpp>

namespace updown {

struct AssetSettings {
    bool enabled{false};
    double bet_size{90.0};           // USDC per trade
    double min_price{0.90};
    double max_price{0.94};
    bool auto_claim_enabled{true};
};

struct TradingWindowSettings {
    int start_minute{45};
    int end_minute{59};
};

struct VolatilitySettings {
    bool enabled{false};

    // Time-based
    bool skip_volatile_hours{false};
    std::vector<int> volatile_hours_et{9, 10, 15, 16};

    // Spot swing over the last hour
    bool check_real_time_volatility{false};
    double max_hourly_volatility_percent{2.0};

    // Order book spread
    bool check_spread{false};
    double max_spread_cents{5.0};

    // Market volume range
    bool check_volume{false};
    double min_volume_usd{100.0};
    double max_volume_usd{50000.0};
};

struct StopLossSettings {
    bool enabled{true};
    double threshold{0.70};          // sell when current price drops below
    int interval_seconds{30};
};

struct AutoClaimSettings {
    bool enabled{true};
    int interval_minutes{60};
    int days_back{7};
};

enum class GasSpeed {
    SAFE_LOW,
    STANDARD,
    FAST
};

inline std::string gas_speed_to_string(GasSpeed s) {
    switch (s) {
        case GasSpeed::SAFE_LOW: return "safeLow";
        case GasSpeed::STANDARD: return "standard";
        case GasSpeed::FAST: return "fast";
    }
    return "standard";
}

inline GasSpeed gas_speed_from_string(const std::string& s) {
    if (s == "safeLow" || s == "safe_low") return GasSpeed::SAFE_LOW;
    if (s == "fast") return GasSpeed::FAST;
    return GasSpeed::STANDARD;
}

struct AdvancedSettings {
    int scan_interval_seconds{5};
    int min_fetch_interval_seconds{3};   // throttle on market data calls
    std::string rpc_url;                 // preferred RPC, tried before the config list
    GasSpeed gas_speed{GasSpeed::STANDARD};
    int order_delay_ms{500};             // pause between consecutive orders
};

// Price band -> assumed win probability
struct WinRateBand {
    double min_price{0.0};
    double win_rate{0.0};
};

/**
 * Operator-controlled runtime settings. Last write wins, no versioning.
 */
struct BotSettings {
    std::map<std::string, AssetSettings> assets;
    TradingWindowSettings trading_window;
    VolatilitySettings volatility;
    StopLossSettings stop_loss;
    AutoClaimSettings auto_claim;
    AdvancedSettings advanced;
    std::vector<WinRateBand> win_rate_table;
    bool global_bot_enabled{false};

    static BotSettings factory_defaults();

    // Empty when valid, otherwise the first problem found
    std::string validation_error() const;

    const AssetSettings* asset(const std::string& id) const;
};

// Stop-loss thresholds above 1 are cents
double normalize_threshold(double threshold);

void to_json(nlohmann::json& j, const AssetSettings& s);
void from_json(const nlohmann::json& j, AssetSettings& s);
void to_json(nlohmann::json& j, const TradingWindowSettings& s);
void from_json(const nlohmann::json& j, TradingWindowSettings& s);
void to_json(nlohmann::json& j, const VolatilitySettings& s);
void from_json(const nlohmann::json& j, VolatilitySettings& s);
void to_json(nlohmann::json& j, const StopLossSettings& s);
void from_json(const nlohmann::json& j, StopLossSettings& s);
void to_json(nlohmann::json& j, const AutoClaimSettings& s);
void from_json(const nlohmann::json& j, AutoClaimSettings& s);
void to_json(nlohmann::json& j, const AdvancedSettings& s);
void from_json(const nlohmann::json& j, AdvancedSettings& s);
void to_json(nlohmann::json& j, const WinRateBand& b);
void from_json(const nlohmann::json& j, WinRateBand& b);

// from_json only touches keys present in j, so it doubles as a deep merge
void to_json(nlohmann::json& j, const BotSettings& s);
void from_json(const nlohmann::json& j, BotSettings& s);

/**
 * Thread-safe owner of BotSettings with file persistence and change listeners.
 * Readers take a copy via get_all(); writers go through update/import/reset.
 */
class SettingsManager {
public:
    using Listener = std::function<void(const BotSettings&)>;

    // Empty path keeps settings in memory only
    explicit SettingsManager(std::string path = "");

    BotSettings get_all() const;

    // Deep-merge a partial document; throws std::invalid_argument and keeps state if invalid
    BotSettings update(const nlohmann::json& partial);

    // Apply a typed mutation under the lock, then validate, persist and notify
    BotSettings modify(const std::function<void(BotSettings&)>& fn);

    BotSettings reset_to_factory();

    std::string export_json() const;

    // Merges over factory defaults; throws std::runtime_error("Invalid settings format")
    BotSettings import_json(const std::string& json_text);

    int on_change(Listener listener);
    void remove_listener(int id);

    void save() const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
    BotSettings settings_;

    std::mutex listeners_mutex_;
    std::map<int, Listener> listeners_;
    int next_listener_id_{1};

    BotSettings load();
    void save_locked(const BotSettings& s) const;
    void notify(const BotSettings& current);
};

} // namespace updown
