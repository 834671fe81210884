#pragma once

#include <string>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>
#include "common/types.hpp"

namespace updown {

struct ConnectionConfig {
    // Polymarket
    std::string clob_url{"https://clob.polymarket.com"};
    std::string gamma_url{"https://gamma-api.polymarket.com"};
    std::string data_api_url{"https://data-api.polymarket.com"};

    // Spot price feed (5m klines)
    std::string binance_rest_url{"https://api.binance.com/api/v3"};

    // Polygon gas station v2
    std::string gas_station_url{"https://gasstation.polygon.technology/v2"};

    int http_timeout_ms{10000};
};

struct ChainConfig {
    int64_t chain_id{137};

    // Tried in order on every operation, after settings.advanced.rpc_url if set
    std::vector<std::string> rpc_urls{
        "https://polygon.llamarpc.com",
        "https://polygon-bor-rpc.publicnode.com",
        "https://polygon.drpc.org",
        "https://polygon-rpc.com"
    };

    std::string usdc_address{"0x2791Bca1f2de4661ED88A30C99A7a9449Aa84174"};          // USDC.e
    std::string ctf_address{"0x4D97DCd97eC945f40cF65F87097ACe5EA0476045"};           // ConditionalTokens
    std::string ctf_exchange_address{"0x4bFb41d5B3570DeFd03C39a9A4D8dE6Bd8B8982E"};
    std::string neg_risk_exchange_address{"0xC5d563A36AE78145C45a50134d48A1215220f80a"};
    std::string neg_risk_adapter_address{"0xd91E80cF2E7be2e162c6513ceD06f1dD0dA35296"};

    int receipt_timeout_seconds{120};
    int receipt_poll_ms{3000};
    double gas_fallback_margin{1.10};
    int64_t redeem_gas_limit{400000};
    int64_t approve_gas_limit{100000};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{false};                 // JSON lines format
    int max_log_file_size_mb{50};
    int max_log_files{5};
};

/**
 * Process-level configuration. Static for the lifetime of the process;
 * everything operators can change at runtime lives in BotSettings.
 */
struct Config {
    ConnectionConfig connection;
    ChainConfig chain;
    LoggingConfig logging;

    std::string database_path{"./data/trades.db"};
    std::string settings_path{"./data/settings.json"};

    // Gamma series id per asset; an asset without a series lists zero markets
    std::map<std::string, std::string> series_ids{
        {"btc", "10114"},
        {"eth", ""},
        {"sol", ""}
    };

    // Spot symbol root per asset for the volatility feed ("BTC" -> BTCUSDT)
    std::map<std::string, std::string> spot_symbols{
        {"btc", "BTC"},
        {"eth", "ETH"},
        {"sol", "SOL"}
    };

    // Secrets, environment only, never serialized
    std::string private_key;
    std::string api_key;
    std::string api_secret;
    std::string api_passphrase;
    std::string funder_address;

    // Load from file
    static Config load(const std::string& path);

    // Save to file (without secrets)
    void save(const std::string& path) const;

    // Validate configuration
    bool validate() const;

    // Pull secrets from UPDOWN_* environment variables
    void load_secrets_from_env();

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

// JSON serialization
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace updown
