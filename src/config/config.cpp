#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <spdlog/spdlog.h>

namespace updown {

void to_json(nlohmann::json& j, const ConnectionConfig& c) {
    j = nlohmann::json{
        {"clob_url", c.clob_url},
        {"gamma_url", c.gamma_url},
        {"data_api_url", c.data_api_url},
        {"binance_rest_url", c.binance_rest_url},
        {"gas_station_url", c.gas_station_url},
        {"http_timeout_ms", c.http_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, ConnectionConfig& c) {
    if (j.contains("clob_url")) j.at("clob_url").get_to(c.clob_url);
    if (j.contains("gamma_url")) j.at("gamma_url").get_to(c.gamma_url);
    if (j.contains("data_api_url")) j.at("data_api_url").get_to(c.data_api_url);
    if (j.contains("binance_rest_url")) j.at("binance_rest_url").get_to(c.binance_rest_url);
    if (j.contains("gas_station_url")) j.at("gas_station_url").get_to(c.gas_station_url);
    if (j.contains("http_timeout_ms")) j.at("http_timeout_ms").get_to(c.http_timeout_ms);
}

void to_json(nlohmann::json& j, const ChainConfig& c) {
    j = nlohmann::json{
        {"chain_id", c.chain_id},
        {"rpc_urls", c.rpc_urls},
        {"usdc_address", c.usdc_address},
        {"ctf_address", c.ctf_address},
        {"ctf_exchange_address", c.ctf_exchange_address},
        {"neg_risk_exchange_address", c.neg_risk_exchange_address},
        {"neg_risk_adapter_address", c.neg_risk_adapter_address},
        {"receipt_timeout_seconds", c.receipt_timeout_seconds},
        {"receipt_poll_ms", c.receipt_poll_ms},
        {"gas_fallback_margin", c.gas_fallback_margin},
        {"redeem_gas_limit", c.redeem_gas_limit},
        {"approve_gas_limit", c.approve_gas_limit}
    };
}

void from_json(const nlohmann::json& j, ChainConfig& c) {
    if (j.contains("chain_id")) j.at("chain_id").get_to(c.chain_id);
    if (j.contains("rpc_urls")) j.at("rpc_urls").get_to(c.rpc_urls);
    if (j.contains("usdc_address")) j.at("usdc_address").get_to(c.usdc_address);
    if (j.contains("ctf_address")) j.at("ctf_address").get_to(c.ctf_address);
    if (j.contains("ctf_exchange_address")) j.at("ctf_exchange_address").get_to(c.ctf_exchange_address);
    if (j.contains("neg_risk_exchange_address")) j.at("neg_risk_exchange_address").get_to(c.neg_risk_exchange_address);
    if (j.contains("neg_risk_adapter_address")) j.at("neg_risk_adapter_address").get_to(c.neg_risk_adapter_address);
    if (j.contains("receipt_timeout_seconds")) j.at("receipt_timeout_seconds").get_to(c.receipt_timeout_seconds);
    if (j.contains("receipt_poll_ms")) j.at("receipt_poll_ms").get_to(c.receipt_poll_ms);
    if (j.contains("gas_fallback_margin")) j.at("gas_fallback_margin").get_to(c.gas_fallback_margin);
    if (j.contains("redeem_gas_limit")) j.at("redeem_gas_limit").get_to(c.redeem_gas_limit);
    if (j.contains("approve_gas_limit")) j.at("approve_gas_limit").get_to(c.approve_gas_limit);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"connection", c.connection},
        {"chain", c.chain},
        {"logging", c.logging},
        {"database_path", c.database_path},
        {"settings_path", c.settings_path},
        {"series_ids", c.series_ids},
        {"spot_symbols", c.spot_symbols}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("connection")) j.at("connection").get_to(c.connection);
    if (j.contains("chain")) j.at("chain").get_to(c.chain);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("database_path")) j.at("database_path").get_to(c.database_path);
    if (j.contains("settings_path")) j.at("settings_path").get_to(c.settings_path);
    if (j.contains("series_ids")) {
        for (const auto& [asset, id] : j.at("series_ids").items()) {
            c.series_ids[asset] = id.get<std::string>();
        }
    }
    if (j.contains("spot_symbols")) {
        for (const auto& [asset, sym] : j.at("spot_symbols").items()) {
            c.spot_symbols[asset] = sym.get<std::string>();
        }
    }
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    nlohmann::json j;
    file >> j;

    Config config;
    from_json(j, config);

    if (!config.validate()) {
        throw std::runtime_error("Invalid configuration in: " + path);
    }

    return config;
}

void Config::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

bool Config::validate() const {
    if (chain.rpc_urls.empty()) {
        spdlog::error("chain.rpc_urls must list at least one endpoint");
        return false;
    }

    if (chain.gas_fallback_margin < 1.0) {
        spdlog::error("chain.gas_fallback_margin must be >= 1.0");
        return false;
    }

    if (chain.receipt_timeout_seconds <= 0) {
        spdlog::error("chain.receipt_timeout_seconds must be positive");
        return false;
    }

    if (connection.http_timeout_ms <= 0) {
        spdlog::error("connection.http_timeout_ms must be positive");
        return false;
    }

    if (database_path.empty() || settings_path.empty()) {
        spdlog::error("database_path and settings_path must be set");
        return false;
    }

    return true;
}

void Config::load_secrets_from_env() {
    private_key = get_env("UPDOWN_PRIVATE_KEY", private_key);
    api_key = get_env("UPDOWN_API_KEY", api_key);
    api_secret = get_env("UPDOWN_API_SECRET", api_secret);
    api_passphrase = get_env("UPDOWN_API_PASSPHRASE", api_passphrase);
    funder_address = get_env("UPDOWN_FUNDER_ADDRESS", funder_address);
}

std::string Config::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace updown
