#include "chain/gas_oracle.hpp"
#include "chain/abi.hpp"
#include "market_data/market_adapters.hpp"
#include "common/errors.hpp"
#include <cmath>
#include <spdlog/spdlog.h>

namespace updown {

PolygonGasStation::PolygonGasStation(std::shared_ptr<HttpTransport> http, std::string url)
    : http_(std::move(http))
    , url_(std::move(url))
{
}

uint64_t PolygonGasStation::parse_response(const std::string& body, GasSpeed speed) {
    auto j = nlohmann::json::parse(body);
    auto key = gas_speed_to_string(speed);
    if (!j.contains(key)) {
        throw std::runtime_error("Gas station response missing " + key);
    }

    const auto& tier = j[key];
    std::optional<double> gwei = tier.is_object()
        ? adapters::number_field(tier, {"maxFee", "max_fee"})
        : adapters::as_number(tier);
    if (!gwei || *gwei <= 0.0) {
        throw std::runtime_error("Gas station returned no usable fee for " + key);
    }
    return static_cast<uint64_t>(std::llround(*gwei * 1e9));
}

uint64_t PolygonGasStation::gas_price_wei(GasSpeed speed) {
    return parse_response(http_->get(url_), speed);
}

GasPriceSelector::GasPriceSelector(std::shared_ptr<GasOracle> oracle, double fallback_margin)
    : oracle_(std::move(oracle))
    , fallback_margin_(fallback_margin)
{
}

GasQuote GasPriceSelector::select(GasSpeed speed, RpcConnection& conn) {
    if (oracle_) {
        try {
            uint64_t wei = oracle_->gas_price_wei(speed);
            spdlog::debug("Gas price {} gwei from oracle ({})", wei / 1e9, gas_speed_to_string(speed));
            return {wei, "oracle"};
        } catch (const std::exception& e) {
            spdlog::warn("Gas oracle failed, falling back to node: {}", e.what());
        }
    }

    auto result = conn.call("eth_gasPrice");
    if (!result.is_string()) {
        throw RpcError(-32603, "eth_gasPrice returned no quantity");
    }
    uint64_t node_price = abi::parse_hex_u64(result.get<std::string>());
    auto wei = static_cast<uint64_t>(std::llround(static_cast<double>(node_price) * fallback_margin_));
    spdlog::debug("Gas price {} gwei from node {}", wei / 1e9, conn.url());
    return {wei, "node"};
}

} // namespace updown
