#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include "config/settings.hpp"
#include "utils/http_client.hpp"
#include "chain/rpc_pool.hpp"

namespace updown {

/**
 * Suggested gas price per speed tier. Throws on any failure.
 */
class GasOracle {
public:
    virtual ~GasOracle() = default;
    virtual uint64_t gas_price_wei(GasSpeed speed) = 0;
};

/**
 * Polygon gas station v2: {"safeLow":{"maxFee":..},"standard":{..},"fast":{..}}
 * with fees in gwei.
 */
class PolygonGasStation : public GasOracle {
public:
    PolygonGasStation(std::shared_ptr<HttpTransport> http, std::string url);

    uint64_t gas_price_wei(GasSpeed speed) override;

    // Exposed for tests
    static uint64_t parse_response(const std::string& body, GasSpeed speed);

private:
    std::shared_ptr<HttpTransport> http_;
    std::string url_;
};

struct GasQuote {
    uint64_t wei{0};
    std::string source;   // "oracle" or "node"
};

/**
 * Oracle first, then the connected node's eth_gasPrice scaled by a margin.
 */
class GasPriceSelector {
public:
    GasPriceSelector(std::shared_ptr<GasOracle> oracle, double fallback_margin);

    // Throws RpcError if both sources fail
    GasQuote select(GasSpeed speed, RpcConnection& conn);

private:
    std::shared_ptr<GasOracle> oracle_;
    double fallback_margin_;
};

} // namespace updown
