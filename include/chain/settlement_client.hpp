#pragma once

#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <chrono>
#include "config/config.hpp"
#include "config/settings.hpp"
#include "chain/rpc_pool.hpp"
#include "chain/gas_oracle.hpp"
#include "chain/evm_wallet.hpp"

namespace updown {

struct RedeemRequest {
    std::string condition_id;
    bool neg_risk{false};
    std::string token_id_a;      // Up position id
    std::string token_id_b;      // Down position id
};

struct TxOutcome {
    std::string tx_hash;
    bool confirmed{false};
    bool status_unknown{false};  // receipt did not arrive before the timeout
    std::string description;
};

/**
 * On-chain settlement of resolved positions. Failures throw SettlementError;
 * "nothing to redeem" is reported through the same exception text.
 */
class SettlementClient {
public:
    virtual ~SettlementClient() = default;

    virtual bool can_sign() const = 0;

    virtual TxOutcome redeem(const RedeemRequest& req, GasSpeed speed) = 0;

    virtual GasQuote gas_price(GasSpeed speed) = 0;

    // True when the endpoint answers a block-number query
    virtual bool probe(const std::string& url) = 0;

    // One-time USDC allowance and ERC1155 operator approvals for trading
    virtual std::vector<TxOutcome> approve_usdc(GasSpeed speed) = 0;
};

/**
 * Polygon implementation: legacy EIP-155 transactions signed locally,
 * submitted through the first healthy RPC endpoint.
 */
class PolygonSettlementClient : public SettlementClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // wallet may be null, in which case every write throws
    PolygonSettlementClient(ChainConfig chain,
                            std::shared_ptr<RpcEndpointPool> pool,
                            std::shared_ptr<GasPriceSelector> gas,
                            std::shared_ptr<EvmWallet> wallet,
                            Sleeper sleeper = nullptr);

    bool can_sign() const override { return wallet_ != nullptr; }

    TxOutcome redeem(const RedeemRequest& req, GasSpeed speed) override;
    GasQuote gas_price(GasSpeed speed) override;
    bool probe(const std::string& url) override;
    std::vector<TxOutcome> approve_usdc(GasSpeed speed) override;

private:
    ChainConfig chain_;
    std::shared_ptr<RpcEndpointPool> pool_;
    std::shared_ptr<GasPriceSelector> gas_;
    std::shared_ptr<EvmWallet> wallet_;
    Sleeper sleeper_;

    std::string eth_call(RpcConnection& conn, const std::string& to, const std::string& data);
    Bytes position_balance(RpcConnection& conn, const std::string& token_id);

    TxOutcome send_transaction(RpcConnection& conn, const std::string& to, const Bytes& data,
                               uint64_t gas_limit, GasSpeed speed, const std::string& description);
    void wait_for_receipt(RpcConnection& conn, TxOutcome& tx);
};

} // namespace updown
