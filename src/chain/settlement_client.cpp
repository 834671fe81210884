#include "chain/settlement_client.hpp"
#include "chain/abi.hpp"
#include "common/errors.hpp"
#include <thread>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace updown {

namespace {
    // 1M USDC in base units (6 decimals)
    constexpr double MIN_ALLOWANCE = 1e12;

    Bytes max_uint256() {
        return Bytes(32, 0xff);
    }
}

PolygonSettlementClient::PolygonSettlementClient(ChainConfig chain,
                                                 std::shared_ptr<RpcEndpointPool> pool,
                                                 std::shared_ptr<GasPriceSelector> gas,
                                                 std::shared_ptr<EvmWallet> wallet,
                                                 Sleeper sleeper)
    : chain_(std::move(chain))
    , pool_(std::move(pool))
    , gas_(std::move(gas))
    , wallet_(std::move(wallet))
    , sleeper_(std::move(sleeper))
{
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::string PolygonSettlementClient::eth_call(RpcConnection& conn, const std::string& to,
                                              const std::string& data) {
    nlohmann::json params = nlohmann::json::array({
        {{"to", to}, {"data", data}},
        "latest"
    });
    auto result = conn.call("eth_call", params);
    if (!result.is_string()) {
        throw RpcError(-32603, "eth_call returned no data");
    }
    return result.get<std::string>();
}

Bytes PolygonSettlementClient::position_balance(RpcConnection& conn, const std::string& token_id) {
    auto data = abi::CallBuilder("balanceOf(address,uint256)")
        .add_address(wallet_->address())
        .add_uint(abi::uint256_from_decimal(token_id))
        .build_hex();
    return abi::word_at(eth_call(conn, chain_.ctf_address, data), 0);
}

GasQuote PolygonSettlementClient::gas_price(GasSpeed speed) {
    auto conn = pool_->connect();
    return gas_->select(speed, conn);
}

bool PolygonSettlementClient::probe(const std::string& url) {
    return pool_->probe(url);
}

TxOutcome PolygonSettlementClient::redeem(const RedeemRequest& req, GasSpeed speed) {
    if (!wallet_) {
        throw SettlementError("No private key configured");
    }
    if (req.condition_id.empty()) {
        throw SettlementError("Missing condition id");
    }

    RpcConnection conn = [&]() {
        try {
            return pool_->connect();
        } catch (const RpcError& e) {
            throw SettlementError(e.what());
        }
    }();

    try {
        // Unresolved conditions have a zero payout denominator
        auto denom = eth_call(conn, chain_.ctf_address,
            abi::CallBuilder("payoutDenominator(bytes32)").add_bytes32(req.condition_id).build_hex());
        if (abi::is_zero_word(denom)) {
            throw SettlementError("condition not resolved");
        }

        Bytes balance_a = abi::uint256(0);
        Bytes balance_b = abi::uint256(0);
        bool have_balances = !req.token_id_a.empty() && !req.token_id_b.empty();
        if (have_balances) {
            balance_a = position_balance(conn, req.token_id_a);
            balance_b = position_balance(conn, req.token_id_b);
            if (abi::is_zero_word(crypto::hex_encode(balance_a)) &&
                abi::is_zero_word(crypto::hex_encode(balance_b))) {
                throw SettlementError("nothing to redeem");
            }
        }

        std::string to;
        Bytes data;
        if (req.neg_risk) {
            if (!have_balances) {
                throw SettlementError("NegRisk redemption needs both position ids");
            }
            to = chain_.neg_risk_adapter_address;
            data = abi::CallBuilder("redeemPositions(bytes32,uint256[])")
                .add_bytes32(req.condition_id)
                .add_uint_array({balance_a, balance_b})
                .build();
        } else {
            to = chain_.ctf_address;
            data = abi::CallBuilder("redeemPositions(address,bytes32,bytes32,uint256[])")
                .add_address(chain_.usdc_address)
                .add_bytes32("0x" + std::string(64, '0'))
                .add_bytes32(req.condition_id)
                .add_uint_array({abi::uint256(1), abi::uint256(2)})
                .build();
        }

        return send_transaction(conn, to, data, static_cast<uint64_t>(chain_.redeem_gas_limit), speed,
                                "redeem " + req.condition_id);
    } catch (const SettlementError&) {
        throw;
    } catch (const std::exception& e) {
        throw SettlementError(std::string("Redeem failed: ") + e.what());
    }
}

std::vector<TxOutcome> PolygonSettlementClient::approve_usdc(GasSpeed speed) {
    if (!wallet_) {
        throw SettlementError("No private key configured");
    }

    std::vector<TxOutcome> sent;
    auto conn = pool_->connect();
    const auto& owner = wallet_->address();

    for (const auto& spender : {chain_.ctf_exchange_address, chain_.neg_risk_exchange_address}) {
        auto allowance = eth_call(conn, chain_.usdc_address,
            abi::CallBuilder("allowance(address,address)").add_address(owner).add_address(spender).build_hex());
        if (abi::word_to_double(allowance) >= MIN_ALLOWANCE) {
            spdlog::info("USDC allowance for {} already set", spender);
            continue;
        }
        auto data = abi::CallBuilder("approve(address,uint256)")
            .add_address(spender)
            .add_uint(max_uint256())
            .build();
        sent.push_back(send_transaction(conn, chain_.usdc_address, data,
                                        static_cast<uint64_t>(chain_.approve_gas_limit), speed,
                                        "approve USDC for " + spender));
    }

    for (const auto& op : {chain_.ctf_exchange_address, chain_.neg_risk_exchange_address,
                           chain_.neg_risk_adapter_address}) {
        auto approved = eth_call(conn, chain_.ctf_address,
            abi::CallBuilder("isApprovedForAll(address,address)").add_address(owner).add_address(op).build_hex());
        if (!abi::is_zero_word(approved)) {
            spdlog::info("CTF operator {} already approved", op);
            continue;
        }
        auto data = abi::CallBuilder("setApprovalForAll(address,bool)")
            .add_address(op)
            .add_bool(true)
            .build();
        sent.push_back(send_transaction(conn, chain_.ctf_address, data,
                                        static_cast<uint64_t>(chain_.approve_gas_limit), speed,
                                        "approve CTF operator " + op));
    }

    return sent;
}

TxOutcome PolygonSettlementClient::send_transaction(RpcConnection& conn, const std::string& to,
                                                    const Bytes& data, uint64_t gas_limit,
                                                    GasSpeed speed, const std::string& description) {
    auto nonce = conn.call("eth_getTransactionCount",
                           nlohmann::json::array({wallet_->address(), "pending"}));
    if (!nonce.is_string()) {
        throw RpcError(-32603, "eth_getTransactionCount returned no quantity");
    }

    auto gas = gas_->select(speed, conn);

    LegacyTransaction tx;
    tx.nonce = abi::parse_hex_u64(nonce.get<std::string>());
    tx.gas_price_wei = gas.wei;
    tx.gas_limit = gas_limit;
    tx.to = to;
    tx.data = data;
    tx.chain_id = static_cast<uint64_t>(chain_.chain_id);

    auto raw = wallet_->sign_transaction(tx);
    auto hash = conn.call("eth_sendRawTransaction", nlohmann::json::array({crypto::to_hex_prefixed(raw)}));
    if (!hash.is_string()) {
        throw RpcError(-32603, "eth_sendRawTransaction returned no hash");
    }

    TxOutcome out;
    out.tx_hash = hash.get<std::string>();
    out.description = description;
    spdlog::info("Sent {} tx {} (nonce {}, gas {} gwei via {})",
                 description, out.tx_hash, tx.nonce, gas.wei / 1e9, gas.source);

    wait_for_receipt(conn, out);
    return out;
}

void PolygonSettlementClient::wait_for_receipt(RpcConnection& conn, TxOutcome& tx) {
    const int poll_ms = std::max(1, chain_.receipt_poll_ms);
    const int max_polls = std::max(1, chain_.receipt_timeout_seconds * 1000 / poll_ms);

    for (int i = 0; i < max_polls; i++) {
        nlohmann::json receipt;
        try {
            receipt = conn.call("eth_getTransactionReceipt", nlohmann::json::array({tx.tx_hash}));
        } catch (const std::exception& e) {
            spdlog::debug("Receipt poll for {} failed: {}", tx.tx_hash, e.what());
        }

        if (receipt.is_object()) {
            auto status = receipt.value("status", std::string("0x1"));
            if (abi::parse_hex_u64(status) == 0) {
                throw SettlementError("Transaction reverted: " + tx.tx_hash);
            }
            tx.confirmed = true;
            spdlog::info("Tx {} confirmed", tx.tx_hash);
            return;
        }
        sleeper_(std::chrono::milliseconds(poll_ms));
    }

    tx.status_unknown = true;
    spdlog::warn("Tx {} not confirmed after {}s, status unknown", tx.tx_hash, chain_.receipt_timeout_seconds);
}

} // namespace updown
