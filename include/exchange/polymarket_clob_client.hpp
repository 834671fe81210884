#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>
#include "exchange/exchange_client.hpp"
#include "chain/evm_wallet.hpp"
#include "config/config.hpp"
#include "utils/http_client.hpp"

namespace updown {

struct ApiCredentials {
    std::string api_key;
    std::string secret;        // url-safe base64
    std::string passphrase;

    bool valid() const { return !api_key.empty() && !secret.empty() && !passphrase.empty(); }
};

/**
 * Polymarket CLOB client.
 *
 * Without a private key the instance is read-only: books and positions
 * only, every order call is rejected locally. With a key, orders are
 * EIP-712 signed and posted with L2 HMAC headers. API credentials come
 * from the environment or are derived on first use through L1 auth.
 */
class PolymarketClobClient : public ExchangeClient {
public:
    PolymarketClobClient(const Config& config, std::shared_ptr<HttpTransport> http,
                         ClockFn clock = wall_now);

    bool is_read_only() const override { return wallet_ == nullptr; }

    OrderBook get_order_book(const std::string& token_id) override;
    OrderAck submit_order(const OrderRequest& req) override;
    CancelAck cancel_order(const std::string& order_id) override;
    std::vector<Position> get_positions() override;

    // Derive or create API credentials up front; false leaves orders rejected until a retry succeeds
    bool initialize();

    std::string wallet_address() const;

    // Address holding the positions: the funder proxy if configured, else the signer
    std::string maker_address() const;

    // Signed order payload as posted to /order (exposed for tests)
    nlohmann::json build_signed_order(const OrderRequest& req, uint64_t salt) const;

    // L2 headers for an authenticated request
    HttpHeaders l2_headers(const std::string& method, const std::string& path,
                           const std::string& body) const;

private:
    std::string clob_url_;
    std::string data_api_url_;
    ChainConfig chain_;
    std::string funder_address_;
    std::shared_ptr<HttpTransport> http_;
    ClockFn clock_;

    std::shared_ptr<EvmWallet> wallet_;

    mutable std::mutex creds_mutex_;
    ApiCredentials creds_;

    int64_t timestamp_seconds() const;
    HttpHeaders l1_headers(int64_t nonce) const;
    std::optional<ApiCredentials> current_credentials();
    int signature_type() const;
};

} // namespace updown
