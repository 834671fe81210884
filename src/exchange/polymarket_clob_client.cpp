#include "exchange/polymarket_clob_client.hpp"
#include "market_data/market_adapters.hpp"
#include "chain/abi.hpp"
#include "common/errors.hpp"
#include "utils/crypto.hpp"
#include <cmath>
#include <cctype>
#include <spdlog/spdlog.h>

namespace updown {

namespace {
    const char* ZERO_ADDRESS = "0x0000000000000000000000000000000000000000";
    const char* CLOB_AUTH_MESSAGE = "This message attests that I control the given wallet";

    const char* ORDER_TYPE =
        "Order(uint256 salt,address maker,address signer,address taker,uint256 tokenId,"
        "uint256 makerAmount,uint256 takerAmount,uint256 expiration,uint256 nonce,"
        "uint256 feeRateBps,uint8 side,uint8 signatureType)";

    const char* CLOB_AUTH_TYPE =
        "ClobAuth(address address,string timestamp,uint256 nonce,string message)";

    // Signature types understood by the exchange contracts
    constexpr int SIG_EOA = 0;
    constexpr int SIG_GNOSIS_SAFE = 2;

    std::string lower(std::string s) {
        for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        return s;
    }
}

PolymarketClobClient::PolymarketClobClient(const Config& config,
                                           std::shared_ptr<HttpTransport> http,
                                           ClockFn clock)
    : clob_url_(config.connection.clob_url)
    , data_api_url_(config.connection.data_api_url)
    , chain_(config.chain)
    , funder_address_(config.funder_address)
    , http_(std::move(http))
    , clock_(std::move(clock))
{
    if (config.private_key.empty()) {
        spdlog::warn("No private key configured - running in read-only mode");
    } else {
        wallet_ = std::make_shared<EvmWallet>(config.private_key);
        spdlog::info("Trading wallet: {}", wallet_->address());
    }

    creds_.api_key = config.api_key;
    creds_.secret = config.api_secret;
    creds_.passphrase = config.api_passphrase;
}

std::string PolymarketClobClient::wallet_address() const {
    return wallet_ ? wallet_->address() : "";
}

std::string PolymarketClobClient::maker_address() const {
    if (!funder_address_.empty()) {
        return EvmWallet::to_checksum_address(funder_address_);
    }
    return wallet_address();
}

int PolymarketClobClient::signature_type() const {
    if (!wallet_ || funder_address_.empty()) return SIG_EOA;
    return lower(maker_address()) == lower(wallet_->address()) ? SIG_EOA : SIG_GNOSIS_SAFE;
}

int64_t PolymarketClobClient::timestamp_seconds() const {
    return std::chrono::duration_cast<std::chrono::seconds>(clock_().time_since_epoch()).count();
}

// ============================================================================
// Authentication
// ============================================================================

HttpHeaders PolymarketClobClient::l1_headers(int64_t nonce) const {
    std::string ts = std::to_string(timestamp_seconds());

    eip712::Domain domain;
    domain.name = "ClobAuthDomain";
    domain.version = "1";
    domain.chain_id = static_cast<uint64_t>(chain_.chain_id);

    auto struct_hash = eip712::hash_struct(eip712::type_hash(CLOB_AUTH_TYPE), {
        abi::address(wallet_->address()),
        eip712::string_word(ts),
        abi::uint256(static_cast<uint64_t>(nonce)),
        eip712::string_word(CLOB_AUTH_MESSAGE)
    });
    auto sig = wallet_->sign_digest(eip712::digest(eip712::domain_separator(domain), struct_hash));

    return {
        {"POLY_ADDRESS", wallet_->address()},
        {"POLY_SIGNATURE", sig.to_hex65()},
        {"POLY_TIMESTAMP", ts},
        {"POLY_NONCE", std::to_string(nonce)}
    };
}

HttpHeaders PolymarketClobClient::l2_headers(const std::string& method, const std::string& path,
                                             const std::string& body) const {
    ApiCredentials creds;
    {
        std::lock_guard<std::mutex> lock(creds_mutex_);
        creds = creds_;
    }

    std::string ts = std::to_string(timestamp_seconds());
    std::string signature = crypto::clob_hmac_signature(creds.secret, ts + method + path + body);

    return {
        {"POLY_ADDRESS", wallet_address()},
        {"POLY_SIGNATURE", signature},
        {"POLY_TIMESTAMP", ts},
        {"POLY_API_KEY", creds.api_key},
        {"POLY_PASSPHRASE", creds.passphrase},
        {"Content-Type", "application/json"}
    };
}

bool PolymarketClobClient::initialize() {
    if (!wallet_) return false;
    {
        std::lock_guard<std::mutex> lock(creds_mutex_);
        if (creds_.valid()) return true;
    }

    auto parse_creds = [](const std::string& body) {
        auto j = nlohmann::json::parse(body);
        ApiCredentials c;
        c.api_key = adapters::string_field(j, {"apiKey", "api_key", "key"}).value_or("");
        c.secret = adapters::string_field(j, {"secret"}).value_or("");
        c.passphrase = adapters::string_field(j, {"passphrase"}).value_or("");
        return c;
    };

    ApiCredentials derived;
    try {
        derived = parse_creds(http_->get(clob_url_ + "/auth/derive-api-key", l1_headers(0)));
    } catch (const std::exception& e) {
        spdlog::warn("Deriving API key failed ({}), creating a new one", e.what());
    }

    if (!derived.valid()) {
        try {
            derived = parse_creds(http_->post(clob_url_ + "/auth/api-key", "", l1_headers(0)));
        } catch (const std::exception& e) {
            spdlog::error("Failed to obtain API credentials: {}", e.what());
            return false;
        }
    }

    if (!derived.valid()) {
        spdlog::error("API credential response incomplete");
        return false;
    }

    std::lock_guard<std::mutex> lock(creds_mutex_);
    creds_ = derived;
    spdlog::info("API credentials ready");
    return true;
}

std::optional<ApiCredentials> PolymarketClobClient::current_credentials() {
    if (!initialize()) return std::nullopt;
    std::lock_guard<std::mutex> lock(creds_mutex_);
    return creds_;
}

// ============================================================================
// Orders
// ============================================================================

nlohmann::json PolymarketClobClient::build_signed_order(const OrderRequest& req, uint64_t salt) const {
    if (!wallet_) {
        throw std::logic_error("Cannot sign orders in read-only mode");
    }

    // Whole shares at a two-decimal price keep both amounts exact in 1e6 units
    const uint64_t price_cents = static_cast<uint64_t>(std::llround(req.price * 100.0));
    const uint64_t shares = static_cast<uint64_t>(std::llround(req.shares));
    const uint64_t usdc_units = price_cents * shares * 10000;
    const uint64_t share_units = shares * 1000000;

    uint64_t maker_amount = req.side == Side::BUY ? usdc_units : share_units;
    uint64_t taker_amount = req.side == Side::BUY ? share_units : usdc_units;

    std::string maker = maker_address();
    std::string signer = wallet_->address();
    int side = req.side == Side::BUY ? 0 : 1;
    int sig_type = signature_type();

    eip712::Domain domain;
    domain.name = "Polymarket CTF Exchange";
    domain.version = "1";
    domain.chain_id = static_cast<uint64_t>(chain_.chain_id);
    domain.verifying_contract = req.neg_risk ? chain_.neg_risk_exchange_address
                                             : chain_.ctf_exchange_address;

    auto struct_hash = eip712::hash_struct(eip712::type_hash(ORDER_TYPE), {
        abi::uint256(salt),
        abi::address(maker),
        abi::address(signer),
        abi::address(ZERO_ADDRESS),
        abi::uint256_from_decimal(req.token_id),
        abi::uint256(maker_amount),
        abi::uint256(taker_amount),
        abi::uint256(0),
        abi::uint256(0),
        abi::uint256(0),
        abi::uint256(static_cast<uint64_t>(side)),
        abi::uint256(static_cast<uint64_t>(sig_type))
    });
    auto sig = wallet_->sign_digest(eip712::digest(eip712::domain_separator(domain), struct_hash));

    return {
        {"salt", salt},
        {"maker", maker},
        {"signer", signer},
        {"taker", ZERO_ADDRESS},
        {"tokenId", req.token_id},
        {"makerAmount", std::to_string(maker_amount)},
        {"takerAmount", std::to_string(taker_amount)},
        {"expiration", "0"},
        {"nonce", "0"},
        {"feeRateBps", "0"},
        {"side", side_to_string(req.side)},
        {"signatureType", sig_type},
        {"signature", sig.to_hex65()}
    };
}

OrderAck PolymarketClobClient::submit_order(const OrderRequest& req) {
    OrderAck ack;
    if (is_read_only()) {
        ack.error = "Cannot place orders in read-only mode";
        return ack;
    }
    if (req.shares < 1.0 || req.price <= 0.0 || req.price >= 1.0) {
        ack.error = "Invalid order parameters";
        return ack;
    }

    auto creds = current_credentials();
    if (!creds) {
        ack.error = "API credentials unavailable";
        return ack;
    }

    // Salt fits a JSON double exactly
    auto salt_bytes = crypto::random_bytes(8);
    uint64_t salt = 0;
    for (auto b : salt_bytes) salt = (salt << 8) | b;
    salt &= (1ULL << 53) - 1;

    nlohmann::json payload = {
        {"order", build_signed_order(req, salt)},
        {"owner", creds->api_key},
        {"orderType", order_type_to_string(req.type)}
    };
    std::string body = payload.dump();

    spdlog::info("Placing {} order: token={} price={:.2f} shares={:.0f} ({})",
                 side_to_string(req.side), req.token_id, req.price, req.shares,
                 order_type_to_string(req.type));

    try {
        auto response = http_->post(clob_url_ + "/order", body, l2_headers("POST", "/order", body));
        ack = adapters::parse_order_ack(nlohmann::json::parse(response, nullptr, false), req.side);
    } catch (const HttpError& e) {
        auto j = nlohmann::json::parse(e.body(), nullptr, false);
        if (!j.is_discarded() && j.is_object()) {
            ack = adapters::parse_order_ack(j, req.side);
            if (ack.accepted) {
                // A non-2xx status never counts as an accepted order
                ack.accepted = false;
                ack.error = e.what();
            }
        } else {
            ack.error = e.what();
        }
    }

    if (ack.accepted) {
        spdlog::info("Order placed - ID: {} status: {}", ack.order_id, ack.status);
    } else if (ack.insufficient_funds) {
        spdlog::error("INSUFFICIENT FUNDS: {}", ack.error);
    } else {
        spdlog::error("Order rejected: {}", ack.error);
    }
    return ack;
}

CancelAck PolymarketClobClient::cancel_order(const std::string& order_id) {
    CancelAck ack;
    if (is_read_only()) {
        ack.error = "Cannot cancel orders in read-only mode";
        return ack;
    }
    if (!current_credentials()) {
        ack.error = "API credentials unavailable";
        return ack;
    }

    nlohmann::json payload = {{"orderID", order_id}};
    std::string body = payload.dump();

    try {
        auto response = http_->del(clob_url_ + "/order", body, l2_headers("DELETE", "/order", body));
        auto j = nlohmann::json::parse(response, nullptr, false);
        if (j.is_object() && j.contains("not_canceled") && j["not_canceled"].is_object() &&
            j["not_canceled"].contains(order_id)) {
            ack.error = j["not_canceled"][order_id].is_string()
                ? j["not_canceled"][order_id].get<std::string>()
                : "Order not cancelled";
        } else {
            ack.success = true;
            spdlog::info("Order {} cancelled", order_id);
        }
    } catch (const std::exception& e) {
        ack.error = e.what();
        spdlog::error("Failed to cancel order {}: {}", order_id, e.what());
    }
    return ack;
}

// ============================================================================
// Market data
// ============================================================================

OrderBook PolymarketClobClient::get_order_book(const std::string& token_id) {
    auto body = http_->get(clob_url_ + "/book?token_id=" + token_id);
    return adapters::parse_order_book(token_id, nlohmann::json::parse(body));
}

std::vector<Position> PolymarketClobClient::get_positions() {
    std::string user = maker_address();
    if (user.empty()) {
        return {};
    }
    auto body = http_->get(data_api_url_ + "/positions?user=" + user + "&sizeThreshold=0.01");
    return adapters::parse_positions(nlohmann::json::parse(body));
}

} // namespace updown
