#pragma once

#include <string>
#include <memory>
#include <cstdint>
#include "utils/crypto.hpp"

namespace updown {

struct Signature {
    Bytes r;        // 32 bytes
    Bytes s;        // 32 bytes, low-s normalized
    int recovery_id{0};

    // r || s || (27 + recovery_id), as used for EIP-712 signatures
    std::string to_hex65() const;
};

/**
 * Pre-EIP-1559 transaction, signed with EIP-155 replay protection.
 */
struct LegacyTransaction {
    uint64_t nonce{0};
    uint64_t gas_price_wei{0};
    uint64_t gas_limit{0};
    std::string to;
    uint64_t value_wei{0};
    Bytes data;
    uint64_t chain_id{137};
};

/**
 * secp256k1 key pair backed by OpenSSL EC.
 */
class EvmWallet {
public:
    // Throws std::invalid_argument for a malformed or out-of-range key
    explicit EvmWallet(const std::string& private_key_hex);
    ~EvmWallet();

    EvmWallet(const EvmWallet&) = delete;
    EvmWallet& operator=(const EvmWallet&) = delete;

    // EIP-55 checksummed
    const std::string& address() const { return address_; }

    Signature sign_digest(const Hash32& digest) const;

    // Raw RLP bytes ready for eth_sendRawTransaction
    Bytes sign_transaction(const LegacyTransaction& tx) const;

    static std::string to_checksum_address(const std::string& hex_address);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string address_;
};

} // namespace updown
