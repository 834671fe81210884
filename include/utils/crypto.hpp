#pragma once

#include <string>
#include <vector>
#include <array>
#include <cstdint>

namespace updown {

using Bytes = std::vector<uint8_t>;
using Hash32 = std::array<uint8_t, 32>;

namespace crypto {

/**
 * HMAC-SHA256 for CLOB L2 authentication. The secret is url-safe base64,
 * the signature is returned url-safe base64 as the exchange expects.
 */
std::string clob_hmac_signature(const std::string& b64_secret, const std::string& message);

Bytes hmac_sha256(const Bytes& key, const std::string& message);

Hash32 sha256(const Bytes& data);

/**
 * Ethereum Keccak-256 (original padding, not NIST SHA3-256).
 */
Hash32 keccak256(const uint8_t* data, size_t len);
Hash32 keccak256(const Bytes& data);
Hash32 keccak256(const std::string& data);

/**
 * Base64 encoding/decoding. Decoding accepts both standard and url-safe alphabets.
 */
std::string base64_encode(const Bytes& data, bool url_safe = false);
Bytes base64_decode(const std::string& encoded);

/**
 * Hex encoding, lowercase. Decoding accepts an optional 0x prefix.
 */
std::string hex_encode(const uint8_t* data, size_t len);
std::string hex_encode(const Bytes& data);
std::string hex_encode(const Hash32& data);
std::string to_hex_prefixed(const Bytes& data);
std::string to_hex_prefixed(const Hash32& data);
Bytes hex_decode(const std::string& hex);

Bytes random_bytes(size_t count);

} // namespace crypto
} // namespace updown
