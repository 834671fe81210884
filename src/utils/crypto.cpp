#include "utils/crypto.hpp"
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <openssl/rand.h>
#include <openssl/evp.h>
#include <stdexcept>

namespace updown {
namespace crypto {

namespace {
    const char* kHexDigits = "0123456789abcdef";

    int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    int b64_value(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+' || c == '-') return 62;
        if (c == '/' || c == '_') return 63;
        return -1;
    }
}

std::string clob_hmac_signature(const std::string& b64_secret, const std::string& message) {
    return base64_encode(hmac_sha256(base64_decode(b64_secret), message), true);
}

Bytes hmac_sha256(const Bytes& key, const std::string& message) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (!HMAC(EVP_sha256(),
              key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(message.data()), message.size(),
              hash, &hash_len)) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    return Bytes(hash, hash + hash_len);
}

Hash32 sha256(const Bytes& data) {
    Hash32 out{};
    SHA256(data.data(), data.size(), out.data());
    return out;
}

Hash32 keccak256(const Bytes& data) {
    return keccak256(data.data(), data.size());
}

Hash32 keccak256(const std::string& data) {
    return keccak256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

std::string base64_encode(const Bytes& data, bool url_safe) {
    const char* chars = url_safe
        ? "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_"
        : "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string result;
    result.reserve((data.size() + 2) / 3 * 4);
    uint32_t val = 0;
    int bits = -6;

    for (uint8_t c : data) {
        val = (val << 8) + c;
        bits += 8;
        while (bits >= 0) {
            result.push_back(chars[(val >> bits) & 0x3F]);
            bits -= 6;
        }
    }

    if (bits > -6) {
        result.push_back(chars[((val << 8) >> (bits + 8)) & 0x3F]);
    }

    while (result.size() % 4) {
        result.push_back('=');
    }

    return result;
}

Bytes base64_decode(const std::string& encoded) {
    Bytes result;
    uint32_t val = 0;
    int bits = -8;

    for (char c : encoded) {
        if (c == '=') break;
        int v = b64_value(c);
        if (v < 0) continue;

        val = (val << 6) + static_cast<uint32_t>(v);
        bits += 6;

        if (bits >= 0) {
            result.push_back(static_cast<uint8_t>((val >> bits) & 0xFF));
            bits -= 8;
        }
    }

    return result;
}

std::string hex_encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(kHexDigits[data[i] >> 4]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

std::string hex_encode(const Bytes& data) {
    return hex_encode(data.data(), data.size());
}

std::string hex_encode(const Hash32& data) {
    return hex_encode(data.data(), data.size());
}

std::string to_hex_prefixed(const Bytes& data) {
    return "0x" + hex_encode(data);
}

std::string to_hex_prefixed(const Hash32& data) {
    return "0x" + hex_encode(data);
}

Bytes hex_decode(const std::string& hex) {
    size_t start = (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) ? 2 : 0;
    std::string digits = hex.substr(start);
    if (digits.size() % 2 != 0) {
        digits.insert(digits.begin(), '0');
    }

    Bytes result;
    result.reserve(digits.size() / 2);
    for (size_t i = 0; i < digits.size(); i += 2) {
        int hi = hex_value(digits[i]);
        int lo = hex_value(digits[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::invalid_argument("Invalid hex string: " + hex);
        }
        result.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return result;
}

Bytes random_bytes(size_t count) {
    Bytes bytes(count);
    if (RAND_bytes(bytes.data(), static_cast<int>(count)) != 1) {
        throw std::runtime_error("Failed to generate random bytes");
    }
    return bytes;
}

} // namespace crypto
} // namespace updown
