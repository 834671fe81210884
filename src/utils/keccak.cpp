#include "utils/crypto.hpp"
#include <cstring>

// Keccak-256 as used by Ethereum. OpenSSL before 3.2 only ships the NIST-padded SHA3 variants.

namespace updown {
namespace crypto {

namespace {
    constexpr size_t kRate = 136;  // 1088-bit rate for 256-bit output

    constexpr uint64_t kRoundConstants[24] = {
        0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808AULL, 0x8000000080008000ULL,
        0x000000000000808BULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
        0x000000000000008AULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000AULL,
        0x000000008000808BULL, 0x800000000000008BULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
        0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800AULL, 0x800000008000000AULL,
        0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
    };

    constexpr int kRotations[24] = {
        1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
    };

    constexpr int kPiLanes[24] = {
        10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
    };

    inline uint64_t rotl64(uint64_t x, int n) {
        return (x << n) | (x >> (64 - n));
    }

    void keccak_f1600(uint64_t st[25]) {
        uint64_t bc[5];
        for (int round = 0; round < 24; ++round) {
            // Theta
            for (int i = 0; i < 5; ++i) {
                bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
            }
            for (int i = 0; i < 5; ++i) {
                uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
                for (int j = 0; j < 25; j += 5) {
                    st[j + i] ^= t;
                }
            }

            // Rho and Pi
            uint64_t t = st[1];
            for (int i = 0; i < 24; ++i) {
                int j = kPiLanes[i];
                bc[0] = st[j];
                st[j] = rotl64(t, kRotations[i]);
                t = bc[0];
            }

            // Chi
            for (int j = 0; j < 25; j += 5) {
                for (int i = 0; i < 5; ++i) {
                    bc[i] = st[j + i];
                }
                for (int i = 0; i < 5; ++i) {
                    st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
                }
            }

            // Iota
            st[0] ^= kRoundConstants[round];
        }
    }

    void absorb_block(uint64_t st[25], const uint8_t* block) {
        for (size_t i = 0; i < kRate / 8; ++i) {
            uint64_t lane = 0;
            for (int b = 7; b >= 0; --b) {
                lane = (lane << 8) | block[i * 8 + static_cast<size_t>(b)];
            }
            st[i] ^= lane;
        }
        keccak_f1600(st);
    }
}

Hash32 keccak256(const uint8_t* data, size_t len) {
    uint64_t st[25] = {0};

    size_t offset = 0;
    while (len - offset >= kRate) {
        absorb_block(st, data + offset);
        offset += kRate;
    }

    uint8_t last[kRate] = {0};
    size_t remaining = len - offset;
    if (remaining > 0) {
        std::memcpy(last, data + offset, remaining);
    }
    last[remaining] ^= 0x01;
    last[kRate - 1] ^= 0x80;
    absorb_block(st, last);

    Hash32 out{};
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<uint8_t>(st[i / 8] >> (8 * (i % 8)));
    }
    return out;
}

} // namespace crypto
} // namespace updown
