// EC_KEY is deprecated in OpenSSL 3 but is still the direct route to raw secp256k1 math
#define OPENSSL_SUPPRESS_DEPRECATED

#include "chain/evm_wallet.hpp"
#include "chain/abi.hpp"
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/bn.h>
#include <openssl/obj_mac.h>
#include <stdexcept>
#include <cctype>

namespace updown {

namespace {
    struct BnDeleter { void operator()(BIGNUM* p) const { BN_free(p); } };
    struct BnCtxDeleter { void operator()(BN_CTX* p) const { BN_CTX_free(p); } };
    struct PointDeleter { void operator()(EC_POINT* p) const { EC_POINT_free(p); } };
    struct SigDeleter { void operator()(ECDSA_SIG* p) const { ECDSA_SIG_free(p); } };

    using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
    using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
    using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
    using SigPtr = std::unique_ptr<ECDSA_SIG, SigDeleter>;

    Bytes bn_to_32(const BIGNUM* bn) {
        Bytes out(32, 0);
        if (BN_bn2binpad(bn, out.data(), 32) != 32) {
            throw std::runtime_error("BIGNUM does not fit 32 bytes");
        }
        return out;
    }

    Bytes point_to_64(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
        uint8_t buf[65];
        if (EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED, buf, sizeof(buf), ctx) != 65) {
            throw std::runtime_error("Failed to serialize EC point");
        }
        return Bytes(buf + 1, buf + 65);
    }
}

std::string Signature::to_hex65() const {
    Bytes raw = r;
    raw.insert(raw.end(), s.begin(), s.end());
    raw.push_back(static_cast<uint8_t>(27 + recovery_id));
    return crypto::to_hex_prefixed(raw);
}

struct EvmWallet::Impl {
    EC_KEY* key{nullptr};
    BnPtr order{BN_new()};
    Bytes public_key;   // X || Y

    ~Impl() {
        if (key) EC_KEY_free(key);
    }

    const EC_GROUP* group() const { return EC_KEY_get0_group(key); }

    // Public key recovered from (digest, r, s) for the given parity, empty if invalid
    Bytes recover(const Hash32& digest, const BIGNUM* r, const BIGNUM* s, int recid) const {
        BnCtxPtr ctx(BN_CTX_new());
        PointPtr R(EC_POINT_new(group()));
        if (!EC_POINT_set_compressed_coordinates(group(), R.get(), r, recid & 1, ctx.get())) {
            return {};
        }

        BnPtr e(BN_bin2bn(digest.data(), static_cast<int>(digest.size()), nullptr));
        BnPtr rinv(BN_mod_inverse(nullptr, r, order.get(), ctx.get()));
        if (!rinv) return {};

        // Q = r^-1 (sR - eG)
        BnPtr u1(BN_new());
        BnPtr u2(BN_new());
        BnPtr neg_e(BN_new());
        BN_mod_sub(neg_e.get(), order.get(), e.get(), order.get(), ctx.get());
        BN_mod_mul(u1.get(), neg_e.get(), rinv.get(), order.get(), ctx.get());
        BN_mod_mul(u2.get(), s, rinv.get(), order.get(), ctx.get());

        PointPtr Q(EC_POINT_new(group()));
        if (!EC_POINT_mul(group(), Q.get(), u1.get(), R.get(), u2.get(), ctx.get())) {
            return {};
        }
        return point_to_64(group(), Q.get(), ctx.get());
    }
};

EvmWallet::EvmWallet(const std::string& private_key_hex)
    : impl_(std::make_unique<Impl>())
{
    Bytes raw = crypto::hex_decode(private_key_hex);
    if (raw.size() != 32) {
        throw std::invalid_argument("Private key must be 32 bytes");
    }

    impl_->key = EC_KEY_new_by_curve_name(NID_secp256k1);
    if (!impl_->key) {
        throw std::runtime_error("secp256k1 is not available in this OpenSSL build");
    }

    BnCtxPtr ctx(BN_CTX_new());
    EC_GROUP_get_order(impl_->group(), impl_->order.get(), ctx.get());

    BnPtr priv(BN_bin2bn(raw.data(), static_cast<int>(raw.size()), nullptr));
    if (BN_is_zero(priv.get()) || BN_cmp(priv.get(), impl_->order.get()) >= 0) {
        throw std::invalid_argument("Private key out of range");
    }
    if (!EC_KEY_set_private_key(impl_->key, priv.get())) {
        throw std::runtime_error("Failed to set private key");
    }

    PointPtr pub(EC_POINT_new(impl_->group()));
    if (!EC_POINT_mul(impl_->group(), pub.get(), priv.get(), nullptr, nullptr, ctx.get()) ||
        !EC_KEY_set_public_key(impl_->key, pub.get())) {
        throw std::runtime_error("Failed to derive public key");
    }

    impl_->public_key = point_to_64(impl_->group(), pub.get(), ctx.get());
    auto h = crypto::keccak256(impl_->public_key);
    address_ = to_checksum_address("0x" + crypto::hex_encode(h.data() + 12, 20));
}

EvmWallet::~EvmWallet() = default;

Signature EvmWallet::sign_digest(const Hash32& digest) const {
    SigPtr sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), impl_->key));
    if (!sig) {
        throw std::runtime_error("ECDSA signing failed");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    // Low-s form required by Ethereum
    BnCtxPtr ctx(BN_CTX_new());
    BnPtr half(BN_dup(impl_->order.get()));
    BN_rshift1(half.get(), half.get());
    BnPtr s_norm(BN_dup(s));
    if (BN_cmp(s_norm.get(), half.get()) > 0) {
        BN_sub(s_norm.get(), impl_->order.get(), s_norm.get());
    }

    for (int recid = 0; recid < 2; ++recid) {
        if (impl_->recover(digest, r, s_norm.get(), recid) == impl_->public_key) {
            Signature out;
            out.r = bn_to_32(r);
            out.s = bn_to_32(s_norm.get());
            out.recovery_id = recid;
            return out;
        }
    }
    throw std::runtime_error("Could not determine signature recovery id");
}

Bytes EvmWallet::sign_transaction(const LegacyTransaction& tx) const {
    Bytes to = crypto::hex_decode(tx.to);

    std::vector<Bytes> fields{
        rlp::encode_uint(tx.nonce),
        rlp::encode_uint(tx.gas_price_wei),
        rlp::encode_uint(tx.gas_limit),
        rlp::encode_bytes(to),
        rlp::encode_uint(tx.value_wei),
        rlp::encode_bytes(tx.data)
    };

    std::vector<Bytes> unsigned_fields = fields;
    unsigned_fields.push_back(rlp::encode_uint(tx.chain_id));
    unsigned_fields.push_back(rlp::encode_uint(0));
    unsigned_fields.push_back(rlp::encode_uint(0));

    auto sig = sign_digest(crypto::keccak256(rlp::encode_list(unsigned_fields)));

    fields.push_back(rlp::encode_uint(static_cast<uint64_t>(sig.recovery_id) + tx.chain_id * 2 + 35));
    fields.push_back(rlp::encode_bytes(rlp::trim_leading_zeros(sig.r)));
    fields.push_back(rlp::encode_bytes(rlp::trim_leading_zeros(sig.s)));
    return rlp::encode_list(fields);
}

std::string EvmWallet::to_checksum_address(const std::string& hex_address) {
    std::string lower = crypto::hex_encode(crypto::hex_decode(hex_address));
    if (lower.size() != 40) {
        throw std::invalid_argument("Address must be 20 bytes: " + hex_address);
    }
    std::string hash = crypto::hex_encode(crypto::keccak256(lower));

    std::string out = "0x";
    for (size_t i = 0; i < lower.size(); ++i) {
        char c = lower[i];
        if (std::isalpha(static_cast<unsigned char>(c)) && hash[i] >= '8') {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        out.push_back(c);
    }
    return out;
}

} // namespace updown
