#include <gtest/gtest.h>
#include "utils/crypto.hpp"
#include "chain/abi.hpp"
#include "chain/evm_wallet.hpp"

using namespace updown;

// ============================================================================
// Hashes and encodings
// ============================================================================

TEST(CryptoTest, Keccak256_EmptyInput) {
    EXPECT_EQ(crypto::hex_encode(crypto::keccak256(std::string())),
              "c5d2460186f7233c927e7db2dcc703c0e500b653ca82273b7bfad8045d85a470");
}

TEST(CryptoTest, Keccak256_Abc) {
    EXPECT_EQ(crypto::hex_encode(crypto::keccak256(std::string("abc"))),
              "4e03657aea45a94fc7d47ba826c8d667c0d1e6e33a64a036ec44f58fa12d6c45");
}

TEST(CryptoTest, Sha256_Abc) {
    Bytes data{'a', 'b', 'c'};
    EXPECT_EQ(crypto::hex_encode(crypto::sha256(data)),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, HmacSha256_Rfc4231Case2) {
    Bytes key{'J', 'e', 'f', 'e'};
    auto mac = crypto::hmac_sha256(key, "what do ya want for nothing?");
    EXPECT_EQ(crypto::hex_encode(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(CryptoTest, ClobSignature_IsUrlSafeBase64) {
    auto secret = crypto::base64_encode(Bytes(32, 0xfb), true);
    auto sig = crypto::clob_hmac_signature(secret, "1700000000POST/order{}");

    EXPECT_EQ(sig.find('+'), std::string::npos);
    EXPECT_EQ(sig.find('/'), std::string::npos);
    EXPECT_EQ(crypto::base64_decode(sig).size(), 32u);
}

TEST(CryptoTest, Base64_RoundTripsBothAlphabets) {
    EXPECT_EQ(crypto::base64_encode(Bytes{'h', 'e', 'l', 'l', 'o'}), "aGVsbG8=");

    Bytes raw{0xfb, 0xff, 0xfe};
    EXPECT_EQ(crypto::base64_encode(raw), "+//+");
    EXPECT_EQ(crypto::base64_encode(raw, true), "-__-");
    EXPECT_EQ(crypto::base64_decode("-__-"), raw);
}

TEST(CryptoTest, HexDecode_AcceptsPrefix) {
    EXPECT_EQ(crypto::hex_decode("0x0aff"), (Bytes{0x0a, 0xff}));
    EXPECT_EQ(crypto::hex_decode("0AFF"), (Bytes{0x0a, 0xff}));
}

// ============================================================================
// ABI / RLP
// ============================================================================

TEST(AbiTest, Selector_KnownFunctions) {
    EXPECT_EQ(crypto::hex_encode(updown::abi::selector("transfer(address,uint256)")), "a9059cbb");
    EXPECT_EQ(crypto::hex_encode(updown::abi::selector("balanceOf(address)")), "70a08231");
}

TEST(AbiTest, Uint256FromDecimal_HandlesValuesAbove64Bits) {
    // 2^64
    auto word = updown::abi::uint256_from_decimal("18446744073709551616");
    ASSERT_EQ(word.size(), 32u);
    EXPECT_EQ(word[23], 0x01);
    for (size_t i = 24; i < 32; i++) EXPECT_EQ(word[i], 0x00);
}

TEST(AbiTest, DynamicArray_EncodedInTail) {
    auto data = updown::abi::CallBuilder("redeemPositions(bytes32,uint256[])")
        .add_bytes32("0x" + std::string(64, '1'))
        .add_uint_array({updown::abi::uint256(5), updown::abi::uint256(7)})
        .build();

    // selector + 2 head words + length + 2 elements
    ASSERT_EQ(data.size(), 4u + 32 * 5);
    // offset of the array is 0x40
    EXPECT_EQ(data[4 + 32 + 31], 0x40);
    EXPECT_EQ(data[4 + 64 + 31], 2);
    EXPECT_EQ(data[4 + 96 + 31], 5);
    EXPECT_EQ(data[4 + 128 + 31], 7);
}

TEST(AbiTest, HexQuantity) {
    EXPECT_EQ(updown::abi::to_hex_quantity(0), "0x0");
    EXPECT_EQ(updown::abi::to_hex_quantity(255), "0xff");
    EXPECT_EQ(updown::abi::parse_hex_u64("0x1a"), 26u);
    EXPECT_TRUE(updown::abi::is_zero_word("0x" + std::string(64, '0')));
}

TEST(RlpTest, Encoding_YellowPaperExamples) {
    EXPECT_EQ(crypto::hex_encode(rlp::encode_uint(0)), "80");
    EXPECT_EQ(crypto::hex_encode(rlp::encode_uint(15)), "0f");
    EXPECT_EQ(crypto::hex_encode(rlp::encode_uint(1024)), "820400");
    EXPECT_EQ(crypto::hex_encode(rlp::encode_bytes(Bytes{'d', 'o', 'g'})), "83646f67");

    auto list = rlp::encode_list({rlp::encode_bytes(Bytes{'c', 'a', 't'}),
                                  rlp::encode_bytes(Bytes{'d', 'o', 'g'})});
    EXPECT_EQ(crypto::hex_encode(list), "c88363617483646f67");
}

// ============================================================================
// Wallet
// ============================================================================

TEST(EvmWalletTest, AddressFromPrivateKeyOne) {
    EvmWallet wallet("0x0000000000000000000000000000000000000000000000000000000000000001");
    EXPECT_EQ(wallet.address(), "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
}

TEST(EvmWalletTest, ChecksumAddress_Eip55Vector) {
    EXPECT_EQ(EvmWallet::to_checksum_address("0x5aaeb6053f3e94c9b9a09f33669435e7ef1beaed"),
              "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed");
}

TEST(EvmWalletTest, RejectsMalformedKey) {
    EXPECT_THROW(EvmWallet("0x1234"), std::invalid_argument);
    EXPECT_THROW(EvmWallet(std::string(64, '0')), std::invalid_argument);
}

TEST(EvmWalletTest, Signature_IsCanonical) {
    EvmWallet wallet("0x4646464646464646464646464646464646464646464646464646464646464646");
    auto sig = wallet.sign_digest(crypto::keccak256(std::string("order")));

    ASSERT_EQ(sig.r.size(), 32u);
    ASSERT_EQ(sig.s.size(), 32u);
    EXPECT_TRUE(sig.recovery_id == 0 || sig.recovery_id == 1);
    // low-s: top bit of s is clear
    EXPECT_LT(sig.s[0], 0x80);

    auto hex = sig.to_hex65();
    ASSERT_EQ(hex.size(), 132u);
    auto v = hex.substr(130);
    EXPECT_TRUE(v == "1b" || v == "1c");
}

TEST(EvmWalletTest, SignedTransaction_CarriesEip155V) {
    EvmWallet wallet("0x4646464646464646464646464646464646464646464646464646464646464646");

    LegacyTransaction tx;
    tx.nonce = 9;
    tx.gas_price_wei = 20000000000ULL;
    tx.gas_limit = 21000;
    tx.to = "0x3535353535353535353535353535353535353535";
    tx.value_wei = 1000000000000000000ULL;
    tx.chain_id = 137;

    auto raw = crypto::hex_encode(wallet.sign_transaction(tx));

    // list prefix, then nonce 9, gas price 20 gwei, gas 21000
    EXPECT_EQ(raw.substr(0, 2), "f8");
    EXPECT_NE(raw.find("098504a817c800825208943535353535353535353535353535353535353535"), std::string::npos);
    // v = 137 * 2 + 35 + {0,1} = 0x0135 / 0x0136, followed by r (a0 = 32 bytes)
    bool v_ok = raw.find("820135a0") != std::string::npos || raw.find("820136a0") != std::string::npos;
    EXPECT_TRUE(v_ok);
}
