#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include "utils/crypto.hpp"

namespace updown {
namespace abi {

// 32-byte big-endian words
Bytes uint256(uint64_t value);
Bytes uint256_from_decimal(const std::string& decimal);   // token ids exceed 64 bits
Bytes uint256_from_hex(const std::string& hex);
Bytes address(const std::string& hex);
Bytes bytes32(const std::string& hex);

// keccak256(signature)[0..4]
Bytes selector(const std::string& signature);

/**
 * Builds calldata for a function call. Static arguments go in the head,
 * dynamic uint256[] arrays are appended to the tail with head offsets.
 */
class CallBuilder {
public:
    explicit CallBuilder(const std::string& signature);

    CallBuilder& add_address(const std::string& hex);
    CallBuilder& add_uint(uint64_t value);
    CallBuilder& add_uint(const Bytes& word);
    CallBuilder& add_bytes32(const std::string& hex);
    CallBuilder& add_bool(bool value);
    CallBuilder& add_uint_array(const std::vector<Bytes>& words);

    Bytes build() const;
    std::string build_hex() const;

private:
    struct Arg {
        Bytes word;                  // static value
        std::vector<Bytes> array;    // dynamic uint256[]
        bool dynamic{false};
    };

    Bytes selector_;
    std::vector<Arg> args_;
};

// eth_call result helpers
bool is_zero_word(const std::string& hex_result);
double word_to_double(const std::string& hex_result);
Bytes word_at(const std::string& hex_result, size_t index);
uint64_t parse_hex_u64(const std::string& hex);
std::string to_hex_quantity(uint64_t value);

} // namespace abi

namespace rlp {

Bytes encode_bytes(const Bytes& data);
Bytes encode_uint(uint64_t value);
Bytes encode_list(const std::vector<Bytes>& encoded_items);

// Strip leading zero bytes (RLP integers are minimal big-endian)
Bytes trim_leading_zeros(const Bytes& data);

} // namespace rlp

namespace eip712 {

struct Domain {
    std::string name;
    std::string version;
    uint64_t chain_id{137};
    std::string verifying_contract;   // omitted from the type when empty
};

Hash32 domain_separator(const Domain& domain);
Hash32 type_hash(const std::string& type_string);

// keccak256(0x1901 || domainSeparator || structHash)
Hash32 digest(const Hash32& domain_separator, const Hash32& struct_hash);

// keccak256(typeHash || encoded words)
Hash32 hash_struct(const Hash32& type_hash, const std::vector<Bytes>& words);

Bytes string_word(const std::string& value);   // keccak256 of the UTF-8 string

} // namespace eip712
} // namespace updown
