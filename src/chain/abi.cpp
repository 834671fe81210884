#include "chain/abi.hpp"
#include <stdexcept>
#include <cctype>
#include <sstream>

namespace updown {
namespace abi {

namespace {
    Bytes left_pad(const Bytes& data) {
        if (data.size() > 32) {
            throw std::invalid_argument("ABI word exceeds 32 bytes");
        }
        Bytes word(32 - data.size(), 0);
        word.insert(word.end(), data.begin(), data.end());
        return word;
    }

    std::string strip_0x(const std::string& hex) {
        if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
            return hex.substr(2);
        }
        return hex;
    }
}

Bytes uint256(uint64_t value) {
    Bytes word(32, 0);
    for (int i = 0; i < 8; ++i) {
        word[31 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    return word;
}

Bytes uint256_from_decimal(const std::string& decimal) {
    if (decimal.empty()) {
        throw std::invalid_argument("Empty decimal for uint256");
    }
    Bytes word(32, 0);
    for (char c : decimal) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw std::invalid_argument("Invalid decimal for uint256: " + decimal);
        }
        // word = word * 10 + digit
        unsigned carry = static_cast<unsigned>(c - '0');
        for (int i = 31; i >= 0; --i) {
            unsigned v = word[i] * 10u + carry;
            word[i] = static_cast<uint8_t>(v & 0xFF);
            carry = v >> 8;
        }
        if (carry != 0) {
            throw std::overflow_error("Decimal exceeds uint256: " + decimal);
        }
    }
    return word;
}

Bytes uint256_from_hex(const std::string& hex) {
    return left_pad(rlp::trim_leading_zeros(crypto::hex_decode(hex)));
}

Bytes address(const std::string& hex) {
    auto raw = crypto::hex_decode(hex);
    if (raw.size() != 20) {
        throw std::invalid_argument("Address must be 20 bytes: " + hex);
    }
    return left_pad(raw);
}

Bytes bytes32(const std::string& hex) {
    auto raw = crypto::hex_decode(hex);
    if (raw.size() != 32) {
        throw std::invalid_argument("bytes32 must be 32 bytes: " + hex);
    }
    return raw;
}

Bytes selector(const std::string& signature) {
    auto h = crypto::keccak256(signature);
    return Bytes(h.begin(), h.begin() + 4);
}

CallBuilder::CallBuilder(const std::string& signature)
    : selector_(selector(signature)) {}

CallBuilder& CallBuilder::add_address(const std::string& hex) {
    args_.push_back({address(hex), {}, false});
    return *this;
}

CallBuilder& CallBuilder::add_uint(uint64_t value) {
    args_.push_back({uint256(value), {}, false});
    return *this;
}

CallBuilder& CallBuilder::add_uint(const Bytes& word) {
    args_.push_back({left_pad(word), {}, false});
    return *this;
}

CallBuilder& CallBuilder::add_bytes32(const std::string& hex) {
    args_.push_back({bytes32(hex), {}, false});
    return *this;
}

CallBuilder& CallBuilder::add_bool(bool value) {
    args_.push_back({uint256(value ? 1 : 0), {}, false});
    return *this;
}

CallBuilder& CallBuilder::add_uint_array(const std::vector<Bytes>& words) {
    Arg arg;
    arg.dynamic = true;
    for (const auto& w : words) {
        arg.array.push_back(left_pad(w));
    }
    args_.push_back(std::move(arg));
    return *this;
}

Bytes CallBuilder::build() const {
    Bytes head;
    Bytes tail;
    const uint64_t head_size = 32 * args_.size();

    for (const auto& arg : args_) {
        if (!arg.dynamic) {
            head.insert(head.end(), arg.word.begin(), arg.word.end());
            continue;
        }
        auto offset = uint256(head_size + tail.size());
        head.insert(head.end(), offset.begin(), offset.end());

        auto len = uint256(arg.array.size());
        tail.insert(tail.end(), len.begin(), len.end());
        for (const auto& w : arg.array) {
            tail.insert(tail.end(), w.begin(), w.end());
        }
    }

    Bytes out = selector_;
    out.insert(out.end(), head.begin(), head.end());
    out.insert(out.end(), tail.begin(), tail.end());
    return out;
}

std::string CallBuilder::build_hex() const {
    return crypto::to_hex_prefixed(build());
}

Bytes word_at(const std::string& hex_result, size_t index) {
    auto raw = crypto::hex_decode(hex_result);
    if (raw.size() < 32 * (index + 1)) {
        throw std::runtime_error("eth_call result too short");
    }
    return Bytes(raw.begin() + 32 * index, raw.begin() + 32 * (index + 1));
}

bool is_zero_word(const std::string& hex_result) {
    for (char c : strip_0x(hex_result)) {
        if (c != '0') return false;
    }
    return true;
}

double word_to_double(const std::string& hex_result) {
    double value = 0.0;
    for (uint8_t b : crypto::hex_decode(hex_result)) {
        value = value * 256.0 + b;
    }
    return value;
}

uint64_t parse_hex_u64(const std::string& hex) {
    auto digits = strip_0x(hex);
    if (digits.empty()) return 0;
    if (digits.size() > 16) {
        throw std::overflow_error("Quantity exceeds 64 bits: " + hex);
    }
    return std::stoull(digits, nullptr, 16);
}

std::string to_hex_quantity(uint64_t value) {
    std::ostringstream ss;
    ss << "0x" << std::hex << value;
    return ss.str();
}

} // namespace abi

namespace rlp {

namespace {
    Bytes length_prefix(size_t len, uint8_t short_base, uint8_t long_base) {
        if (len <= 55) {
            return Bytes{static_cast<uint8_t>(short_base + len)};
        }
        Bytes len_bytes;
        for (size_t v = len; v > 0; v >>= 8) {
            len_bytes.insert(len_bytes.begin(), static_cast<uint8_t>(v & 0xFF));
        }
        Bytes out{static_cast<uint8_t>(long_base + len_bytes.size())};
        out.insert(out.end(), len_bytes.begin(), len_bytes.end());
        return out;
    }
}

Bytes trim_leading_zeros(const Bytes& data) {
    size_t i = 0;
    while (i < data.size() && data[i] == 0) ++i;
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(i), data.end());
}

Bytes encode_bytes(const Bytes& data) {
    if (data.size() == 1 && data[0] < 0x80) {
        return data;
    }
    Bytes out = length_prefix(data.size(), 0x80, 0xb7);
    out.insert(out.end(), data.begin(), data.end());
    return out;
}

Bytes encode_uint(uint64_t value) {
    Bytes be;
    for (uint64_t v = value; v > 0; v >>= 8) {
        be.insert(be.begin(), static_cast<uint8_t>(v & 0xFF));
    }
    return encode_bytes(be);
}

Bytes encode_list(const std::vector<Bytes>& encoded_items) {
    Bytes payload;
    for (const auto& item : encoded_items) {
        payload.insert(payload.end(), item.begin(), item.end());
    }
    Bytes out = length_prefix(payload.size(), 0xc0, 0xf7);
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

} // namespace rlp

namespace eip712 {

Hash32 type_hash(const std::string& type_string) {
    return crypto::keccak256(type_string);
}

Bytes string_word(const std::string& value) {
    auto h = crypto::keccak256(value);
    return Bytes(h.begin(), h.end());
}

Hash32 hash_struct(const Hash32& type_hash, const std::vector<Bytes>& words) {
    Bytes buf(type_hash.begin(), type_hash.end());
    for (const auto& w : words) {
        buf.insert(buf.end(), w.begin(), w.end());
    }
    return crypto::keccak256(buf);
}

Hash32 domain_separator(const Domain& domain) {
    std::vector<Bytes> words{
        string_word(domain.name),
        string_word(domain.version),
        abi::uint256(domain.chain_id)
    };

    if (domain.verifying_contract.empty()) {
        return hash_struct(type_hash("EIP712Domain(string name,string version,uint256 chainId)"), words);
    }

    words.push_back(abi::address(domain.verifying_contract));
    return hash_struct(
        type_hash("EIP712Domain(string name,string version,uint256 chainId,address verifyingContract)"),
        words);
}

Hash32 digest(const Hash32& domain_separator, const Hash32& struct_hash) {
    Bytes buf{0x19, 0x01};
    buf.insert(buf.end(), domain_separator.begin(), domain_separator.end());
    buf.insert(buf.end(), struct_hash.begin(), struct_hash.end());
    return crypto::keccak256(buf);
}

} // namespace eip712
} // namespace updown
