#include "crypto_utils.hpp"
#include "trade_errors.hpp"

#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <cctype>
#include <cstring>
#include <memory>

// ------------------------ hex ------------------------

std::string to_hex(const std::uint8_t* data, size_t len, bool prefix) {
    static const char* digits = "0123456789abcdef";
    std::string out = prefix ? "0x" : "";
    out.reserve(out.size() + len * 2);
    for (size_t i = 0; i < len; i++) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

std::string to_hex(const Bytes& b, bool prefix) {
    return to_hex(b.data(), b.size(), prefix);
}

std::string to_hex(const Bytes32& b, bool prefix) {
    return to_hex(b.data(), b.size(), prefix);
}

static int hex_nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string strip_0x(const std::string& s) {
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) return s.substr(2);
    return s;
}

Bytes from_hex(const std::string& hex) {
    const std::string h = strip_0x(hex);
    if (h.size() % 2 != 0) throw SignatureError("odd-length hex string");

    Bytes out(h.size() / 2);
    for (size_t i = 0; i < out.size(); i++) {
        int hi = hex_nibble(h[2 * i]);
        int lo = hex_nibble(h[2 * i + 1]);
        if (hi < 0 || lo < 0) throw SignatureError("invalid hex digit");
        out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return out;
}

// ------------------------ base64 ------------------------

std::string base64_encode(const std::uint8_t* data, size_t len) {
    std::string out(4 * ((len + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(n < 0 ? 0 : static_cast<size_t>(n));
    return out;
}

std::string base64_encode(const std::string& s) {
    return base64_encode(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

bool base64_decode(const std::string& in, Bytes& out) {
    std::string s;
    s.reserve(in.size() + 3);
    for (char c : in) {
        if (c == '-') s.push_back('+');
        else if (c == '_') s.push_back('/');
        else if (c == '\n' || c == '\r' || c == ' ') continue;
        else s.push_back(c);
    }
    while (s.size() % 4 != 0) s.push_back('=');
    if (s.empty()) return false;

    size_t pad = 0;
    if (s[s.size() - 1] == '=') pad++;
    if (s[s.size() - 2] == '=') pad++;

    out.assign(s.size() / 4 * 3, 0);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                            static_cast<int>(s.size()));
    if (n < 0 || static_cast<size_t>(n) < pad) return false;
    out.resize(static_cast<size_t>(n) - pad);
    return true;
}

std::string base64_to_url_safe(std::string s) {
    for (auto& c : s) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return s;
}

// ------------------------ keccak-256 ------------------------

static const std::uint64_t kKeccakRoundConstants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL, 0x8000000080008000ULL,
    0x000000000000808bULL, 0x0000000080000001ULL, 0x8000000080008081ULL, 0x8000000000008009ULL,
    0x000000000000008aULL, 0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL, 0x8000000000008003ULL,
    0x8000000000008002ULL, 0x8000000000000080ULL, 0x000000000000800aULL, 0x800000008000000aULL,
    0x8000000080008081ULL, 0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

static const int kKeccakRotations[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14, 27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

static const int kKeccakPiLanes[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4, 15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

static inline std::uint64_t rotl64(std::uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

static void keccak_f1600(std::uint64_t st[25]) {
    std::uint64_t bc[5];
    for (int round = 0; round < 24; round++) {
        // theta
        for (int i = 0; i < 5; i++)
            bc[i] = st[i] ^ st[i + 5] ^ st[i + 10] ^ st[i + 15] ^ st[i + 20];
        for (int i = 0; i < 5; i++) {
            std::uint64_t t = bc[(i + 4) % 5] ^ rotl64(bc[(i + 1) % 5], 1);
            for (int j = 0; j < 25; j += 5) st[j + i] ^= t;
        }

        // rho + pi
        std::uint64_t t = st[1];
        for (int i = 0; i < 24; i++) {
            int j = kKeccakPiLanes[i];
            bc[0] = st[j];
            st[j] = rotl64(t, kKeccakRotations[i]);
            t = bc[0];
        }

        // chi
        for (int j = 0; j < 25; j += 5) {
            for (int i = 0; i < 5; i++) bc[i] = st[j + i];
            for (int i = 0; i < 5; i++) st[j + i] ^= (~bc[(i + 1) % 5]) & bc[(i + 2) % 5];
        }

        // iota
        st[0] ^= kKeccakRoundConstants[round];
    }
}

static void keccak_absorb_block(std::uint64_t st[25], const std::uint8_t* block, size_t rate) {
    for (size_t i = 0; i < rate; i++) {
        st[i / 8] ^= static_cast<std::uint64_t>(block[i]) << (8 * (i % 8));
    }
    keccak_f1600(st);
}

Bytes32 keccak256(const std::uint8_t* data, size_t len) {
    constexpr size_t rate = 136;
    std::uint64_t st[25];
    std::memset(st, 0, sizeof(st));

    while (len >= rate) {
        keccak_absorb_block(st, data, rate);
        data += rate;
        len -= rate;
    }

    std::uint8_t last[rate];
    std::memset(last, 0, sizeof(last));
    if (len > 0) std::memcpy(last, data, len);
    last[len] ^= 0x01;
    last[rate - 1] ^= 0x80;
    keccak_absorb_block(st, last, rate);

    Bytes32 out{};
    for (size_t i = 0; i < out.size(); i++) {
        out[i] = static_cast<std::uint8_t>(st[i / 8] >> (8 * (i % 8)));
    }
    return out;
}

Bytes32 keccak256(const std::string& s) {
    return keccak256(reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

Bytes32 keccak256(const Bytes& b) {
    return keccak256(b.data(), b.size());
}

// ------------------------ hmac ------------------------

Bytes hmac_sha256(const Bytes& key, const std::string& msg) {
    unsigned int outlen = 0;
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned char* rc = HMAC(EVP_sha256(),
                             key.data(), static_cast<int>(key.size()),
                             reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
                             out, &outlen);
    if (!rc) throw SignatureError("HMAC-SHA256 failed");
    return Bytes(out, out + outlen);
}

// ------------------------ words ------------------------

struct BnDeleter {
    void operator()(BIGNUM* bn) const { BN_free(bn); }
};
using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;

Bytes32 uint256_word(const std::string& value) {
    if (value.empty()) throw SignatureError("empty integer value");

    BIGNUM* raw = nullptr;
    const std::string hex = strip_0x(value);
    int consumed = 0;
    if (hex.size() != value.size()) {
        consumed = BN_hex2bn(&raw, hex.c_str());
        if (consumed != static_cast<int>(hex.size())) consumed = -1;
    } else {
        consumed = BN_dec2bn(&raw, value.c_str());
        if (consumed != static_cast<int>(value.size())) consumed = -1;
    }
    BnPtr bn(raw);
    if (!bn || consumed <= 0) throw SignatureError("not an unsigned integer: " + value);
    if (BN_is_negative(bn.get())) throw SignatureError("negative value for uint256: " + value);
    if (BN_num_bytes(bn.get()) > 32) throw SignatureError("value exceeds 256 bits: " + value);

    Bytes32 out{};
    BN_bn2binpad(bn.get(), out.data(), 32);
    return out;
}

Bytes32 uint256_word(std::uint64_t value) {
    Bytes32 out{};
    for (int i = 0; i < 8; i++) {
        out[31 - i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
    return out;
}

Bytes32 address_word(const std::string& address) {
    Bytes raw = from_hex(address);
    if (raw.size() != 20) throw SignatureError("address must be 20 bytes: " + address);
    Bytes32 out{};
    std::memcpy(out.data() + 12, raw.data(), 20);
    return out;
}

std::string to_checksum_address(const std::string& address) {
    Bytes raw = from_hex(address);
    if (raw.size() != 20) throw SignatureError("address must be 20 bytes: " + address);

    const std::string lower = to_hex(raw, false);
    const Bytes32 h = keccak256(lower);

    std::string out = "0x";
    for (size_t i = 0; i < lower.size(); i++) {
        char c = lower[i];
        int nibble = (i % 2 == 0) ? (h[i / 2] >> 4) : (h[i / 2] & 0x0f);
        if (c >= 'a' && c <= 'f' && nibble >= 8) c = static_cast<char>(std::toupper(c));
        out.push_back(c);
    }
    return out;
}

bool same_address(const std::string& a, const std::string& b) {
    std::string x = strip_0x(a), y = strip_0x(b);
    if (x.size() != y.size()) return false;
    for (size_t i = 0; i < x.size(); i++) {
        if (std::tolower(static_cast<unsigned char>(x[i])) != std::tolower(static_cast<unsigned char>(y[i])))
            return false;
    }
    return true;
}

// ------------------------ randomness ------------------------

std::uint64_t generate_salt() {
    std::uint8_t buf[8];
    if (RAND_bytes(buf, sizeof(buf)) != 1) throw SignatureError("CSPRNG unavailable for order salt");

    std::uint64_t v = 0;
    for (auto b : buf) v = (v << 8) | b;
    return v & ((1ULL << 53) - 1);
}
