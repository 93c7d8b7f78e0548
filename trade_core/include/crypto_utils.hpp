#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <vector>

using Bytes = std::vector<std::uint8_t>;
using Bytes32 = std::array<std::uint8_t, 32>;

// ---- hex ----
std::string to_hex(const std::uint8_t* data, size_t len, bool prefix = true);
std::string to_hex(const Bytes& b, bool prefix = true);
std::string to_hex(const Bytes32& b, bool prefix = true);

// Accepts optional 0x prefix; throws SignatureError on odd length or bad digit
Bytes from_hex(const std::string& hex);

// ---- base64 (OpenSSL EVP block coder) ----
std::string base64_encode(const std::uint8_t* data, size_t len);
std::string base64_encode(const std::string& s);

// Accepts standard and URL-safe alphabets, with or without padding.
// Returns false on malformed input.
bool base64_decode(const std::string& in, Bytes& out);

// '+' -> '-', '/' -> '_' (padding kept)
std::string base64_to_url_safe(std::string s);

// ---- digests ----
// Original Keccak-256 (0x01 padding), as used by Ethereum; not NIST SHA3-256
Bytes32 keccak256(const std::uint8_t* data, size_t len);
Bytes32 keccak256(const std::string& s);
Bytes32 keccak256(const Bytes& b);

Bytes hmac_sha256(const Bytes& key, const std::string& msg);

// ---- ethereum words ----
// Decimal or 0x-hex unsigned integer -> 32-byte big-endian word.
// Throws SignatureError when not a valid integer or wider than 256 bits.
Bytes32 uint256_word(const std::string& value);
Bytes32 uint256_word(std::uint64_t value);

// 20-byte address left-padded to a word
Bytes32 address_word(const std::string& address);

// Lowercase 0x address -> EIP-55 mixed case; throws SignatureError if malformed
std::string to_checksum_address(const std::string& address);
bool same_address(const std::string& a, const std::string& b);

// ---- randomness ----
// CSPRNG value below 2^53 so it survives JSON number handling on the venue side
std::uint64_t generate_salt();
