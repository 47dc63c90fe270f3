#pragma once

#include <ulidkit/result.hpp>
#include <ulidkit/uint128.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace ulidkit {

// 16-byte binary ULID: bytes 0-5 big-endian timestamp, bytes 6-15
// big-endian randomness.
using RawBytes = std::array<uint8_t, 16>;

constexpr size_t kRawLength = 16;
constexpr size_t kEncodedLength = 26;
constexpr size_t kUuidLength = 36;
constexpr size_t kCompactUuidLength = 32;

constexpr unsigned kTimestampBits = 48;
constexpr unsigned kRandomBits = 80;
constexpr uint64_t kMaxTimestamp = (1ULL << kTimestampBits) - 1;

namespace codec {

// Crockford Base32, no I, L, O or U.
extern const char kAlphabet[33];

// Raw bytes <-> 128-bit integer, big-endian.
Uint128 to_uint128(const RawBytes& raw);
RawBytes from_uint128(const Uint128& value);

// 26 uppercase symbols. Always succeeds.
std::string encode(const RawBytes& raw);

// Exactly 26 symbols, case-insensitive. The first symbol must be 0-7
// since 26 symbols carry 130 bits and the top two are always zero.
Result<RawBytes> decode(const std::string& text);

// True iff decode() would succeed.
bool is_valid(const std::string& text);

// Canonical uppercase spelling of a valid ULID.
Result<std::string> normalize(const std::string& text);

// xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase hex.
std::string to_uuid_string(const RawBytes& raw);

// Accepts the hyphenated 36-char form and the bare 32-hex-digit form.
Result<RawBytes> from_uuid_string(const std::string& text);

// Generic integer entry points. encode_u128 always yields 26 symbols;
// decode_u128 accepts 1 to 26 symbols.
std::string encode_u128(const Uint128& value);
Result<Uint128> decode_u128(const std::string& text);

} // namespace codec
} // namespace ulidkit
