#pragma once

// String-level entry points. Everything here is a thin pipeline over
// codec.hpp, generator.hpp and ulid.hpp.

#include <ulidkit/codec.hpp>
#include <ulidkit/generator.hpp>
#include <ulidkit/result.hpp>
#include <ulidkit/uint128.hpp>
#include <ulidkit/ulid.hpp>
#include <cstdint>
#include <string>

namespace ulidkit {

// Monotonic id from Generator::global().
Result<std::string> generate();

// Current time plus fresh randomness, without the generator lock. Ids
// minted in the same millisecond are unique in practice but unordered.
Result<std::string> generate_random();

// Random payload with the given timestamp; no generator state involved.
Result<std::string> generate_with_timestamp(uint64_t timestamp_ms);

bool is_valid(const std::string& text);
Result<std::string> normalize(const std::string& text);

Result<uint64_t> extract_timestamp(const std::string& text);
Result<Uint128> extract_randomness(const std::string& text);

Result<std::string> to_uuid(const std::string& text);
Result<std::string> from_uuid(const std::string& uuid);

std::string encode_base32(const Uint128& value);
Result<Uint128> decode_base32(const std::string& text);

} // namespace ulidkit
