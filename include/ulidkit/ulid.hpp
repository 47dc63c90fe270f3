#pragma once

#include <ulidkit/codec.hpp>
#include <ulidkit/generator.hpp>
#include <ulidkit/result.hpp>
#include <ulidkit/uint128.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace ulidkit {

// Parsed view of one identifier. Ordering follows the raw bytes, which
// matches the ordering of the text form.
struct Ulid {
    RawBytes bytes{};

    static Result<Ulid> parse(const std::string& text);
    static Result<Ulid> from_uuid(const std::string& text);
    static Ulid from_raw(const RawBytes& raw);

    // Next id from the process-wide generator, or from `gen`.
    static Result<Ulid> generate();
    static Result<Ulid> generate(Generator& gen);

    // Wall-clock timestamp and fresh randomness, no generator involved.
    static Result<Ulid> random();

    // Fresh randomness with a caller-chosen timestamp. Does not touch any
    // generator state, so ids made this way carry no ordering guarantee
    // within a millisecond.
    static Result<Ulid> with_timestamp(uint64_t timestamp_ms);

    uint64_t timestamp_ms() const;
    Uint128 randomness() const;
    std::chrono::system_clock::time_point time_point() const;

    std::string to_string() const;
    std::string to_uuid_string() const;

    bool operator==(const Ulid& other) const;
    bool operator!=(const Ulid& other) const;
    bool operator<(const Ulid& other) const;
    bool operator<=(const Ulid& other) const;
    bool operator>(const Ulid& other) const;
    bool operator>=(const Ulid& other) const;
};

} // namespace ulidkit

namespace std {

template<>
struct hash<ulidkit::Ulid> {
    size_t operator()(const ulidkit::Ulid& id) const noexcept {
        auto v = ulidkit::codec::to_uint128(id.bytes);
        size_t h = hash<uint64_t>{}(v.hi);
        h ^= hash<uint64_t>{}(v.lo) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace std
