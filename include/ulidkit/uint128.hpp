#pragma once

#include <cstdint>
#include <string>

namespace ulidkit {

// Unsigned 128-bit integer as two 64-bit words. Carries the 80-bit
// randomness component and the values fed to the generic Base32 codec.
struct Uint128 {
    uint64_t hi = 0;
    uint64_t lo = 0;

    constexpr Uint128() = default;
    constexpr Uint128(uint64_t low) : hi(0), lo(low) {}
    constexpr Uint128(uint64_t high, uint64_t low) : hi(high), lo(low) {}

    static constexpr Uint128 max() { return Uint128(~0ULL, ~0ULL); }

    // Value with the low `bits` bits set (bits >= 128 gives max()).
    static constexpr Uint128 mask(unsigned bits) {
        if (bits == 0) return Uint128();
        if (bits >= 128) return max();
        if (bits == 64) return Uint128(0, ~0ULL);
        if (bits < 64) return Uint128(0, (1ULL << bits) - 1);
        return Uint128((1ULL << (bits - 64)) - 1, ~0ULL);
    }

    constexpr Uint128 operator&(const Uint128& o) const { return Uint128(hi & o.hi, lo & o.lo); }
    constexpr Uint128 operator|(const Uint128& o) const { return Uint128(hi | o.hi, lo | o.lo); }

    constexpr Uint128 operator<<(unsigned n) const {
        if (n == 0) return *this;
        if (n >= 128) return Uint128();
        if (n >= 64) return Uint128(lo << (n - 64), 0);
        return Uint128((hi << n) | (lo >> (64 - n)), lo << n);
    }

    constexpr Uint128 operator>>(unsigned n) const {
        if (n == 0) return *this;
        if (n >= 128) return Uint128();
        if (n >= 64) return Uint128(0, hi >> (n - 64));
        return Uint128(hi >> n, (lo >> n) | (hi << (64 - n)));
    }

    // Wraps at 2^128; callers that must not wrap compare against a bound first.
    Uint128& operator++() {
        if (++lo == 0) ++hi;
        return *this;
    }

    // Decimal rendering, e.g. "1208925819614629174706175" for mask(80).
    std::string to_string() const;
};

constexpr bool operator==(const Uint128& a, const Uint128& b) { return a.hi == b.hi && a.lo == b.lo; }
constexpr bool operator!=(const Uint128& a, const Uint128& b) { return !(a == b); }
constexpr bool operator<(const Uint128& a, const Uint128& b) {
    return a.hi < b.hi || (a.hi == b.hi && a.lo < b.lo);
}
constexpr bool operator>(const Uint128& a, const Uint128& b) { return b < a; }
constexpr bool operator<=(const Uint128& a, const Uint128& b) { return !(b < a); }
constexpr bool operator>=(const Uint128& a, const Uint128& b) { return !(a < b); }

} // namespace ulidkit
