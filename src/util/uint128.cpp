#include <ulidkit/uint128.hpp>
#include <algorithm>

namespace ulidkit {

// Divide a big-endian array of 32-bit limbs (in-place) by 10, return the remainder.
static uint32_t div_by_10(uint32_t* limbs, size_t len) {
    uint64_t carry = 0;
    for (size_t i = 0; i < len; ++i) {
        uint64_t cur = (carry << 32) | limbs[i];
        limbs[i] = static_cast<uint32_t>(cur / 10);
        carry = cur % 10;
    }
    return static_cast<uint32_t>(carry);
}

std::string Uint128::to_string() const {
    if (hi == 0 && lo == 0) return "0";

    uint32_t limbs[4] = {
        static_cast<uint32_t>(hi >> 32), static_cast<uint32_t>(hi),
        static_cast<uint32_t>(lo >> 32), static_cast<uint32_t>(lo),
    };

    // 2^128 - 1 has 39 decimal digits
    std::string out;
    out.reserve(39);
    while (limbs[0] | limbs[1] | limbs[2] | limbs[3]) {
        out += static_cast<char>('0' + div_by_10(limbs, 4));
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace ulidkit
