#include <ulidkit/codec.hpp>

namespace ulidkit::codec {

const char kAlphabet[33] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// ---- Symbol lookup: character code -> 5-bit value, -1 on miss ----

static constexpr std::array<int8_t, 256> make_decode_table() {
    std::array<int8_t, 256> table{};
    for (auto& v : table) v = -1;
    for (int i = 0; i < 32; ++i) {
        char c = "0123456789ABCDEFGHJKMNPQRSTVWXYZ"[i];
        table[static_cast<unsigned char>(c)] = static_cast<int8_t>(i);
        if (c >= 'A' && c <= 'Z') {
            table[static_cast<unsigned char>(c - 'A' + 'a')] = static_cast<int8_t>(i);
        }
    }
    return table;
}

static constexpr std::array<int8_t, 256> kDecodeTable = make_decode_table();

static int symbol_value(char c) {
    return kDecodeTable[static_cast<unsigned char>(c)];
}

// ---- Hex helpers ----

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static UlidError invalid_symbol(const std::string& text, size_t pos) {
    return UlidError{UlidError::InvalidCharacter,
        std::string("invalid Base32 character '") + text[pos] +
            "' at position " + std::to_string(pos),
        "ULIDs use Crockford Base32: 0-9 and A-Z without I, L, O, U"};
}

// ---- Raw <-> integer ----

Uint128 to_uint128(const RawBytes& raw) {
    Uint128 v;
    for (int i = 0; i < 8; ++i) {
        v.hi = (v.hi << 8) | raw[i];
        v.lo = (v.lo << 8) | raw[i + 8];
    }
    return v;
}

RawBytes from_uint128(const Uint128& value) {
    RawBytes raw;
    for (int i = 0; i < 8; ++i) {
        raw[7 - i] = static_cast<uint8_t>(value.hi >> (8 * i));
        raw[15 - i] = static_cast<uint8_t>(value.lo >> (8 * i));
    }
    return raw;
}

// ---- Base32 ----
// 128 bits are written as 26 five-bit groups, most significant first.
// The first group only carries 3 bits of the value.

std::string encode_u128(const Uint128& value) {
    char buf[kEncodedLength];
    Uint128 v = value;
    for (int i = static_cast<int>(kEncodedLength) - 1; i >= 0; --i) {
        buf[i] = kAlphabet[v.lo & 0x1F];
        v = v >> 5;
    }
    return std::string(buf, kEncodedLength);
}

Result<Uint128> decode_u128(const std::string& text) {
    if (text.empty() || text.size() > kEncodedLength) {
        return UlidError{UlidError::InvalidFormat,
            "Base32 value must be 1 to 26 characters",
            "Got " + std::to_string(text.size()) + " characters"};
    }

    Uint128 v;
    for (size_t i = 0; i < text.size(); ++i) {
        int sym = symbol_value(text[i]);
        if (sym < 0) return invalid_symbol(text, i);
        v = (v << 5) | Uint128(static_cast<uint64_t>(sym));
    }

    // Only a full-width value can spill past 128 bits, via its leading symbol
    if (text.size() == kEncodedLength && symbol_value(text[0]) > 7) {
        return UlidError{UlidError::InvalidFormat,
            "Base32 value exceeds 128 bits",
            std::string("Leading character must be 0-7, got '") + text[0] + "'"};
    }
    return Result<Uint128>::ok(v);
}

std::string encode(const RawBytes& raw) {
    return encode_u128(to_uint128(raw));
}

Result<RawBytes> decode(const std::string& text) {
    if (text.size() != kEncodedLength) {
        return UlidError{UlidError::InvalidFormat,
            "ULID must be exactly 26 characters",
            "Got " + std::to_string(text.size()) + " characters"};
    }
    auto value = decode_u128(text);
    ULIDKIT_TRY(value);
    return Result<RawBytes>::ok(from_uint128(value.value()));
}

bool is_valid(const std::string& text) {
    return decode(text).is_ok();
}

Result<std::string> normalize(const std::string& text) {
    auto raw = decode(text);
    ULIDKIT_TRY(raw);
    return Result<std::string>::ok(encode(raw.value()));
}

// ---- UUID text form ----

std::string to_uuid_string(const RawBytes& raw) {
    std::string out;
    out.reserve(kUuidLength);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[raw[i] >> 4];
        out += hex_chars[raw[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

Result<RawBytes> from_uuid_string(const std::string& text) {
    if (text.size() == kUuidLength) {
        if (text[8] != '-' || text[13] != '-' || text[18] != '-' || text[23] != '-') {
            return UlidError{UlidError::InvalidFormat,
                "UUID string has invalid dash positions",
                "Expected dashes at positions 8, 13, 18, 23"};
        }
    } else if (text.size() != kCompactUuidLength) {
        return UlidError{UlidError::InvalidFormat,
            "UUID string must be 36 characters (or 32 without dashes)",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"};
    }

    RawBytes raw{};
    size_t byte_idx = 0;
    for (size_t i = 0; i < text.size(); ) {
        if (text.size() == kUuidLength && (i == 8 || i == 13 || i == 18 || i == 23)) {
            ++i;
            continue;
        }
        if (text[i] == '-' || text[i + 1] == '-') {
            size_t bad = text[i] == '-' ? i : i + 1;
            return UlidError{UlidError::InvalidFormat,
                "UUID string has a dash at position " + std::to_string(bad),
                text.size() == kUuidLength
                    ? "Expected dashes only at positions 8, 13, 18, 23"
                    : "The 32-character form has no dashes"};
        }
        int hi = hex_val(text[i]);
        int lo = hex_val(text[i + 1]);
        if (hi < 0 || lo < 0) {
            size_t bad = hi < 0 ? i : i + 1;
            return UlidError{UlidError::InvalidCharacter,
                "UUID string contains invalid hex character",
                std::string("Invalid char '") + text[bad] + "' at position " + std::to_string(bad)};
        }
        raw[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<RawBytes>::ok(raw);
}

} // namespace ulidkit::codec
