#include <ulidkit/ulidkit.hpp>

namespace ulidkit {

Result<std::string> generate() {
    return Ulid::generate().map([](const Ulid& id) { return id.to_string(); });
}

Result<std::string> generate_random() {
    return Ulid::random().map([](const Ulid& id) { return id.to_string(); });
}

Result<std::string> generate_with_timestamp(uint64_t timestamp_ms) {
    return Ulid::with_timestamp(timestamp_ms).map([](const Ulid& id) { return id.to_string(); });
}

bool is_valid(const std::string& text) {
    return codec::is_valid(text);
}

Result<std::string> normalize(const std::string& text) {
    return codec::normalize(text);
}

Result<uint64_t> extract_timestamp(const std::string& text) {
    return timestamp_of(text);
}

Result<Uint128> extract_randomness(const std::string& text) {
    return random_of(text);
}

Result<std::string> to_uuid(const std::string& text) {
    auto raw = codec::decode(text);
    ULIDKIT_TRY(raw);
    return Result<std::string>::ok(codec::to_uuid_string(raw.value()));
}

Result<std::string> from_uuid(const std::string& uuid) {
    auto raw = codec::from_uuid_string(uuid);
    ULIDKIT_TRY(raw);
    return Result<std::string>::ok(codec::encode(raw.value()));
}

std::string encode_base32(const Uint128& value) {
    return codec::encode_u128(value);
}

Result<Uint128> decode_base32(const std::string& text) {
    return codec::decode_u128(text);
}

} // namespace ulidkit
