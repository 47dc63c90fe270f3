#include <ulidkit/ulid.hpp>

namespace ulidkit {

Result<Ulid> Ulid::parse(const std::string& text) {
    auto raw = codec::decode(text);
    ULIDKIT_TRY(raw);
    return Result<Ulid>::ok(from_raw(raw.value()));
}

Result<Ulid> Ulid::from_uuid(const std::string& text) {
    auto raw = codec::from_uuid_string(text);
    ULIDKIT_TRY(raw);
    return Result<Ulid>::ok(from_raw(raw.value()));
}

Ulid Ulid::from_raw(const RawBytes& raw) {
    Ulid id;
    id.bytes = raw;
    return id;
}

Result<Ulid> Ulid::generate() {
    return generate(Generator::global());
}

Result<Ulid> Ulid::generate(Generator& gen) {
    auto raw = gen.next_raw();
    ULIDKIT_TRY(raw);
    return Result<Ulid>::ok(from_raw(raw.value()));
}

Result<Ulid> Ulid::random() {
    return with_timestamp(system_clock_ms());
}

Result<Ulid> Ulid::with_timestamp(uint64_t timestamp_ms) {
    auto raw = make_raw(timestamp_ms, random80());
    ULIDKIT_TRY(raw);
    return Result<Ulid>::ok(from_raw(raw.value()));
}

uint64_t Ulid::timestamp_ms() const {
    return ulidkit::timestamp_of(bytes);
}

Uint128 Ulid::randomness() const {
    return ulidkit::random_of(bytes);
}

std::chrono::system_clock::time_point Ulid::time_point() const {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds(timestamp_ms())));
}

std::string Ulid::to_string() const {
    return codec::encode(bytes);
}

std::string Ulid::to_uuid_string() const {
    return codec::to_uuid_string(bytes);
}

// std::array compares lexicographically, i.e. as a big-endian integer
bool Ulid::operator==(const Ulid& other) const { return bytes == other.bytes; }
bool Ulid::operator!=(const Ulid& other) const { return bytes != other.bytes; }
bool Ulid::operator<(const Ulid& other) const { return bytes < other.bytes; }
bool Ulid::operator<=(const Ulid& other) const { return bytes <= other.bytes; }
bool Ulid::operator>(const Ulid& other) const { return bytes > other.bytes; }
bool Ulid::operator>=(const Ulid& other) const { return bytes >= other.bytes; }

} // namespace ulidkit
