#pragma once

#include <ulidkit/codec.hpp>
#include <ulidkit/result.hpp>
#include <ulidkit/uint128.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace ulidkit {

// Supplies the random payload for a new millisecond. Only the low 80
// bits are used.
using RandomSource = std::function<Uint128()>;

// Milliseconds since the Unix epoch.
using Clock = std::function<uint64_t()>;

// What to do when the clock reports a time before the last emitted one.
enum class ClockPolicy {
    Hold,   // keep the last timestamp and increment the randomness
    Fail    // report ClockRegression
};

const char* clock_policy_name(ClockPolicy policy);
Result<ClockPolicy> parse_clock_policy(const std::string& name);

// Outcome of comparing a new clock reading with the generator state.
enum class Transition {
    Advance,    // fresh generator, or time moved forward
    Collide,    // same millisecond as the last id
    Regress     // clock moved backwards
};

const char* transition_name(Transition t);

Transition classify(bool primed, uint64_t last_ms, uint64_t now_ms);

struct GeneratorOptions {
    ClockPolicy clock_policy = ClockPolicy::Hold;
    // Fixed seed for the random source; unset seeds from std::random_device
    std::optional<uint64_t> seed;
};

uint64_t system_clock_ms();

// mt19937_64-backed source. Not thread-safe on its own; a Generator only
// calls it under its lock.
RandomSource make_random_source(std::optional<uint64_t> seed = std::nullopt);

// 80 random bits from a thread_local engine.
Uint128 random80();

// Assemble raw bytes, rejecting timestamps above 48 bits. Randomness is
// truncated to 80 bits.
Result<RawBytes> make_raw(uint64_t timestamp_ms, const Uint128& random);

uint64_t timestamp_of(const RawBytes& raw);
Uint128 random_of(const RawBytes& raw);
Result<uint64_t> timestamp_of(const std::string& text);
Result<Uint128> random_of(const std::string& text);

// Monotonic ULID generator. Every call runs its compare-and-update under
// one mutex, so a shared instance never emits duplicates or goes
// backwards. Separate instances are independent: no ordering holds
// between ids from different generators.
class Generator {
public:
    Generator();
    explicit Generator(const GeneratorOptions& options);
    Generator(RandomSource random, Clock clock, ClockPolicy policy = ClockPolicy::Hold);

    Generator(const Generator&) = delete;
    Generator& operator=(const Generator&) = delete;

    // Reads the clock inside the critical section so callers are
    // serialized in clock order.
    Result<RawBytes> next_raw();
    Result<RawBytes> next_raw(uint64_t now_ms);

    ClockPolicy clock_policy() const { return policy_; }

    // Process-wide default instance.
    static Generator& global();

private:
    struct State {
        bool primed = false;
        uint64_t last_timestamp_ms = 0;
        Uint128 last_random;
    };

    // What one call did, for logging once the lock is released.
    struct Step {
        Transition transition = Transition::Advance;
        uint64_t timestamp_ms = 0;
        uint64_t behind_ms = 0;
    };

    // Requires mutex_ held. Does no I/O.
    Result<RawBytes> advance(uint64_t now_ms, Step& step);
    static void report(const Step& step, const Result<RawBytes>& result);

    RandomSource random_;
    Clock clock_;
    ClockPolicy policy_;
    std::mutex mutex_;
    State state_;
};

} // namespace ulidkit
