#include <ulidkit/generator.hpp>
#include <ulidkit/log.hpp>
#include <chrono>
#include <memory>
#include <random>

namespace ulidkit {

static constexpr Uint128 kRandomMask = Uint128::mask(kRandomBits);

const char* clock_policy_name(ClockPolicy policy) {
    switch (policy) {
        case ClockPolicy::Hold: return "hold";
        case ClockPolicy::Fail: return "fail";
    }
    return "unknown";
}

Result<ClockPolicy> parse_clock_policy(const std::string& name) {
    if (name == "hold") return Result<ClockPolicy>::ok(ClockPolicy::Hold);
    if (name == "fail") return Result<ClockPolicy>::ok(ClockPolicy::Fail);
    return UlidError{UlidError::InvalidArg,
        "unknown clock-regression policy: '" + name + "'",
        "expected \"hold\" or \"fail\""};
}

const char* transition_name(Transition t) {
    switch (t) {
        case Transition::Advance: return "advance";
        case Transition::Collide: return "collide";
        case Transition::Regress: return "regress";
    }
    return "unknown";
}

Transition classify(bool primed, uint64_t last_ms, uint64_t now_ms) {
    if (!primed || now_ms > last_ms) return Transition::Advance;
    if (now_ms == last_ms) return Transition::Collide;
    return Transition::Regress;
}

// ---- Capabilities ----

uint64_t system_clock_ms() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

static uint64_t device_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

static Uint128 draw80(std::mt19937_64& engine) {
    uint64_t hi = engine();
    uint64_t lo = engine();
    return Uint128(hi, lo) & kRandomMask;
}

RandomSource make_random_source(std::optional<uint64_t> seed) {
    auto engine = std::make_shared<std::mt19937_64>(seed ? *seed : device_seed());
    return [engine]() { return draw80(*engine); };
}

Uint128 random80() {
    static thread_local std::mt19937_64 engine(device_seed());
    return draw80(engine);
}

// ---- Field access ----

Result<RawBytes> make_raw(uint64_t timestamp_ms, const Uint128& random) {
    if (timestamp_ms > kMaxTimestamp) {
        return UlidError{UlidError::TimestampOverflow,
            "timestamp " + std::to_string(timestamp_ms) + " ms exceeds 48 bits",
            "the largest encodable timestamp is " + std::to_string(kMaxTimestamp)};
    }
    Uint128 value = (Uint128(timestamp_ms) << kRandomBits) | (random & kRandomMask);
    return Result<RawBytes>::ok(codec::from_uint128(value));
}

uint64_t timestamp_of(const RawBytes& raw) {
    uint64_t ts = 0;
    for (int i = 0; i < 6; ++i) {
        ts = (ts << 8) | raw[i];
    }
    return ts;
}

Uint128 random_of(const RawBytes& raw) {
    return codec::to_uint128(raw) & kRandomMask;
}

Result<uint64_t> timestamp_of(const std::string& text) {
    auto raw = codec::decode(text);
    ULIDKIT_TRY(raw);
    return Result<uint64_t>::ok(timestamp_of(raw.value()));
}

Result<Uint128> random_of(const std::string& text) {
    auto raw = codec::decode(text);
    ULIDKIT_TRY(raw);
    return Result<Uint128>::ok(random_of(raw.value()));
}

// ---- Generator ----

Generator::Generator() : Generator(GeneratorOptions{}) {}

Generator::Generator(const GeneratorOptions& options)
    : Generator(make_random_source(options.seed), system_clock_ms, options.clock_policy) {}

Generator::Generator(RandomSource random, Clock clock, ClockPolicy policy)
    : random_(std::move(random)), clock_(std::move(clock)), policy_(policy) {}

Generator& Generator::global() {
    static Generator instance;
    return instance;
}

Result<RawBytes> Generator::next_raw() {
    Step step;
    auto result = [&] {
        std::lock_guard<std::mutex> lock(mutex_);
        return advance(clock_(), step);
    }();
    report(step, result);
    return result;
}

Result<RawBytes> Generator::next_raw(uint64_t now_ms) {
    Step step;
    auto result = [&] {
        std::lock_guard<std::mutex> lock(mutex_);
        return advance(now_ms, step);
    }();
    report(step, result);
    return result;
}

// Runs after the lock is released.
void Generator::report(const Step& step, const Result<RawBytes>& result) {
    if (step.transition == Transition::Regress && result.is_ok()) {
        log::debug("clock moved backwards by %llu ms, holding timestamp %llu",
                   static_cast<unsigned long long>(step.behind_ms),
                   static_cast<unsigned long long>(step.timestamp_ms));
    }
    if (result.is_err() && result.error().code == UlidError::RandomnessExhausted) {
        log::warn("randomness exhausted at timestamp %llu",
                  static_cast<unsigned long long>(step.timestamp_ms));
    }
}

Result<RawBytes> Generator::advance(uint64_t now_ms, Step& step) {
    if (now_ms > kMaxTimestamp) {
        return UlidError{UlidError::TimestampOverflow,
            "clock reading " + std::to_string(now_ms) + " ms exceeds 48 bits",
            "the largest encodable timestamp is " + std::to_string(kMaxTimestamp)};
    }

    step.transition = classify(state_.primed, state_.last_timestamp_ms, now_ms);
    switch (step.transition) {
        case Transition::Advance:
            state_.last_timestamp_ms = now_ms;
            state_.last_random = random_() & kRandomMask;
            state_.primed = true;
            break;

        case Transition::Regress:
            step.behind_ms = state_.last_timestamp_ms - now_ms;
            if (policy_ == ClockPolicy::Fail) {
                return UlidError{UlidError::ClockRegression,
                    "clock moved backwards by " + std::to_string(step.behind_ms) + " ms",
                    "set [generator] clock-regression = \"hold\" to keep generating"};
            }
            [[fallthrough]];

        case Transition::Collide:
            step.timestamp_ms = state_.last_timestamp_ms;
            if (state_.last_random == kRandomMask) {
                return UlidError{UlidError::RandomnessExhausted,
                    "80-bit random component exhausted within millisecond " +
                        std::to_string(state_.last_timestamp_ms),
                    "wait for the next millisecond before generating again"};
            }
            ++state_.last_random;
            break;
    }

    step.timestamp_ms = state_.last_timestamp_ms;
    return make_raw(state_.last_timestamp_ms, state_.last_random);
}

} // namespace ulidkit
