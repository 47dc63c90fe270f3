#include <catch2/catch.hpp>
#include <ulidkit/codec.hpp>
#include <ulidkit/generator.hpp>
#include <ulidkit/log.hpp>
#include "stderr_capture.hpp"
#include <algorithm>
#include <atomic>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace ulidkit;

// Random source that replays a fixed list, then repeats the last entry.
static RandomSource fixed_sequence(std::vector<Uint128> values) {
    auto index = std::make_shared<size_t>(0);
    return [values, index]() {
        size_t i = std::min(*index, values.size() - 1);
        ++*index;
        return values[i];
    };
}

static Clock fixed_clock(uint64_t ms) {
    return [ms]() { return ms; };
}

// ===== Transition tag =====

TEST_CASE("classify fresh state always advances", "[generator]") {
    REQUIRE(classify(false, 0, 0) == Transition::Advance);
    REQUIRE(classify(false, 500, 10) == Transition::Advance);
}

TEST_CASE("classify primed state", "[generator]") {
    REQUIRE(classify(true, 100, 101) == Transition::Advance);
    REQUIRE(classify(true, 100, 100) == Transition::Collide);
    REQUIRE(classify(true, 100, 99) == Transition::Regress);
}

TEST_CASE("transition and policy names", "[generator]") {
    REQUIRE(std::string(transition_name(Transition::Advance)) == "advance");
    REQUIRE(std::string(transition_name(Transition::Collide)) == "collide");
    REQUIRE(std::string(transition_name(Transition::Regress)) == "regress");
    REQUIRE(std::string(clock_policy_name(ClockPolicy::Hold)) == "hold");
    REQUIRE(std::string(clock_policy_name(ClockPolicy::Fail)) == "fail");
}

TEST_CASE("parse_clock_policy", "[generator]") {
    REQUIRE(parse_clock_policy("hold").value() == ClockPolicy::Hold);
    REQUIRE(parse_clock_policy("fail").value() == ClockPolicy::Fail);
    auto r = parse_clock_policy("rewind");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::InvalidArg);
}

// ===== Field extraction =====

TEST_CASE("make_raw places timestamp and randomness", "[generator]") {
    auto r = make_raw(1547942611000ULL, Uint128(0x1234ULL, 0x56789abcdef01234ULL));
    REQUIRE(r.is_ok());
    REQUIRE(timestamp_of(r.value()) == 1547942611000ULL);
    REQUIRE(random_of(r.value()) == Uint128(0x1234ULL, 0x56789abcdef01234ULL));
}

TEST_CASE("make_raw truncates randomness to 80 bits", "[generator]") {
    auto r = make_raw(7, Uint128::max());
    REQUIRE(r.is_ok());
    REQUIRE(timestamp_of(r.value()) == 7);
    REQUIRE(random_of(r.value()) == Uint128::mask(80));
}

TEST_CASE("make_raw rejects timestamps above 48 bits", "[generator]") {
    REQUIRE(make_raw(kMaxTimestamp, Uint128(0)).is_ok());

    auto r = make_raw(kMaxTimestamp + 1, Uint128(0));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::TimestampOverflow);

    auto huge = make_raw(1ULL << 50, Uint128(0));
    REQUIRE(huge.is_err());
    REQUIRE(huge.error().code == UlidError::TimestampOverflow);
}

TEST_CASE("timestamp_of and random_of on text", "[generator]") {
    auto ts = timestamp_of(std::string("01ARZ3NDEKTSV4RRFFQ69G5FAV"));
    REQUIRE(ts.is_ok());
    REQUIRE(ts.value() == 1469922850259ULL);

    auto rnd = random_of(std::string("01ARZ3NDEKTSV4RRFFQ69G5FAV"));
    REQUIRE(rnd.is_ok());
    REQUIRE(rnd.value().to_string() == "1012768647078601740696923");

    auto bad = timestamp_of(std::string("01ARZ3NDEKTSV4RRFFQ69G5FA"));
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == UlidError::InvalidFormat);
}

// ===== Monotonic state machine =====

TEST_CASE("first call draws fresh randomness", "[generator]") {
    Generator gen(fixed_sequence({Uint128(42)}), fixed_clock(1000));
    auto r = gen.next_raw(1000);
    REQUIRE(r.is_ok());
    REQUIRE(timestamp_of(r.value()) == 1000);
    REQUIRE(random_of(r.value()) == Uint128(42));
}

TEST_CASE("same millisecond increments randomness", "[generator]") {
    Generator gen(fixed_sequence({Uint128(42), Uint128(9000)}), fixed_clock(0));
    auto a = gen.next_raw(1000);
    auto b = gen.next_raw(1000);
    auto c = gen.next_raw(1000);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(c.is_ok());
    REQUIRE(random_of(b.value()) == Uint128(43));
    REQUIRE(random_of(c.value()) == Uint128(44));
    REQUIRE(timestamp_of(c.value()) == 1000);
    REQUIRE(codec::encode(a.value()) < codec::encode(b.value()));
    REQUIRE(codec::encode(b.value()) < codec::encode(c.value()));
}

TEST_CASE("increment carries across the 64-bit word", "[generator]") {
    Generator gen(fixed_sequence({Uint128(0, ~0ULL)}), fixed_clock(0));
    REQUIRE(gen.next_raw(5).is_ok());
    auto r = gen.next_raw(5);
    REQUIRE(r.is_ok());
    REQUIRE(random_of(r.value()) == Uint128(1, 0));
}

TEST_CASE("new millisecond draws fresh randomness", "[generator]") {
    Generator gen(fixed_sequence({Uint128(500), Uint128(3)}), fixed_clock(0));
    REQUIRE(gen.next_raw(1000).is_ok());
    auto r = gen.next_raw(1001);
    REQUIRE(r.is_ok());
    REQUIRE(timestamp_of(r.value()) == 1001);
    // Lower randomness is fine: the timestamp already orders it
    REQUIRE(random_of(r.value()) == Uint128(3));
}

TEST_CASE("random source output is masked to 80 bits", "[generator]") {
    Generator gen(fixed_sequence({Uint128::max()}), fixed_clock(0));
    auto r = gen.next_raw(1);
    REQUIRE(r.is_ok());
    REQUIRE(timestamp_of(r.value()) == 1);
    REQUIRE(random_of(r.value()) == Uint128::mask(80));
}

TEST_CASE("randomness exhaustion is reported, not wrapped", "[generator]") {
    Generator gen(fixed_sequence({Uint128::mask(80), Uint128(0)}), fixed_clock(0));
    auto first = gen.next_raw(2000);
    REQUIRE(first.is_ok());

    auto second = gen.next_raw(2000);
    REQUIRE(second.is_err());
    REQUIRE(second.error().code == UlidError::RandomnessExhausted);

    // State is unchanged, so the next millisecond recovers
    auto third = gen.next_raw(2001);
    REQUIRE(third.is_ok());
    REQUIRE(codec::encode(first.value()) < codec::encode(third.value()));
}

TEST_CASE("clock regression holds the timestamp by default", "[generator]") {
    Generator gen(fixed_sequence({Uint128(10)}), fixed_clock(0));
    auto a = gen.next_raw(5000);
    auto b = gen.next_raw(4000);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(timestamp_of(b.value()) == 5000);
    REQUIRE(random_of(b.value()) == Uint128(11));
    REQUIRE(codec::encode(a.value()) < codec::encode(b.value()));
}

TEST_CASE("clock regression fails under the fail policy", "[generator]") {
    Generator gen(fixed_sequence({Uint128(10)}), fixed_clock(0), ClockPolicy::Fail);
    REQUIRE(gen.clock_policy() == ClockPolicy::Fail);
    REQUIRE(gen.next_raw(5000).is_ok());

    auto r = gen.next_raw(4000);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::ClockRegression);

    // Failed call leaves the state alone
    auto same = gen.next_raw(5000);
    REQUIRE(same.is_ok());
    REQUIRE(random_of(same.value()) == Uint128(11));
}

TEST_CASE("next_raw rejects timestamps above 48 bits", "[generator]") {
    Generator gen(fixed_sequence({Uint128(1)}), fixed_clock(0));
    auto r = gen.next_raw(kMaxTimestamp + 1);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == UlidError::TimestampOverflow);

    REQUIRE(gen.next_raw(kMaxTimestamp).is_ok());
}

TEST_CASE("next_raw without argument reads the injected clock", "[generator]") {
    Generator gen(fixed_sequence({Uint128(1)}), fixed_clock(1547942611000ULL));
    auto a = gen.next_raw();
    auto b = gen.next_raw();
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(timestamp_of(a.value()) == 1547942611000ULL);
    REQUIRE(random_of(b.value()) == Uint128(2));
}

TEST_CASE("system clock generator tracks wall time", "[generator]") {
    Generator gen;
    auto before = system_clock_ms();
    auto r = gen.next_raw();
    auto after = system_clock_ms();
    REQUIRE(r.is_ok());
    REQUIRE(timestamp_of(r.value()) >= before);
    REQUIRE(timestamp_of(r.value()) <= after);
}

TEST_CASE("seeded generators are reproducible", "[generator]") {
    GeneratorOptions opts;
    opts.seed = 42;
    Generator a(opts);
    Generator b(opts);
    for (uint64_t ms = 100; ms < 110; ++ms) {
        auto ra = a.next_raw(ms);
        auto rb = b.next_raw(ms);
        REQUIRE(ra.is_ok());
        REQUIRE(rb.is_ok());
        REQUIRE(ra.value() == rb.value());
    }
}

TEST_CASE("random80 stays within 80 bits", "[generator]") {
    for (int i = 0; i < 100; ++i) {
        REQUIRE(random80() <= Uint128::mask(80));
    }
}

// ===== Ordering and concurrency =====

TEST_CASE("rapid generation is strictly increasing", "[generator]") {
    Generator gen;
    std::string prev;
    for (int i = 0; i < 10000; ++i) {
        auto r = gen.next_raw();
        REQUIRE(r.is_ok());
        auto text = codec::encode(r.value());
        if (!prev.empty()) REQUIRE(prev < text);
        prev = text;
    }
}

TEST_CASE("shared generator is safe across threads", "[generator]") {
    Generator gen;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 2000;

    std::vector<std::vector<std::string>> results(kThreads);
    std::atomic<bool> failed{false};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&, t] {
            results[t].reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                auto r = gen.next_raw();
                if (r.is_err()) {
                    failed = true;
                    return;
                }
                results[t].push_back(codec::encode(r.value()));
            }
        });
    }
    for (auto& w : workers) w.join();
    REQUIRE_FALSE(failed.load());

    std::set<std::string> all;
    for (const auto& ids : results) {
        // Each thread observes its own calls in serialization order
        REQUIRE(std::is_sorted(ids.begin(), ids.end()));
        REQUIRE(std::adjacent_find(ids.begin(), ids.end()) == ids.end());
        all.insert(ids.begin(), ids.end());
    }
    REQUIRE(all.size() == static_cast<size_t>(kThreads * kPerThread));
}

TEST_CASE("independent generators per thread", "[generator]") {
    constexpr int kThreads = 4;
    std::vector<int> ordered(kThreads, 0);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&ordered, t] {
            Generator local;
            std::string prev;
            bool ok = true;
            for (int i = 0; i < 1000; ++i) {
                auto r = local.next_raw();
                if (r.is_err()) { ok = false; break; }
                auto text = codec::encode(r.value());
                if (!prev.empty() && !(prev < text)) ok = false;
                prev = text;
            }
            ordered[t] = ok ? 1 : 0;
        });
    }
    for (auto& w : workers) w.join();
    for (int ok : ordered) REQUIRE(ok == 1);
}

// ===== Logging =====

TEST_CASE("clock regression is logged once at debug level", "[generator][log]") {
    log::set_level(log::Debug);
    log::set_color_enabled(false);

    Generator gen(fixed_sequence({Uint128(10)}), fixed_clock(0));
    Result<RawBytes> held = UlidError{UlidError::InvalidArg, "unset"};
    auto output = capture_stderr([&] {
        REQUIRE(gen.next_raw(5000).is_ok());
        held = gen.next_raw(4000);
    });
    log::set_level(log::Info);

    REQUIRE(held.is_ok());
    REQUIRE(timestamp_of(held.value()) == 5000);
    REQUIRE(output == "debug: clock moved backwards by 1000 ms, holding timestamp 5000\n");

    // The generator lock is free again once the call returns
    REQUIRE(gen.next_raw(5000).is_ok());
}

TEST_CASE("failed regression and plain collisions log nothing", "[generator][log]") {
    log::set_level(log::Debug);
    log::set_color_enabled(false);

    Generator strict(fixed_sequence({Uint128(10)}), fixed_clock(0), ClockPolicy::Fail);
    auto output = capture_stderr([&] {
        REQUIRE(strict.next_raw(5000).is_ok());
        REQUIRE(strict.next_raw(5000).is_ok());
        REQUIRE(strict.next_raw(4000).is_err());
    });
    log::set_level(log::Info);

    REQUIRE(output.empty());
}

TEST_CASE("randomness exhaustion is logged as a warning", "[generator][log]") {
    log::set_level(log::Warn);
    log::set_color_enabled(false);

    Generator gen(fixed_sequence({Uint128::mask(80)}), fixed_clock(0));
    auto output = capture_stderr([&] {
        REQUIRE(gen.next_raw(2000).is_ok());
        REQUIRE(gen.next_raw(2000).is_err());
    });
    log::set_level(log::Info);

    REQUIRE(output == "warn: randomness exhausted at timestamp 2000\n");
}
