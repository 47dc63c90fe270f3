#pragma once

#include <string>

namespace ulidkit {

struct UlidError {
    enum Code {
        InvalidFormat,
        InvalidCharacter,
        RandomnessExhausted,
        TimestampOverflow,
        ClockRegression,
        IO,
        Parse,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;

    UlidError() = default;
    UlidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    UlidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace ulidkit
