#include <ulidkit/error.hpp>

namespace ulidkit {

const char* UlidError::code_name(Code c) {
    switch (c) {
        case InvalidFormat:       return "InvalidFormat";
        case InvalidCharacter:    return "InvalidCharacter";
        case RandomnessExhausted: return "RandomnessExhausted";
        case TimestampOverflow:   return "TimestampOverflow";
        case ClockRegression:     return "ClockRegression";
        case IO:                  return "IO";
        case Parse:               return "Parse";
        case InvalidArg:          return "InvalidArg";
    }
    return "Unknown";
}

std::string UlidError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    return result;
}

} // namespace ulidkit
