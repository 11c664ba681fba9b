#pragma once

#include <stdexcept>
#include <string>

namespace opm::domain {

enum class PriceErrorKind {
    EXPONENT_MISMATCH,
    EXPONENT_OVERFLOW,
    EXPONENT_UNDERFLOW,
    DIVISION_BY_ZERO,
    ARITHMETIC_OVERFLOW,
    NEGATIVE_RESULT
};

inline std::string to_string(PriceErrorKind kind) {
    switch (kind) {
        case PriceErrorKind::EXPONENT_MISMATCH: return "EXPONENT_MISMATCH";
        case PriceErrorKind::EXPONENT_OVERFLOW: return "EXPONENT_OVERFLOW";
        case PriceErrorKind::EXPONENT_UNDERFLOW: return "EXPONENT_UNDERFLOW";
        case PriceErrorKind::DIVISION_BY_ZERO: return "DIVISION_BY_ZERO";
        case PriceErrorKind::ARITHMETIC_OVERFLOW: return "ARITHMETIC_OVERFLOW";
        case PriceErrorKind::NEGATIVE_RESULT: return "NEGATIVE_RESULT";
    }
    throw std::invalid_argument("Unknown PriceErrorKind");
}

inline PriceErrorKind price_error_kind_from_string(const std::string& str) {
    if (str == "EXPONENT_MISMATCH") return PriceErrorKind::EXPONENT_MISMATCH;
    if (str == "EXPONENT_OVERFLOW") return PriceErrorKind::EXPONENT_OVERFLOW;
    if (str == "EXPONENT_UNDERFLOW") return PriceErrorKind::EXPONENT_UNDERFLOW;
    if (str == "DIVISION_BY_ZERO") return PriceErrorKind::DIVISION_BY_ZERO;
    if (str == "ARITHMETIC_OVERFLOW") return PriceErrorKind::ARITHMETIC_OVERFLOW;
    if (str == "NEGATIVE_RESULT") return PriceErrorKind::NEGATIVE_RESULT;
    throw std::invalid_argument("Invalid price error kind: " + str);
}

} // namespace opm::domain
