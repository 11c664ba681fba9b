#include "domain/math/PriceMath.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <string>

namespace opm::domain {

namespace {

using uint128 = unsigned __int128;

constexpr uint64_t kMaxU64 = std::numeric_limits<uint64_t>::max();

// 10^19 is the largest power of ten below 2^64.
constexpr std::array<uint64_t, 20> kPow10 = {
    1ULL, 10ULL, 100ULL, 1000ULL, 10000ULL, 100000ULL, 1000000ULL,
    10000000ULL, 100000000ULL, 1000000000ULL, 10000000000ULL,
    100000000000ULL, 1000000000000ULL, 10000000000000ULL,
    100000000000000ULL, 1000000000000000ULL, 10000000000000000ULL,
    100000000000000000ULL, 1000000000000000000ULL, 10000000000000000000ULL
};

static_assert(kPow10[PD_EXPO] == PD_SCALE);

uint64_t narrow(uint128 value, const char* what) {
    if (value > static_cast<uint128>(kMaxU64)) {
        throw PriceMathError(PriceErrorKind::ARITHMETIC_OVERFLOW,
                             std::string(what) + " does not fit in 64 bits");
    }
    return static_cast<uint64_t>(value);
}

uint64_t checked_add(uint64_t lhs, uint64_t rhs, const char* what) {
    return narrow(static_cast<uint128>(lhs) + rhs, what);
}

uint128 checked_add_wide(uint128 lhs, uint128 rhs, const char* what) {
    uint128 sum = lhs + rhs;
    if (sum < lhs) {
        throw PriceMathError(PriceErrorKind::ARITHMETIC_OVERFLOW,
                             std::string(what) + " overflows 128-bit intermediate");
    }
    return sum;
}

void require_same_exponent(const Price& a, const Price& b) {
    if (a.exponent() != b.exponent()) {
        throw PriceMathError(PriceErrorKind::EXPONENT_MISMATCH,
                             "exponents differ: " + std::to_string(a.exponent()) +
                             " vs " + std::to_string(b.exponent()));
    }
}

uint64_t latest(const Price& a, const Price& b) {
    return std::max(a.publish_time(), b.publish_time());
}

} // anonymous namespace

uint64_t scale_price(uint64_t mantissa, uint64_t from_expo, uint64_t to_expo) {
    if (from_expo == to_expo) {
        return mantissa;
    }

    if (from_expo < to_expo) {
        // Truncates; larger shifts than 10^19 leave nothing of a 64-bit value
        uint64_t diff = to_expo - from_expo;
        if (diff >= kPow10.size()) return 0;
        return mantissa / kPow10[diff];
    }

    uint64_t diff = from_expo - to_expo;
    if (mantissa == 0) return 0;
    if (diff >= kPow10.size() || mantissa > kMaxU64 / kPow10[diff]) {
        throw PriceMathError(PriceErrorKind::ARITHMETIC_OVERFLOW,
                             "scaling " + std::to_string(mantissa) + " from exponent " +
                             std::to_string(from_expo) + " to " + std::to_string(to_expo));
    }
    return mantissa * kPow10[diff];
}

Price scale_price(const Price& price, uint64_t to_expo) {
    return Price(scale_price(price.mantissa(), price.exponent(), to_expo),
                 scale_price(price.confidence(), price.exponent(), to_expo),
                 to_expo,
                 price.publish_time());
}

Price add_prices(const Price& a, const Price& b) {
    require_same_exponent(a, b);
    return Price(checked_add(a.mantissa(), b.mantissa(), "mantissa sum"),
                 checked_add(a.confidence(), b.confidence(), "confidence sum"),
                 a.exponent(),
                 latest(a, b));
}

Price sub_prices(const Price& a, const Price& b) {
    require_same_exponent(a, b);
    if (b.mantissa() > a.mantissa()) {
        throw PriceMathError(PriceErrorKind::NEGATIVE_RESULT,
                             std::to_string(a.mantissa()) + " - " +
                             std::to_string(b.mantissa()) + " is negative");
    }
    // Uncertainty compounds regardless of the sign of the operation
    return Price(a.mantissa() - b.mantissa(),
                 checked_add(a.confidence(), b.confidence(), "confidence sum"),
                 a.exponent(),
                 latest(a, b));
}

Price mul_prices(const Price& a, const Price& b) {
    if (a.exponent() > MAX_EXPO || b.exponent() > MAX_EXPO - a.exponent()) {
        throw PriceMathError(PriceErrorKind::EXPONENT_OVERFLOW,
                             "combined exponent of " + std::to_string(a.exponent()) +
                             " and " + std::to_string(b.exponent()) +
                             " exceeds " + std::to_string(MAX_EXPO));
    }

    uint128 mantissa = static_cast<uint128>(a.mantissa()) * b.mantissa();

    // First-order propagation; the conf_a * conf_b term is dropped
    uint128 confidence = checked_add_wide(
        static_cast<uint128>(a.confidence()) * b.mantissa(),
        static_cast<uint128>(b.confidence()) * a.mantissa(),
        "product confidence");

    return Price(narrow(mantissa / PD_SCALE, "product mantissa"),
                 narrow(confidence / PD_SCALE, "product confidence"),
                 a.exponent() + b.exponent(),
                 latest(a, b));
}

Price div_prices(const Price& a, const Price& b) {
    if (b.mantissa() == 0) {
        throw PriceMathError(PriceErrorKind::DIVISION_BY_ZERO, "divisor mantissa is zero");
    }
    if (b.exponent() > a.exponent()) {
        throw PriceMathError(PriceErrorKind::EXPONENT_UNDERFLOW,
                             "divisor exponent " + std::to_string(b.exponent()) +
                             " exceeds dividend exponent " + std::to_string(a.exponent()));
    }

    uint128 mantissa = static_cast<uint128>(a.mantissa()) * PD_SCALE;
    uint128 confidence = checked_add_wide(
        static_cast<uint128>(a.confidence()) * PD_SCALE,
        static_cast<uint128>(b.confidence()) * a.mantissa(),
        "quotient confidence");

    return Price(narrow(mantissa / b.mantissa(), "quotient mantissa"),
                 narrow(confidence / b.mantissa(), "quotient confidence"),
                 a.exponent() - b.exponent(),
                 latest(a, b));
}

Price combine_prices(const Price& a, const Price& b) {
    return div_prices(a, b);
}

} // namespace opm::domain
