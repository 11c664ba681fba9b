#pragma once

#include "domain/errors/PriceMathError.hpp"
#include "domain/value_objects/Price.hpp"

#include <cstdint>

namespace opm::domain {

// Fixed-point normalization used by mul/div: products and quotients of two
// mantissas are divided (or multiplied) by PD_SCALE = 10^PD_EXPO.
inline constexpr uint64_t PD_EXPO = 9;
inline constexpr uint64_t PD_SCALE = 1'000'000'000;
inline constexpr uint64_t SCALE = PD_SCALE;
inline constexpr uint64_t MAX_MANTISSA_BITS = 28;
inline constexpr uint64_t MAX_EXPO = 18;

constexpr bool fits_mantissa_bits(uint64_t value) noexcept {
    return value < (uint64_t{1} << MAX_MANTISSA_BITS);
}

// Rescale a bare mantissa between exponents. Moving to a larger exponent
// divides and truncates; moving to a smaller one multiplies and throws
// ARITHMETIC_OVERFLOW if the result does not fit.
uint64_t scale_price(uint64_t mantissa, uint64_t from_expo, uint64_t to_expo);

// Rescale mantissa and confidence together; publish_time is kept.
Price scale_price(const Price& price, uint64_t to_expo);

// All binary operations stamp the result with the later publish_time and
// throw PriceMathError instead of returning a wrapped or clamped value.
Price add_prices(const Price& a, const Price& b);
Price sub_prices(const Price& a, const Price& b);
Price mul_prices(const Price& a, const Price& b);
Price div_prices(const Price& a, const Price& b);

// Cross-currency conversion: X/Q divided by Y/Q gives X/Y.
Price combine_prices(const Price& a, const Price& b);

} // namespace opm::domain
