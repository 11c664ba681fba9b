#pragma once

#include <compare>
#include <cstdint>

namespace opm::domain {

// Fixed-point oracle price: value ~= mantissa * 10^exponent, with confidence
// as the absolute uncertainty at the same exponent.
class Price {
public:
    Price(uint64_t mantissa, uint64_t confidence, uint64_t exponent, uint64_t publish_time);

    static Price zero(uint64_t exponent, uint64_t publish_time = 0);

    uint64_t mantissa() const noexcept { return mantissa_; }
    uint64_t confidence() const noexcept { return confidence_; }
    uint64_t exponent() const noexcept { return exponent_; }
    uint64_t publish_time() const noexcept { return publish_time_; }

    bool operator==(const Price&) const = default;

private:
    uint64_t mantissa_;
    uint64_t confidence_;
    uint64_t exponent_;
    uint64_t publish_time_;
};

} // namespace opm::domain
