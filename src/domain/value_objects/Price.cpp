#include "domain/value_objects/Price.hpp"

namespace opm::domain {

Price::Price(uint64_t mantissa, uint64_t confidence, uint64_t exponent, uint64_t publish_time)
    : mantissa_(mantissa)
    , confidence_(confidence)
    , exponent_(exponent)
    , publish_time_(publish_time) {}

Price Price::zero(uint64_t exponent, uint64_t publish_time) {
    return Price(0, 0, exponent, publish_time);
}

} // namespace opm::domain
