#pragma once

#include "domain/requests/PriceOperation.hpp"
#include "domain/value_objects/Price.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace opm::domain {

struct PriceRequest {
    std::string id;
    PriceOperation operation;
    Price a;
    std::optional<Price> b;               // binary operations
    std::optional<uint64_t> to_exponent;  // scale
};

} // namespace opm::domain
