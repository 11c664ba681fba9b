#pragma once

#include "domain/errors/PriceErrorKind.hpp"
#include "domain/value_objects/Price.hpp"

#include <optional>
#include <string>

namespace opm::domain {

// Exactly one of price / error is set.
struct PriceResult {
    std::string id;
    std::optional<Price> price;
    std::optional<PriceErrorKind> error;
    std::string message;

    bool ok() const noexcept { return price.has_value(); }
};

} // namespace opm::domain
