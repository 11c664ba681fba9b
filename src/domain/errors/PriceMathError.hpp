#pragma once

#include "domain/errors/PriceErrorKind.hpp"

#include <stdexcept>
#include <string>

namespace opm::domain {

class PriceMathError : public std::runtime_error {
public:
    PriceMathError(PriceErrorKind kind, const std::string& message);

    PriceErrorKind kind() const noexcept { return kind_; }

private:
    PriceErrorKind kind_;
};

} // namespace opm::domain
