#include "domain/errors/PriceMathError.hpp"

namespace opm::domain {

PriceMathError::PriceMathError(PriceErrorKind kind, const std::string& message)
    : std::runtime_error(to_string(kind) + ": " + message)
    , kind_(kind) {}

} // namespace opm::domain
