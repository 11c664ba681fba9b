#pragma once

#include "domain/requests/PriceRequest.hpp"
#include "domain/requests/PriceResult.hpp"

#include <cstdint>

namespace opm::services {

class PriceCalculatorService {
public:
    // Runs one request through the math core. Math failures come back as an
    // error result; a request missing the operand its operation needs
    // throws std::invalid_argument.
    domain::PriceResult evaluate(const domain::PriceRequest& request);

    uint64_t request_count() const noexcept { return success_count_ + failure_count_; }
    uint64_t success_count() const noexcept { return success_count_; }
    uint64_t failure_count() const noexcept { return failure_count_; }

private:
    domain::Price apply(const domain::PriceRequest& request) const;

    uint64_t success_count_{0};
    uint64_t failure_count_{0};
};

} // namespace opm::services
