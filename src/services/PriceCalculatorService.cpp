#include "services/PriceCalculatorService.hpp"

#include "domain/errors/PriceMathError.hpp"
#include "domain/math/PriceMath.hpp"

#include <stdexcept>

using namespace opm::domain;

namespace opm::services {

PriceResult PriceCalculatorService::evaluate(const PriceRequest& request) {
    try {
        auto price = apply(request);
        ++success_count_;
        return PriceResult{request.id, price, std::nullopt, ""};
    } catch (const PriceMathError& e) {
        ++failure_count_;
        return PriceResult{request.id, std::nullopt, e.kind(), e.what()};
    }
}

Price PriceCalculatorService::apply(const PriceRequest& request) const {
    if (request.operation == PriceOperation::SCALE) {
        if (!request.to_exponent) {
            throw std::invalid_argument("scale request without to_exponent");
        }
        return scale_price(request.a, *request.to_exponent);
    }

    if (!request.b) {
        throw std::invalid_argument("binary request without second operand");
    }
    const Price& a = request.a;
    const Price& b = *request.b;

    switch (request.operation) {
        case PriceOperation::ADD: return add_prices(a, b);
        case PriceOperation::SUB: return sub_prices(a, b);
        case PriceOperation::MUL: return mul_prices(a, b);
        case PriceOperation::DIV: return div_prices(a, b);
        case PriceOperation::COMBINE: return combine_prices(a, b);
        case PriceOperation::SCALE: break;
    }
    throw std::invalid_argument("Unhandled price operation");
}

} // namespace opm::services
