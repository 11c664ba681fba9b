#pragma once

#include <stdexcept>
#include <string>

namespace opm::domain {

enum class PriceOperation { SCALE, ADD, SUB, MUL, DIV, COMBINE };

inline PriceOperation price_operation_from_string(const std::string& str) {
    if (str == "scale") return PriceOperation::SCALE;
    if (str == "add") return PriceOperation::ADD;
    if (str == "sub") return PriceOperation::SUB;
    if (str == "mul") return PriceOperation::MUL;
    if (str == "div") return PriceOperation::DIV;
    if (str == "combine") return PriceOperation::COMBINE;
    throw std::invalid_argument("Invalid price operation: " + str);
}

inline bool is_binary(PriceOperation op) {
    return op != PriceOperation::SCALE;
}

} // namespace opm::domain
