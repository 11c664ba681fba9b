#pragma once

#include "domain/requests/PriceRequest.hpp"
#include "domain/requests/PriceResult.hpp"

#include <string>

namespace opm::infrastructure {

class PriceJsonCodec {
public:
    // Parse one calculator request object. Integer fields accept either a
    // JSON unsigned number or a string of decimal digits, since oracle feeds
    // ship 64-bit values as strings. Throws std::invalid_argument on any
    // malformed or missing field.
    domain::PriceRequest parse_request(const std::string& json_str) const;

    // Best-effort "id" of a request line, empty when the line has none or
    // does not parse. Lets a rejected request still be matched by its caller.
    std::string request_id(const std::string& json_str) const;

    domain::Price parse_price(const std::string& json_str) const;

    // indent < 0 writes a single line. Invalid UTF-8 in strings is replaced
    // with U+FFFD rather than failing the dump.
    std::string serialize_result(const domain::PriceResult& result, int indent = -1) const;

    // Failure that never reached the math core (e.g. a request that did not parse).
    std::string serialize_failure(const std::string& id,
                                  const std::string& error,
                                  const std::string& message,
                                  int indent = -1) const;
};

} // namespace opm::infrastructure
