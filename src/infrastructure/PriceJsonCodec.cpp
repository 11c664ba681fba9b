#include "infrastructure/PriceJsonCodec.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <stdexcept>
#include <system_error>

using json = nlohmann::json;
using namespace opm::domain;

namespace opm::infrastructure {

namespace {

json parse_object(const std::string& json_str) {
    json obj;
    try {
        obj = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw std::invalid_argument(std::string("Malformed JSON: ") + e.what());
    }
    if (!obj.is_object()) {
        throw std::invalid_argument("Expected a JSON object");
    }
    return obj;
}

uint64_t parse_digits(const std::string& str, const char* field) {
    uint64_t value = 0;
    const char* first = str.data();
    const char* last = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (str.empty() || ec != std::errc() || ptr != last) {
        throw std::invalid_argument(
            std::string("Field '") + field + "' is not an unsigned 64-bit integer: " + str);
    }
    return value;
}

uint64_t read_u64(const json& obj, const char* field) {
    auto it = obj.find(field);
    if (it == obj.end()) {
        throw std::invalid_argument(std::string("Missing field: ") + field);
    }
    if (it->is_number_unsigned()) {
        return it->get<uint64_t>();
    }
    if (it->is_string()) {
        return parse_digits(it->get<std::string>(), field);
    }
    throw std::invalid_argument(
        std::string("Field '") + field + "' must be an unsigned integer, got: " + it->dump());
}

Price price_from_json(const json& obj, const char* name) {
    if (!obj.is_object()) {
        throw std::invalid_argument(std::string("Price '") + name + "' must be an object");
    }
    return Price(read_u64(obj, "mantissa"),
                 read_u64(obj, "confidence"),
                 read_u64(obj, "exponent"),
                 read_u64(obj, "publish_time"));
}

json price_to_json(const Price& price) {
    return json{
        {"mantissa", price.mantissa()},
        {"confidence", price.confidence()},
        {"exponent", price.exponent()},
        {"publish_time", price.publish_time()}
    };
}

} // anonymous namespace

PriceRequest PriceJsonCodec::parse_request(const std::string& json_str) const {
    auto obj = parse_object(json_str);

    std::string id;
    if (obj.contains("id")) {
        if (!obj["id"].is_string()) {
            throw std::invalid_argument("Field 'id' must be a string");
        }
        id = obj["id"].get<std::string>();
    }

    if (!obj.contains("op") || !obj["op"].is_string()) {
        throw std::invalid_argument("Missing or non-string field: op");
    }
    auto op = price_operation_from_string(obj["op"].get<std::string>());

    if (!obj.contains("a")) {
        throw std::invalid_argument("Missing field: a");
    }

    PriceRequest request{id, op, price_from_json(obj["a"], "a"), std::nullopt, std::nullopt};

    if (is_binary(op)) {
        if (!obj.contains("b")) {
            throw std::invalid_argument("Missing field: b");
        }
        request.b = price_from_json(obj["b"], "b");
    } else {
        request.to_exponent = read_u64(obj, "to_exponent");
    }

    return request;
}

std::string PriceJsonCodec::request_id(const std::string& json_str) const {
    auto obj = json::parse(json_str, nullptr, false);
    if (!obj.is_object()) return "";
    auto it = obj.find("id");
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

Price PriceJsonCodec::parse_price(const std::string& json_str) const {
    return price_from_json(parse_object(json_str), "price");
}

std::string PriceJsonCodec::serialize_result(const PriceResult& result, int indent) const {
    json out;
    out["id"] = result.id;
    out["ok"] = result.ok();
    if (result.price) {
        out["price"] = price_to_json(*result.price);
    } else if (result.error) {
        out["error"] = to_string(*result.error);
        out["message"] = result.message;
    }
    return out.dump(indent, ' ', false, json::error_handler_t::replace);
}

std::string PriceJsonCodec::serialize_failure(const std::string& id,
                                              const std::string& error,
                                              const std::string& message,
                                              int indent) const {
    json out{
        {"id", id},
        {"ok", false},
        {"error", error},
        {"message", message}
    };
    return out.dump(indent, ' ', false, json::error_handler_t::replace);
}

} // namespace opm::infrastructure
