#include "json_reader.hpp"
#include "../errors.hpp"
#include <cstdint>
#include <fstream>
#include <limits>

using json = nlohmann::json;

namespace covercalc {
namespace io {

namespace {

const json& field(const json& j, const std::string& key, const std::string& where) {
    if (!j.is_object()) {
        throw ValidationError(where + " must be a JSON object");
    }
    if (!j.contains(key) || j.at(key).is_null()) {
        throw ValidationError(where + "." + key + " is required");
    }
    return j.at(key);
}

std::string string_field(const json& j, const std::string& key, const std::string& where) {
    const json& v = field(j, key, where);
    if (!v.is_string()) {
        throw ValidationError(where + "." + key + " must be a string");
    }
    return v.get<std::string>();
}

Cents cents_field(const json& j, const std::string& key, const std::string& where) {
    const json& v = field(j, key, where);
    if (!v.is_number_integer()) {
        throw ValidationError(where + "." + key + " must be an integer number of cents");
    }
    if (v.is_number_unsigned() &&
        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<Cents>::max())) {
        throw ValidationError(where + "." + key + " is out of range");
    }
    return v.get<Cents>();
}

int int_field(const json& j, const std::string& key, const std::string& where) {
    const json& v = field(j, key, where);
    if (!v.is_number_integer()) {
        throw ValidationError(where + "." + key + " must be an integer");
    }
    if (v.is_number_unsigned() &&
        v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw ValidationError(where + "." + key + " is out of range");
    }
    const int64_t value = v.get<int64_t>();
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw ValidationError(where + "." + key + " is out of range");
    }
    return static_cast<int>(value);
}

std::optional<int> optional_int(const json& j, const std::string& key, const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    return int_field(j, key, where);
}

} // anonymous namespace

QuoteRequest quote_request_from_json(const json& j) {
    const std::string where = "request";
    QuoteRequest request;
    request.product_code = parse_product_code(string_field(j, "product_code", where));
    request.partner_id = string_field(j, "partner_id", where);

    if (request.product_code == ProductCode::Shipping) {
        ShippingDetails& s = request.shipping;
        s.declared_value = cents_field(j, "declared_value", where);
        s.item_category = string_field(j, "item_category", where);
        s.destination_state = string_field(j, "destination_state", where);
        s.destination_risk = string_field(j, "destination_risk", where);
        s.service_level = string_field(j, "service_level", where);
    } else {
        PpiDetails& p = request.ppi;
        p.order_value = cents_field(j, "order_value", where);
        p.term_months = int_field(j, "term_months", where);
        p.job_category = string_field(j, "job_category", where);
        p.state = string_field(j, "state", where);
        p.age = optional_int(j, "age", where);
        p.tenure_months = optional_int(j, "tenure_months", where);
    }
    return request;
}

Policyholder policyholder_from_json(const json& j) {
    const std::string where = "policyholder";
    Policyholder holder;
    holder.name = string_field(j, "name", where);
    holder.email = string_field(j, "email", where);
    holder.state = string_field(j, "state", where);
    holder.age = optional_int(j, "age", where);
    holder.tenure_months = optional_int(j, "tenure_months", where);
    return holder;
}

json read_json_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw ValidationError("cannot open " + filepath);
    }
    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw ValidationError("invalid JSON in " + filepath + ": " + e.what());
    }
}

} // namespace io
} // namespace covercalc
