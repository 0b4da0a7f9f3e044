#include "product.hpp"
#include "errors.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace covercalc {

namespace {

const std::array<const char*, 51> US_STATES = {
    "AK", "AL", "AR", "AZ", "CA", "CO", "CT", "DC", "DE", "FL", "GA",
    "HI", "IA", "ID", "IL", "IN", "KS", "KY", "LA", "MA", "MD", "ME",
    "MI", "MN", "MO", "MS", "MT", "NC", "ND", "NE", "NH", "NJ", "NM",
    "NV", "NY", "OH", "OK", "OR", "PA", "RI", "SC", "SD", "TN", "TX",
    "UT", "VA", "VT", "WA", "WI", "WV", "WY"
};

const std::array<const char*, 7> ITEM_CATEGORIES = {
    "general", "standard", "apparel", "electronics", "electronics_high_value",
    "jewelry", "jewelry_high_value"
};

const std::array<const char*, 5> JOB_CATEGORIES = {
    "full_time", "part_time", "seasonal_temp", "contractor", "self_employed"
};

template <size_t N>
bool contains(const std::array<const char*, N>& table, const std::string& value) {
    return std::any_of(table.begin(), table.end(),
                       [&value](const char* entry) { return value == entry; });
}

} // anonymous namespace

std::string to_string(ProductCode product) {
    switch (product) {
        case ProductCode::Shipping: return "shipping";
        case ProductCode::Ppi: return "ppi";
    }
    throw std::logic_error("Unknown product code value");
}

std::string to_string(RiskBand band) {
    switch (band) {
        case RiskBand::A: return "A";
        case RiskBand::B: return "B";
        case RiskBand::C: return "C";
        case RiskBand::D: return "D";
        case RiskBand::E: return "E";
    }
    throw std::logic_error("Unknown risk band value");
}

ProductCode parse_product_code(const std::string& code) {
    if (code == "shipping") return ProductCode::Shipping;
    if (code == "ppi") return ProductCode::Ppi;
    throw ValidationError("Unknown product code: " + code);
}

RiskBand parse_risk_band(const std::string& band) {
    if (band == "A") return RiskBand::A;
    if (band == "B") return RiskBand::B;
    if (band == "C") return RiskBand::C;
    if (band == "D") return RiskBand::D;
    if (band == "E") return RiskBand::E;
    throw ValidationError("Unknown risk band: " + band);
}

bool is_known_state(const std::string& code) {
    return contains(US_STATES, code);
}

bool is_known_item_category(const std::string& category) {
    return contains(ITEM_CATEGORIES, category);
}

bool is_high_value_category(const std::string& category) {
    return category == "electronics_high_value" || category == "jewelry_high_value";
}

bool is_known_destination_risk(const std::string& risk) {
    return risk == "low" || risk == "medium" || risk == "high";
}

bool is_known_service_level(const std::string& level) {
    return level == "ground" || level == "expedited" || level == "overnight";
}

bool is_known_job_category(const std::string& category) {
    return contains(JOB_CATEGORIES, category);
}

const std::string& QuoteRequest::state() const {
    return product_code == ProductCode::Shipping ? shipping.destination_state : ppi.state;
}

Cents QuoteRequest::coverage_cents() const {
    return product_code == ProductCode::Shipping ? shipping.declared_value : ppi.order_value;
}

} // namespace covercalc
