#ifndef COVERCALC_PRODUCT_HPP
#define COVERCALC_PRODUCT_HPP

#include "money.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace covercalc {

enum class ProductCode : uint8_t {
    Shipping = 0,
    Ppi = 1
};

// Risk bands, A (lowest risk) through E (highest)
enum class RiskBand : uint8_t {
    A = 0,
    B = 1,
    C = 2,
    D = 3,
    E = 4
};

std::string to_string(ProductCode product);
std::string to_string(RiskBand band);

// Parse "shipping" / "ppi"; throws ValidationError otherwise
ProductCode parse_product_code(const std::string& code);

// Parse "A".."E"; throws ValidationError otherwise
RiskBand parse_risk_band(const std::string& band);

// Reference tables for input domain checks
bool is_known_state(const std::string& code);
bool is_known_item_category(const std::string& category);
bool is_high_value_category(const std::string& category);
bool is_known_destination_risk(const std::string& risk);
bool is_known_service_level(const std::string& level);
bool is_known_job_category(const std::string& category);

// Shipping protection inputs
struct ShippingDetails {
    Cents declared_value = 0;
    std::string item_category;
    std::string destination_state;
    std::string destination_risk;   // low | medium | high
    std::string service_level;      // ground | expedited | overnight
};

// Payment-protection inputs
struct PpiDetails {
    Cents order_value = 0;
    int term_months = 0;
    std::string job_category;
    std::string state;
    std::optional<int> age;
    std::optional<int> tenure_months;
};

struct QuoteRequest {
    ProductCode product_code = ProductCode::Shipping;
    std::string partner_id;
    ShippingDetails shipping;
    PpiDetails ppi;

    // Jurisdiction of the risk: destination state for shipping, applicant state for ppi
    const std::string& state() const;

    // Insured amount: declared value for shipping, order value for ppi
    Cents coverage_cents() const;
};

// Policyholder details supplied at bind time
struct Policyholder {
    std::string name;
    std::string email;
    std::string state;
    std::optional<int> age;
    std::optional<int> tenure_months;
};

} // namespace covercalc

#endif // COVERCALC_PRODUCT_HPP
