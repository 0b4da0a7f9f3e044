#ifndef COVERCALC_CARRIER_ROUTER_HPP
#define COVERCALC_CARRIER_ROUTER_HPP

#include "money.hpp"
#include "pricing_engine.hpp"
#include "product.hpp"
#include "risk_scorer.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace covercalc {

// Carrier appetite for one product. Empty eligible lists mean "any".
struct CarrierAppetite {
    std::vector<std::string> eligible_states;
    std::vector<std::string> excluded_states;
    std::vector<std::string> eligible_categories;
    std::vector<std::string> excluded_categories;
    std::vector<std::string> excluded_job_categories;
    std::vector<RiskBand> excluded_risk_bands;
    std::optional<Cents> max_declared_value_cents;
    std::optional<int> max_term_months;
    std::optional<RiskBand> max_risk_band;
};

struct Carrier {
    std::string id;
    std::string name;
    std::map<ProductCode, CarrierAppetite> appetite;  // products the carrier writes
    Cents capacity_cents = 0;                         // remaining underwriting capacity
    double loss_ratio = 0.60;                         // expected losses per premium cent at multiplier 1.0
    Cents fixed_cost_cents = 0;                       // per-policy acquisition cost

    // margin = premium - premium * loss_ratio * risk_multiplier - fixed_cost_cents
    double margin_cents(Cents premium_cents, double risk_multiplier) const;
};

// Everything the router needs to know about a priced quote
struct RoutingRequest {
    ProductCode product_code = ProductCode::Shipping;
    std::string state;
    std::string item_category;   // shipping only
    std::string job_category;    // ppi only
    Cents declared_value_cents = 0;
    int term_months = 0;
    RiskBand risk_band = RiskBand::A;
    double risk_multiplier = 1.0;
    Cents premium_cents = 0;

    static RoutingRequest from_quote(const QuoteRequest& request,
                                     const RiskAssessment& risk,
                                     const PriceBreakdown& price);
};

// Audit record for one carrier considered by the router
struct CarrierEvaluation {
    std::string carrier_id;
    bool eligible;
    std::string reason;       // rejection reason, or "eligible"
    double margin_cents;
    Cents capacity_cents;
};

struct RoutingDecision {
    std::string carrier_id;
    double margin_cents;
    Cents capacity_cents;
    std::string rationale;
    std::vector<CarrierEvaluation> evaluations;  // every carrier, eligible first

    RoutingDecision() : margin_cents(0.0), capacity_cents(0) {}
};

// Returns an empty string when the request fits the appetite, otherwise the
// first rejection reason
std::string check_appetite(const RoutingRequest& request, const CarrierAppetite& appetite);

// Evaluate every carrier: eligible carriers first by margin descending then
// carrier id ascending, followed by ineligible carriers by id
std::vector<CarrierEvaluation> evaluate_carriers(const RoutingRequest& request,
                                                 const std::vector<Carrier>& carriers);

// Pick the eligible carrier with the highest margin; ties go to the lowest id.
// Capacity is compared, not consumed. Throws NoCarrierAvailableError when no
// carrier is eligible.
RoutingDecision route_to_carrier(const RoutingRequest& request,
                                 const std::vector<Carrier>& carriers);

} // namespace covercalc

#endif // COVERCALC_CARRIER_ROUTER_HPP
