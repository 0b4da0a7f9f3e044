#include "carrier_router.hpp"
#include "errors.hpp"
#include <algorithm>
#include <sstream>

namespace covercalc {

namespace {

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // anonymous namespace

double Carrier::margin_cents(Cents premium_cents, double risk_multiplier) const {
    double premium = static_cast<double>(premium_cents);
    return premium - premium * loss_ratio * risk_multiplier -
           static_cast<double>(fixed_cost_cents);
}

RoutingRequest RoutingRequest::from_quote(const QuoteRequest& request,
                                          const RiskAssessment& risk,
                                          const PriceBreakdown& price) {
    RoutingRequest r;
    r.product_code = request.product_code;
    r.state = request.state();
    if (request.product_code == ProductCode::Shipping) {
        r.item_category = request.shipping.item_category;
        r.declared_value_cents = request.shipping.declared_value;
    } else {
        r.job_category = request.ppi.job_category;
        r.term_months = request.ppi.term_months;
    }
    r.risk_band = risk.band;
    r.risk_multiplier = risk.risk_multiplier;
    r.premium_cents = price.total_premium_cents;
    return r;
}

std::string check_appetite(const RoutingRequest& request, const CarrierAppetite& appetite) {
    if (!appetite.eligible_states.empty() && !contains(appetite.eligible_states, request.state)) {
        return "State " + request.state + " not in appetite";
    }
    if (contains(appetite.excluded_states, request.state)) {
        return "State " + request.state + " excluded";
    }
    if (std::find(appetite.excluded_risk_bands.begin(), appetite.excluded_risk_bands.end(),
                  request.risk_band) != appetite.excluded_risk_bands.end()) {
        return "Risk band " + to_string(request.risk_band) + " excluded";
    }
    if (appetite.max_risk_band && request.risk_band > *appetite.max_risk_band) {
        return "Risk band " + to_string(request.risk_band) + " exceeds max " +
               to_string(*appetite.max_risk_band);
    }

    if (request.product_code == ProductCode::Shipping) {
        if (!appetite.eligible_categories.empty() &&
            !contains(appetite.eligible_categories, request.item_category)) {
            return "Category " + request.item_category + " not in appetite";
        }
        if (contains(appetite.excluded_categories, request.item_category)) {
            return "Category " + request.item_category + " excluded";
        }
        if (appetite.max_declared_value_cents &&
            request.declared_value_cents > *appetite.max_declared_value_cents) {
            return "Declared value " + std::to_string(request.declared_value_cents) +
                   " exceeds max " + std::to_string(*appetite.max_declared_value_cents);
        }
    } else {
        if (appetite.max_term_months && request.term_months > *appetite.max_term_months) {
            return "Term " + std::to_string(request.term_months) + " months exceeds max " +
                   std::to_string(*appetite.max_term_months);
        }
        if (contains(appetite.excluded_job_categories, request.job_category)) {
            return "Job category " + request.job_category + " excluded";
        }
    }
    return "";
}

std::vector<CarrierEvaluation> evaluate_carriers(const RoutingRequest& request,
                                                 const std::vector<Carrier>& carriers) {
    std::vector<CarrierEvaluation> evaluations;
    evaluations.reserve(carriers.size());

    for (const auto& carrier : carriers) {
        CarrierEvaluation eval;
        eval.carrier_id = carrier.id;
        eval.capacity_cents = carrier.capacity_cents;
        eval.margin_cents = carrier.margin_cents(request.premium_cents, request.risk_multiplier);
        eval.eligible = false;

        if (carrier.capacity_cents < 0) {
            throw std::logic_error("Carrier " + carrier.id + " has negative capacity");
        }

        auto it = carrier.appetite.find(request.product_code);
        if (it == carrier.appetite.end()) {
            eval.reason = "Product " + to_string(request.product_code) + " not written";
        } else {
            eval.reason = check_appetite(request, it->second);
            if (eval.reason.empty()) {
                if (carrier.capacity_cents < request.premium_cents) {
                    eval.reason = "Insufficient capacity";
                } else {
                    eval.eligible = true;
                    eval.reason = "eligible";
                }
            }
        }
        evaluations.push_back(std::move(eval));
    }

    std::stable_sort(evaluations.begin(), evaluations.end(),
        [](const CarrierEvaluation& a, const CarrierEvaluation& b) {
            if (a.eligible != b.eligible) return a.eligible;
            if (a.eligible && a.margin_cents != b.margin_cents) {
                return a.margin_cents > b.margin_cents;
            }
            return a.carrier_id < b.carrier_id;
        });
    return evaluations;
}

RoutingDecision route_to_carrier(const RoutingRequest& request,
                                 const std::vector<Carrier>& carriers) {
    RoutingDecision decision;
    decision.evaluations = evaluate_carriers(request, carriers);

    if (decision.evaluations.empty() || !decision.evaluations.front().eligible) {
        throw NoCarrierAvailableError("no carrier appetite or capacity for " +
                                      to_string(request.product_code) + " in " + request.state);
    }

    const CarrierEvaluation& best = decision.evaluations.front();
    decision.carrier_id = best.carrier_id;
    decision.margin_cents = best.margin_cents;
    decision.capacity_cents = best.capacity_cents;

    std::ostringstream rationale;
    rationale << "Selected " << best.carrier_id
              << " with margin $" << format_dollars(best.margin_cents)
              << " (premium: $" << format_dollars(static_cast<double>(request.premium_cents))
              << ", capacity: $" << format_dollars(static_cast<double>(best.capacity_cents)) << ")";
    decision.rationale = rationale.str();
    return decision;
}

} // namespace covercalc
