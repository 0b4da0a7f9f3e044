#ifndef COVERCALC_PRICING_ENGINE_HPP
#define COVERCALC_PRICING_ENGINE_HPP

#include "money.hpp"
#include "product.hpp"
#include "rate_curves.hpp"
#include "risk_scorer.hpp"
#include <string>
#include <utility>
#include <vector>

namespace covercalc {

// Premium breakdown for one quote.
//
// Composition order is fixed and rounds once:
//   base_premium_exact  = value * base_rate * factors..., floored at the minimum premium
//   base_premium_cents  = round_half_up(base_premium_exact), reported only
//   total_premium_cents = round_half_up(base_premium_exact * risk_multiplier * (1 + partner_markup_pct))
struct PriceBreakdown {
    Cents base_premium_cents;
    double base_premium_exact;
    double base_rate;
    std::vector<std::pair<std::string, double>> factors;  // curve factors, in application order
    double risk_multiplier;
    double partner_markup_pct;
    Cents risk_adjusted_premium_cents;  // round_half_up(base_premium_exact * risk_multiplier)
    Cents total_premium_cents;

    PriceBreakdown();

    // Factor value by name; 1.0 if the factor was not applied
    double factor(const std::string& name) const;
};

// Apply the fixed composition to an unrounded base
Cents compose_total_premium(double base_premium_exact, double risk_multiplier,
                            double partner_markup_pct);

// Price a scored request. Rate lookups fail closed with RateNotFoundError;
// a markup outside [0,1) is a ValidationError.
PriceBreakdown price_quote(const QuoteRequest& request,
                           const RiskAssessment& risk,
                           const PartnerTerms& partner,
                           const RateCurveSet& curves);

} // namespace covercalc

#endif // COVERCALC_PRICING_ENGINE_HPP
