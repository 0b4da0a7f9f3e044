#include "pricing_engine.hpp"
#include "errors.hpp"
#include <algorithm>

namespace covercalc {

PriceBreakdown::PriceBreakdown()
    : base_premium_cents(0),
      base_premium_exact(0.0),
      base_rate(0.0),
      risk_multiplier(1.0),
      partner_markup_pct(0.0),
      risk_adjusted_premium_cents(0),
      total_premium_cents(0) {}

double PriceBreakdown::factor(const std::string& name) const {
    for (const auto& [factor_name, value] : factors) {
        if (factor_name == name) {
            return value;
        }
    }
    return 1.0;
}

Cents compose_total_premium(double base_premium_exact, double risk_multiplier,
                            double partner_markup_pct) {
    return round_half_up(base_premium_exact * risk_multiplier * (1.0 + partner_markup_pct));
}

namespace {

// Unrounded base premium in cents plus the factors applied to it
double shipping_base(const ShippingDetails& s, const ShippingRateCurve& curve,
                     PriceBreakdown& out) {
    out.base_rate = curve.base_rate;
    out.factors.emplace_back("category",
        lookup_rate(curve.category, "shipping.category", s.item_category));
    out.factors.emplace_back("destination_risk",
        lookup_rate(curve.destination_risk, "shipping.destination_risk", s.destination_risk));
    out.factors.emplace_back("service_level",
        lookup_rate(curve.service_level, "shipping.service_level", s.service_level));
    if (!curve.state.empty()) {
        out.factors.emplace_back("state",
            lookup_rate(curve.state, "shipping.state", s.destination_state));
    }

    double base = static_cast<double>(s.declared_value) * curve.base_rate;
    for (const auto& entry : out.factors) {
        base *= entry.second;
    }
    return base;
}

double ppi_base(const PpiDetails& p, RiskBand band, const PpiRateCurve& curve,
                PriceBreakdown& out) {
    out.base_rate = curve.base_rate;
    out.factors.emplace_back("term", lookup_term_multiplier(curve.term_buckets, p.term_months));
    out.factors.emplace_back("job_category",
        lookup_rate(curve.job_category, "ppi.job_category", p.job_category));
    out.factors.emplace_back("band", lookup_rate(curve.band, "ppi.band", to_string(band)));
    if (p.age && !curve.age_factors.empty()) {
        out.factors.emplace_back("age",
            lookup_threshold_factor(curve.age_factors, "ppi.age_factors", *p.age));
    }
    if (p.tenure_months && !curve.tenure_factors.empty()) {
        out.factors.emplace_back("tenure",
            lookup_threshold_factor(curve.tenure_factors, "ppi.tenure_factors", *p.tenure_months));
    }

    double base = static_cast<double>(p.order_value) * curve.base_rate;
    for (const auto& entry : out.factors) {
        base *= entry.second;
    }
    return base;
}

} // anonymous namespace

PriceBreakdown price_quote(const QuoteRequest& request,
                           const RiskAssessment& risk,
                           const PartnerTerms& partner,
                           const RateCurveSet& curves) {
    if (partner.markup_pct < 0.0 || partner.markup_pct >= 1.0) {
        throw ValidationError("partner markup_pct must be in [0, 1) for partner " + partner.id);
    }

    PriceBreakdown result;
    double base = 0.0;
    Cents minimum = 1;

    if (request.product_code == ProductCode::Shipping) {
        if (!curves.shipping) {
            throw RateNotFoundError("no rate curve for product shipping");
        }
        base = shipping_base(request.shipping, *curves.shipping, result);
        minimum = curves.shipping->minimum_premium_cents;
    } else {
        if (!curves.ppi) {
            throw RateNotFoundError("no rate curve for product ppi");
        }
        base = ppi_base(request.ppi, risk.band, *curves.ppi, result);
        minimum = curves.ppi->minimum_premium_cents;
    }

    const Cents floor_cents = std::max<Cents>(minimum, 1);
    if (round_half_up(base) < floor_cents) {
        base = static_cast<double>(floor_cents);
    }
    result.base_premium_exact = base;
    result.base_premium_cents = round_half_up(base);
    result.risk_multiplier = risk.risk_multiplier;
    result.partner_markup_pct = partner.markup_pct;
    result.risk_adjusted_premium_cents = round_half_up(base * risk.risk_multiplier);
    result.total_premium_cents = compose_total_premium(
        base, risk.risk_multiplier, partner.markup_pct);
    return result;
}

} // namespace covercalc
