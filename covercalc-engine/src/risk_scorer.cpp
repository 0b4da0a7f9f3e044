#include "risk_scorer.hpp"
#include "errors.hpp"
#include <algorithm>
#include <string>

namespace covercalc {

RiskAssessment::RiskAssessment()
    : raw_score(0.0), score(0.0), band(RiskBand::A), risk_multiplier(BAND_MULTIPLIERS[0]) {}

namespace {

double destination_risk_weight(const std::string& risk) {
    if (risk == "medium") return 0.5;
    if (risk == "high") return 1.0;
    return 0.0;
}

double service_level_weight(const std::string& level) {
    if (level == "ground") return 0.2;
    if (level == "expedited") return 0.1;
    return 0.0;
}

double job_category_weight(const std::string& category) {
    if (category == "part_time") return 0.1;
    if (category == "seasonal_temp" || category == "contractor" ||
        category == "self_employed") {
        return 0.2;
    }
    return 0.0;
}

void validate_shipping(const ShippingDetails& s) {
    if (s.declared_value <= 0) {
        throw ValidationError("declared_value must be positive");
    }
    if (!is_known_item_category(s.item_category)) {
        throw ValidationError("unknown item_category '" + s.item_category + "'");
    }
    if (!is_known_state(s.destination_state)) {
        throw ValidationError("unknown destination_state '" + s.destination_state + "'");
    }
    if (!is_known_destination_risk(s.destination_risk)) {
        throw ValidationError("unknown destination_risk '" + s.destination_risk + "'");
    }
    if (!is_known_service_level(s.service_level)) {
        throw ValidationError("unknown service_level '" + s.service_level + "'");
    }
}

void validate_ppi(const PpiDetails& p) {
    if (p.order_value <= 0) {
        throw ValidationError("order_value must be positive");
    }
    if (p.term_months < 1 || p.term_months > 36) {
        throw ValidationError("term_months must be between 1 and 36");
    }
    if (!is_known_job_category(p.job_category)) {
        throw ValidationError("unknown job_category '" + p.job_category + "'");
    }
    if (!is_known_state(p.state)) {
        throw ValidationError("unknown state '" + p.state + "'");
    }
    if (p.age && (*p.age < 18 || *p.age > 100)) {
        throw ValidationError("age must be between 18 and 100");
    }
    if (p.tenure_months && *p.tenure_months < 0) {
        throw ValidationError("tenure_months must be non-negative");
    }
}

} // anonymous namespace

void validate_quote_request(const QuoteRequest& request) {
    if (request.product_code == ProductCode::Shipping) {
        validate_shipping(request.shipping);
    } else {
        validate_ppi(request.ppi);
    }
}

double shipping_raw_score(const ShippingDetails& details) {
    double value_score = 0.02 * (static_cast<double>(details.declared_value) / 1000.0);
    double category_score = is_high_value_category(details.item_category) ? 0.3 : 0.0;
    return value_score +
           destination_risk_weight(details.destination_risk) +
           service_level_weight(details.service_level) +
           category_score;
}

double ppi_raw_score(const PpiDetails& details) {
    double value_score = 0.02 * (static_cast<double>(details.order_value) / 10000.0);
    double term_score = 0.1 * (static_cast<double>(details.term_months) / 6.0);
    double age_score = (details.age && *details.age < 25) ? 0.3 : 0.0;
    double tenure_score = (details.tenure_months && *details.tenure_months < 6) ? 0.3 : 0.0;
    return value_score + term_score + age_score + tenure_score +
           job_category_weight(details.job_category);
}

RiskBand band_for_score(double score) {
    for (size_t i = 0; i < BAND_THRESHOLDS.size(); ++i) {
        if (score < BAND_THRESHOLDS[i]) {
            return static_cast<RiskBand>(i);
        }
    }
    return RiskBand::E;
}

double multiplier_for_band(RiskBand band) {
    return BAND_MULTIPLIERS[static_cast<size_t>(band)];
}

RiskAssessment score_risk(const QuoteRequest& request) {
    validate_quote_request(request);

    RiskAssessment result;
    result.raw_score = request.product_code == ProductCode::Shipping
        ? shipping_raw_score(request.shipping)
        : ppi_raw_score(request.ppi);
    result.score = std::min(1.0, result.raw_score / RAW_SCORE_SCALE);
    result.band = band_for_score(result.score);
    result.risk_multiplier = multiplier_for_band(result.band);
    return result;
}

} // namespace covercalc
