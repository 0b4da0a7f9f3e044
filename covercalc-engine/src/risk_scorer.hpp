#ifndef COVERCALC_RISK_SCORER_HPP
#define COVERCALC_RISK_SCORER_HPP

#include "product.hpp"
#include <array>

namespace covercalc {

// Result of risk scoring. score is normalised to [0,1]; raw_score is the
// unclamped weighted sum before normalisation.
struct RiskAssessment {
    double raw_score;
    double score;
    RiskBand band;
    double risk_multiplier;

    RiskAssessment();
};

// Band thresholds partition [0,1]: A < 0.2 <= B < 0.4 <= C < 0.6 <= D < 0.8 <= E
constexpr std::array<double, 4> BAND_THRESHOLDS = {0.2, 0.4, 0.6, 0.8};

// Risk multiplier by band: A, B, C, D, E
constexpr std::array<double, 5> BAND_MULTIPLIERS = {1.00, 1.05, 1.10, 1.25, 1.40};

// Raw score divisor; raw scores at or above this map to 1.0
constexpr double RAW_SCORE_SCALE = 2.0;

// Check that every product attribute is within its domain.
// Throws ValidationError naming the first offending field.
void validate_quote_request(const QuoteRequest& request);

// Shipping raw score:
//   0.02*(declared_value/1000) + dest(low 0, medium 0.5, high 1.0)
//   + svc(ground 0.2, expedited 0.1, overnight 0) + 0.3 if high-value category
double shipping_raw_score(const ShippingDetails& details);

// PPI raw score:
//   0.02*(order_value/10000) + 0.1*(term_months/6) + 0.3 if age < 25
//   + 0.3 if tenure_months < 6 + job category instability loading
double ppi_raw_score(const PpiDetails& details);

RiskBand band_for_score(double score);
double multiplier_for_band(RiskBand band);

// Score a validated request. Pure: identical inputs give identical outputs.
// Throws ValidationError when inputs are out of domain.
RiskAssessment score_risk(const QuoteRequest& request);

} // namespace covercalc

#endif // COVERCALC_RISK_SCORER_HPP
