#ifndef COVERCALC_RATE_CURVES_HPP
#define COVERCALC_RATE_CURVES_HPP

#include "money.hpp"
#include "product.hpp"
#include <climits>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace covercalc {

// Ordered threshold factor: applies when value < below.
// An entry with below == INT_MAX acts as the catch-all.
struct ThresholdFactor {
    int below;
    double factor;

    ThresholdFactor() : below(INT_MAX), factor(1.0) {}
    ThresholdFactor(int b, double f) : below(b), factor(f) {}
};

// Term bucket: covers terms up to and including max_term_months
struct TermBucket {
    int max_term_months;
    double multiplier;

    TermBucket() : max_term_months(0), multiplier(1.0) {}
    TermBucket(int max_term, double mult) : max_term_months(max_term), multiplier(mult) {}
};

// Shipping rate curve: base premium as a fraction of declared value, scaled by
// category, destination risk and service level tables. The state table is
// optional; when present every quoted state must have an entry.
struct ShippingRateCurve {
    double base_rate = 0.0;
    Cents minimum_premium_cents = 1;
    std::map<std::string, double> category;
    std::map<std::string, double> destination_risk;
    std::map<std::string, double> service_level;
    std::map<std::string, double> state;
};

// PPI rate curve: base premium as a fraction of order value, scaled by term,
// job category, risk band, and the applicant's age and tenure
struct PpiRateCurve {
    double base_rate = 0.0;
    Cents minimum_premium_cents = 1;
    std::vector<TermBucket> term_buckets;        // ascending max_term_months
    std::map<std::string, double> job_category;
    std::map<std::string, double> band;          // keyed "A".."E"
    std::vector<ThresholdFactor> age_factors;    // ascending below
    std::vector<ThresholdFactor> tenure_factors; // ascending below
};

struct RateCurveSet {
    std::optional<ShippingRateCurve> shipping;
    std::optional<PpiRateCurve> ppi;
};

// Partner commercial terms
struct PartnerTerms {
    std::string id;
    std::vector<ProductCode> products;
    double markup_pct = 0.0;
    std::string api_token;

    bool allows(ProductCode product) const;
};

// Lookup helpers. All fail closed with RateNotFoundError naming the table and key.
double lookup_rate(const std::map<std::string, double>& table,
                   const std::string& table_name, const std::string& key);
double lookup_term_multiplier(const std::vector<TermBucket>& buckets, int term_months);
double lookup_threshold_factor(const std::vector<ThresholdFactor>& factors,
                               const std::string& table_name, int value);

} // namespace covercalc

#endif // COVERCALC_RATE_CURVES_HPP
