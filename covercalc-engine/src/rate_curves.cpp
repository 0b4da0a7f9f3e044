#include "rate_curves.hpp"
#include "errors.hpp"
#include <algorithm>

namespace covercalc {

bool PartnerTerms::allows(ProductCode product) const {
    return std::find(products.begin(), products.end(), product) != products.end();
}

double lookup_rate(const std::map<std::string, double>& table,
                   const std::string& table_name, const std::string& key) {
    auto it = table.find(key);
    if (it == table.end()) {
        throw RateNotFoundError(table_name + " has no entry for '" + key + "'");
    }
    return it->second;
}

double lookup_term_multiplier(const std::vector<TermBucket>& buckets, int term_months) {
    for (const auto& bucket : buckets) {
        if (term_months <= bucket.max_term_months) {
            return bucket.multiplier;
        }
    }
    throw RateNotFoundError("term_buckets has no bucket covering " +
                            std::to_string(term_months) + " months");
}

double lookup_threshold_factor(const std::vector<ThresholdFactor>& factors,
                               const std::string& table_name, int value) {
    for (const auto& entry : factors) {
        if (value < entry.below) {
            return entry.factor;
        }
    }
    throw RateNotFoundError(table_name + " has no band covering " + std::to_string(value));
}

} // namespace covercalc
