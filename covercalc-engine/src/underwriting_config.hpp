#ifndef COVERCALC_UNDERWRITING_CONFIG_HPP
#define COVERCALC_UNDERWRITING_CONFIG_HPP

#include "carrier_router.hpp"
#include "compliance_engine.hpp"
#include "portfolio_simulator.hpp"
#include "rate_curves.hpp"
#include <map>
#include <string>
#include <vector>

namespace covercalc {

/**
 * @brief Immutable underwriting configuration snapshot
 *
 * Everything the pricing, routing and compliance functions read: partner
 * terms, carriers with appetite and capacity, rate curves, the compliance
 * rule set, quote validity and simulator settings.
 */
struct UnderwritingConfig {
    std::map<std::string, PartnerTerms> partners;
    std::vector<Carrier> carriers;           // ordered by id
    RateCurveSet rate_curves;
    RuleSet compliance;
    int quote_validity_days;
    SimulationSettings simulation;
    std::string source_path;                 // empty when parsed from a string

    UnderwritingConfig();

    // Throws ValidationError if the partner is unknown
    const PartnerTerms& partner(const std::string& partner_id) const;

    // nullptr if no carrier has this id
    const Carrier* find_carrier(const std::string& carrier_id) const;
};

/**
 * @brief Check cross-field consistency of a parsed configuration
 *
 * @throws ConfigurationError on duplicate ids, out-of-range ratios or
 *         probabilities, unordered term buckets, or missing rate curves
 */
void validate_underwriting_config(const UnderwritingConfig& config);

/**
 * @brief Parses an underwriting configuration from a JSON string
 *
 * @param json_string JSON document
 * @param config_file_path Path used to resolve a relative compliance.rules_file;
 *        may be empty when rules are inline
 * @return Validated configuration
 * @throws ConfigurationError if the JSON is invalid or fails validation
 */
UnderwritingConfig parse_underwriting_config_from_string(const std::string& json_string,
                                                         const std::string& config_file_path = "");

/**
 * @brief Parses an underwriting configuration from a JSON file
 *
 * @throws ConfigurationError if the file cannot be read or is invalid
 */
UnderwritingConfig parse_underwriting_config_from_file(const std::string& file_path);

/**
 * @brief Parses a compliance rule set document: {"version": ..., "rules": [...]}
 *
 * @throws ConfigurationError on malformed rules or unknown ops and actions
 */
RuleSet parse_rule_set_from_string(const std::string& json_string);
RuleSet parse_rule_set_from_file(const std::string& file_path);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of the config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace covercalc

#endif // COVERCALC_UNDERWRITING_CONFIG_HPP
