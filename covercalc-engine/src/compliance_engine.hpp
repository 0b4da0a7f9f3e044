#ifndef COVERCALC_COMPLIANCE_ENGINE_HPP
#define COVERCALC_COMPLIANCE_ENGINE_HPP

#include "product.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace covercalc {

// Scalar attribute value. Integers and doubles compare numerically with each
// other; strings and bools only compare with their own kind.
using AttributeValue = std::variant<bool, int64_t, double, std::string>;

// Attributes visible to compliance rules, keyed by name
using ComplianceContext = std::map<std::string, AttributeValue>;

enum class ConditionOp : uint8_t {
    Eq, Ne, In, NotIn, Lt, Le, Gt, Ge, Exists
};

enum class RuleAction : uint8_t {
    Block,
    Disclose
};

enum class Decision : uint8_t {
    Allow,
    Block
};

std::string to_string(ConditionOp op);
std::string to_string(RuleAction action);
std::string to_string(Decision decision);
ConditionOp parse_condition_op(const std::string& text);
RuleAction parse_rule_action(const std::string& text);

/**
 * One predicate over the context.
 *
 * Scalar ops use values[0]; In/NotIn use the whole list; Exists ignores values.
 * A missing attribute or a kind mismatch makes any op other than Exists false,
 * Ne and NotIn included.
 */
struct Condition {
    std::string attribute;
    ConditionOp op = ConditionOp::Eq;
    std::vector<AttributeValue> values;
};

struct ComplianceRule {
    std::string id;
    std::vector<ProductCode> products;     // empty: applies to every product
    std::vector<Condition> conditions;     // ANDed; empty always matches
    RuleAction action = RuleAction::Disclose;
    std::string message;

    bool applies_to(ProductCode product) const;
};

struct RuleSet {
    std::string version;
    std::vector<ComplianceRule> rules;     // evaluation order
};

struct ComplianceDecision {
    Decision decision = Decision::Allow;
    std::vector<std::string> disclosures;
    std::vector<std::string> rules_applied;
    std::vector<std::string> blocking_rules;
    std::vector<std::string> block_messages;
    std::string version;
    std::string report_id;

    bool blocked() const { return decision == Decision::Block; }
};

bool evaluate_condition(const Condition& condition, const ComplianceContext& context);

// Evaluate every rule in order. Never throws for missing or mistyped
// attributes; the report id is a digest of version, product and triggered rules.
ComplianceDecision evaluate_compliance(const RuleSet& rules, ProductCode product,
                                       const ComplianceContext& context);

// Quote-time context: product_code, partner_id, state and the product attributes
ComplianceContext make_quote_context(const QuoteRequest& request);

// Bind-time context: policyholder attributes override the request's
void merge_policyholder(ComplianceContext& context, const Policyholder& policyholder);

} // namespace covercalc

#endif // COVERCALC_COMPLIANCE_ENGINE_HPP
