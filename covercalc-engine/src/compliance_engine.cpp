#include "compliance_engine.hpp"
#include "errors.hpp"
#include <cstdio>
#include <optional>

namespace covercalc {

// ============================================================================
// Enum conversions
// ============================================================================

std::string to_string(ConditionOp op) {
    switch (op) {
        case ConditionOp::Eq:     return "eq";
        case ConditionOp::Ne:     return "ne";
        case ConditionOp::In:     return "in";
        case ConditionOp::NotIn:  return "not_in";
        case ConditionOp::Lt:     return "lt";
        case ConditionOp::Le:     return "le";
        case ConditionOp::Gt:     return "gt";
        case ConditionOp::Ge:     return "ge";
        case ConditionOp::Exists: return "exists";
    }
    throw std::logic_error("Unknown ConditionOp");
}

std::string to_string(RuleAction action) {
    switch (action) {
        case RuleAction::Block:    return "block";
        case RuleAction::Disclose: return "disclose";
    }
    throw std::logic_error("Unknown RuleAction");
}

std::string to_string(Decision decision) {
    switch (decision) {
        case Decision::Allow: return "allow";
        case Decision::Block: return "block";
    }
    throw std::logic_error("Unknown Decision");
}

ConditionOp parse_condition_op(const std::string& text) {
    if (text == "eq") return ConditionOp::Eq;
    if (text == "ne") return ConditionOp::Ne;
    if (text == "in") return ConditionOp::In;
    if (text == "not_in") return ConditionOp::NotIn;
    if (text == "lt") return ConditionOp::Lt;
    if (text == "le") return ConditionOp::Le;
    if (text == "gt") return ConditionOp::Gt;
    if (text == "ge") return ConditionOp::Ge;
    if (text == "exists") return ConditionOp::Exists;
    throw ConfigurationError("unknown condition op '" + text + "'");
}

RuleAction parse_rule_action(const std::string& text) {
    if (text == "block") return RuleAction::Block;
    if (text == "disclose") return RuleAction::Disclose;
    throw ConfigurationError("unknown rule action '" + text + "'");
}

bool ComplianceRule::applies_to(ProductCode product) const {
    if (products.empty()) return true;
    for (ProductCode p : products) {
        if (p == product) return true;
    }
    return false;
}

// ============================================================================
// Condition evaluation
// ============================================================================

namespace {

std::optional<double> as_number(const AttributeValue& value) {
    if (const auto* i = std::get_if<int64_t>(&value)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&value)) return *d;
    return std::nullopt;
}

// Equality across kinds: numbers compare numerically, everything else must
// share the same alternative
bool values_equal(const AttributeValue& a, const AttributeValue& b) {
    auto na = as_number(a);
    auto nb = as_number(b);
    if (na && nb) return *na == *nb;
    if (na || nb) return false;
    return a == b;
}

// Three-way ordering; nullopt when the kinds are not comparable
std::optional<int> compare_values(const AttributeValue& a, const AttributeValue& b) {
    auto na = as_number(a);
    auto nb = as_number(b);
    if (na && nb) {
        if (*na < *nb) return -1;
        return *na > *nb ? 1 : 0;
    }
    const auto* sa = std::get_if<std::string>(&a);
    const auto* sb = std::get_if<std::string>(&b);
    if (sa && sb) {
        int c = sa->compare(*sb);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    return std::nullopt;
}

bool contains_value(const std::vector<AttributeValue>& values, const AttributeValue& actual) {
    for (const auto& v : values) {
        if (values_equal(actual, v)) return true;
    }
    return false;
}

// Values are compared as kinds; a list whose members are all of another kind
// makes in/not_in false rather than vacuously true
bool any_same_kind(const std::vector<AttributeValue>& values, const AttributeValue& actual) {
    bool actual_numeric = as_number(actual).has_value();
    for (const auto& v : values) {
        bool numeric = as_number(v).has_value();
        if (actual_numeric && numeric) return true;
        if (!actual_numeric && !numeric && v.index() == actual.index()) return true;
    }
    return false;
}

std::string digest_hex(const std::string& text) {
    // FNV-1a, 64-bit
    uint64_t hash = 14695981039346656037ULL;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return std::string(buf);
}

} // anonymous namespace

bool evaluate_condition(const Condition& condition, const ComplianceContext& context) {
    auto it = context.find(condition.attribute);
    if (condition.op == ConditionOp::Exists) {
        return it != context.end();
    }
    if (it == context.end()) {
        return false;
    }
    const AttributeValue& actual = it->second;

    if (condition.op == ConditionOp::In || condition.op == ConditionOp::NotIn) {
        if (!any_same_kind(condition.values, actual)) return false;
        bool found = contains_value(condition.values, actual);
        return condition.op == ConditionOp::In ? found : !found;
    }

    if (condition.values.empty()) {
        return false;
    }
    const AttributeValue& expected = condition.values.front();

    switch (condition.op) {
        case ConditionOp::Eq:
        case ConditionOp::Ne: {
            bool same_kind = as_number(actual).has_value() == as_number(expected).has_value() &&
                             (as_number(actual).has_value() || actual.index() == expected.index());
            if (!same_kind) return false;
            bool eq = values_equal(actual, expected);
            return condition.op == ConditionOp::Eq ? eq : !eq;
        }
        case ConditionOp::Lt:
        case ConditionOp::Le:
        case ConditionOp::Gt:
        case ConditionOp::Ge: {
            auto cmp = compare_values(actual, expected);
            if (!cmp) return false;
            if (condition.op == ConditionOp::Lt) return *cmp < 0;
            if (condition.op == ConditionOp::Le) return *cmp <= 0;
            if (condition.op == ConditionOp::Gt) return *cmp > 0;
            return *cmp >= 0;
        }
        default:
            return false;
    }
}

// ============================================================================
// Rule set evaluation
// ============================================================================

ComplianceDecision evaluate_compliance(const RuleSet& rules, ProductCode product,
                                       const ComplianceContext& context) {
    ComplianceDecision decision;
    decision.version = rules.version;

    for (const auto& rule : rules.rules) {
        if (!rule.applies_to(product)) continue;

        bool matched = true;
        for (const auto& condition : rule.conditions) {
            if (!evaluate_condition(condition, context)) {
                matched = false;
                break;
            }
        }
        if (!matched) continue;

        decision.rules_applied.push_back(rule.id);
        if (rule.action == RuleAction::Block) {
            decision.decision = Decision::Block;
            decision.blocking_rules.push_back(rule.id);
            decision.block_messages.push_back(rule.message);
        } else {
            decision.disclosures.push_back(rule.message);
        }
    }

    std::string digest_input = rules.version + "|" + to_string(product);
    for (const auto& id : decision.rules_applied) {
        digest_input += "|" + id;
    }
    decision.report_id = "cr_" + digest_hex(digest_input);
    return decision;
}

// ============================================================================
// Context construction
// ============================================================================

ComplianceContext make_quote_context(const QuoteRequest& request) {
    ComplianceContext ctx;
    ctx["product_code"] = to_string(request.product_code);
    ctx["partner_id"] = request.partner_id;
    ctx["state"] = request.state();

    if (request.product_code == ProductCode::Shipping) {
        const ShippingDetails& s = request.shipping;
        ctx["declared_value"] = static_cast<int64_t>(s.declared_value);
        ctx["item_category"] = s.item_category;
        ctx["destination_state"] = s.destination_state;
        ctx["destination_risk"] = s.destination_risk;
        ctx["service_level"] = s.service_level;
    } else {
        const PpiDetails& p = request.ppi;
        ctx["order_value"] = static_cast<int64_t>(p.order_value);
        ctx["term_months"] = static_cast<int64_t>(p.term_months);
        ctx["job_category"] = p.job_category;
        if (p.age) ctx["age"] = static_cast<int64_t>(*p.age);
        if (p.tenure_months) ctx["tenure_months"] = static_cast<int64_t>(*p.tenure_months);
    }
    return ctx;
}

void merge_policyholder(ComplianceContext& context, const Policyholder& policyholder) {
    if (!policyholder.name.empty()) context["name"] = policyholder.name;
    if (!policyholder.email.empty()) context["email"] = policyholder.email;
    if (!policyholder.state.empty()) context["state"] = policyholder.state;
    if (policyholder.age) context["age"] = static_cast<int64_t>(*policyholder.age);
    if (policyholder.tenure_months) {
        context["tenure_months"] = static_cast<int64_t>(*policyholder.tenure_months);
    }
}

} // namespace covercalc
