#include "underwriting_config.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace covercalc {

// ============================================================================
// UnderwritingConfig
// ============================================================================

UnderwritingConfig::UnderwritingConfig()
    : quote_validity_days(30) {}

const PartnerTerms& UnderwritingConfig::partner(const std::string& partner_id) const {
    auto it = partners.find(partner_id);
    if (it == partners.end()) {
        throw ValidationError("unknown partner '" + partner_id + "'");
    }
    return it->second;
}

const Carrier* UnderwritingConfig::find_carrier(const std::string& carrier_id) const {
    for (const auto& carrier : carriers) {
        if (carrier.id == carrier_id) {
            return &carrier;
        }
    }
    return nullptr;
}

// ============================================================================
// Path helpers
// ============================================================================

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigurationError("unterminated ${ in '" + value + "'");
            }
            pos++; // Skip '}'
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        if (var_name.empty()) {
            // A lone '$' is literal
            pos = start + 1;
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute() || config_file_path.empty()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

// ============================================================================
// Section parsers
// ============================================================================

namespace {

std::string read_file(const std::string& file_path, const std::string& what) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigurationError("failed to open " + what + ": " + file_path);
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

const json& require(const json& j, const std::string& key, const std::string& where) {
    if (!j.is_object() || !j.contains(key)) {
        throw ConfigurationError(where + " missing required field: " + key);
    }
    return j.at(key);
}

std::vector<std::string> string_list(const json& j, const std::string& key) {
    std::vector<std::string> values;
    if (j.contains(key)) {
        for (const auto& v : j.at(key)) {
            values.push_back(v.get<std::string>());
        }
    }
    return values;
}

std::map<std::string, double> factor_table(const json& j, const std::string& key,
                                           const std::string& where, bool required) {
    std::map<std::string, double> table;
    if (!j.contains(key)) {
        if (required) {
            throw ConfigurationError(where + " missing required table: " + key);
        }
        return table;
    }
    for (auto it = j.at(key).begin(); it != j.at(key).end(); ++it) {
        table[it.key()] = it.value().get<double>();
    }
    return table;
}

RiskBand band_from_config(const std::string& text) {
    try {
        return parse_risk_band(text);
    } catch (const ValidationError&) {
        throw ConfigurationError("unknown risk band '" + text + "'");
    }
}

ProductCode product_from_config(const std::string& text) {
    try {
        return parse_product_code(text);
    } catch (const ValidationError&) {
        throw ConfigurationError("unknown product code '" + text + "'");
    }
}

PartnerTerms parse_partner(const json& j) {
    PartnerTerms partner;
    partner.id = require(j, "id", "Partner").get<std::string>();
    for (const auto& product : require(j, "products", "Partner '" + partner.id + "'")) {
        partner.products.push_back(product_from_config(product.get<std::string>()));
    }
    if (j.contains("markup_pct")) {
        partner.markup_pct = j.at("markup_pct").get<double>();
    }
    if (j.contains("api_token")) {
        partner.api_token = expand_environment_variables(j.at("api_token").get<std::string>());
    }
    return partner;
}

CarrierAppetite parse_appetite(const json& j) {
    CarrierAppetite a;
    a.eligible_states = string_list(j, "eligible_states");
    a.excluded_states = string_list(j, "excluded_states");
    a.eligible_categories = string_list(j, "eligible_categories");
    a.excluded_categories = string_list(j, "excluded_categories");
    a.excluded_job_categories = string_list(j, "excluded_job_categories");
    for (const auto& band : string_list(j, "excluded_risk_bands")) {
        a.excluded_risk_bands.push_back(band_from_config(band));
    }
    if (j.contains("max_declared_value_cents")) {
        a.max_declared_value_cents = j.at("max_declared_value_cents").get<Cents>();
    }
    if (j.contains("max_term_months")) {
        a.max_term_months = j.at("max_term_months").get<int>();
    }
    if (j.contains("max_risk_band")) {
        a.max_risk_band = band_from_config(j.at("max_risk_band").get<std::string>());
    }
    return a;
}

Carrier parse_carrier(const json& j) {
    Carrier c;
    c.id = require(j, "id", "Carrier").get<std::string>();
    const std::string where = "Carrier '" + c.id + "'";
    c.name = j.value("name", c.id);
    c.capacity_cents = require(j, "capacity_cents", where).get<Cents>();
    c.loss_ratio = j.value("loss_ratio", 0.60);
    c.fixed_cost_cents = j.value("fixed_cost_cents", static_cast<Cents>(0));

    const json& appetite = require(j, "appetite", where);
    for (auto it = appetite.begin(); it != appetite.end(); ++it) {
        c.appetite[product_from_config(it.key())] = parse_appetite(it.value());
    }
    return c;
}

std::vector<ThresholdFactor> threshold_table(const json& j, const std::string& key) {
    std::vector<ThresholdFactor> table;
    if (!j.contains(key)) {
        return table;
    }
    for (const auto& entry : j.at(key)) {
        ThresholdFactor f;
        if (entry.contains("below") && !entry.at("below").is_null()) {
            f.below = entry.at("below").get<int>();
        }
        f.factor = require(entry, "factor", key).get<double>();
        table.push_back(f);
    }
    return table;
}

ShippingRateCurve parse_shipping_curve(const json& j) {
    const std::string where = "rate_curves.shipping";
    ShippingRateCurve curve;
    curve.base_rate = require(j, "base_rate", where).get<double>();
    curve.minimum_premium_cents = j.value("minimum_premium_cents", static_cast<Cents>(1));
    curve.category = factor_table(j, "category", where, true);
    curve.destination_risk = factor_table(j, "destination_risk", where, true);
    curve.service_level = factor_table(j, "service_level", where, true);
    curve.state = factor_table(j, "state", where, false);
    return curve;
}

PpiRateCurve parse_ppi_curve(const json& j) {
    const std::string where = "rate_curves.ppi";
    PpiRateCurve curve;
    curve.base_rate = require(j, "base_rate", where).get<double>();
    curve.minimum_premium_cents = j.value("minimum_premium_cents", static_cast<Cents>(1));
    for (const auto& bucket : require(j, "term_buckets", where)) {
        curve.term_buckets.emplace_back(
            require(bucket, "max_term_months", "term bucket").get<int>(),
            require(bucket, "multiplier", "term bucket").get<double>());
    }
    curve.job_category = factor_table(j, "job_category", where, true);
    curve.band = factor_table(j, "band", where, true);
    curve.age_factors = threshold_table(j, "age_factors");
    curve.tenure_factors = threshold_table(j, "tenure_factors");
    return curve;
}

AttributeValue attribute_from_json(const json& v, const std::string& rule_id) {
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_number_float()) return v.get<double>();
    if (v.is_string()) return v.get<std::string>();
    throw ConfigurationError("rule '" + rule_id + "' has an unsupported condition value: " + v.dump());
}

Condition parse_condition(const json& j, const std::string& rule_id) {
    const std::string where = "Condition in rule '" + rule_id + "'";
    Condition c;
    c.attribute = require(j, "attribute", where).get<std::string>();
    c.op = parse_condition_op(require(j, "op", where).get<std::string>());

    if (c.op == ConditionOp::Exists) {
        return c;
    }
    const json& value = require(j, "value", where);
    if (c.op == ConditionOp::In || c.op == ConditionOp::NotIn) {
        if (!value.is_array()) {
            throw ConfigurationError(where + ": op " + to_string(c.op) + " needs a list value");
        }
        for (const auto& v : value) {
            c.values.push_back(attribute_from_json(v, rule_id));
        }
    } else {
        if (value.is_array()) {
            throw ConfigurationError(where + ": op " + to_string(c.op) + " needs a scalar value");
        }
        c.values.push_back(attribute_from_json(value, rule_id));
    }
    return c;
}

RuleSet parse_rule_set(const json& j) {
    RuleSet rules;
    rules.version = j.value("version", std::string("unversioned"));

    std::set<std::string> ids;
    for (const auto& rule_json : require(j, "rules", "Compliance")) {
        ComplianceRule rule;
        rule.id = require(rule_json, "id", "Rule").get<std::string>();
        if (!ids.insert(rule.id).second) {
            throw ConfigurationError("duplicate compliance rule id: " + rule.id);
        }
        const std::string where = "Rule '" + rule.id + "'";
        rule.action = parse_rule_action(require(rule_json, "action", where).get<std::string>());
        rule.message = rule_json.value("message", std::string());
        for (const auto& product : string_list(rule_json, "products")) {
            rule.products.push_back(product_from_config(product));
        }
        if (rule_json.contains("conditions")) {
            for (const auto& cond : rule_json.at("conditions")) {
                rule.conditions.push_back(parse_condition(cond, rule.id));
            }
        }
        rules.rules.push_back(std::move(rule));
    }
    return rules;
}

LossModelParams parse_loss_model(const json& j) {
    LossModelParams model;
    if (j.contains("claim_probability")) {
        for (auto it = j.at("claim_probability").begin(); it != j.at("claim_probability").end(); ++it) {
            RiskBand band = band_from_config(it.key());
            model.claim_probability[static_cast<size_t>(band)] = it.value().get<double>();
        }
    }
    model.severity_scale = j.value("severity_scale", model.severity_scale);
    model.pareto_alpha = j.value("pareto_alpha", model.pareto_alpha);
    return model;
}

} // anonymous namespace

// ============================================================================
// Validation
// ============================================================================

void validate_underwriting_config(const UnderwritingConfig& config) {
    if (config.partners.empty()) {
        throw ConfigurationError("at least one partner is required");
    }
    for (const auto& [id, partner] : config.partners) {
        if (partner.markup_pct < 0.0 || partner.markup_pct >= 1.0) {
            throw ConfigurationError("partner '" + id + "' markup_pct must be in [0, 1)");
        }
        for (ProductCode product : partner.products) {
            bool has_curve = product == ProductCode::Shipping
                ? config.rate_curves.shipping.has_value()
                : config.rate_curves.ppi.has_value();
            if (!has_curve) {
                throw ConfigurationError("partner '" + id + "' sells " + to_string(product) +
                                         " but no rate curve is configured");
            }
        }
    }

    std::set<std::string> carrier_ids;
    for (const auto& carrier : config.carriers) {
        if (carrier.id.empty()) {
            throw ConfigurationError("carrier id cannot be empty");
        }
        if (!carrier_ids.insert(carrier.id).second) {
            throw ConfigurationError("duplicate carrier id: " + carrier.id);
        }
        if (carrier.capacity_cents < 0) {
            throw ConfigurationError("carrier '" + carrier.id + "' capacity_cents must not be negative");
        }
        if (carrier.loss_ratio < 0.0 || carrier.loss_ratio > 1.0) {
            throw ConfigurationError("carrier '" + carrier.id + "' loss_ratio must be in [0, 1]");
        }
        if (carrier.fixed_cost_cents < 0) {
            throw ConfigurationError("carrier '" + carrier.id + "' fixed_cost_cents must not be negative");
        }
    }

    if (config.rate_curves.shipping && config.rate_curves.shipping->base_rate <= 0.0) {
        throw ConfigurationError("rate_curves.shipping.base_rate must be positive");
    }
    if (config.rate_curves.ppi) {
        const PpiRateCurve& ppi = *config.rate_curves.ppi;
        if (ppi.base_rate <= 0.0) {
            throw ConfigurationError("rate_curves.ppi.base_rate must be positive");
        }
        for (size_t i = 1; i < ppi.term_buckets.size(); ++i) {
            if (ppi.term_buckets[i].max_term_months <= ppi.term_buckets[i - 1].max_term_months) {
                throw ConfigurationError("rate_curves.ppi.term_buckets must be strictly ascending");
            }
        }
    }

    if (config.quote_validity_days < 1) {
        throw ConfigurationError("quote_validity_days must be at least 1");
    }
    if (config.simulation.max_scenario_count < 1) {
        throw ConfigurationError("simulation.max_scenario_count must be at least 1");
    }
    for (double p : config.simulation.loss_model.claim_probability) {
        if (p < 0.0 || p > 1.0) {
            throw ConfigurationError("simulation.loss_model.claim_probability must be in [0, 1]");
        }
    }
    if (config.simulation.loss_model.severity_scale <= 0.0 ||
        config.simulation.loss_model.severity_scale > 1.0) {
        throw ConfigurationError("simulation.loss_model.severity_scale must be in (0, 1]");
    }
    if (config.simulation.loss_model.pareto_alpha <= 0.0) {
        throw ConfigurationError("simulation.loss_model.pareto_alpha must be positive");
    }
}

// ============================================================================
// Entry points
// ============================================================================

RuleSet parse_rule_set_from_string(const std::string& json_string) {
    try {
        return parse_rule_set(json::parse(json_string));
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("JSON parse error in rule set: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigurationError(std::string("JSON type error in rule set: ") + e.what());
    }
}

RuleSet parse_rule_set_from_file(const std::string& file_path) {
    return parse_rule_set_from_string(read_file(file_path, "compliance rules file"));
}

UnderwritingConfig parse_underwriting_config_from_string(const std::string& json_string,
                                                         const std::string& config_file_path) {
    UnderwritingConfig config;
    config.source_path = config_file_path;

    try {
        json j = json::parse(json_string);

        for (const auto& partner_json : require(j, "partners", "Config")) {
            PartnerTerms partner = parse_partner(partner_json);
            if (config.partners.count(partner.id) > 0) {
                throw ConfigurationError("duplicate partner id: " + partner.id);
            }
            config.partners[partner.id] = partner;
        }

        for (const auto& carrier_json : require(j, "carriers", "Config")) {
            config.carriers.push_back(parse_carrier(carrier_json));
        }
        std::sort(config.carriers.begin(), config.carriers.end(),
                  [](const Carrier& a, const Carrier& b) { return a.id < b.id; });

        const json& curves = require(j, "rate_curves", "Config");
        if (curves.contains("shipping")) {
            config.rate_curves.shipping = parse_shipping_curve(curves.at("shipping"));
        }
        if (curves.contains("ppi")) {
            config.rate_curves.ppi = parse_ppi_curve(curves.at("ppi"));
        }

        // Compliance: inline rules or a separate rules file
        const json& compliance = require(j, "compliance", "Config");
        if (compliance.contains("rules_file")) {
            std::string rules_path = resolve_relative_path(
                expand_environment_variables(compliance.at("rules_file").get<std::string>()),
                config_file_path);
            config.compliance = parse_rule_set_from_file(rules_path);
        } else {
            config.compliance = parse_rule_set(compliance);
        }

        config.quote_validity_days = j.value("quote_validity_days", config.quote_validity_days);

        if (j.contains("simulation")) {
            const json& sim = j.at("simulation");
            config.simulation.max_scenario_count =
                sim.value("max_scenario_count", config.simulation.max_scenario_count);
            if (sim.contains("loss_model")) {
                config.simulation.loss_model = parse_loss_model(sim.at("loss_model"));
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigurationError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigurationError(std::string("JSON out of range: ") + e.what());
    }

    validate_underwriting_config(config);
    return config;
}

UnderwritingConfig parse_underwriting_config_from_file(const std::string& file_path) {
    return parse_underwriting_config_from_string(read_file(file_path, "config file"), file_path);
}

} // namespace covercalc
