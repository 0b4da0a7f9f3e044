#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace covercalc {
namespace io {

namespace {

json request_to_json(const QuoteRequest& request) {
    json j;
    j["product_code"] = to_string(request.product_code);
    j["partner_id"] = request.partner_id;
    if (request.product_code == ProductCode::Shipping) {
        const ShippingDetails& s = request.shipping;
        j["declared_value"] = s.declared_value;
        j["item_category"] = s.item_category;
        j["destination_state"] = s.destination_state;
        j["destination_risk"] = s.destination_risk;
        j["service_level"] = s.service_level;
    } else {
        const PpiDetails& p = request.ppi;
        j["order_value"] = p.order_value;
        j["term_months"] = p.term_months;
        j["job_category"] = p.job_category;
        j["state"] = p.state;
        if (p.age) j["age"] = *p.age;
        if (p.tenure_months) j["tenure_months"] = *p.tenure_months;
    }
    return j;
}

json compliance_to_json(const ComplianceDecision& decision) {
    json j;
    j["decision"] = to_string(decision.decision);
    j["disclosures"] = decision.disclosures;
    j["rules_applied"] = decision.rules_applied;
    j["blocking_rules"] = decision.blocking_rules;
    j["block_messages"] = decision.block_messages;
    j["version"] = decision.version;
    j["report_id"] = decision.report_id;
    return j;
}

} // anonymous namespace

json quote_to_json(const Quote& quote) {
    json j;
    j["quote_id"] = quote.id;
    j["request"] = request_to_json(quote.request);
    j["risk"] = {
        {"raw_score", quote.risk.raw_score},
        {"score", quote.risk.score},
        {"band", to_string(quote.risk.band)},
        {"risk_multiplier", quote.risk.risk_multiplier}
    };

    json factors = json::object();
    for (const auto& [name, value] : quote.price.factors) {
        factors[name] = value;
    }
    j["price_breakdown"] = {
        {"base_premium_cents", quote.price.base_premium_cents},
        {"base_premium_exact", quote.price.base_premium_exact},
        {"base_rate", quote.price.base_rate},
        {"factors", factors},
        {"risk_multiplier", quote.price.risk_multiplier},
        {"partner_markup_pct", quote.price.partner_markup_pct},
        {"risk_adjusted_premium_cents", quote.price.risk_adjusted_premium_cents},
        {"total_premium_cents", quote.price.total_premium_cents}
    };
    j["premium_cents"] = quote.price.total_premium_cents;
    j["carrier_id"] = quote.carrier_id;
    j["carrier_margin_cents"] = quote.carrier_margin_cents;
    j["routing_rationale"] = quote.routing_rationale;
    j["compliance"] = compliance_to_json(quote.compliance);
    j["quote_date"] = quote.quote_date.to_string();
    j["expires_on"] = quote.expires_on.to_string();
    return j;
}

json policy_to_json(const Policy& policy) {
    json holder;
    holder["name"] = policy.policyholder.name;
    holder["email"] = policy.policyholder.email;
    holder["state"] = policy.policyholder.state;
    if (policy.policyholder.age) holder["age"] = *policy.policyholder.age;
    if (policy.policyholder.tenure_months) holder["tenure_months"] = *policy.policyholder.tenure_months;

    json j;
    j["policy_id"] = policy.id;
    j["quote_id"] = policy.quote_id;
    j["product_code"] = to_string(policy.product_code);
    j["status"] = to_string(policy.status);
    j["policyholder"] = holder;
    j["premium_total_cents"] = policy.premium_total_cents;
    j["coverage_cents"] = policy.coverage_cents;
    j["risk_band"] = to_string(policy.risk_band);
    j["carrier_id"] = policy.carrier_id;
    j["effective_date"] = policy.effective_date.to_string();
    j["expiration_date"] = policy.expiration_date.to_string();
    j["disclosures"] = policy.disclosures;
    j["compliance_report_id"] = policy.compliance_report_id;
    if (policy.cancelled_on) {
        j["cancel_date"] = policy.cancelled_on->to_string();
        j["refund_cents"] = policy.refund_cents;
    }
    return j;
}

void write_portfolio_result_json(std::ostream& out, const PortfolioResult& result,
                                 const SensitivityResult* sensitivity,
                                 bool include_distribution,
                                 bool pretty_print) {
    // Formatted into a local buffer so the caller's stream flags are untouched
    std::ostringstream os;
    const std::string indent = pretty_print ? "  " : "";
    const std::string newline = pretty_print ? "\n" : "";
    const std::string space = pretty_print ? " " : "";
    const std::string i2 = indent + indent;
    const std::string i3 = i2 + indent;

    os << std::fixed << std::setprecision(2);

    os << "{" << newline;
    os << indent << "\"as_of_month\":" << space << "\"" << result.as_of_month.to_string() << "\"," << newline;
    os << indent << "\"scenario_count\":" << space << result.scenario_count << "," << newline;
    os << indent << "\"seed\":" << space << result.seed << "," << newline;
    os << indent << "\"active_policy_count\":" << space << result.active_policy_count << "," << newline;
    os << indent << "\"var95\":" << space << result.var95 << "," << newline;
    os << indent << "\"var99\":" << space << result.var99 << "," << newline;
    os << indent << "\"tailvar99\":" << space << result.tailvar99 << "," << newline;

    // Scenario statistics
    os << indent << "\"scenario_statistics\":" << space << "{" << newline;
    os << i2 << "\"mean\":" << space << result.statistics.mean << "," << newline;
    os << i2 << "\"median\":" << space << result.statistics.median << "," << newline;
    os << i2 << "\"std_dev\":" << space << result.statistics.std_dev << "," << newline;
    os << i2 << "\"min\":" << space << result.statistics.min << "," << newline;
    os << i2 << "\"max\":" << space << result.statistics.max << newline;
    os << indent << "}," << newline;

    // Retention table
    os << indent << "\"retention_table\":" << space << "[" << newline;
    for (size_t i = 0; i < result.retention_table.size(); ++i) {
        const RetentionRow& row = result.retention_table[i];
        os << i2 << "{"
           << "\"retention\":" << space << row.retention << "," << space
           << "\"expected_loss\":" << space << row.expected_loss << "," << space
           << "\"expected_ceded\":" << space << row.expected_ceded << "," << space
           << "\"reinsurance_premium\":" << space << row.reinsurance_premium << "," << space
           << "\"expected_net\":" << space << row.expected_net << "}";
        if (i + 1 < result.retention_table.size()) os << ",";
        os << newline;
    }
    os << indent << "]," << newline;

    // Recommendation
    os << indent << "\"recommended\":" << space << "{" << newline;
    os << i2 << "\"retention\":" << space << result.recommended.retention << "," << newline;
    os << i2 << "\"expected_net\":" << space << result.recommended.expected_net << "," << newline;
    os << i2 << "\"rationale\":" << space << json(result.recommended.rationale).dump() << newline;
    os << indent << "}";

    if (sensitivity) {
        auto write_series = [&](const char* name, const std::vector<SensitivityPoint>& points, bool last) {
            os << i2 << "\"" << name << "\":" << space << "[" << newline;
            for (size_t i = 0; i < points.size(); ++i) {
                os << i3 << "{"
                   << "\"value\":" << space << points[i].value << "," << space
                   << "\"recommended_retention\":" << space << points[i].recommended_retention << "," << space
                   << "\"expected_net\":" << space << points[i].expected_net << "}";
                if (i + 1 < points.size()) os << ",";
                os << newline;
            }
            os << i2 << "]" << (last ? "" : ",") << newline;
        };
        os << "," << newline;
        os << indent << "\"sensitivity\":" << space << "{" << newline;
        write_series("rate_on_line", sensitivity->rate_on_line, false);
        write_series("load", sensitivity->load, true);
        os << indent << "}";
    }

    os << "," << newline;
    os << indent << "\"execution_time_ms\":" << space << result.execution_time_ms;

    if (include_distribution) {
        os << "," << newline;
        os << indent << "\"distribution\":" << space << "[";
        if (!result.scenario_losses.empty()) {
            if (pretty_print) {
                os << newline << i2;
            }
            for (size_t i = 0; i < result.scenario_losses.size(); ++i) {
                if (i > 0) {
                    os << ",";
                    if (pretty_print && i % 10 == 0) {
                        os << newline << i2;
                    } else {
                        os << space;
                    }
                }
                os << result.scenario_losses[i];
            }
            if (pretty_print) {
                os << newline << indent;
            }
        }
        os << "]";
    }

    os << newline << "}" << newline;
    out << os.str();
}

void write_portfolio_result_json(const std::string& filepath, const PortfolioResult& result,
                                 const SensitivityResult* sensitivity,
                                 bool include_distribution,
                                 bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_portfolio_result_json(file, result, sensitivity, include_distribution, pretty_print);
}

void write_json_document(std::ostream& os, const std::string& filepath, const json& doc) {
    if (filepath.empty()) {
        os << doc.dump(2) << std::endl;
        return;
    }
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    file << doc.dump(2) << std::endl;
}

} // namespace io
} // namespace covercalc
