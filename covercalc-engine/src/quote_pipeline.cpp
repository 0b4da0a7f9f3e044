#include "quote_pipeline.hpp"
#include "carrier_router.hpp"
#include "compliance_engine.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "pricing_engine.hpp"
#include "risk_scorer.hpp"

namespace covercalc {

namespace {

// Releases a bind claim unless the bind completed
class BindClaim {
public:
    BindClaim(QuoteBook& book, std::string quote_id)
        : book_(book), quote_id_(std::move(quote_id)), completed_(false) {}

    ~BindClaim() {
        if (!completed_) {
            book_.release_claim(quote_id_);
        }
    }

    void complete() {
        book_.complete_bind(quote_id_);
        completed_ = true;
    }

    BindClaim(const BindClaim&) = delete;
    BindClaim& operator=(const BindClaim&) = delete;

private:
    QuoteBook& book_;
    std::string quote_id_;
    bool completed_;
};

void validate_policyholder(const Policyholder& holder) {
    if (!holder.state.empty() && !is_known_state(holder.state)) {
        throw ValidationError("policyholder.state '" + holder.state + "' is not a known state code");
    }
    if (holder.age && (*holder.age < 18 || *holder.age > 100)) {
        throw ValidationError("policyholder.age must be in [18, 100]");
    }
    if (holder.tenure_months && *holder.tenure_months < 0) {
        throw ValidationError("policyholder.tenure_months must not be negative");
    }
}

} // anonymous namespace

Date coverage_end_date(const QuoteRequest& request, const Date& effective_date) {
    if (request.product_code == ProductCode::Shipping) {
        return effective_date.add_days(SHIPPING_COVERAGE_DAYS);
    }
    return effective_date.add_months(request.ppi.term_months);
}

QuotePipeline::QuotePipeline(std::shared_ptr<ConfigStore> config)
    : config_(std::move(config)) {
    if (!config_) {
        throw std::logic_error("QuotePipeline requires a config store");
    }
}

// ============================================================================
// Quote
// ============================================================================

Quote QuotePipeline::quote(const QuoteRequest& request, const Date& quote_date) {
    Logger& logger = Logger::get_instance();
    std::shared_ptr<const UnderwritingConfig> config = config_->snapshot();

    try {
        const PartnerTerms& partner = config->partner(request.partner_id);
        if (!partner.allows(request.product_code)) {
            throw ValidationError("partner '" + partner.id + "' does not offer " +
                                  to_string(request.product_code));
        }

        RiskAssessment risk = score_risk(request);
        PriceBreakdown price = price_quote(request, risk, partner, config->rate_curves);

        RoutingDecision routing = route_to_carrier(
            RoutingRequest::from_quote(request, risk, price),
            capacity_.with_remaining(config->carriers));

        ComplianceDecision compliance = evaluate_compliance(
            config->compliance, request.product_code, make_quote_context(request));

        Quote q;
        q.id = quotes_.next_id();
        q.request = request;
        q.risk = risk;
        q.price = std::move(price);
        q.carrier_id = routing.carrier_id;
        q.carrier_margin_cents = routing.margin_cents;
        q.routing_rationale = routing.rationale;
        q.compliance = std::move(compliance);
        q.quote_date = quote_date;
        q.expires_on = quote_date.add_days(config->quote_validity_days);

        quotes_.add(q);
        logger.log_quote_issued(q);
        return q;

    } catch (const UnderwritingError& e) {
        logger.log_quote_failed(request, error_kind(e), e.what());
        throw;
    }
}

// ============================================================================
// Bind
// ============================================================================

Policy QuotePipeline::bind(const std::string& quote_id, const Policyholder& policyholder,
                           const Date& bind_date) {
    Logger& logger = Logger::get_instance();

    try {
        validate_policyholder(policyholder);

        std::shared_ptr<const Quote> quote = quotes_.claim_for_bind(quote_id, bind_date);
        BindClaim claim(quotes_, quote_id);

        std::shared_ptr<const UnderwritingConfig> config = config_->snapshot();

        ComplianceContext context = make_quote_context(quote->request);
        merge_policyholder(context, policyholder);
        ComplianceDecision decision = evaluate_compliance(
            config->compliance, quote->request.product_code, context);
        if (decision.blocked()) {
            throw ComplianceBlockedError(decision.blocking_rules);
        }

        const Carrier* carrier = config->find_carrier(quote->carrier_id);
        if (!carrier) {
            throw NoCarrierAvailableError("carrier " + quote->carrier_id + " is no longer configured");
        }
        if (!capacity_.try_consume(*carrier, quote->price.total_premium_cents)) {
            throw NoCarrierAvailableError("carrier " + carrier->id + " has insufficient capacity for " +
                                          std::to_string(quote->price.total_premium_cents) + " cents");
        }

        Policy policy;
        policy.id = policies_.next_id();
        policy.quote_id = quote->id;
        policy.product_code = quote->request.product_code;
        policy.policyholder = policyholder;
        policy.status = PolicyStatus::Active;
        policy.premium_total_cents = quote->price.total_premium_cents;
        policy.coverage_cents = quote->request.coverage_cents();
        policy.risk_band = quote->risk.band;
        policy.carrier_id = carrier->id;
        policy.effective_date = bind_date;
        policy.expiration_date = coverage_end_date(quote->request, bind_date);
        policy.disclosures = decision.disclosures;
        policy.compliance_report_id = decision.report_id;

        policies_.add(policy);
        claim.complete();

        logger.log_bind_completed(policy);
        return policy;

    } catch (const ComplianceBlockedError& e) {
        logger.log_bind_rejected(quote_id, error_kind(e), e.what(), e.rule_ids());
        throw;
    } catch (const UnderwritingError& e) {
        logger.log_bind_rejected(quote_id, error_kind(e), e.what());
        throw;
    }
}

// ============================================================================
// Cancel
// ============================================================================

Policy QuotePipeline::cancel(const std::string& policy_id, const Date& cancel_date) {
    Logger& logger = Logger::get_instance();
    try {
        Policy policy = policies_.cancel(policy_id, cancel_date);
        logger.log_policy_cancelled(policy);
        return policy;
    } catch (const UnderwritingError& e) {
        logger.log_warning("quote_pipeline", "cancel of " + policy_id + " failed: " + e.what());
        throw;
    }
}

// ============================================================================
// Accessors
// ============================================================================

std::shared_ptr<const Quote> QuotePipeline::get_quote(const std::string& quote_id) const {
    return quotes_.get(quote_id);
}

QuoteStatus QuotePipeline::quote_status(const std::string& quote_id) const {
    return quotes_.status(quote_id);
}

Policy QuotePipeline::get_policy(const std::string& policy_id) const {
    return policies_.get(policy_id);
}

std::vector<Policy> QuotePipeline::policies() const {
    return policies_.all();
}

size_t QuotePipeline::quote_count() const {
    return quotes_.size();
}

Cents QuotePipeline::remaining_capacity(const std::string& carrier_id) const {
    std::shared_ptr<const UnderwritingConfig> config = config_->snapshot();
    const Carrier* carrier = config->find_carrier(carrier_id);
    if (!carrier) {
        throw NoCarrierAvailableError("unknown carrier " + carrier_id);
    }
    return capacity_.remaining(*carrier);
}

PolicyBook QuotePipeline::policy_book_snapshot() const {
    return PolicyBook::from_policies(policies_.all());
}

} // namespace covercalc
