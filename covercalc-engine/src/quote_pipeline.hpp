#ifndef COVERCALC_QUOTE_PIPELINE_HPP
#define COVERCALC_QUOTE_PIPELINE_HPP

#include "calendar.hpp"
#include "capacity_book.hpp"
#include "config_store.hpp"
#include "policy_book.hpp"
#include "policy_store.hpp"
#include "quote_book.hpp"
#include <memory>
#include <string>
#include <vector>

namespace covercalc {

// Shipping cover runs this many days from the effective date
constexpr int SHIPPING_COVERAGE_DAYS = 30;

/**
 * @brief Underwriting decision pipeline
 *
 * quote() chains risk scoring, pricing, carrier routing and compliance over
 * one configuration snapshot and stores the resulting quote. bind() turns a
 * quote into a policy after re-running compliance with the policyholder's
 * attributes and consuming the routed carrier's capacity. cancel() ends a
 * policy with a 30/360 pro-rata refund.
 *
 * Quotes for any number of requests may run concurrently. Binds are
 * serialised per quote id only.
 */
class QuotePipeline {
public:
    explicit QuotePipeline(std::shared_ptr<ConfigStore> config);

    /**
     * @brief Price and route a request, then store it as a quote
     *
     * A compliance block at quote time is recorded on the quote and logged;
     * it does not fail the quote.
     *
     * @throws ValidationError for unknown partners, products the partner does
     *         not sell, or out-of-domain attributes
     * @throws RateNotFoundError for gaps in the rate curves
     * @throws NoCarrierAvailableError if no carrier is eligible
     */
    Quote quote(const QuoteRequest& request, const Date& quote_date);

    /**
     * @brief Bind a quote into an active policy
     *
     * @throws QuoteNotFoundError if unknown, already bound, or being bound
     * @throws QuoteExpiredError if bind_date is past the quote's expiry
     * @throws ValidationError if policyholder attributes are out of domain
     * @throws ComplianceBlockedError with the blocking rule ids
     * @throws NoCarrierAvailableError if the carrier's capacity no longer
     *         covers the premium
     */
    Policy bind(const std::string& quote_id, const Policyholder& policyholder, const Date& bind_date);

    /**
     * @brief Cancel an active policy with a 30/360 pro-rata refund
     *
     * @throws PolicyNotFoundError for unknown ids
     * @throws ValidationError if already cancelled
     */
    Policy cancel(const std::string& policy_id, const Date& cancel_date);

    std::shared_ptr<const Quote> get_quote(const std::string& quote_id) const;
    QuoteStatus quote_status(const std::string& quote_id) const;
    Policy get_policy(const std::string& policy_id) const;
    std::vector<Policy> policies() const;
    size_t quote_count() const;

    // Capacity still available to bind against the carrier under the current config
    Cents remaining_capacity(const std::string& carrier_id) const;

    // Bound policies as simulator input
    PolicyBook policy_book_snapshot() const;

    ConfigStore& config_store() { return *config_; }

private:
    std::shared_ptr<ConfigStore> config_;
    QuoteBook quotes_;
    CapacityBook capacity_;
    PolicyStore policies_;
};

// Expiration of a policy bound on effective_date: shipping 30 days, ppi term_months
Date coverage_end_date(const QuoteRequest& request, const Date& effective_date);

} // namespace covercalc

#endif // COVERCALC_QUOTE_PIPELINE_HPP
