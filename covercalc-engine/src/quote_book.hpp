#ifndef COVERCALC_QUOTE_BOOK_HPP
#define COVERCALC_QUOTE_BOOK_HPP

#include "calendar.hpp"
#include "compliance_engine.hpp"
#include "pricing_engine.hpp"
#include "product.hpp"
#include "risk_scorer.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace covercalc {

enum class QuoteStatus : uint8_t {
    Quoted,
    Expired,
    Bound
};

std::string to_string(QuoteStatus status);

// Issued quote. Immutable once stored; status lives in the QuoteBook.
struct Quote {
    std::string id;
    QuoteRequest request;
    RiskAssessment risk;
    PriceBreakdown price;
    std::string carrier_id;
    double carrier_margin_cents = 0.0;
    std::string routing_rationale;
    ComplianceDecision compliance;   // quote-time decision
    Date quote_date;
    Date expires_on;
};

/**
 * @brief Thread-safe store of issued quotes and their status
 *
 * A quote moves quoted -> bound through claim_for_bind() followed by
 * complete_bind(). While claimed, further claims of the same id fail, so a
 * quote binds at most once. Claims of different ids do not contend beyond the
 * map lookup.
 */
class QuoteBook {
public:
    QuoteBook();

    // Sequential ids: q_000001, q_000002, ...
    std::string next_id();

    void add(const Quote& quote);

    // Throws QuoteNotFoundError for unknown ids
    std::shared_ptr<const Quote> get(const std::string& quote_id) const;
    QuoteStatus status(const std::string& quote_id) const;

    /**
     * @brief Claim a quote for binding
     *
     * @throws QuoteNotFoundError if unknown, already bound, or already claimed
     * @throws QuoteExpiredError if expired or bind_date is past the expiry date
     *         (the quote is marked expired)
     */
    std::shared_ptr<const Quote> claim_for_bind(const std::string& quote_id, const Date& bind_date);

    // Mark a claimed quote bound and release the claim
    void complete_bind(const std::string& quote_id);

    // Release a claim without changing status
    void release_claim(const std::string& quote_id);

    size_t size() const;

private:
    struct Entry {
        std::shared_ptr<const Quote> quote;
        QuoteStatus status;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> quotes_;
    std::set<std::string> in_flight_;
    uint64_t sequence_;
};

} // namespace covercalc

#endif // COVERCALC_QUOTE_BOOK_HPP
