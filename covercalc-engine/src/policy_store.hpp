#ifndef COVERCALC_POLICY_STORE_HPP
#define COVERCALC_POLICY_STORE_HPP

#include "calendar.hpp"
#include "money.hpp"
#include "product.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace covercalc {

enum class PolicyStatus : uint8_t {
    Active,
    Cancelled
};

std::string to_string(PolicyStatus status);
PolicyStatus parse_policy_status(const std::string& text);

// Bound policy, one per bound quote
struct Policy {
    std::string id;
    std::string quote_id;
    ProductCode product_code = ProductCode::Shipping;
    Policyholder policyholder;
    PolicyStatus status = PolicyStatus::Active;
    Cents premium_total_cents = 0;
    Cents coverage_cents = 0;
    RiskBand risk_band = RiskBand::A;
    std::string carrier_id;
    Date effective_date;
    Date expiration_date;
    std::vector<std::string> disclosures;
    std::string compliance_report_id;
    std::optional<Date> cancelled_on;
    Cents refund_cents = 0;
};

// Pro-rata refund of the unused premium under 30/360: days used run from the
// effective date to the cancel date over a 360-day year, floored to cents.
// Cancelling on or before the effective date refunds everything.
Cents prorata_refund_cents(Cents premium_cents, const Date& effective_date, const Date& cancel_date);

/**
 * @brief Thread-safe store of bound policies
 */
class PolicyStore {
public:
    PolicyStore();

    // Sequential ids: pol_000001, pol_000002, ...
    std::string next_id();

    void add(const Policy& policy);

    // Throws PolicyNotFoundError
    Policy get(const std::string& policy_id) const;

    /**
     * @brief Cancel an active policy and record its refund
     *
     * @throws PolicyNotFoundError for unknown ids
     * @throws ValidationError if the policy is already cancelled
     */
    Policy cancel(const std::string& policy_id, const Date& cancel_date);

    // All policies, ordered by id
    std::vector<Policy> all() const;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Policy> policies_;
    uint64_t sequence_;
};

} // namespace covercalc

#endif // COVERCALC_POLICY_STORE_HPP
