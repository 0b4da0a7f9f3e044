#ifndef COVERCALC_POLICY_BOOK_HPP
#define COVERCALC_POLICY_BOOK_HPP

#include "calendar.hpp"
#include "money.hpp"
#include "policy_store.hpp"
#include "product.hpp"
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace covercalc {

// One policy as seen by the portfolio simulator
struct PolicyBookEntry {
    std::string policy_id;
    ProductCode product_code = ProductCode::Shipping;
    RiskBand risk_band = RiskBand::A;
    Cents premium_cents = 0;
    Cents coverage_cents = 0;
    Date effective_date;
    Date expiration_date;
    PolicyStatus status = PolicyStatus::Active;

    // Active, effective by the month's last day and not expired before its first day
    bool is_active_in(const YearMonth& month) const;

    bool operator==(const PolicyBookEntry& other) const;
};

/**
 * @brief Snapshot of the policy book fed to the simulator
 *
 * CSV and Parquet sources share one column layout:
 *   policy_id, product_code, risk_band, premium_cents, coverage_cents,
 *   effective_date, expiration_date, status
 */
class PolicyBook {
public:
    void add(const PolicyBookEntry& entry);
    void add(PolicyBookEntry&& entry);

    const PolicyBookEntry& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    const std::vector<PolicyBookEntry>& entries() const { return entries_; }

    void reserve(size_t count);
    void clear();

    std::vector<PolicyBookEntry> active_in(const YearMonth& month) const;

    // Throws ValidationError on malformed rows, naming the line
    static PolicyBook load_from_csv(const std::string& filepath);
    static PolicyBook load_from_csv(std::istream& is);

    static PolicyBook load_from_parquet(const std::string& filepath);

    // Chooses the loader by file extension (.parquet, otherwise CSV)
    static PolicyBook load(const std::string& filepath);

    static PolicyBook from_policies(const std::vector<Policy>& policies);

    void write_csv(std::ostream& os) const;

private:
    std::vector<PolicyBookEntry> entries_;
};

} // namespace covercalc

#endif // COVERCALC_POLICY_BOOK_HPP
