#include "policy_store.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cstdio>

namespace covercalc {

std::string to_string(PolicyStatus status) {
    switch (status) {
        case PolicyStatus::Active:    return "active";
        case PolicyStatus::Cancelled: return "cancelled";
    }
    throw std::logic_error("Unknown PolicyStatus");
}

PolicyStatus parse_policy_status(const std::string& text) {
    if (text == "active") return PolicyStatus::Active;
    if (text == "cancelled") return PolicyStatus::Cancelled;
    throw ValidationError("unknown policy status '" + text + "'");
}

Cents prorata_refund_cents(Cents premium_cents, const Date& effective_date, const Date& cancel_date) {
    constexpr int64_t YEAR_DAYS = 360;
    int64_t days_used = std::max<int64_t>(0, days_30_360(effective_date, cancel_date));
    int64_t days_left = std::max<int64_t>(0, YEAR_DAYS - days_used);
    return premium_cents * days_left / YEAR_DAYS;
}

PolicyStore::PolicyStore() : sequence_(0) {}

std::string PolicyStore::next_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "pol_%06llu", static_cast<unsigned long long>(++sequence_));
    return std::string(buf);
}

void PolicyStore::add(const Policy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (policies_.count(policy.id) > 0) {
        throw std::logic_error("Duplicate policy id: " + policy.id);
    }
    policies_[policy.id] = policy;
}

Policy PolicyStore::get(const std::string& policy_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = policies_.find(policy_id);
    if (it == policies_.end()) {
        throw PolicyNotFoundError(policy_id);
    }
    return it->second;
}

Policy PolicyStore::cancel(const std::string& policy_id, const Date& cancel_date) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = policies_.find(policy_id);
    if (it == policies_.end()) {
        throw PolicyNotFoundError(policy_id);
    }

    Policy& policy = it->second;
    if (policy.status == PolicyStatus::Cancelled) {
        throw ValidationError("policy " + policy_id + " is already cancelled");
    }

    policy.status = PolicyStatus::Cancelled;
    policy.cancelled_on = cancel_date;
    policy.refund_cents = prorata_refund_cents(policy.premium_total_cents,
                                               policy.effective_date, cancel_date);
    return policy;
}

std::vector<Policy> PolicyStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Policy> result;
    result.reserve(policies_.size());
    for (const auto& [id, policy] : policies_) {
        result.push_back(policy);
    }
    return result;
}

size_t PolicyStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policies_.size();
}

} // namespace covercalc
