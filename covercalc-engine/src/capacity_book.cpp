#include "capacity_book.hpp"
#include <algorithm>
#include <stdexcept>

namespace covercalc {

Cents CapacityBook::consumed(const std::string& carrier_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = consumed_.find(carrier_id);
    return it == consumed_.end() ? 0 : it->second;
}

Cents CapacityBook::remaining(const Carrier& carrier) const {
    return std::max<Cents>(0, carrier.capacity_cents - consumed(carrier.id));
}

bool CapacityBook::try_consume(const Carrier& carrier, Cents amount) {
    if (amount < 0) {
        throw std::logic_error("Negative capacity consumption for carrier " + carrier.id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Cents& used = consumed_[carrier.id];
    if (carrier.capacity_cents - used < amount) {
        return false;
    }
    used += amount;
    return true;
}

std::vector<Carrier> CapacityBook::with_remaining(const std::vector<Carrier>& carriers) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Carrier> result = carriers;
    for (auto& carrier : result) {
        auto it = consumed_.find(carrier.id);
        if (it != consumed_.end()) {
            carrier.capacity_cents = std::max<Cents>(0, carrier.capacity_cents - it->second);
        }
    }
    return result;
}

} // namespace covercalc
