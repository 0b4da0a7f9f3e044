#ifndef COVERCALC_CAPACITY_BOOK_HPP
#define COVERCALC_CAPACITY_BOOK_HPP

#include "carrier_router.hpp"
#include "money.hpp"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace covercalc {

/**
 * @brief Tracks capacity consumed by bound policies, per carrier
 *
 * Remaining capacity is the configured capacity_cents less everything bound
 * against the carrier, so a reloaded configuration keeps prior consumption.
 */
class CapacityBook {
public:
    CapacityBook() = default;

    Cents consumed(const std::string& carrier_id) const;
    Cents remaining(const Carrier& carrier) const;

    // Atomically consume amount from the carrier's remaining capacity.
    // Returns false, consuming nothing, if remaining < amount.
    bool try_consume(const Carrier& carrier, Cents amount);

    // Copies of the carriers with capacity_cents set to what remains
    std::vector<Carrier> with_remaining(const std::vector<Carrier>& carriers) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Cents> consumed_;
};

} // namespace covercalc

#endif // COVERCALC_CAPACITY_BOOK_HPP
