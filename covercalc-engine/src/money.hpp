#ifndef COVERCALC_MONEY_HPP
#define COVERCALC_MONEY_HPP

#include <cstdint>
#include <string>

namespace covercalc {

// All monetary amounts are integer cents
using Cents = int64_t;

// Round to the nearest integer, halves away from zero.
// A small tolerance absorbs binary representation error so that values such
// as 41112.5 computed as 41112.4999999999 still round up.
int64_t round_half_up(double value);

// Format cents as dollars with two decimals, e.g. 62162 -> "621.62"
std::string format_dollars(double cents);

} // namespace covercalc

#endif // COVERCALC_MONEY_HPP
