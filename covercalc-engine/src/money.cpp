#include "money.hpp"
#include <cmath>
#include <cstdio>

namespace covercalc {

namespace {

constexpr double ROUNDING_TOLERANCE = 1e-9;

} // anonymous namespace

int64_t round_half_up(double value) {
    if (value < 0.0) {
        return -round_half_up(-value);
    }
    return static_cast<int64_t>(std::floor(value + 0.5 + ROUNDING_TOLERANCE));
}

std::string format_dollars(double cents) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", cents / 100.0);
    return buf;
}

} // namespace covercalc
