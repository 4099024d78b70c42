// src/domain.cpp
#include "domain.h"
#include <cmath>
#include <sstream>

namespace {

void check_axis(const char* axis, double lo, double hi) {
    if (!std::isfinite(lo) || !std::isfinite(hi) || lo >= hi) {
        std::ostringstream msg;
        msg << "invalid domain_" << axis << " (" << lo << ", " << hi << "): "
            << axis << "_min must be finite and less than " << axis << "_max";
        throw ConfigurationError(msg.str());
    }
}

} // namespace

Domain Domain::from_bounds(std::pair<double, double> domain_x,
                           std::pair<double, double> domain_y) {
    check_axis("x", domain_x.first, domain_x.second);
    check_axis("y", domain_y.first, domain_y.second);
    return Domain{domain_x.first, domain_x.second, domain_y.first, domain_y.second};
}
