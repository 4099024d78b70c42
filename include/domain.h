#ifndef DOMAIN_H
#define DOMAIN_H

#include <stdexcept>
#include <string>
#include <utility>

class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

// Rectangle [x_min, x_max] x [y_min, y_max]. Fixed for the whole run.
struct Domain {
    double x_min;
    double x_max;
    double y_min;
    double y_max;

    // Throws ConfigurationError unless both axes are finite and non-empty
    static Domain from_bounds(std::pair<double, double> domain_x,
                              std::pair<double, double> domain_y);

    double width() const { return x_max - x_min; }
    double height() const { return y_max - y_min; }

    // Boundary counts as inside
    bool contains(double x, double y) const {
        return x >= x_min && x <= x_max && y >= y_min && y <= y_max;
    }
};

#endif // DOMAIN_H
