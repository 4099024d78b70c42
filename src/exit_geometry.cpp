// src/exit_geometry.cpp
#include "exit_geometry.h"
#include <cmath>
#include <initializer_list>
#include <sstream>

const char* boundary_label(Boundary b) {
    switch (b) {
        case Boundary::Left:   return "left";
        case Boundary::Right:  return "right";
        case Boundary::Bottom: return "bottom";
        case Boundary::Top:    return "top";
    }
    return "unknown";
}

std::optional<Boundary> parse_boundary(const std::string& label) {
    if (label == "left") return Boundary::Left;
    if (label == "right") return Boundary::Right;
    if (label == "bottom") return Boundary::Bottom;
    if (label == "top") return Boundary::Top;
    return std::nullopt;
}

double find_exit_point(double x1, double y1, double x2, double y2, const Domain& domain) {
    const double dx = x2 - x1;
    const double dy = y2 - y1;

    bool found = false;
    double best = 1.0;
    auto consider = [&](double t, double free_coord, double lo, double hi) {
        if (!(t >= 0.0 && t <= 1.0)) return;
        if (free_coord < lo || free_coord > hi) return;
        if (!found || t < best) {
            best = t;
            found = true;
        }
    };

    // A candidate on x = const is on that line exactly; only its y is checked
    // against the domain (and vice versa). A zero component yields no candidates.
    if (dx != 0.0) {
        for (double bound : {domain.x_min, domain.x_max}) {
            const double t = (bound - x1) / dx;
            consider(t, y1 + t * dy, domain.y_min, domain.y_max);
        }
    }
    if (dy != 0.0) {
        for (double bound : {domain.y_min, domain.y_max}) {
            const double t = (bound - y1) / dy;
            consider(t, x1 + t * dx, domain.x_min, domain.x_max);
        }
    }

    return found ? best : 1.0;
}

BoundaryHit identify_exit_boundary(double x, double y, const Domain& domain, double tol) {
    if (std::abs(x - domain.x_min) <= tol) return {Boundary::Left, domain.x_min};
    if (std::abs(x - domain.x_max) <= tol) return {Boundary::Right, domain.x_max};
    if (std::abs(y - domain.y_min) <= tol) return {Boundary::Bottom, domain.y_min};
    if (std::abs(y - domain.y_max) <= tol) return {Boundary::Top, domain.y_max};

    std::ostringstream msg;
    msg.precision(17);
    msg << "Point (" << x << ", " << y << ") is not on any boundary";
    throw GeometryError(x, y, msg.str());
}
