#ifndef EXIT_GEOMETRY_H
#define EXIT_GEOMETRY_H

#include <optional>
#include <stdexcept>
#include <string>
#include "domain.h"

enum class Boundary { Left, Right, Bottom, Top };

const char* boundary_label(Boundary b);
std::optional<Boundary> parse_boundary(const std::string& label);

struct BoundaryHit {
    Boundary boundary;
    double value;  // x for left/right, y for bottom/top
};

class GeometryError : public std::runtime_error {
public:
    GeometryError(double x, double y, const std::string& what)
        : std::runtime_error(what), x_(x), y_(y) {}

    double x() const { return x_; }
    double y() const { return y_; }

private:
    double x_, y_;
};

constexpr double kBoundaryTolerance = 1e-10;

// Parameter t in [0, 1] where the step (x1, y1) -> (x2, y2) first crosses the
// boundary of the domain, i.e. the smallest t whose crossing point lies on the
// closed rectangle. Falls back to 1.0 when no candidate survives (endpoint used
// as exit point), e.g. rounding exactly at a corner.
double find_exit_point(double x1, double y1, double x2, double y2, const Domain& domain);

// Which edge the point sits on, checked in the order left, right, bottom, top.
// Throws GeometryError if the point is not within `tol` of any edge.
BoundaryHit identify_exit_boundary(double x, double y, const Domain& domain,
                                   double tol = kBoundaryTolerance);

#endif // EXIT_GEOMETRY_H
