#ifndef SEGMENT_H
#define SEGMENT_H

#include <optional>
#include "exit_geometry.h"

// One recorded step of one path. Exit data is present only on the step that
// left the domain, which is always the last step of that path.
struct Segment {
    long long path_id = 0;
    int step = 0;  // 1-based within the path
    double start_x = 0.0;
    double start_y = 0.0;
    double end_x = 0.0;
    double end_y = 0.0;
    bool has_exited = false;
    std::optional<double> intersection_x;
    std::optional<double> intersection_y;
    std::optional<Boundary> exit_boundary;
    std::optional<double> boundary_value;

    bool operator==(const Segment& other) const {
        return path_id == other.path_id && step == other.step &&
               start_x == other.start_x && start_y == other.start_y &&
               end_x == other.end_x && end_y == other.end_y &&
               has_exited == other.has_exited &&
               intersection_x == other.intersection_x &&
               intersection_y == other.intersection_y &&
               exit_boundary == other.exit_boundary &&
               boundary_value == other.boundary_value;
    }
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

#endif // SEGMENT_H
