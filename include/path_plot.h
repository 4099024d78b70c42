#ifndef PATH_PLOT_H
#define PATH_PLOT_H

#include <optional>
#include <string>
#include <vector>
#include "domain.h"
#include "random_utils.h"
#include "segment.h"
#include "utils.h"

struct PathTrace {
    long long path_id = 0;
    std::vector<Vec2D> points;  // start point, then the end of every step
    std::optional<Vec2D> intersection;
    std::optional<Vec2D> exit_point;
};

struct PlotOptions {
    int width = 800;
    int height = 800;
    double margin = 0.05;  // extra room around the domain, in domain units
    std::string title = "Brownian Motion Paths";
};

// Up to n distinct path ids drawn at random, sorted ascending
std::vector<long long> select_paths(const std::vector<Segment>& segments, size_t n, walk_rng& rng);

// Polyline of one path ordered by step. Empty trace if the id is unknown.
PathTrace trace_path(const std::vector<Segment>& segments, long long path_id);

std::string render_paths_svg(const std::vector<Segment>& segments,
                             const std::vector<long long>& path_ids,
                             const Domain& domain,
                             const PlotOptions& options = PlotOptions());

void save_paths_svg(const std::string& filename,
                    const std::vector<Segment>& segments,
                    const std::vector<long long>& path_ids,
                    const Domain& domain,
                    const PlotOptions& options = PlotOptions());

#endif // PATH_PLOT_H
