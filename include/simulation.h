#ifndef SIMULATION_H
#define SIMULATION_H

#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>
#include "domain.h"
#include "segment.h"

enum class AggregationMode {
    Locked,       // every segment goes straight into the shared sink
    ThreadLocal   // per-thread buffers, merged into the sink after the join
};

struct SimulationParams {
    std::pair<double, double> domain_x = {0.0, 1.0};
    std::pair<double, double> domain_y = {0.0, 1.0};
    long long max_global_exits = 10000;
    int paths_per_thread = 100;
    double step_size = 0.1;
    std::optional<std::uint64_t> seed;
    int num_threads = 0;  // 0 = omp_get_max_threads()
    AggregationMode aggregation = AggregationMode::Locked;
    bool verbose = false;
};

// Throws ConfigurationError naming the first bad value
void validate(const SimulationParams& params);

int resolve_thread_count(const SimulationParams& params);

// Runs the walks until max_global_exits exits have been recorded and returns
// the segments of every path that exited, in arrival order.
std::vector<Segment> simulate(const SimulationParams& params);

std::vector<Segment> simulate(std::pair<double, double> domain_x,
                              std::pair<double, double> domain_y,
                              long long max_global_exits,
                              int paths_per_thread,
                              double step_size,
                              std::optional<std::uint64_t> seed);

// Drops every segment whose path never exited, keeping relative order
std::vector<Segment> remove_non_exiting_paths(const std::vector<Segment>& segments);

struct StepStats {
    size_t count = 0;
    double mean = 0.0;
    double min = 0.0;
    double q25 = 0.0;
    double median = 0.0;
    double q75 = 0.0;
    double max = 0.0;
};

struct SimulationSummary {
    size_t total_segments = 0;
    size_t unique_paths = 0;
    size_t total_exits = 0;
    std::map<Boundary, size_t> exits_by_boundary;
    StepStats steps_per_path;
};

SimulationSummary summarize(const std::vector<Segment>& segments);

#endif // SIMULATION_H
