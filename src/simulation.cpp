// src/simulation.cpp
#include "simulation.h"
#include <omp.h>
#include <tbb/combinable.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <iterator>
#include <mutex>
#include <numeric>
#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include "exit_budget.h"
#include "exit_geometry.h"
#include "path_worker.h"
#include "random_utils.h"
#include "segment_sink.h"

namespace {

template <typename T>
[[noreturn]] void reject(const char* name, T value, const char* requirement) {
    std::ostringstream msg;
    msg << "invalid " << name << " " << value << ": " << requirement;
    throw ConfigurationError(msg.str());
}

// Linear interpolation between order statistics of sorted data
double quantile(const std::vector<double>& sorted, double p) {
    const double h = (sorted.size() - 1) * p;
    const size_t lo = static_cast<size_t>(std::floor(h));
    const size_t hi = std::min(lo + 1, sorted.size() - 1);
    return sorted[lo] + (h - lo) * (sorted[hi] - sorted[lo]);
}

} // namespace

void validate(const SimulationParams& params) {
    // Domain::from_bounds reports bad bounds
    Domain::from_bounds(params.domain_x, params.domain_y);

    if (!std::isfinite(params.step_size) || params.step_size <= 0.0) {
        reject("step_size", params.step_size, "must be a positive finite number");
    }
    if (params.paths_per_thread <= 0) {
        reject("paths_per_thread", params.paths_per_thread, "must be positive");
    }
    if (params.max_global_exits < 0) {
        reject("max_global_exits", params.max_global_exits, "must not be negative");
    }
    if (params.num_threads < 0) {
        reject("num_threads", params.num_threads, "must not be negative (0 selects all hardware threads)");
    }
}

int resolve_thread_count(const SimulationParams& params) {
    return (params.num_threads > 0) ?
           params.num_threads :
           omp_get_max_threads();
}

std::vector<Segment> simulate(const SimulationParams& params) {
    validate(params);
    const Domain domain = Domain::from_bounds(params.domain_x, params.domain_y);
    const int num_threads = resolve_thread_count(params);

    GlobalExitBudget budget(params.max_global_exits);
    PathIdAllocator ids;
    SegmentSink sink;
    tbb::combinable<std::vector<Segment>> local_segments;

    std::atomic<bool> abort{false};
    std::exception_ptr failure;
    std::mutex failure_mutex;

    auto start_time = std::chrono::high_resolution_clock::now();
    if (params.verbose) {
        std::cout << "Simulation starting with " << num_threads << " threads, "
                  << params.paths_per_thread << " paths per thread\n";
    }

    #pragma omp parallel num_threads(num_threads)
    {
        const int thread_id = omp_get_thread_num();
        try {
            PathWorker worker(domain, params.paths_per_thread, params.step_size,
                              budget, ids, make_thread_rng(params.seed, thread_id));

            if (params.aggregation == AggregationMode::ThreadLocal) {
                std::vector<Segment>& buffer = local_segments.local();
                worker.run([&buffer](Segment&& s) { buffer.push_back(std::move(s)); }, abort);
            } else {
                worker.run([&sink](Segment&& s) { sink.append(std::move(s)); }, abort);
            }
        } catch (const GeometryError& e) {
            std::lock_guard<std::mutex> lock(failure_mutex);
            std::cerr << "Thread " << thread_id << ": exit point ("
                      << e.x() << ", " << e.y() << ") matches no boundary, aborting run\n";
            if (!failure) failure = std::current_exception();
            abort.store(true);
        } catch (...) {
            std::lock_guard<std::mutex> lock(failure_mutex);
            if (!failure) failure = std::current_exception();
            abort.store(true);
        }
    }

    // Partial results are dropped along with the sink
    if (failure) {
        std::rethrow_exception(failure);
    }

    if (params.aggregation == AggregationMode::ThreadLocal) {
        local_segments.combine_each([&sink](std::vector<Segment>& buffer) {
            sink.append_batch(std::move(buffer));
        });
    }

    std::vector<Segment> all_segments = sink.take();
    std::vector<Segment> result = remove_non_exiting_paths(all_segments);

    if (params.verbose) {
        auto end_time = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = end_time - start_time;
        std::cout << "Simulation finished: " << result.size() << " of "
                  << all_segments.size() << " segments kept, "
                  << ids.allocated() << " paths started, time: "
                  << elapsed.count() << " seconds" << std::endl;
    }

    return result;
}

std::vector<Segment> simulate(std::pair<double, double> domain_x,
                              std::pair<double, double> domain_y,
                              long long max_global_exits,
                              int paths_per_thread,
                              double step_size,
                              std::optional<std::uint64_t> seed) {
    SimulationParams params;
    params.domain_x = domain_x;
    params.domain_y = domain_y;
    params.max_global_exits = max_global_exits;
    params.paths_per_thread = paths_per_thread;
    params.step_size = step_size;
    params.seed = seed;
    return simulate(params);
}

std::vector<Segment> remove_non_exiting_paths(const std::vector<Segment>& segments) {
    std::unordered_set<long long> exited;
    for (const auto& seg : segments) {
        if (seg.has_exited) {
            exited.insert(seg.path_id);
        }
    }

    std::vector<Segment> filtered;
    filtered.reserve(segments.size());
    std::copy_if(segments.begin(), segments.end(), std::back_inserter(filtered),
                 [&exited](const Segment& seg) { return exited.count(seg.path_id) > 0; });
    return filtered;
}

SimulationSummary summarize(const std::vector<Segment>& segments) {
    SimulationSummary summary;
    summary.total_segments = segments.size();

    std::unordered_map<long long, size_t> steps;
    for (const auto& seg : segments) {
        ++steps[seg.path_id];
        if (seg.has_exited) {
            ++summary.total_exits;
            if (seg.exit_boundary) {
                ++summary.exits_by_boundary[*seg.exit_boundary];
            }
        }
    }
    summary.unique_paths = steps.size();

    if (steps.empty()) {
        return summary;
    }

    std::vector<double> counts;
    counts.reserve(steps.size());
    for (const auto& entry : steps) {
        counts.push_back(static_cast<double>(entry.second));
    }
    std::sort(counts.begin(), counts.end());

    StepStats& s = summary.steps_per_path;
    s.count = counts.size();
    s.mean = std::accumulate(counts.begin(), counts.end(), 0.0) / counts.size();
    s.min = counts.front();
    s.q25 = quantile(counts, 0.25);
    s.median = quantile(counts, 0.5);
    s.q75 = quantile(counts, 0.75);
    s.max = counts.back();
    return summary;
}
