#ifndef PATH_WORKER_H
#define PATH_WORKER_H

#include <atomic>
#include <functional>
#include <random>
#include <vector>
#include "domain.h"
#include "exit_budget.h"
#include "random_utils.h"
#include "segment.h"

struct PathState {
    long long id;
    double x;
    double y;
    int step_count;
};

using SegmentEmitter = std::function<void(Segment&&)>;

// Steps a fixed pool of paths until the global exit budget runs out.
// A worker and everything it owns is used by a single thread.
class PathWorker {
public:
    PathWorker(const Domain& domain, int paths_per_thread, double step_size,
               GlobalExitBudget& budget, PathIdAllocator& ids, walk_rng rng);

    // Runs until the budget is exhausted or `abort` is raised by another
    // worker. Every step is passed to `emit` in the order it was taken.
    void run(const SegmentEmitter& emit, const std::atomic<bool>& abort);

    // One sweep over the pool. Returns false once an exit was refused
    // because the budget had already been used up.
    bool step_all(const SegmentEmitter& emit);

    const std::vector<PathState>& paths() const { return paths_; }

private:
    PathState fresh_path();

    Domain domain_;
    GlobalExitBudget& budget_;
    PathIdAllocator& ids_;
    walk_rng rng_;
    std::normal_distribution<double> step_dist_;
    std::uniform_real_distribution<double> unit_dist_{0.0, 1.0};
    std::vector<PathState> paths_;
};

#endif // PATH_WORKER_H
