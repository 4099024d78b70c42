// src/path_worker.cpp
#include "path_worker.h"
#include "exit_geometry.h"
#include <utility>

PathWorker::PathWorker(const Domain& domain, int paths_per_thread, double step_size,
                       GlobalExitBudget& budget, PathIdAllocator& ids, walk_rng rng)
    : domain_(domain),
      budget_(budget),
      ids_(ids),
      rng_(std::move(rng)),
      step_dist_(0.0, step_size) {
    paths_.reserve(paths_per_thread);
    for (int i = 0; i < paths_per_thread; ++i) {
        paths_.push_back(fresh_path());
    }
}

PathState PathWorker::fresh_path() {
    PathState p;
    p.id = ids_.next();
    p.x = domain_.x_min + unit_dist_(rng_) * domain_.width();
    p.y = domain_.y_min + unit_dist_(rng_) * domain_.height();
    p.step_count = 0;
    return p;
}

void PathWorker::run(const SegmentEmitter& emit, const std::atomic<bool>& abort) {
    while (!paths_.empty() && !budget_.exhausted() &&
           !abort.load(std::memory_order_relaxed)) {
        if (!step_all(emit)) {
            break;
        }
    }
}

bool PathWorker::step_all(const SegmentEmitter& emit) {
    size_t i = 0;
    while (i < paths_.size()) {
        PathState& path = paths_[i];

        const double dx = step_dist_(rng_);
        const double dy = step_dist_(rng_);
        const double new_x = path.x + dx;
        const double new_y = path.y + dy;
        const int new_step_count = path.step_count + 1;

        Segment seg;
        seg.path_id = path.id;
        seg.step = new_step_count;
        seg.start_x = path.x;
        seg.start_y = path.y;
        seg.end_x = new_x;
        seg.end_y = new_y;

        if (!domain_.contains(new_x, new_y)) {
            const double t = find_exit_point(path.x, path.y, new_x, new_y, domain_);
            const double ix = path.x + t * dx;
            const double iy = path.y + t * dy;
            const BoundaryHit hit = identify_exit_boundary(ix, iy, domain_);

            if (!budget_.try_consume()) {
                // Budget gone: the step is dropped and the path stays where it was
                return false;
            }

            seg.has_exited = true;
            seg.intersection_x = ix;
            seg.intersection_y = iy;
            seg.exit_boundary = hit.boundary;
            seg.boundary_value = hit.value;
            emit(std::move(seg));

            // Reuse the slot; the new path is stepped before moving on
            path = fresh_path();
        } else {
            emit(std::move(seg));

            path.x = new_x;
            path.y = new_y;
            path.step_count = new_step_count;
            ++i;
        }
    }
    return true;
}
