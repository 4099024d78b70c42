#ifndef EXIT_BUDGET_H
#define EXIT_BUDGET_H

#include <atomic>

// Total number of exits all workers may record between them.
class GlobalExitBudget {
public:
    explicit GlobalExitBudget(long long max_exits) : max_exits_(max_exits) {}

    // Unsynchronised look at the counter, used for the loop condition only.
    bool exhausted() const {
        return counter_.load(std::memory_order_relaxed) >= max_exits_;
    }

    // Claims one exit. False means the cap had already been reached and the
    // exit must not be recorded.
    bool try_consume() {
        return counter_.fetch_add(1, std::memory_order_relaxed) < max_exits_;
    }

private:
    const long long max_exits_;
    std::atomic<long long> counter_{0};
};

class PathIdAllocator {
public:
    long long next() { return counter_.fetch_add(1, std::memory_order_relaxed); }
    long long allocated() const { return counter_.load(std::memory_order_relaxed); }

private:
    std::atomic<long long> counter_{0};
};

#endif // EXIT_BUDGET_H
