// include/random_utils.h
#ifndef RANDOM_UTILS_H
#define RANDOM_UTILS_H

#include <cstdint>
#include <optional>
#include <random>

using walk_rng = std::mt19937_64;

// Generator for worker `thread_index`. With a seed every worker gets its own
// reproducible stream; without one it is seeded from std::random_device.
walk_rng make_thread_rng(std::optional<std::uint64_t> seed, int thread_index);

#endif
