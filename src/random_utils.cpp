// src/random_utils.cpp
#include "random_utils.h"

walk_rng make_thread_rng(std::optional<std::uint64_t> seed, int thread_index) {
    if (seed) {
        std::seed_seq seq{
            static_cast<std::uint32_t>(*seed & 0xffffffffu),
            static_cast<std::uint32_t>(*seed >> 32),
            static_cast<std::uint32_t>(thread_index)
        };
        return walk_rng(seq);
    }

    std::random_device rd;
    std::seed_seq seq{rd(), rd(), rd(), rd()};
    return walk_rng(seq);
}
