#pragma once

#include <mapkit/cancellation.hpp>

#include <cstddef>

namespace mapkit {

constexpr int default_buffer_multiplier = 4;

struct map_opts {
    // upper bound of transforms executing at once, must be set (> 0).
    int max_concurrency = 0;
    // streaming only: ordering channel holds max_concurrency * buffer_multiplier handles.
    int buffer_multiplier = default_buffer_multiplier;
    cancel_token cancel;
};

// throws std::invalid_argument naming the offending field.
void validate(const map_opts& opts);

// max_concurrency * buffer_multiplier, clamped to INT_MAX instead of overflowing.
std::size_t channel_capacity(int max_concurrency, int buffer_multiplier);

}  // namespace mapkit
