#include <mapkit/map_opts.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace mapkit {

void validate(const map_opts& opts) {
    if (opts.max_concurrency <= 0) {
        throw std::invalid_argument(
            fmt::format("max_concurrency must be greater than zero, got {}", opts.max_concurrency));
    }
    if (opts.buffer_multiplier < 1) {
        throw std::invalid_argument(
            fmt::format("buffer_multiplier must be at least 1, got {}", opts.buffer_multiplier));
    }
}

std::size_t channel_capacity(int max_concurrency, int buffer_multiplier) {
    if (max_concurrency <= 0 || buffer_multiplier < 1) {
        throw std::invalid_argument(
            fmt::format("channel_capacity: invalid arguments ({}, {})", max_concurrency, buffer_multiplier));
    }
    const std::int64_t capacity = static_cast<std::int64_t>(max_concurrency) * buffer_multiplier;
    constexpr std::int64_t limit = std::numeric_limits<int>::max();
    return static_cast<std::size_t>(capacity > limit ? limit : capacity);
}

}  // namespace mapkit
