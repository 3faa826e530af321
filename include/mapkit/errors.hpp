#pragma once

#include <system_error>

namespace mapkit {
namespace errors {
enum class map_err {
    // no 0
    cancelled = 1,
    not_called,
    transform_threw,
    source_failed,
    stream_closed,
    read_in_progress,
    channel_closed,
    channel_busy,
};

const std::error_category& map_category() noexcept;

std::error_code make_error_code(map_err e);

}  // namespace errors
}  // namespace mapkit

namespace std {
template <>
struct is_error_code_enum<mapkit::errors::map_err> : true_type {};
}  // namespace std
