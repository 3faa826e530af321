#include <mapkit/errors.hpp>

#include <string>

namespace mapkit {

namespace errors {
namespace {
struct map_err_cat : std::error_category {
   public:
    const char* name() const noexcept override { return "mapkit"; }

    std::string message(int ev) const override {
        switch (static_cast<map_err>(ev)) {
            case map_err::cancelled:
                return "cancelled";
            case map_err::not_called:
                return "not_called";
            case map_err::transform_threw:
                return "transform threw an exception";
            case map_err::source_failed:
                return "input sequence failed";
            case map_err::stream_closed:
                return "stream closed";
            case map_err::read_in_progress:
                return "read already in progress";
            case map_err::channel_closed:
                return "channel closed";
            case map_err::channel_busy:
                return "channel busy";
            default:
                return "unrecognized error";
        }
    }

    // lets callers test for cancellation the usual way: ec == std::errc::operation_canceled
    std::error_condition default_error_condition(int ev) const noexcept override {
        if (static_cast<map_err>(ev) == map_err::cancelled) {
            return std::make_error_condition(std::errc::operation_canceled);
        }
        return std::error_condition(ev, *this);
    }
};

const map_err_cat the_map_err_category;
}  // namespace

const std::error_category& map_category() noexcept {
    return the_map_err_category;
}

std::error_code make_error_code(map_err e) {
    return {static_cast<int>(e), the_map_err_category};
}

}  // namespace errors

}  // namespace mapkit
