#pragma once

#include <mapkit/async_callback.hpp>
#include <mapkit/cancellation.hpp>
#include <mapkit/errors.hpp>
#include <mapkit/log.hpp>
#include <mapkit/sequence.hpp>

#include <function2/function2.hpp>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace mapkit {

// Adapts a transform that has no use for the signal, f(in, done), to the engine signature
// f(in, cancel_token, done). Makes dropping the token visible at the call site.
template <class Transform>
auto ignore_cancellation(Transform f) {
    return [f = std::move(f)](auto&& in, cancel_token, auto done) mutable {
        f(std::forward<decltype(in)>(in), std::move(done));
    };
}

namespace details {

enum class run_state { running, draining, stopped };

constexpr std::string_view to_string(run_state s) {
    switch (s) {
        case run_state::running:
            return "running";
        case run_state::draining:
            return "draining";
        case run_state::stopped:
            return "stopped";
    }
    return "unknown";
}

// one input item bound to the transform, ready to be launched.
template <class Out>
using work_thunk = fu2::unique_function<void(cancel_token, done_callback<Out>)>;

// pulls the next input and binds it; std::nullopt once the input is exhausted.
template <class Out>
using work_source = fu2::unique_function<std::optional<work_thunk<Out>>()>;

// std::function, fu2 functions and plain pointers can be empty; lambdas cannot.
template <class F>
bool is_null_callable(const F& f) {
    if constexpr (std::is_pointer_v<F> || std::is_member_pointer_v<F>) {
        return f == nullptr;
    } else if constexpr (std::is_class_v<F> && std::is_constructible_v<bool, const F&> &&
                         !std::is_convertible_v<const F&, bool>) {
        return !static_cast<bool>(f);
    } else {
        return false;
    }
}

template <class Out, class Sequence, class Transform>
work_source<Out> bind_work(Sequence input, Transform transform) {
    using in_type = sequence_value_t<Sequence>;
    static_assert(std::is_invocable_v<Transform&, in_type, cancel_token, done_callback<Out>>,
                  "transform expected to be callable as f(in, cancel_token, done_callback<Out>)");

    // shared: every launched item calls the same transform object, possibly concurrently.
    auto shared_transform = std::make_shared<Transform>(std::move(transform));
    return [input = std::move(input), shared_transform]() mutable -> std::optional<work_thunk<Out>> {
        auto item = input();
        if (!item) {
            return std::nullopt;
        }
        return work_thunk<Out>([shared_transform, item = std::move(*item)](cancel_token token,
                                                                          done_callback<Out> done) mutable {
            (*shared_transform)(std::move(item), std::move(token), std::move(done));
        });
    };
}

// validation shared by both engines, before anything gets scheduled.
template <class Sequence, class Transform>
void check_arguments(const Sequence& input, const Transform& transform) {
    if (is_null_callable(input)) {
        throw std::invalid_argument("input sequence must not be null");
    }
    if (is_null_callable(transform)) {
        throw std::invalid_argument("transform must not be null");
    }
}

// An exception out of the transform counts as that item's failure. done stays alive in this
// frame while the transform runs, so unwinding cannot report not_called first.
// An item whose signal tripped between admission and start is not run at all.
template <class Out>
void run_work(work_thunk<Out>& work, cancel_token token, const done_callback<Out>& done) {
    if (token.cancelled()) {
        done(make_error_code(errors::map_err::cancelled), Out{});
        return;
    }
    try {
        work(std::move(token), done);
    } catch (const std::system_error& e) {
        log::error("mapkit: transform threw: {}", e.what());
        done(e.code(), Out{});
    } catch (const std::exception& e) {
        log::error("mapkit: transform threw: {}", e.what());
        done(make_error_code(errors::map_err::transform_threw), Out{});
    }
}

// Pulls the next work item, turning an exception from the input into an error code.
template <class Out>
std::optional<work_thunk<Out>> pull_work(work_source<Out>& source, std::error_code& ec) {
    try {
        return source();
    } catch (const std::system_error& e) {
        log::error("mapkit: input sequence threw: {}", e.what());
        ec = e.code();
    } catch (const std::exception& e) {
        log::error("mapkit: input sequence threw: {}", e.what());
        ec = make_error_code(errors::map_err::source_failed);
    }
    return std::nullopt;
}

}  // namespace details

}  // namespace mapkit
