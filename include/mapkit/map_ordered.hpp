#pragma once

#include <mapkit/admission_gate.hpp>
#include <mapkit/async_callback.hpp>
#include <mapkit/cancellation.hpp>
#include <mapkit/errors.hpp>
#include <mapkit/log.hpp>
#include <mapkit/map_opts.hpp>
#include <mapkit/sequence.hpp>
#include <mapkit/strand.hpp>
#include <mapkit/utils.hpp>
#include <mapkit/work.hpp>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace mapkit {

namespace details {

template <class Out, class Done>
struct eager_out {
    using type = Out;
};

// Out not given explicitly: take it from done(std::error_code, std::vector<Out>).
template <class Done>
struct eager_out<void, Done> {
    using type = typename std::decay_t<utils::result_type_t<std::decay_t<Done>>>::value_type;
};

// One async_map_ordered invocation. All members are touched on m_strand only; transforms run
// on the io_context and hop back onto the strand to report.
template <class Out>
class eager_map_op : public std::enable_shared_from_this<eager_map_op<Out>> {
   public:
    eager_map_op(asio::io_context& ctx,
                 work_source<Out> work,
                 const map_opts& opts,
                 std::size_t size_hint,
                 async_callback<std::vector<Out>> done)
        : m_ctx(ctx),
          m_strand(make_strand(ctx)),
          m_work(std::move(work)),
          m_gate(make_admission_gate(m_strand, opts.max_concurrency)),
          m_cancel(cancel_source::linked(opts.cancel)),
          m_done(std::move(done)) {
        m_results.reserve(size_hint);
    }

    void start() {
        auto self = this->shared_from_this();
        std::weak_ptr<eager_map_op> weak_self = self;
        m_cancel_link = cancel_subscription(m_cancel.token(), [weak_self] {
            if (auto self = weak_self.lock()) {
                asio::post(self->m_strand, [self] { self->on_cancelled(); });
            }
        });
        asio::post(m_strand, [self] { self->pump(); });
    }

   private:
    // admits and launches items until the gate is full, the input ends or the run stops.
    void pump() {
        while (m_state == run_state::running) {
            if (m_cancel.cancelled()) {
                on_cancelled();
                return;
            }

            std::error_code ec;
            auto work = pull_work(m_work, ec);
            if (ec) {
                fail(ec);
                break;
            }
            if (!work) {
                set_state(run_state::draining);
                break;
            }

            if (!m_gate->try_acquire()) {
                m_held = std::move(work);
                m_gate->async_acquire(
                    [self = this->shared_from_this()](std::error_code ec) { self->on_admitted(ec); });
                return;
            }
            launch(std::move(*work));
        }
        maybe_stop();
    }

    void on_admitted(std::error_code ec) {
        auto work = std::exchange(m_held, std::nullopt);
        if (ec) {
            // gate was cancelled, whoever cancelled it already recorded why.
            maybe_stop();
            return;
        }
        if (m_state != run_state::running || m_cancel.cancelled() || !work) {
            // nothing may start after cancellation, hand the slot back.
            m_gate->release();
            maybe_stop();
            return;
        }
        launch(std::move(*work));
        pump();
    }

    void launch(work_thunk<Out> work) {
        const auto position = m_next_position++;
        m_results.emplace_back();
        ++m_in_flight;

        admission_slot slot(m_gate);
        auto self = this->shared_from_this();
        auto done = to_shared(async_callback<Out>(
            [self, position, slot = std::move(slot)](std::error_code ec, Out value) mutable {
                asio::post(self->m_strand, [self, position, slot = std::move(slot), ec,
                                            value = std::move(value)]() mutable {
                    slot.release();
                    self->on_item_done(position, ec, std::move(value));
                });
            },
            "mapkit::async_map_ordered"));

        asio::post(m_ctx, [work = std::move(work), token = m_cancel.token(), done = std::move(done)]() mutable {
            run_work(work, std::move(token), done);
        });
    }

    void on_item_done(std::size_t position, std::error_code ec, Out value) {
        --m_in_flight;
        if (ec) {
            fail(ec);
        } else {
            m_results[position] = std::move(value);
        }
        maybe_stop();
    }

    // first error wins; later ones are only logged.
    void fail(std::error_code ec) {
        if (!m_first_error) {
            m_first_error = ec;
            log::debug("async_map_ordered: failure, no further admissions: {}", ec.message());
        } else {
            log::debug("async_map_ordered: additional failure ignored: {}", ec.message());
        }
        m_gate->cancel(make_error_code(errors::map_err::cancelled));
        if (m_state == run_state::running) {
            set_state(run_state::draining);
        }
        m_cancel.cancel();
    }

    void on_cancelled() {
        if (m_state == run_state::stopped) {
            return;
        }
        if (!m_first_error) {
            m_first_error = make_error_code(errors::map_err::cancelled);
        }
        m_gate->cancel(make_error_code(errors::map_err::cancelled));
        if (m_state == run_state::running) {
            set_state(run_state::draining);
        }
        maybe_stop();
    }

    // stopped only once every launched item reported back, so no work outlives the call.
    void maybe_stop() {
        if (m_state != run_state::draining || m_in_flight != 0 || m_held) {
            return;
        }
        set_state(run_state::stopped);
        m_cancel_link.reset();

        auto ec = m_first_error;
        if (!ec && m_cancel.cancelled()) {
            ec = make_error_code(errors::map_err::cancelled);
        }

        std::vector<Out> out;
        if (!ec) {
            out.reserve(m_results.size());
            for (auto& r : m_results) {
                out.push_back(std::move(*r));
            }
        }
        m_results.clear();

        asio::post(m_ctx, [done = std::move(m_done), ec, out = std::move(out)]() mutable { done(ec, std::move(out)); });
    }

    void set_state(run_state s) {
        log::debug("async_map_ordered: {} -> {} (launched: {}, in flight: {})", to_string(m_state), to_string(s),
                   m_next_position, m_in_flight);
        m_state = s;
    }

    asio::io_context& m_ctx;
    strand_t m_strand;
    work_source<Out> m_work;
    std::shared_ptr<admission_gate> m_gate;
    cancel_source m_cancel;
    cancel_subscription m_cancel_link;
    async_callback<std::vector<Out>> m_done;

    run_state m_state = run_state::running;
    std::optional<work_thunk<Out>> m_held;
    std::vector<std::optional<Out>> m_results;
    std::size_t m_next_position = 0;
    std::size_t m_in_flight = 0;
    std::error_code m_first_error;
};

}  // namespace details

// Applies transform to every item of input with at most opts.max_concurrency transforms running
// at once and completes with the results in input order:
//
//   transform(in, cancel_token, done_callback<Out>)
//   done(std::error_code, std::vector<Out>)
//
// On the first failure no further items are admitted, the items already running are waited for
// and done gets that first error with an empty vector. Cancellation through opts.cancel ends the
// same way with map_err::cancelled. done is called exactly once, through ctx.
//
// Throws std::invalid_argument, before scheduling anything, when opts are invalid or input or
// transform is an empty function object.
template <class Out = void, class Sequence, class Transform, class Done>
void async_map_ordered(asio::io_context& ctx, Sequence input, Transform transform, const map_opts& opts, Done done) {
    using out_type = typename details::eager_out<Out, Done>::type;

    validate(opts);
    details::check_arguments(input, transform);

    const auto hint = size_hint(input);
    auto op = std::make_shared<details::eager_map_op<out_type>>(
        ctx, details::bind_work<out_type>(std::move(input), std::move(transform)), opts, hint,
        async_callback<std::vector<out_type>>(std::move(done), "mapkit::async_map_ordered done"));
    op->start();
}

}  // namespace mapkit
