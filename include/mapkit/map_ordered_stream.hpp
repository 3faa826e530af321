#pragma once

#include <mapkit/admission_gate.hpp>
#include <mapkit/async_callback.hpp>
#include <mapkit/cancellation.hpp>
#include <mapkit/errors.hpp>
#include <mapkit/log.hpp>
#include <mapkit/map_opts.hpp>
#include <mapkit/ordered_channel.hpp>
#include <mapkit/strand.hpp>
#include <mapkit/work.hpp>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

#include <function2/function2.hpp>

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace mapkit {

struct stream_stats {
    std::size_t launched = 0;
    std::size_t completed = 0;
    std::size_t delivered = 0;
    // most items ever launched but not yet handed to the consumer.
    std::size_t peak_undelivered = 0;
};

namespace details {

enum class consumer_state { open, ended, failed, closed };

// Shared state of one map_ordered_stream invocation.
//
// The producer (pump and friends) launches items in input order and writes their pending results
// into m_channel; the consumer (next and friends) reads them back in the same order and waits for
// each one to resolve. Both sides, and every completion, run on m_strand.
template <class Out>
class stream_state : public std::enable_shared_from_this<stream_state<Out>> {
   public:
    using handle_t = std::shared_ptr<pending_result<Out>>;
    using next_handler_t = fu2::unique_function<void(std::error_code, std::optional<Out>)>;
    using close_handler_t = fu2::unique_function<void(std::error_code)>;

    stream_state(asio::io_context& ctx, work_source<Out> work, const map_opts& opts, std::size_t capacity)
        : m_ctx(ctx),
          m_strand(make_strand(ctx)),
          m_work(std::move(work)),
          m_gate(make_admission_gate(m_strand, opts.max_concurrency)),
          m_channel(m_strand, capacity),
          m_cancel(cancel_source::linked(opts.cancel)) {}

    void start() {
        auto self = this->shared_from_this();
        std::weak_ptr<stream_state> weak_self = self;
        m_cancel_link = cancel_subscription(m_cancel.token(), [weak_self] {
            if (auto self = weak_self.lock()) {
                asio::post(self->m_strand, [self] { self->on_cancelled(); });
            }
        });
        log::debug("map_ordered_stream: max concurrency {}, channel capacity {}", m_gate->capacity(),
                   m_channel.capacity());
        asio::post(m_strand, [self] { self->pump(); });
    }

    void next(next_handler_t h) {
        if (m_next_handler) {
            post_user(std::move(h), make_error_code(errors::map_err::read_in_progress), std::nullopt);
            return;
        }
        if (m_consumer == consumer_state::ended) {
            post_user(std::move(h), std::error_code(), std::nullopt);
            return;
        }
        if (m_consumer != consumer_state::open) {
            post_user(std::move(h), make_error_code(errors::map_err::stream_closed), std::nullopt);
            return;
        }
        m_next_handler = std::move(h);
        if (m_cancel.cancelled()) {
            finish_consumer(consumer_state::failed, make_error_code(errors::map_err::cancelled));
            return;
        }
        m_channel.async_read([self = this->shared_from_this()](std::error_code ec, std::optional<handle_t> handle) {
            self->on_read(ec, std::move(handle));
        });
    }

    void close(close_handler_t h) {
        if (m_consumer == consumer_state::open) {
            finish_consumer(consumer_state::closed, make_error_code(errors::map_err::cancelled));
        }
        if (h) {
            if (m_state == run_state::stopped) {
                asio::post(m_ctx, [h = std::move(h)]() mutable { h(std::error_code()); });
            } else {
                m_close_waiters.push_back(std::move(h));
            }
        }
    }

    stream_stats stats() const {
        stream_stats s;
        s.launched = m_launched.load(std::memory_order_acquire);
        s.completed = m_completed.load(std::memory_order_acquire);
        s.delivered = m_delivered.load(std::memory_order_acquire);
        s.peak_undelivered = m_peak_undelivered.load(std::memory_order_acquire);
        return s;
    }

    std::size_t channel_capacity() const noexcept { return m_channel.capacity(); }

    const strand_t& get_executor() const noexcept { return m_strand; }

   private:
    ////////////////////////////////////////////////////////////////////////////////
    // producer

    void pump() {
        while (!m_producer_done) {
            if (m_cancel.cancelled()) {
                stop_producer(make_error_code(errors::map_err::cancelled));
                return;
            }
            if (m_first_error) {
                stop_producer(m_first_error);
                return;
            }

            std::error_code ec;
            auto work = pull_work(m_work, ec);
            if (ec) {
                stop_producer(ec);
                return;
            }
            if (!work) {
                stop_producer(std::error_code());
                return;
            }

            if (!m_gate->try_acquire()) {
                m_held = std::move(work);
                m_gate->async_acquire(
                    [self = this->shared_from_this()](std::error_code ec) { self->on_admitted(ec); });
                return;
            }
            if (!launch_and_write(std::move(*work))) {
                return;
            }
        }
    }

    void on_admitted(std::error_code ec) {
        auto work = std::exchange(m_held, std::nullopt);
        if (ec) {
            stop_producer(ec);
            return;
        }
        if (m_producer_done || !work || m_cancel.cancelled() || m_first_error) {
            m_gate->release();
            stop_producer(m_first_error ? m_first_error : make_error_code(errors::map_err::cancelled));
            return;
        }
        if (launch_and_write(std::move(*work))) {
            pump();
        }
    }

    // false when the write had to suspend; the producer resumes from on_written.
    bool launch_and_write(work_thunk<Out> work) {
        auto handle = launch(std::move(work));
        if (m_channel.try_write(handle)) {
            return true;
        }
        m_channel.async_write(std::move(handle),
                              [self = this->shared_from_this()](std::error_code ec) { self->on_written(ec); });
        return false;
    }

    void on_written(std::error_code ec) {
        if (ec) {
            stop_producer(ec == errors::map_err::channel_closed && m_first_error ? m_first_error : ec);
            return;
        }
        pump();
    }

    handle_t launch(work_thunk<Out> work) {
        auto handle = std::make_shared<pending_result<Out>>(m_next_position++);
        ++m_in_flight;
        const auto launched = m_launched.fetch_add(1, std::memory_order_acq_rel) + 1;
        const auto undelivered = launched - m_delivered.load(std::memory_order_acquire);
        if (undelivered > m_peak_undelivered.load(std::memory_order_relaxed)) {
            m_peak_undelivered.store(undelivered, std::memory_order_release);
        }

        admission_slot slot(m_gate);
        auto self = this->shared_from_this();
        auto done = to_shared(async_callback<Out>(
            [self, handle, slot = std::move(slot)](std::error_code ec, Out value) mutable {
                asio::post(self->m_strand, [self, handle, slot = std::move(slot), ec,
                                            value = std::move(value)]() mutable {
                    slot.release();
                    self->on_item_done(*handle, ec, std::move(value));
                });
            },
            "mapkit::map_ordered_stream"));

        asio::post(m_ctx, [work = std::move(work), token = m_cancel.token(), done = std::move(done)]() mutable {
            run_work(work, std::move(token), done);
        });
        return handle;
    }

    void on_item_done(pending_result<Out>& handle, std::error_code ec, Out value) {
        --m_in_flight;
        m_completed.fetch_add(1, std::memory_order_acq_rel);
        if (ec) {
            if (!m_first_error) {
                // stop admitting right away; the shared signal trips once the consumer reaches
                // this position, so items before it still finish undisturbed.
                m_first_error = ec;
                log::debug("map_ordered_stream: item {} failed, no further admissions: {}", handle.position(),
                           ec.message());
                m_gate->cancel(ec);
                m_channel.cancel_write(ec);
            }
            handle.resolve(ec, std::nullopt);
        } else {
            handle.resolve(ec, std::move(value));
        }
        maybe_stop();
    }

    void stop_producer(std::error_code ec) {
        if (m_producer_done) {
            return;
        }
        m_producer_done = true;
        m_held.reset();
        if (ec) {
            log::debug("map_ordered_stream: producer stopped after {} items: {}", m_next_position, ec.message());
        }
        m_channel.close(ec);
        if (m_state == run_state::running) {
            set_state(run_state::draining);
        }
        maybe_stop();
    }

    ////////////////////////////////////////////////////////////////////////////////
    // consumer

    void on_read(std::error_code ec, std::optional<handle_t> handle) {
        if (!m_next_handler) {
            // read was abandoned by cancellation or close.
            return;
        }
        if (!handle) {
            if (ec) {
                finish_consumer(consumer_state::failed, ec);
            } else {
                finish_consumer(consumer_state::ended, std::error_code());
            }
            return;
        }
        (*handle)->async_wait([self = this->shared_from_this()](std::error_code ec, std::optional<Out> value) {
            self->on_resolved(ec, std::move(value));
        });
    }

    void on_resolved(std::error_code ec, std::optional<Out> value) {
        if (!m_next_handler) {
            return;
        }
        m_delivered.fetch_add(1, std::memory_order_acq_rel);
        if (ec) {
            finish_consumer(consumer_state::failed, ec);
            return;
        }
        post_user(std::exchange(m_next_handler, nullptr), std::error_code(), std::move(value));
    }

    // ended, failed or closed: no more reads will be served, so everything gets torn down.
    void finish_consumer(consumer_state s, std::error_code ec) {
        m_consumer = s;
        if (m_next_handler) {
            post_user(std::exchange(m_next_handler, nullptr), ec, std::nullopt);
        }
        teardown();
    }

    ////////////////////////////////////////////////////////////////////////////////
    // teardown

    // trip the signal and wake the producer wherever it is suspended; maybe_stop then waits for
    // it to unwind and for the launched items before the invocation counts as stopped.
    void teardown() {
        const auto cancelled = make_error_code(errors::map_err::cancelled);
        m_cancel.cancel();
        m_gate->cancel(cancelled);
        m_channel.cancel_write(cancelled);
        m_channel.cancel_read(cancelled);
        m_channel.clear();
        maybe_stop();
    }

    void on_cancelled() {
        if (m_state == run_state::stopped) {
            return;
        }
        const auto cancelled = make_error_code(errors::map_err::cancelled);
        m_gate->cancel(cancelled);
        m_channel.cancel_write(cancelled);
        if (m_consumer == consumer_state::open && m_next_handler) {
            finish_consumer(consumer_state::failed, cancelled);
            return;
        }
        maybe_stop();
    }

    void maybe_stop() {
        if (m_state == run_state::stopped || !m_producer_done || m_in_flight != 0 ||
            m_consumer == consumer_state::open) {
            return;
        }
        set_state(run_state::stopped);
        m_cancel_link.reset();
        m_channel.clear();
        for (auto& h : m_close_waiters) {
            asio::post(m_ctx, [h = std::move(h)]() mutable { h(std::error_code()); });
        }
        m_close_waiters.clear();
    }

    void post_user(next_handler_t h, std::error_code ec, std::optional<Out> value) {
        asio::post(m_ctx, [h = std::move(h), ec, value = std::move(value)]() mutable { h(ec, std::move(value)); });
    }

    void set_state(run_state s) {
        log::debug("map_ordered_stream: {} -> {} (launched: {}, in flight: {})", to_string(m_state), to_string(s),
                   m_next_position, m_in_flight);
        m_state = s;
    }

    asio::io_context& m_ctx;
    strand_t m_strand;
    work_source<Out> m_work;
    std::shared_ptr<admission_gate> m_gate;
    ordered_channel<handle_t> m_channel;
    cancel_source m_cancel;
    cancel_subscription m_cancel_link;

    run_state m_state = run_state::running;
    bool m_producer_done = false;
    std::optional<work_thunk<Out>> m_held;
    std::size_t m_next_position = 0;
    std::size_t m_in_flight = 0;
    std::error_code m_first_error;

    consumer_state m_consumer = consumer_state::open;
    next_handler_t m_next_handler;
    std::vector<close_handler_t> m_close_waiters;

    std::atomic<std::size_t> m_launched{0};
    std::atomic<std::size_t> m_completed{0};
    std::atomic<std::size_t> m_delivered{0};
    std::atomic<std::size_t> m_peak_undelivered{0};
};

}  // namespace details

// Lazy, forward-only, ordered view over one map_ordered_stream invocation. Move-only. Destroying
// it closes the stream; launched items are still waited for in the background before the
// invocation's resources go away.
template <class Out>
class ordered_stream {
   public:
    using next_handler_t = typename details::stream_state<Out>::next_handler_t;
    using close_handler_t = typename details::stream_state<Out>::close_handler_t;

    ordered_stream() = default;
    explicit ordered_stream(std::shared_ptr<details::stream_state<Out>> state) : m_state(std::move(state)) {}

    ~ordered_stream() { close(); }

    ordered_stream(const ordered_stream&) = delete;
    ordered_stream& operator=(const ordered_stream&) = delete;

    ordered_stream(ordered_stream&& rhs) noexcept : m_state(std::move(rhs.m_state)) {}

    ordered_stream& operator=(ordered_stream&& rhs) noexcept {
        if (this != &rhs) {
            close();
            m_state = std::move(rhs.m_state);
        }
        return *this;
    }

    // h(ec, value): value in input order; std::nullopt with no error at the end of input.
    // one read at a time, the next one may be issued from h.
    void async_next(next_handler_t h) {
        asio::post(m_state->get_executor(),
                   [state = m_state, h = std::move(h)]() mutable { state->next(std::move(h)); });
    }

    // early termination; a pending read completes with map_err::cancelled.
    void close() {
        if (!m_state) {
            return;
        }
        asio::post(m_state->get_executor(), [state = m_state]() mutable { state->close(nullptr); });
    }

    // closes and calls h once every launched item has finished.
    void async_close(close_handler_t h) {
        asio::post(m_state->get_executor(),
                   [state = m_state, h = std::move(h)]() mutable { state->close(std::move(h)); });
    }

    stream_stats stats() const { return m_state->stats(); }
    std::size_t channel_capacity() const { return m_state->channel_capacity(); }

    explicit operator bool() const noexcept { return m_state != nullptr; }

   private:
    std::shared_ptr<details::stream_state<Out>> m_state;
};

// Streaming counterpart of async_map_ordered. Results are produced as soon as they are both
// complete and next in input order. The producer runs at most
// channel_capacity(max_concurrency, buffer_multiplier) handles ahead of the consumer.
//
// Throws std::invalid_argument, before scheduling anything, when opts are invalid or input or
// transform is an empty function object.
template <class Out, class Sequence, class Transform>
ordered_stream<Out> map_ordered_stream(asio::io_context& ctx,
                                       Sequence input,
                                       Transform transform,
                                       const map_opts& opts) {
    validate(opts);
    details::check_arguments(input, transform);

    const auto capacity = channel_capacity(opts.max_concurrency, opts.buffer_multiplier);
    auto state = std::make_shared<details::stream_state<Out>>(
        ctx, details::bind_work<Out>(std::move(input), std::move(transform)), opts, capacity);
    state->start();
    return ordered_stream<Out>(std::move(state));
}

namespace details {

template <class Out>
struct collect_state {
    ordered_stream<Out> stream;
    std::vector<Out> items;
    async_callback<std::vector<Out>> done;
};

template <class Out>
void collect_next(std::shared_ptr<collect_state<Out>> st) {
    st->stream.async_next([st](std::error_code ec, std::optional<Out> value) mutable {
        if (ec) {
            st->done(ec, std::vector<Out>());
            return;
        }
        if (!value) {
            st->done(std::error_code(), std::move(st->items));
            return;
        }
        st->items.push_back(std::move(*value));
        collect_next(std::move(st));
    });
}

}  // namespace details

// Reads stream to the end: h(std::error_code, std::vector<Out>).
template <class Out, class Handler>
void async_collect(ordered_stream<Out> stream, Handler h) {
    auto st = std::make_shared<details::collect_state<Out>>(details::collect_state<Out>{
        std::move(stream), {}, async_callback<std::vector<Out>>(std::move(h), "mapkit::async_collect")});
    details::collect_next(std::move(st));
}

}  // namespace mapkit
