#pragma once

#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <function2/function2.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace mapkit {

namespace details {

class cancel_state {
   public:
    using callback_t = fu2::unique_function<void()>;

    bool cancelled() const noexcept { return m_cancelled.load(std::memory_order_acquire); }

    // returns true only for the call that tripped the state.
    bool request_cancel();

    // 0 means the callback already ran because the state was tripped.
    std::uint64_t subscribe(callback_t cb);
    void unsubscribe(std::uint64_t id);

   private:
    std::atomic<bool> m_cancelled{false};
    std::mutex m_mutex;
    std::uint64_t m_next_id = 1;
    std::vector<std::pair<std::uint64_t, callback_t>> m_callbacks;
};

}  // namespace details

class cancel_token {
   public:
    // never cancelled.
    cancel_token() = default;

    bool cancelled() const noexcept { return m_state && m_state->cancelled(); }
    bool can_be_cancelled() const noexcept { return m_state != nullptr; }

   private:
    friend class cancel_source;
    friend class cancel_subscription;

    explicit cancel_token(std::shared_ptr<details::cancel_state> state) : m_state(std::move(state)) {}

    std::shared_ptr<details::cancel_state> m_state;
};

// Runs a callback once when the token trips. Unregisters on destruction. The callback may run on
// whichever thread trips the token, so it should only capture things it can safely outlive.
class cancel_subscription {
   public:
    cancel_subscription() = default;
    cancel_subscription(const cancel_token& token, fu2::unique_function<void()> cb);
    ~cancel_subscription() { reset(); }

    cancel_subscription(const cancel_subscription&) = delete;
    cancel_subscription& operator=(const cancel_subscription&) = delete;

    cancel_subscription(cancel_subscription&& rhs) noexcept
        : m_state(std::move(rhs.m_state)), m_id(std::exchange(rhs.m_id, 0)) {}

    cancel_subscription& operator=(cancel_subscription&& rhs) noexcept {
        if (this != &rhs) {
            reset();
            m_state = std::move(rhs.m_state);
            m_id = std::exchange(rhs.m_id, 0);
        }
        return *this;
    }

    void reset();

   private:
    std::weak_ptr<details::cancel_state> m_state;
    std::uint64_t m_id = 0;
};

class cancel_source {
   public:
    cancel_source();
    ~cancel_source();

    cancel_source(const cancel_source&) = delete;
    cancel_source& operator=(const cancel_source&) = delete;
    cancel_source(cancel_source&&) noexcept = default;
    cancel_source& operator=(cancel_source&&) noexcept = default;

    // trips when parent trips or when cancelled directly; never the other way round.
    static cancel_source linked(const cancel_token& parent);

    cancel_token token() const { return cancel_token(m_state); }

    bool cancel() { return m_state->request_cancel(); }
    bool cancelled() const noexcept { return m_state->cancelled(); }

    // arms a deadline; calling it again replaces the previous one.
    void cancel_after(asio::io_context& ctx, std::chrono::steady_clock::duration d);

   private:
    std::shared_ptr<details::cancel_state> m_state;
    cancel_subscription m_parent_link;
    std::unique_ptr<asio::steady_timer> m_deadline;
};

}  // namespace mapkit
