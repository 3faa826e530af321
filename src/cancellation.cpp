#include <mapkit/cancellation.hpp>
#include <mapkit/log.hpp>

#include <algorithm>

namespace mapkit {

namespace details {

bool cancel_state::request_cancel() {
    std::vector<std::pair<std::uint64_t, callback_t>> to_run;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_cancelled.exchange(true, std::memory_order_acq_rel)) {
            return false;
        }
        to_run.swap(m_callbacks);
    }
    // outside of the lock: callbacks are free to subscribe/unsubscribe or trip other states.
    for (auto& [id, cb] : to_run) {
        cb();
    }
    return true;
}

std::uint64_t cancel_state::subscribe(callback_t cb) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_cancelled.load(std::memory_order_acquire)) {
            auto id = m_next_id++;
            m_callbacks.emplace_back(id, std::move(cb));
            return id;
        }
    }
    cb();
    return 0;
}

void cancel_state::unsubscribe(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::find_if(m_callbacks.begin(), m_callbacks.end(), [id](auto& entry) { return entry.first == id; });
    if (it != m_callbacks.end()) {
        m_callbacks.erase(it);
    }
}

}  // namespace details

cancel_subscription::cancel_subscription(const cancel_token& token, fu2::unique_function<void()> cb) {
    if (!token.m_state) {
        // token that can never trip, nothing to wait for.
        return;
    }
    m_id = token.m_state->subscribe(std::move(cb));
    if (m_id != 0) {
        m_state = token.m_state;
    }
}

void cancel_subscription::reset() {
    if (m_id == 0) {
        return;
    }
    if (auto state = m_state.lock()) {
        state->unsubscribe(m_id);
    }
    m_state.reset();
    m_id = 0;
}

cancel_source::cancel_source() : m_state(std::make_shared<details::cancel_state>()) {}

cancel_source::~cancel_source() {
    if (m_deadline) {
        m_deadline->cancel();
    }
}

cancel_source cancel_source::linked(const cancel_token& parent) {
    cancel_source child;
    std::weak_ptr<details::cancel_state> weak_child = child.m_state;
    child.m_parent_link = cancel_subscription(parent, [weak_child] {
        if (auto state = weak_child.lock()) {
            state->request_cancel();
        }
    });
    return child;
}

void cancel_source::cancel_after(asio::io_context& ctx, std::chrono::steady_clock::duration d) {
    if (m_deadline) {
        m_deadline->cancel();
    }
    m_deadline = std::make_unique<asio::steady_timer>(ctx, d);

    std::weak_ptr<details::cancel_state> weak_state = m_state;
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    m_deadline->async_wait([weak_state, ms](std::error_code ec) {
        if (!ec) {
            if (auto state = weak_state.lock()) {
                if (state->request_cancel()) {
                    log::debug("cancel_source: deadline of {}ms expired", ms);
                }
            }
        } else if (ec != asio::error::operation_aborted) {
            log::warning("cancel_source: deadline timer error: {}", ec.message());
        }
    });
}

}  // namespace mapkit
