#include <mapkit/admission_gate.hpp>
#include <mapkit/log.hpp>

#include <asio/dispatch.hpp>
#include <asio/post.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace mapkit {

admission_gate::admission_gate(strand_t strand, int capacity) : m_strand(std::move(strand)), m_capacity(capacity) {
    if (capacity <= 0) {
        throw std::invalid_argument(fmt::format("admission_gate: capacity must be positive, got {}", capacity));
    }
}

bool admission_gate::try_acquire() {
    if (m_cancel_ec || !m_waiters.empty()) {
        return false;
    }
    if (m_in_use.load(std::memory_order_relaxed) >= m_capacity) {
        return false;
    }
    m_in_use.fetch_add(1, std::memory_order_acq_rel);
    return true;
}

void admission_gate::async_acquire(acquire_handler_t h) {
    if (m_cancel_ec) {
        asio::post(m_strand, [h = std::move(h), ec = m_cancel_ec]() mutable { h(ec); });
        return;
    }
    if (try_acquire()) {
        asio::post(m_strand, [h = std::move(h)]() mutable { h(std::error_code()); });
        return;
    }
    m_waiters.push_back(std::move(h));
}

void admission_gate::cancel(std::error_code ec) {
    if (m_cancel_ec) {
        return;
    }
    m_cancel_ec = ec;
    while (!m_waiters.empty()) {
        auto h = std::move(m_waiters.front());
        m_waiters.pop_front();
        asio::post(m_strand, [h = std::move(h), ec]() mutable { h(ec); });
    }
}

void admission_gate::release() noexcept {
    try {
        asio::dispatch(m_strand, [self = shared_from_this()] { self->do_release(); });
    } catch (const std::exception& e) {
        // a release that cannot be scheduled must not take down the cleanup path running it.
        log::warning("admission_gate: release failed: {}", e.what());
    }
}

void admission_gate::do_release() {
    if (m_in_use.load(std::memory_order_relaxed) == 0) {
        log::warning("admission_gate: release without matching acquire ignored");
        return;
    }
    if (!m_waiters.empty()) {
        // slot passes straight to the oldest waiter, in_use stays the same.
        auto h = std::move(m_waiters.front());
        m_waiters.pop_front();
        asio::post(m_strand, [h = std::move(h)]() mutable { h(std::error_code()); });
        return;
    }
    m_in_use.fetch_sub(1, std::memory_order_acq_rel);
}

std::shared_ptr<admission_gate> make_admission_gate(strand_t strand, int capacity) {
    return std::make_shared<admission_gate>(std::move(strand), capacity);
}

}  // namespace mapkit
