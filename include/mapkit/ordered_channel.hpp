#pragma once

#include <mapkit/errors.hpp>
#include <mapkit/strand.hpp>

#include <asio/post.hpp>

#include <function2/function2.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace mapkit {

// Result of one scheduled work item. Resolved exactly once, awaited by at most one waiter.
// Not thread-safe: resolve and async_wait both run on the owning engine's strand.
template <class T>
class pending_result {
   public:
    using wait_handler_t = fu2::unique_function<void(std::error_code, std::optional<T>)>;

    explicit pending_result(std::size_t position) : m_position(position) {}

    std::size_t position() const noexcept { return m_position; }
    bool ready() const noexcept { return m_resolved; }

    void resolve(std::error_code ec, std::optional<T> value) {
        if (m_resolved) {
            return;
        }
        m_resolved = true;
        m_ec = ec;
        m_value = std::move(value);
        if (m_waiter) {
            std::exchange(m_waiter, nullptr)(m_ec, std::move(m_value));
        }
    }

    // runs h right away when already resolved, otherwise from resolve().
    void async_wait(wait_handler_t h) {
        if (m_resolved) {
            h(m_ec, std::move(m_value));
            return;
        }
        m_waiter = std::move(h);
    }

   private:
    const std::size_t m_position;
    bool m_resolved = false;
    std::error_code m_ec;
    std::optional<T> m_value;
    wait_handler_t m_waiter;
};

// Bounded FIFO with one writer and one reader, both on the same strand.
//
// A write suspends while the buffer is full, a read suspends while it is empty. close() with an
// empty error code is a clean end of stream; with an error the reader gets it after the buffered
// items. Handlers of suspended operations are always completed through the strand.
template <class T>
class ordered_channel {
   public:
    using write_handler_t = fu2::unique_function<void(std::error_code)>;
    using read_handler_t = fu2::unique_function<void(std::error_code, std::optional<T>)>;

    ordered_channel(strand_t strand, std::size_t capacity) : m_strand(std::move(strand)), m_capacity(capacity) {
        if (capacity == 0) {
            throw std::invalid_argument("ordered_channel: capacity must be at least 1");
        }
    }

    ordered_channel(const ordered_channel&) = delete;
    ordered_channel& operator=(const ordered_channel&) = delete;

    // moves from v only when it returns true.
    bool try_write(T& v) {
        if (m_closed || m_pending_write || m_items.size() >= m_capacity) {
            return false;
        }
        push(std::move(v));
        return true;
    }

    void async_write(T v, write_handler_t h) {
        if (m_closed) {
            post(std::move(h), make_error_code(errors::map_err::channel_closed));
            return;
        }
        if (m_pending_write) {
            post(std::move(h), make_error_code(errors::map_err::channel_busy));
            return;
        }
        if (m_items.size() < m_capacity) {
            push(std::move(v));
            post(std::move(h), std::error_code());
            return;
        }
        m_pending_write.emplace(std::move(v), std::move(h));
    }

    void async_read(read_handler_t h) {
        if (m_pending_read) {
            post_read(std::move(h), make_error_code(errors::map_err::channel_busy), std::nullopt);
            return;
        }
        if (!m_items.empty()) {
            auto v = std::move(m_items.front());
            m_items.pop_front();
            admit_pending_write();
            post_read(std::move(h), std::error_code(), std::move(v));
            return;
        }
        if (m_closed) {
            post_read(std::move(h), m_close_ec, std::nullopt);
            return;
        }
        m_pending_read = std::move(h);
    }

    // idempotent, the first close decides the error code.
    void close(std::error_code ec = {}) {
        if (m_closed) {
            return;
        }
        m_closed = true;
        m_close_ec = ec;
        if (m_pending_write) {
            auto pending = std::move(*m_pending_write);
            m_pending_write.reset();
            post(std::move(pending.second), make_error_code(errors::map_err::channel_closed));
        }
        if (m_pending_read && m_items.empty()) {
            post_read(std::exchange(m_pending_read, nullptr), m_close_ec, std::nullopt);
        }
    }

    // fails a suspended writer, the value it was writing is dropped.
    void cancel_write(std::error_code ec) {
        if (m_pending_write) {
            auto pending = std::move(*m_pending_write);
            m_pending_write.reset();
            post(std::move(pending.second), ec);
        }
    }

    void cancel_read(std::error_code ec) {
        if (m_pending_read) {
            post_read(std::exchange(m_pending_read, nullptr), ec, std::nullopt);
        }
    }

    // drops everything buffered, used on teardown.
    void clear() { m_items.clear(); }

    std::size_t size() const noexcept { return m_items.size(); }
    std::size_t capacity() const noexcept { return m_capacity; }
    bool closed() const noexcept { return m_closed; }
    bool write_pending() const noexcept { return m_pending_write.has_value(); }
    bool read_pending() const noexcept { return static_cast<bool>(m_pending_read); }

   private:
    void push(T v) {
        if (m_pending_read) {
            post_read(std::exchange(m_pending_read, nullptr), std::error_code(), std::move(v));
            return;
        }
        m_items.push_back(std::move(v));
    }

    void admit_pending_write() {
        if (m_pending_write && m_items.size() < m_capacity) {
            auto pending = std::move(*m_pending_write);
            m_pending_write.reset();
            m_items.push_back(std::move(pending.first));
            post(std::move(pending.second), std::error_code());
        }
    }

    void post(write_handler_t h, std::error_code ec) {
        asio::post(m_strand, [h = std::move(h), ec]() mutable { h(ec); });
    }

    void post_read(read_handler_t h, std::error_code ec, std::optional<T> v) {
        asio::post(m_strand, [h = std::move(h), ec, v = std::move(v)]() mutable { h(ec, std::move(v)); });
    }

    strand_t m_strand;
    const std::size_t m_capacity;
    std::deque<T> m_items;
    std::optional<std::pair<T, write_handler_t>> m_pending_write;
    read_handler_t m_pending_read;
    bool m_closed = false;
    std::error_code m_close_ec;
};

}  // namespace mapkit
