#pragma once

#include <mapkit/strand.hpp>

#include <function2/function2.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <system_error>
#include <utility>

namespace mapkit {

// Asynchronous counting gate. Bounds the number of work items executing at once.
//
// try_acquire/async_acquire/cancel/waiting must run on the gate's strand. release() may be called
// from anywhere, it hops onto the strand by itself. Waiters are completed through asio::post,
// never inline, and get the released slot handed over directly so a later try_acquire cannot
// overtake them.
class admission_gate : public std::enable_shared_from_this<admission_gate> {
   public:
    using acquire_handler_t = fu2::unique_function<void(std::error_code)>;

    // throws std::invalid_argument when capacity <= 0.
    admission_gate(strand_t strand, int capacity);

    admission_gate(const admission_gate&) = delete;
    admission_gate& operator=(const admission_gate&) = delete;

    bool try_acquire();
    void async_acquire(acquire_handler_t h);

    // fails every queued waiter with ec; all acquisitions after this fail with ec too.
    void cancel(std::error_code ec);

    // never fails. releasing more than was acquired is logged and ignored.
    void release() noexcept;

    int capacity() const noexcept { return m_capacity; }
    int in_use() const noexcept { return m_in_use.load(std::memory_order_acquire); }
    std::size_t waiting() const noexcept { return m_waiters.size(); }
    bool cancelled() const noexcept { return static_cast<bool>(m_cancel_ec); }

    const strand_t& get_executor() const noexcept { return m_strand; }

   private:
    void do_release();

    strand_t m_strand;
    const int m_capacity;
    std::atomic<int> m_in_use{0};
    std::error_code m_cancel_ec;
    std::deque<acquire_handler_t> m_waiters;
};

std::shared_ptr<admission_gate> make_admission_gate(strand_t strand, int capacity);

// Holds one acquired slot and gives it back exactly once: on release() or on destruction,
// whichever comes first. Keeps the gate alive for as long as the slot is held.
class admission_slot {
   public:
    admission_slot() = default;

    // adopts a slot the caller already acquired from gate.
    explicit admission_slot(std::shared_ptr<admission_gate> gate) : m_gate(std::move(gate)) {}

    ~admission_slot() { release(); }

    admission_slot(const admission_slot&) = delete;
    admission_slot& operator=(const admission_slot&) = delete;

    admission_slot(admission_slot&& rhs) noexcept : m_gate(std::move(rhs.m_gate)) {}

    admission_slot& operator=(admission_slot&& rhs) noexcept {
        if (this != &rhs) {
            release();
            m_gate = std::move(rhs.m_gate);
        }
        return *this;
    }

    void release() noexcept {
        if (auto gate = std::exchange(m_gate, nullptr)) {
            gate->release();
        }
    }

    explicit operator bool() const noexcept { return m_gate != nullptr; }

   private:
    std::shared_ptr<admission_gate> m_gate;
};

}  // namespace mapkit
