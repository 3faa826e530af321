#pragma once

#include <mapkit/errors.hpp>
#include <mapkit/log.hpp>

#include <function2/function2.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace mapkit {

namespace details {

template <class T>
struct func_type {
    using async_callback_t = fu2::unique_function<void(std::error_code, T)>;
};

template <>
struct func_type<void> {
    using async_callback_t = fu2::unique_function<void(std::error_code)>;
};

struct default_log_fns_t {
    template <class... Args>
    static void print_error_line(std::string_view fmt_str, Args&&... args) {
        log::error(fmt_str, std::forward<Args>(args)...);
    }
};

}  // namespace details

// Single-shot completion callback. If destroyed without being called it calls itself with
// map_err::not_called, so whoever waits on it is always released.
template <class T, class LogFns = details::default_log_fns_t>
class async_callback_impl_t {
   public:
    async_callback_impl_t() : m_cb(nullptr) {}

    template <class Callable,
              typename = std::enable_if_t<!std::is_same_v<std::decay_t<Callable>, async_callback_impl_t>>>
    async_callback_impl_t(Callable cb, std::string origin_tag = "mapkit")
        : m_cb(std::move(cb)), m_origin_tag(std::move(origin_tag)) {}

    ~async_callback_impl_t() { handle_not_called(); }

    async_callback_impl_t(const async_callback_impl_t&) = delete;
    async_callback_impl_t& operator=(const async_callback_impl_t&) = delete;

    async_callback_impl_t(async_callback_impl_t&& rhs) noexcept
        : m_cb(std::move(rhs.m_cb)),
          m_called(rhs.m_called.load(std::memory_order_relaxed)),
          m_origin_tag(std::move(rhs.m_origin_tag)) {
        rhs.m_cb = nullptr;
    }

    async_callback_impl_t& operator=(async_callback_impl_t&& rhs) {
        handle_not_called();
        m_cb = std::move(rhs.m_cb);
        rhs.m_cb = nullptr;
        m_called.store(rhs.m_called.load(std::memory_order_relaxed), std::memory_order_relaxed);
        m_origin_tag = std::move(rhs.m_origin_tag);
        return *this;
    }

    template <typename EnableWhenVoid = std::enable_if<std::is_same_v<T, void>>,
              typename = typename EnableWhenVoid::type>
    void operator()(const std::error_code& ec) {
        call_operator(ec);
    }

    template <typename Param = T,
              typename EnableWhenNonVoid = std::enable_if<!std::is_same_v<T, void>>,
              typename = typename EnableWhenNonVoid::type>
    void operator()(const std::error_code& ec, Param&& p) {
        call_operator(ec, std::forward<Param>(p));
    }

    explicit operator bool() const { return m_cb.operator bool(); }

    bool called() const { return m_called.load(std::memory_order_acquire); }

   private:
    template <class... Args>
    void call_operator(Args&&... args) {
        static_assert(std::is_invocable_v<decltype(m_cb), Args...>, "not invocable");

        if (!m_cb) {
            return;
        }
        if (!m_called.exchange(true, std::memory_order_acq_rel)) {
            std::invoke(m_cb, std::forward<Args>(args)...);
        } else {
            LogFns::print_error_line("{}: attempt to call the callback twice", m_origin_tag);
        }
    }

    void handle_not_called() {
        if (m_cb) {
            if (!m_called.exchange(true, std::memory_order_acq_rel)) {
                LogFns::print_error_line("{}: callback has not been called", m_origin_tag);
                if constexpr (std::is_same_v<T, void>) {
                    std::exchange(m_cb, nullptr)(make_error_code(errors::map_err::not_called));
                } else {
                    std::exchange(m_cb, nullptr)(make_error_code(errors::map_err::not_called), T{});
                }
            }
        }
    }

   private:
    typename details::func_type<T>::async_callback_t m_cb;
    std::atomic<bool> m_called{false};
    std::string m_origin_tag;
};

// Copyable form. The last copy going away uncalled is what triggers not_called.
template <class T>
class shared_async_callback_impl_t {
   public:
    explicit shared_async_callback_impl_t(async_callback_impl_t<T> cb)
        : m_cb_shared_ptr(std::make_shared<async_callback_impl_t<T>>(std::move(cb))) {}

    template <typename EnableWhenVoid = std::enable_if<std::is_same_v<T, void>>,
              typename = typename EnableWhenVoid::type>
    void operator()(const std::error_code& ec) const {
        (*m_cb_shared_ptr)(ec);
    }

    template <typename Param = T,
              typename EnableWhenNonVoid = std::enable_if<!std::is_same_v<T, void>>,
              typename = typename EnableWhenNonVoid::type>
    void operator()(const std::error_code& ec, Param&& p) const {
        (*m_cb_shared_ptr)(ec, std::forward<Param>(p));
    }

    explicit operator bool() const { return m_cb_shared_ptr && m_cb_shared_ptr->operator bool(); }

    bool called() const { return m_cb_shared_ptr->called(); }

   private:
    std::shared_ptr<async_callback_impl_t<T>> m_cb_shared_ptr;
};

template <class T>
shared_async_callback_impl_t<T> to_shared(async_callback_impl_t<T> cb) {
    return shared_async_callback_impl_t<T>(std::move(cb));
}

template <class T>
using async_callback = async_callback_impl_t<T>;

// what a transform receives to report its result.
template <class T>
using done_callback = shared_async_callback_impl_t<T>;

}  // namespace mapkit
