#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

// An input sequence is any callable returning std::optional<T>; std::nullopt ends it. The engines
// pull it once per item, left to right, and stop pulling after the first nullopt. Sequences may
// be unbounded.
namespace mapkit {

template <class Sequence>
using sequence_value_t = typename std::invoke_result_t<Sequence&>::value_type;

namespace details {

template <class Container>
struct container_source {
    using value_type = std::decay_t<decltype(*std::begin(std::declval<Container&>()))>;

    // the container lives on the heap so the iterator survives moves of the source itself.
    explicit container_source(Container c)
        : m_c(std::make_shared<Container>(std::move(c))), m_it(std::begin(*m_c)) {}

    std::optional<value_type> operator()() {
        if (m_it == std::end(*m_c)) {
            return std::nullopt;
        }
        return std::optional<value_type>(std::move(*m_it++));
    }

    std::size_t size_hint() const { return static_cast<std::size_t>(std::distance(std::begin(*m_c), std::end(*m_c))); }

    std::shared_ptr<Container> m_c;
    decltype(std::begin(std::declval<Container&>())) m_it;
};

template <class Iter>
struct range_source {
    using value_type = typename std::iterator_traits<Iter>::value_type;

    std::optional<value_type> operator()() {
        if (m_first == m_last) {
            return std::nullopt;
        }
        return std::optional<value_type>(*m_first++);
    }

    Iter m_first;
    Iter m_last;
};

template <class Sequence>
struct take_source {
    std::optional<sequence_value_t<Sequence>> operator()() {
        if (m_left == 0) {
            return std::nullopt;
        }
        --m_left;
        auto v = m_seq();
        if (!v) {
            m_left = 0;
        }
        return v;
    }

    Sequence m_seq;
    std::size_t m_left;
};

template <class T, class = void>
struct has_size_hint : std::false_type {};

template <class T>
struct has_size_hint<T, std::void_t<decltype(std::declval<const T&>().size_hint())>> : std::true_type {};

}  // namespace details

// takes ownership; elements are moved out as they are pulled.
template <class Container>
auto from_container(Container c) {
    return details::container_source<Container>(std::move(c));
}

// does not own the elements, they are copied. [first, last) must outlive the invocation.
template <class Iter>
auto from_range(Iter first, Iter last) {
    return details::range_source<Iter>{std::move(first), std::move(last)};
}

// gen() -> std::optional<T>
template <class Generator>
auto from_generator(Generator gen) {
    static_assert(std::is_invocable_v<Generator&>, "generator must be callable without arguments");
    return gen;
}

template <class Sequence>
auto take(Sequence seq, std::size_t n) {
    return details::take_source<Sequence>{std::move(seq), n};
}

// number of items when the sequence knows it upfront, 0 otherwise. only used for reservation.
template <class Sequence>
std::size_t size_hint(const Sequence& seq) {
    if constexpr (details::has_size_hint<Sequence>::value) {
        return seq.size_hint();
    } else {
        return 0;
    }
}

}  // namespace mapkit
