#pragma once

#include <system_error>
#include <type_traits>

namespace mapkit::utils {

// T of a completion handler void(std::error_code, T); void for void(std::error_code).
template <class T>
struct result_type : public result_type<decltype(&T::operator())> {};

template <class ClassType, class T>
struct result_type<void (ClassType::*)(std::error_code, T) const> {
    using type = T;
};

template <class ClassType>
struct result_type<void (ClassType::*)(std::error_code) const> {
    using type = void;
};

template <class ClassType, class T>
struct result_type<void (ClassType::*)(std::error_code, T)> {
    using type = T;
};

template <class ClassType>
struct result_type<void (ClassType::*)(std::error_code)> {
    using type = void;
};

template <class T>
struct result_type<void (*)(std::error_code, T)> {
    using type = T;
};

template <typename AsioLikeCallable>
using result_type_t = typename result_type<AsioLikeCallable>::type;

}  // namespace mapkit::utils
