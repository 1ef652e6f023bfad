/*
* File: gpu_flags
* Project: prism
* Created on: 1/12/2026
*
* Description: Bitwise operators for enum class flags (clear masks and the like).
*/
#ifndef PRISM_GPU_FLAGS_HPP
#define PRISM_GPU_FLAGS_HPP

#include <type_traits>

namespace prism {

template <typename E>
struct is_flags_enum : std::false_type {};

template <typename E>
constexpr E operator| (E a, E b) {
    static_assert(is_flags_enum<E>::value, "enum is not a flags enum");
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(a) | static_cast<U>(b));
}

template <typename E>
constexpr E operator& (E a, E b) {
    static_assert(is_flags_enum<E>::value, "enum is not a flags enum");
    using U = std::underlying_type_t<E>;
    return static_cast<E>(static_cast<U>(a) & static_cast<U>(b));
}

template <typename E>
E& operator|=(E& a, E b) {
    a = (a | b);
    return a;
}

// true when any bit of `bit` is set in `value`
template <typename E>
constexpr bool hasFlag(E value, E bit) {
    static_assert(is_flags_enum<E>::value, "enum is not a flags enum");
    using U = std::underlying_type_t<E>;
    return (static_cast<U>(value) & static_cast<U>(bit)) != 0;
}

} // namespace prism

#endif //PRISM_GPU_FLAGS_HPP
