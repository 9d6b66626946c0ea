#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace hcodec {

namespace detail {

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

} // namespace detail

// Printable rendering of a symbol for error messages and reports.
// int8_t/uint8_t symbols print as numbers, not characters.
template <typename T>
std::string describe_symbol(const T& symbol) {
    if constexpr (std::is_same_v<T, signed char> || std::is_same_v<T, unsigned char>) {
        return std::to_string(static_cast<int>(symbol));
    } else if constexpr (detail::is_streamable<T>::value) {
        std::ostringstream oss;
        oss << symbol;
        return oss.str();
    } else {
        return "<unprintable symbol>";
    }
}

} // namespace hcodec
