#pragma once

#include <charconv>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace va {

namespace detail {

template <typename T, typename = void>
struct is_iterable : std::false_type {};

template <typename T>
struct is_iterable<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                                  decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

template <typename T>
constexpr bool is_string_like_v = std::is_convertible_v<const T&, std::string_view>;

}  // namespace detail

template <typename T>
std::string describe(const T& value);

// Describes a value nested inside a collection: strings are quoted.
template <typename T>
std::string describeElement(const T& value) {
    if constexpr (detail::is_string_like_v<T>) {
        return "\"" + std::string(std::string_view(value)) + "\"";
    } else {
        return describe(value);
    }
}

// Shortest round-trip text of a floating point value. Whole numbers keep a
// trailing ".0" so 3.0 reads "3.0" rather than "3".
template <typename T>
std::string describeFloatingPoint(T value) {
    char buffer[64];
    auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc()) {
        std::ostringstream os;
        os << value;
        return os.str();
    }
    std::string out(buffer, end);
    if (out.find_first_of(".en") == std::string::npos) {
        out += ".0";
    }
    return out;
}

// Renders a value for use in an error message: "4", "2.5", "foo", "true",
// "[1, 2, 3]", "[\"a\", \"b\"]".
template <typename T>
std::string describe(const T& value) {
    if constexpr (std::is_same_v<T, bool>) {
        return value ? "true" : "false";
    } else if constexpr (std::is_floating_point_v<T>) {
        return describeFloatingPoint(value);
    } else if constexpr (std::is_same_v<T, char>) {
        return std::string(1, value);
    } else if constexpr (detail::is_string_like_v<T>) {
        return std::string(std::string_view(value));
    } else if constexpr (detail::is_iterable<T>::value) {
        std::string out = "[";
        bool first = true;
        for (const auto& item : value) {
            if (!first) out += ", ";
            first = false;
            out += describeElement(item);
        }
        out += "]";
        return out;
    } else {
        std::ostringstream os;
        os << value;
        return os.str();
    }
}

}  // namespace va
