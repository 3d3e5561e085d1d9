#pragma once

#include <ostream>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "interval.bound.hpp"
#include "interval.hpp"

template <BoundPoint T>
struct fmt::formatter<Bound<T>> : fmt::formatter<std::string_view> {
    auto format(const Bound<T>& b, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}({})", b.is_closed() ? "Included" : "Excluded", b.point());
    }
};

// [0, 2): each bracket follows its own bound
template <BoundPoint T>
struct fmt::formatter<Interval<T>> : fmt::formatter<std::string_view> {
    auto format(const Interval<T>& i, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}{}, {}{}", i.left_bound().is_open() ? '(' : '[', i.left_point(),
                              i.right_point(), i.right_bound().is_open() ? ')' : ']');
    }
};

template <BoundPoint T>
    requires fmt::is_formattable<T>::value
std::ostream& operator<<(std::ostream& out, const Bound<T>& b) {
    fmt::print(out, "{}", b);
    return out;
}

template <BoundPoint T>
    requires fmt::is_formattable<T>::value
std::ostream& operator<<(std::ostream& out, const Interval<T>& i) {
    fmt::print(out, "{}", i);
    return out;
}
