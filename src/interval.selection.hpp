#pragma once

#include <algorithm>
#include <concepts>
#include <ranges>
#include <type_traits>
#include <utility>
#include <vector>

#include <tl/optional.hpp>

#include "interval.hpp"

template <typename I>
struct is_interval : std::false_type {};

template <BoundPoint T>
struct is_interval<Interval<T>> : std::true_type {};

template <typename R>
concept IntervalRange = std::ranges::input_range<R> && is_interval<std::ranges::range_value_t<R>>::value;

template <IntervalRange R>
using interval_of_t = std::ranges::range_value_t<R>;

template <IntervalRange R>
using interval_point_t = typename interval_of_t<R>::point_type;

template <typename W>
concept Summable = requires(const W& a, const W& b) {
    { a + b } -> std::convertible_to<W>;
};

template <typename P>
using point_difference_t = decltype(std::declval<const P&>() - std::declval<const P&>());

template <IntervalRange R>
bool contains_any(R&& intervals, const interval_point_t<R>& point) {
    return std::ranges::any_of(intervals, [&point](const interval_of_t<R>& i) { return i.contains(point); });
}

template <IntervalRange R>
tl::optional<interval_of_t<R>> find_containing(R&& intervals, const interval_point_t<R>& point) {
    for (const interval_of_t<R>& i : intervals) {
        if (i.contains(point))
            return i;
    }

    return tl::nullopt;
}

// Absent for an empty sequence or as soon as one step of the fold comes up empty.
template <IntervalRange R>
tl::optional<interval_of_t<R>> intersect_all(R&& intervals) {
    using interval_type = interval_of_t<R>;

    tl::optional<interval_type> common;
    bool first = true;
    for (const interval_type& next : intervals) {
        if (first) {
            common = next.into_non_empty();
            first = false;
        } else {
            common = common.and_then([&next](const interval_type& acc) { return acc.intersect(next); });
        }

        if (!common)
            return tl::nullopt;
    }

    return common;
}

// Overlapping stretches count once.
template <IntervalRange R>
    requires Subtractable<interval_point_t<R>> && Summable<point_difference_t<interval_point_t<R>>>
auto total_width(R&& intervals) {
    using interval_type = interval_of_t<R>;
    using width_type = point_difference_t<interval_point_t<R>>;

    std::vector<interval_type> sorted;
    for (const interval_type& i : intervals) {
        if (!i.is_empty())
            sorted.push_back(i);
    }

    std::ranges::sort(sorted, [](const interval_type& lhs, const interval_type& rhs) {
        return lhs.left_point() < rhs.left_point();
    });

    width_type total{};
    tl::optional<interval_type> run;
    for (const interval_type& next : sorted) {
        if (!run) {
            run = next;
        } else if (tl::optional<interval_type> joined = run->union_with(next)) {
            run = joined;
        } else {
            total = total + run->width();
            run = next;
        }
    }

    if (run)
        total = total + run->width();

    return total;
}
