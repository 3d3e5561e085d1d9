#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <ranges>
#include <utility>
#include <vector>

#include <tl/expected.hpp>
#include <tl/optional.hpp>

#include "interval.bound.hpp"
#include "interval.error.hpp"
#include "logging.hpp"

template <typename T>
concept Subtractable = requires(const T& a, const T& b) {
    { a - b };
};

template <typename T>
concept ShiftableUp = requires(const T& a, const T& b) {
    { a + b } -> std::convertible_to<T>;
};

template <typename T>
concept ShiftableDown = requires(const T& a, const T& b) {
    { a - b } -> std::convertible_to<T>;
};

// left_point() <= right_point() always holds.
template <BoundPoint T>
class Interval {
public:
    using point_type = T;
    using bound_type = Bound<T>;

    Interval()
        requires std::default_initializable<T>
        : _start{}, _end{} {}

    // Bounds sharing a point merge by the union rule: right_open(p, p) is stored as [p, p].
    explicit Interval(const Bound<T>& start, const tl::optional<Bound<T>>& end = tl::nullopt)
        : _start{end ? start.union_or_least(*end) : start}, _end{end ? start.union_or_greatest(*end) : start} {}

    Interval(const Bound<T>& start, const Bound<T>& end) : Interval{start, tl::optional<Bound<T>>{end}} {}

    static Interval open(T start, T end) {
        return Interval{Bound<T>::excluded(std::move(start)), Bound<T>::excluded(std::move(end))};
    }

    static Interval closed(T start, T end) {
        return Interval{Bound<T>::included(std::move(start)), Bound<T>::included(std::move(end))};
    }

    static Interval left_open(T start, T end) {
        return Interval{Bound<T>::excluded(std::move(start)), Bound<T>::included(std::move(end))};
    }

    static Interval right_open(T start, T end) {
        return Interval{Bound<T>::included(std::move(start)), Bound<T>::excluded(std::move(end))};
    }

    static Interval from_point(const T& point) { return closed(point, point); }

    const T& left_point() const noexcept { return _start.point(); }
    const T& right_point() const noexcept { return _end.point(); }
    const Bound<T>& left_bound() const noexcept { return _start; }
    const Bound<T>& right_bound() const noexcept { return _end; }

    bool is_empty() const { return _start == _end && _start.is_open(); }

    tl::optional<Interval> into_non_empty() const {
        if (is_empty())
            return tl::nullopt;

        return *this;
    }

    bool contains(const T& point) const {
        return (_start.point() < point && point < _end.point()) || (point == _start.point() && _start.is_closed()) ||
               (point == _end.point() && _end.is_closed());
    }

    tl::optional<Interval> intersect(const Interval& other) const {
        if (is_empty() || other.is_empty())
            return tl::nullopt;

        const auto [a, b] = oriented(*this, other);
        if (a->right_point() < b->left_point() ||
            (a->right_point() == b->left_point() && (a->_end.is_open() || b->_start.is_open()))) {
            return tl::nullopt;
        }

        Bound<T> start = a->_start.intersect_or_greatest(b->_start);
        Bound<T> end = a->_end.intersect_or_least(b->_end);

        // [p, p] against (p, q): the narrowed bounds meet on an excluded point
        if (start.point() == end.point() && (start.is_open() || end.is_open()))
            return tl::nullopt;

        return Interval{RawBounds{}, std::move(start), std::move(end)};
    }

    tl::optional<Interval> union_with(const Interval& other) const {
        if (is_empty() && other.is_empty())
            return tl::nullopt;
        if (is_empty())
            return other;
        if (other.is_empty())
            return *this;

        const auto [a, b] = oriented(*this, other);
        if (a->right_point() < b->left_point() ||
            (a->right_point() == b->left_point() && a->_end.is_open() && b->_start.is_open())) {
            return tl::nullopt;
        }

        return Interval{RawBounds{}, a->_start.union_or_least(b->_start), a->_end.union_or_greatest(b->_end)};
    }

    template <std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, const Interval&>
    static tl::optional<Interval> enclose(R&& intervals) {
        tl::optional<Interval> hull;
        for (const Interval& next : intervals) {
            if (next.is_empty())
                continue;

            if (!hull) {
                hull = next;
            } else {
                hull = Interval{hull->_start.union_or_least(next._start), hull->_end.union_or_greatest(next._end)};
            }
        }

        return hull;
    }

    static tl::optional<Interval> enclose(std::initializer_list<Interval> intervals) {
        return enclose(std::views::all(intervals));
    }

    // Single pass, first match wins. Not minimal for unordered input.
    template <std::ranges::input_range R>
        requires std::convertible_to<std::ranges::range_reference_t<R>, const Interval&>
    static std::vector<Interval> normalize(R&& intervals) {
        std::vector<Interval> merged;
        for (const Interval& next : intervals) {
            if (next.is_empty())
                continue;

            bool append = true;
            for (Interval& item : merged) {
                if (tl::optional<Interval> joined = item.union_with(next)) {
                    item = *joined;
                    append = false;
                    break;
                }
            }

            if (append)
                merged.push_back(next);
        }

        return merged;
    }

    static std::vector<Interval> normalize(std::initializer_list<Interval> intervals) {
        return normalize(std::views::all(intervals));
    }

    auto width() const
        requires Subtractable<T>
    {
        return _end.point() - _start.point();
    }

    // A shift past the opposite bound swaps the two; the try_ variants refuse it instead.
    void left_crop(const T& amount)
        requires ShiftableUp<T>
    {
        reshape(_start.with_point(_start.point() + amount), _end);
    }

    void right_crop(const T& amount)
        requires ShiftableDown<T>
    {
        reshape(_start, _end.with_point(_end.point() - amount));
    }

    void left_extend(const T& amount)
        requires ShiftableDown<T>
    {
        reshape(_start.with_point(_start.point() - amount), _end);
    }

    void right_extend(const T& amount)
        requires ShiftableUp<T>
    {
        reshape(_start, _end.with_point(_end.point() + amount));
    }

    tl::expected<void, IntervalError> try_left_crop(const T& amount)
        requires ShiftableUp<T>
    {
        return try_reshape(_start.with_point(_start.point() + amount), _end);
    }

    tl::expected<void, IntervalError> try_right_crop(const T& amount)
        requires ShiftableDown<T>
    {
        return try_reshape(_start, _end.with_point(_end.point() - amount));
    }

    tl::expected<void, IntervalError> try_left_extend(const T& amount)
        requires ShiftableDown<T>
    {
        return try_reshape(_start.with_point(_start.point() - amount), _end);
    }

    tl::expected<void, IntervalError> try_right_extend(const T& amount)
        requires ShiftableUp<T>
    {
        return try_reshape(_start, _end.with_point(_end.point() + amount));
    }

    friend bool operator==(const Interval&, const Interval&) = default;

private:
    struct RawBounds {};

    // Caller guarantees start.point() <= end.point().
    Interval(RawBounds, Bound<T> start, Bound<T> end) : _start{std::move(start)}, _end{std::move(end)} {}

    static std::pair<const Interval*, const Interval*> oriented(const Interval& lhs, const Interval& rhs) noexcept {
        if (lhs.left_point() <= rhs.left_point())
            return {&lhs, &rhs};

        return {&rhs, &lhs};
    }

    void reshape(const Bound<T>& start, const Bound<T>& end) { *this = Interval{start, end}; }

    tl::expected<void, IntervalError> try_reshape(const Bound<T>& start, const Bound<T>& end) {
        if (end.point() < start.point()) {
            const IntervalError err{InvertedIntervalError{render_point(start.point()), render_point(end.point())}};
            log_interval_error(library_logger(), err);
            return tl::make_unexpected(err);
        }

        reshape(start, end);
        return {};
    }

    Bound<T> _start;
    Bound<T> _end;
};

template <BoundPoint T>
tl::expected<Interval<T>, IntervalError> require_non_empty(const Interval<T>& interval) {
    if (interval.is_empty())
        return tl::make_unexpected(IntervalError{EmptyIntervalError{render_point(interval.left_point())}});

    return interval;
}

template <BoundPoint T>
    requires HashablePoint<T>
struct std::hash<Interval<T>> {
    size_t operator()(const Interval<T>& i) const noexcept {
        return interval_hash_combine(std::hash<Bound<T>>{}(i.left_bound()), std::hash<Bound<T>>{}(i.right_bound()));
    }
};
