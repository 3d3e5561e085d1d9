#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>

template <typename T>
concept BoundPoint = std::totally_ordered<T> && std::copyable<T>;

enum class BoundKind : uint8_t {
    Included,
    Excluded,
};

template <BoundPoint T>
class Bound {
public:
    using point_type = T;

    Bound()
        requires std::default_initializable<T>
        : _kind{BoundKind::Included}, _point{} {}

    Bound(const BoundKind kind, T point) noexcept(std::is_nothrow_move_constructible_v<T>)
        : _kind{kind}, _point{std::move(point)} {}

    static Bound included(T point) { return Bound{BoundKind::Included, std::move(point)}; }
    static Bound excluded(T point) { return Bound{BoundKind::Excluded, std::move(point)}; }
    static Bound from_point(T point) { return included(std::move(point)); }

    BoundKind kind() const noexcept { return _kind; }
    const T& point() const noexcept { return _point; }
    bool is_closed() const noexcept { return _kind == BoundKind::Included; }
    bool is_open() const noexcept { return !is_closed(); }

    Bound with_point(T point) const { return Bound{_kind, std::move(point)}; }

    // At a shared point: closed only if both are closed.
    [[nodiscard]] Bound intersect_or_least(const Bound& other) const {
        if (_point == other._point)
            return is_closed() && other.is_closed() ? *this : excluded(_point);

        return _point < other._point ? *this : other;
    }

    [[nodiscard]] Bound intersect_or_greatest(const Bound& other) const {
        if (_point == other._point)
            return is_closed() && other.is_closed() ? *this : excluded(_point);

        return _point > other._point ? *this : other;
    }

    // At a shared point: closed if either is closed.
    [[nodiscard]] Bound union_or_least(const Bound& other) const {
        if (_point == other._point)
            return is_open() && other.is_open() ? *this : included(_point);

        return _point < other._point ? *this : other;
    }

    [[nodiscard]] Bound union_or_greatest(const Bound& other) const {
        if (_point == other._point)
            return is_open() && other.is_open() ? *this : included(_point);

        return _point > other._point ? *this : other;
    }

    friend bool operator==(const Bound&, const Bound&) = default;

private:
    BoundKind _kind;
    T _point;
};

inline size_t interval_hash_combine(const size_t seed, const size_t value) noexcept {
    return seed ^ (value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}

template <typename T>
concept HashablePoint = requires(const T& t) {
    { std::hash<T>{}(t) } -> std::convertible_to<size_t>;
};

template <BoundPoint T>
    requires HashablePoint<T>
struct std::hash<Bound<T>> {
    size_t operator()(const Bound<T>& b) const noexcept {
        return interval_hash_combine(std::hash<T>{}(b.point()), static_cast<size_t>(b.kind()));
    }
};
