#ifndef POLY_BOOL_BASE_HPP
#define POLY_BOOL_BASE_HPP

#include <cmath>
#include <cstddef>
#include <utility>
#include <type_traits>
#include <concepts>
#include <span>
#include <ranges>


#ifndef POLY_BOOL_ASSERT
#include <cassert>
#define POLY_BOOL_ASSERT assert
#endif

// used for checks that would drastically slow down the algorithm
#ifndef POLY_BOOL_ASSERT_SLOW
#define POLY_BOOL_ASSERT_SLOW(X) (void)0
#endif

#ifndef POLY_BOOL_DEBUG_LOG
#define POLY_BOOL_DEBUG_LOG(...) (void)0
#endif


namespace poly_bool {

/** Mathematical operations on coordinate types. This struct can be specialized
by users of this library. */
template<typename Coord> struct coord_ops {
    /** Two points closer than this, in either axis, are considered the same
    point. Inputs are expected to lie in a bounded working range, so the
    tolerance is absolute. */
    static constexpr Coord epsilon() noexcept { return Coord(1e-9); }

    static Coord sqrt(Coord x) { return std::sqrt(x); }
    static Coord abs(Coord x) { return std::abs(x); }
    static Coord atan2(Coord y,Coord x) { return std::atan2(y,x); }
};

template<> struct coord_ops<float> {
    static constexpr float epsilon() noexcept { return 1e-5f; }

    static float sqrt(float x) { return std::sqrt(x); }
    static float abs(float x) { return std::abs(x); }
    static float atan2(float y,float x) { return std::atan2(y,x); }
};

template<typename T> concept coordinate =
    std::floating_point<T>
    && requires(T c) {
        { coord_ops<T>::epsilon() } -> std::same_as<T>;
        { coord_ops<T>::sqrt(c) } -> std::same_as<T>;
        { coord_ops<T>::abs(c) } -> std::same_as<T>;
        { coord_ops<T>::atan2(c,c) } -> std::same_as<T>;
    };

/* Getters for point-like objects. This can be specialized by the user for other
types. Static functions "get_x" and "get_y" should be defined to get the X and Y
coordinates respectively. */
template<typename T> struct point_ops {};

template<typename T> struct point_ops<T[2]> {
    static constexpr const T &get_x(const T (&p)[2]) noexcept { return p[0]; }
    static constexpr const T &get_y(const T (&p)[2]) noexcept { return p[1]; }
};

template<typename T> struct point_ops<std::span<T,2>> {
    static constexpr const T &get_x(const std::span<T,2> &p) noexcept { return p[0]; }
    static constexpr const T &get_y(const std::span<T,2> &p) noexcept { return p[1]; }
};

template<typename T,typename Coord> concept point = requires(const T &v) {
    { point_ops<T>::get_x(v) } -> std::convertible_to<Coord>;
    { point_ops<T>::get_y(v) } -> std::convertible_to<Coord>;
};

template<typename T> struct point_t {
    T _data[2];

    point_t() = default;
    constexpr point_t(const T &x,const T &y) noexcept(std::is_nothrow_copy_constructible_v<T>)
        : _data{x,y} {}
    constexpr point_t(const point_t &b) = default;
    template<point<T> U> constexpr point_t(const U &b)
        noexcept(std::is_nothrow_copy_constructible_v<T>
            && noexcept(point_ops<U>::get_x(b))
            && noexcept(point_ops<U>::get_y(b)))
        : _data{
            static_cast<T>(point_ops<U>::get_x(b)),
            static_cast<T>(point_ops<U>::get_y(b))} {}

    constexpr point_t &operator=(const point_t &b) noexcept(std::is_nothrow_copy_constructible_v<T>) = default;

    constexpr T &operator[](std::size_t i) noexcept { return _data[i]; }
    constexpr const T &operator[](std::size_t i) const noexcept { return _data[i]; }

    constexpr T &x() noexcept { return _data[0]; }
    constexpr const T &x() const noexcept { return _data[0]; }
    constexpr T &y() noexcept { return _data[1]; }
    constexpr const T &y() const noexcept { return _data[1]; }

    constexpr T *begin() noexcept { return _data; }
    constexpr const T *begin() const noexcept { return _data; }
    constexpr T *end() noexcept { return _data+2; }
    constexpr const T *end() const noexcept { return _data+2; }

    constexpr std::size_t size() const noexcept { return 2; }

    constexpr point_t &operator+=(const point_t &b) {
        _data[0] += b[0];
        _data[1] += b[1];
        return *this;
    }

    constexpr point_t &operator-=(const point_t &b) {
        _data[0] -= b[0];
        _data[1] -= b[1];
        return *this;
    }

    constexpr point_t &operator*=(T b) {
        _data[0] *= b;
        _data[1] *= b;
        return *this;
    }

    constexpr point_t operator-() const {
        return {-_data[0],-_data[1]};
    }

    friend constexpr void swap(point_t &a,point_t &b) noexcept(std::is_nothrow_swappable_v<T>) {
        using std::swap;
        swap(a._data[0],b._data[0]);
        swap(a._data[1],b._data[1]);
    }
};

template<typename T> struct point_ops<point_t<T>> {
    static constexpr const T &get_x(const point_t<T> &p) noexcept { return p[0]; }
    static constexpr const T &get_y(const point_t<T> &p) noexcept { return p[1]; }
};

template<typename T>
constexpr point_t<T> operator+(const point_t<T> &a,const point_t<T> &b) {
    return {a[0]+b[0],a[1]+b[1]};
}

template<typename T>
constexpr point_t<T> operator-(const point_t<T> &a,const point_t<T> &b) {
    return {a[0]-b[0],a[1]-b[1]};
}

template<typename T>
constexpr point_t<T> operator*(const point_t<T> &a,T b) {
    return {a[0]*b,a[1]*b};
}
template<typename T>
constexpr point_t<T> operator*(T a,const point_t<T> &b) {
    return {a*b[0],a*b[1]};
}

/* Equality is exact. Tolerant comparison is done with "approx_equal". */
template<typename T>
constexpr bool operator==(const point_t<T> &a,const point_t<T> &b) {
    return a[0] == b[0] && a[1] == b[1];
}
template<typename T>
constexpr bool operator!=(const point_t<T> &a,const point_t<T> &b) {
    return a[0] != b[0] || a[1] != b[1];
}

/* A functor to provide STL containers an arbitrary but consistent order for
point_t */
struct point_less {
    template<typename T>
    constexpr bool operator()(const point_t<T> &a,const point_t<T> &b) const {
        return (a[0] == b[0]) ? (a[1] < b[1]) : (a[0] < b[0]);
    }
};

template<typename T> constexpr T vdot(const point_t<T> &a,const point_t<T> &b) {
    return a[0]*b[0] + a[1]*b[1];
}

/* The Z component of the 3D cross product of "a" and "b". Positive if "b" is
counter-clockwise from "a". */
template<typename T> constexpr T vcross(const point_t<T> &a,const point_t<T> &b) {
    return a[0]*b[1] - a[1]*b[0];
}

template<typename T> constexpr T square(const point_t<T> &a) {
    return vdot(a,a);
}

template<coordinate Coord> Coord vmag(const point_t<Coord> &x) {
    return coord_ops<Coord>::sqrt(square(x));
}

template<coordinate Coord> Coord distance(const point_t<Coord> &a,const point_t<Coord> &b) {
    return vmag(b - a);
}

/* True if "a" and "b" are within "epsilon" of each other in both axes */
template<coordinate Coord> bool approx_equal(
    const point_t<Coord> &a,
    const point_t<Coord> &b,
    Coord epsilon = coord_ops<Coord>::epsilon())
{
    return coord_ops<Coord>::abs(a[0]-b[0]) <= epsilon
        && coord_ops<Coord>::abs(a[1]-b[1]) <= epsilon;
}

template<coordinate Coord> point_t<Coord> lerp(const point_t<Coord> &a,const point_t<Coord> &b,Coord t) {
    return {a[0] + (b[0]-a[0])*t,a[1] + (b[1]-a[1])*t};
}

/* Returns a positive number if counter-clockwise, negative if clockwise and
zero if degenerate. The magnitude is twice the area of the triangle. */
template<coordinate Coord> constexpr Coord triangle_winding(
    const point_t<Coord> &p1,
    const point_t<Coord> &p2,
    const point_t<Coord> &p3)
{
    return vcross(p2 - p1,p3 - p1);
}


template<typename T,typename Coord> concept point_range
    = std::ranges::range<T> && point<std::ranges::range_value_t<T>,Coord>;

template<typename T,typename Coord> concept point_range_range
    = std::ranges::range<T> && point_range<std::ranges::range_value_t<T>,Coord>;

template<coordinate Coord> class winding_dir_sink {
    point_t<Coord> first;
    point_t<Coord> prev;
    Coord r;

public:
    winding_dir_sink(point_t<Coord> first)
        : first{first}, prev{first}, r(0) {}

    void operator()(point_t<Coord> p) {
        r += vcross(prev,p);
        prev = p;
    }

    Coord close() {
        return r + vcross(prev,first);
    }
};

/** Returns a positive number if counter-clockwise, negative if clockwise and
zero if degenerate.

The magnitude of the return value is two times the area of the polygon (the
shoelace formula).*/
template<coordinate Coord,point_range<Coord> Points>
Coord winding_dir(Points &&points) {
    auto itr = std::ranges::begin(points);
    auto end = std::ranges::end(points);
    if(itr == end) return 0;

    winding_dir_sink<Coord> sink{point_t<Coord>(*itr)};
    while(++itr != end) sink(point_t<Coord>(*itr));
    return sink.close();
}

} // namespace poly_bool

#endif
