#ifndef POLY_BOOL_PRIMITIVES_HPP
#define POLY_BOOL_PRIMITIVES_HPP

#include <algorithm>
#include <limits>
#include <variant>
#include <span>

#include "base.hpp"


namespace poly_bool {

template<coordinate Coord> struct segment_t {
    point_t<Coord> a;
    point_t<Coord> b;

    segment_t() = default;
    constexpr segment_t(const point_t<Coord> &a,const point_t<Coord> &b) noexcept : a{a}, b{b} {}

    point_t<Coord> delta() const { return b - a; }
    Coord length() const { return vmag(b - a); }
    point_t<Coord> at(Coord t) const { return lerp(a,b,t); }
};

/* A half-infinite line. "direction" does not need to be normalized; the
parameter of a point on the ray is measured in multiples of "direction". */
template<coordinate Coord> struct ray_t {
    point_t<Coord> origin;
    point_t<Coord> direction;

    ray_t() = default;
    constexpr ray_t(const point_t<Coord> &origin,const point_t<Coord> &direction) noexcept
        : origin{origin}, direction{direction} {}

    point_t<Coord> at(Coord t) const { return origin + direction * t; }
};

/* Minimum bounding rectangle */
template<coordinate Coord> struct rect_t {
    point_t<Coord> lo;
    point_t<Coord> hi;

    static constexpr rect_t empty() noexcept {
        constexpr Coord inf = std::numeric_limits<Coord>::infinity();
        return {{inf,inf},{-inf,-inf}};
    }

    bool is_empty() const noexcept { return lo[0] > hi[0] || lo[1] > hi[1]; }

    void expand(const point_t<Coord> &p) noexcept {
        lo[0] = std::min(lo[0],p[0]);
        lo[1] = std::min(lo[1],p[1]);
        hi[0] = std::max(hi[0],p[0]);
        hi[1] = std::max(hi[1],p[1]);
    }

    void expand(const rect_t &r) noexcept {
        if(r.is_empty()) return;
        expand(r.lo);
        expand(r.hi);
    }

    bool overlaps(const rect_t &b,Coord epsilon = coord_ops<Coord>::epsilon()) const noexcept {
        return lo[0] <= b.hi[0] + epsilon && b.lo[0] <= hi[0] + epsilon
            && lo[1] <= b.hi[1] + epsilon && b.lo[1] <= hi[1] + epsilon;
    }

    bool contains(const point_t<Coord> &p,Coord epsilon = coord_ops<Coord>::epsilon()) const noexcept {
        return p[0] >= lo[0] - epsilon && p[0] <= hi[0] + epsilon
            && p[1] >= lo[1] - epsilon && p[1] <= hi[1] + epsilon;
    }
};

template<coordinate Coord> rect_t<Coord> segment_rect(const point_t<Coord> &a,const point_t<Coord> &b) noexcept {
    return {
        {std::min(a[0],b[0]),std::min(a[1],b[1])},
        {std::max(a[0],b[0]),std::max(a[1],b[1])}};
}

template<coordinate Coord,point_range<Coord> Points> rect_t<Coord> points_rect(Points &&points) {
    auto r = rect_t<Coord>::empty();
    for(auto &&p : points) r.expand(point_t<Coord>(p));
    return r;
}

/** The kinds of geometry the intersection dispatch understands */
template<coordinate Coord> using shape_t = std::variant<point_t<Coord>,segment_t<Coord>,ray_t<Coord>>;

struct no_intersection {};

/**
 * A single common point.
 *
 * `ta` and `tb` are the parameters of the point on the first and second
 * operand respectively: the ratio along a segment (exactly 0 or 1 when the
 * point is one of the segment's end points), the multiple of the direction
 * vector for a ray, and zero for a point.
 */
template<coordinate Coord> struct point_hit {
    point_t<Coord> p;
    Coord ta;
    Coord tb;
};

/**
 * Collinear operands sharing an interval.
 *
 * The end points of the interval are ordered by ascending `ta`. Each end
 * point is an end point of one of the two operands.
 */
template<coordinate Coord> struct overlap_hit {
    point_t<Coord> p[2];
    Coord ta[2];
    Coord tb[2];
    bool same_direction;
};

template<coordinate Coord> using intersection_t
    = std::variant<no_intersection,point_hit<Coord>,overlap_hit<Coord>>;

namespace detail {

template<coordinate Coord> Coord project_ratio(
    const point_t<Coord> &p,
    const point_t<Coord> &a,
    const point_t<Coord> &b)
{
    point_t<Coord> d = b - a;
    return vdot(p - a,d) / square(d);
}

/* Ratio of "p" on segment a-b, clamped to [0,1] and snapped to exactly 0 or 1
when within "epsilon" of an end point */
template<coordinate Coord> Coord snapped_ratio(
    const point_t<Coord> &p,
    const point_t<Coord> &a,
    const point_t<Coord> &b,
    Coord epsilon)
{
    if(approx_equal(p,a,epsilon)) return 0;
    if(approx_equal(p,b,epsilon)) return 1;
    return std::clamp(project_ratio(p,a,b),Coord(0),Coord(1));
}

template<coordinate Coord> point_hit<Coord> make_vertex_hit(
    const point_t<Coord> &p,
    const point_t<Coord> &a0,
    const point_t<Coord> &a1,
    const point_t<Coord> &b0,
    const point_t<Coord> &b1,
    Coord epsilon)
{
    return {p,snapped_ratio(p,a0,a1,epsilon),snapped_ratio(p,b0,b1,epsilon)};
}

template<coordinate Coord> overlap_hit<Coord> make_overlap(
    const point_t<Coord> &a0,
    const point_t<Coord> &a1,
    const point_t<Coord> &b0,
    const point_t<Coord> &b1,
    Coord lo,
    Coord hi,
    Coord tb0,
    Coord tb1,
    Coord epsilon)
{
    Coord tol = epsilon / vmag(a1 - a0);
    overlap_hit<Coord> r;
    r.same_direction = vdot(a1 - a0,b1 - b0) > 0;

    /* each end of the interval is a vertex; vertices of the first operand take
    precedence when both qualify */
    auto end_point = [&](Coord t,bool low) -> point_t<Coord> {
        if(low ? t <= tol : t >= 1 - tol) return low ? a0 : a1;
        return (coord_ops<Coord>::abs(tb0 - t) <= coord_ops<Coord>::abs(tb1 - t)) ? b0 : b1;
    };

    r.p[0] = end_point(lo,true);
    r.p[1] = end_point(hi,false);
    for(int i=0; i<2; ++i) {
        r.ta[i] = snapped_ratio(r.p[i],a0,a1,epsilon);
        r.tb[i] = snapped_ratio(r.p[i],b0,b1,epsilon);
    }
    return r;
}

template<coordinate Coord> intersection_t<Coord> collinear_intersection(
    const point_t<Coord> &a0,
    const point_t<Coord> &a1,
    const point_t<Coord> &b0,
    const point_t<Coord> &b1,
    Coord epsilon)
{
    Coord la = vmag(a1 - a0);
    Coord tb0 = project_ratio(b0,a0,a1);
    Coord tb1 = project_ratio(b1,a0,a1);
    Coord lo = std::max(Coord(0),std::min(tb0,tb1));
    Coord hi = std::min(Coord(1),std::max(tb0,tb1));

    if((lo - hi) * la > epsilon) return no_intersection{};

    if((hi - lo) * la <= epsilon) {
        // touching at a single point, which must be a shared end point
        point_t<Coord> mid = lerp(a0,a1,(lo+hi)/2);
        for(const point_t<Coord> *v : {&a0,&a1,&b0,&b1}) {
            if(approx_equal(*v,mid,epsilon)) return make_vertex_hit(*v,a0,a1,b0,b1,epsilon);
        }
        return make_vertex_hit(mid,a0,a1,b0,b1,epsilon);
    }

    return make_overlap(a0,a1,b0,b1,lo,hi,tb0,tb1,epsilon);
}

} // namespace detail

/**
 * Intersect segment a0-a1 with segment b0-b1.
 *
 * Both segments must have a length greater than zero. Points within `epsilon`
 * of each other are considered equal. When the intersection is at, or within
 * `epsilon` of, an end point of either segment, the returned point is exactly
 * that end point (end points of the first segment take precedence).
 */
template<coordinate Coord> intersection_t<Coord> segment_intersection(
    const point_t<Coord> &a0,
    const point_t<Coord> &a1,
    const point_t<Coord> &b0,
    const point_t<Coord> &b1,
    Coord epsilon = coord_ops<Coord>::epsilon())
{
    using ops = coord_ops<Coord>;

    point_t<Coord> da = a1 - a0;
    point_t<Coord> db = b1 - b0;
    Coord la = vmag(da);
    Coord lb = vmag(db);
    POLY_BOOL_ASSERT(la > 0 && lb > 0);

    // signed distances of each end point from the other segment's line
    Coord b0d = vcross(da,b0 - a0) / la;
    Coord b1d = vcross(da,b1 - a0) / la;
    Coord a0d = vcross(db,a0 - b0) / lb;
    Coord a1d = vcross(db,a1 - b0) / lb;

    if((ops::abs(b0d) <= epsilon && ops::abs(b1d) <= epsilon)
        || (ops::abs(a0d) <= epsilon && ops::abs(a1d) <= epsilon))
    {
        return detail::collinear_intersection(a0,a1,b0,b1,epsilon);
    }

    if((b0d > epsilon && b1d > epsilon) || (b0d < -epsilon && b1d < -epsilon)) return no_intersection{};
    if((a0d > epsilon && a1d > epsilon) || (a0d < -epsilon && a1d < -epsilon)) return no_intersection{};

    /* An end point lying on the other segment. The lines are not parallel, so
    all such end points are within a few epsilon of each other. */
    auto on_a = [&](const point_t<Coord> &p,Coord d) {
        if(ops::abs(d) > epsilon) return false;
        Coord t = detail::project_ratio(p,a0,a1);
        return t >= -epsilon/la && t <= 1 + epsilon/la;
    };
    auto on_b = [&](const point_t<Coord> &p,Coord d) {
        if(ops::abs(d) > epsilon) return false;
        Coord t = detail::project_ratio(p,b0,b1);
        return t >= -epsilon/lb && t <= 1 + epsilon/lb;
    };
    if(on_b(a0,a0d)) return detail::make_vertex_hit(a0,a0,a1,b0,b1,epsilon);
    if(on_b(a1,a1d)) return detail::make_vertex_hit(a1,a0,a1,b0,b1,epsilon);
    if(on_a(b0,b0d)) return detail::make_vertex_hit(b0,a0,a1,b0,b1,epsilon);
    if(on_a(b1,b1d)) return detail::make_vertex_hit(b1,a0,a1,b0,b1,epsilon);

    /* both pairs of end points straddle the other line by more than epsilon,
    so this is a proper crossing */
    if((b0d > 0) == (b1d > 0) || (a0d > 0) == (a1d > 0)) return no_intersection{};

    Coord denom = vcross(da,db);
    Coord t = std::clamp(vcross(b0 - a0,db) / denom,Coord(0),Coord(1));
    Coord u = std::clamp(vcross(b0 - a0,da) / denom,Coord(0),Coord(1));
    return point_hit<Coord>{lerp(a0,a1,t),t,u};
}

/* Distance from "p" to the closest point of segment a-b */
template<coordinate Coord> Coord segment_distance(
    const point_t<Coord> &p,
    const point_t<Coord> &a,
    const point_t<Coord> &b)
{
    point_t<Coord> d = b - a;
    Coord l2 = square(d);
    if(l2 == 0) return distance(p,a);
    Coord t = std::clamp(vdot(p - a,d) / l2,Coord(0),Coord(1));
    return distance(p,lerp(a,b,t));
}

template<coordinate Coord> bool point_on_segment(
    const point_t<Coord> &p,
    const point_t<Coord> &a,
    const point_t<Coord> &b,
    Coord epsilon = coord_ops<Coord>::epsilon())
{
    return segment_rect(a,b).contains(p,epsilon) && segment_distance(p,a,b) <= epsilon;
}

namespace detail {

/* Each overload handles one pair of geometry kinds. Pairs whose first operand
is of a "larger" kind than the second are handled by swapping the operands and
swapping the parameters of the result back. */
template<coordinate Coord> struct intersect_dispatch {
    Coord epsilon;

    static intersection_t<Coord> swapped(intersection_t<Coord> r) {
        if(auto *ph = std::get_if<point_hit<Coord>>(&r)) {
            std::swap(ph->ta,ph->tb);
        } else if(auto *oh = std::get_if<overlap_hit<Coord>>(&r)) {
            std::swap(oh->ta,oh->tb);
            if(oh->ta[0] > oh->ta[1]) {
                std::swap(oh->p[0],oh->p[1]);
                std::swap(oh->ta[0],oh->ta[1]);
                std::swap(oh->tb[0],oh->tb[1]);
            }
        }
        return r;
    }

    intersection_t<Coord> operator()(const point_t<Coord> &a,const point_t<Coord> &b) const {
        if(approx_equal(a,b,epsilon)) return point_hit<Coord>{a,0,0};
        return no_intersection{};
    }

    intersection_t<Coord> operator()(const point_t<Coord> &a,const segment_t<Coord> &b) const {
        if(!point_on_segment(a,b.a,b.b,epsilon)) return no_intersection{};
        return point_hit<Coord>{a,0,snapped_ratio(a,b.a,b.b,epsilon)};
    }

    intersection_t<Coord> operator()(const point_t<Coord> &a,const ray_t<Coord> &b) const {
        Coord t = vdot(a - b.origin,b.direction) / square(b.direction);
        if(t < 0) return operator()(a,b.origin);
        if(!approx_equal(a,b.at(t),epsilon)) return no_intersection{};
        return point_hit<Coord>{a,0,t};
    }

    intersection_t<Coord> operator()(const segment_t<Coord> &a,const segment_t<Coord> &b) const {
        return segment_intersection(a.a,a.b,b.a,b.b,epsilon);
    }

    /* The ray is truncated to a segment that reaches past the other operand,
    and the segment parameters are scaled back to ray parameters. */
    intersection_t<Coord> operator()(const ray_t<Coord> &a,const segment_t<Coord> &b) const {
        Coord reach = std::max(distance(a.origin,b.a),distance(a.origin,b.b)) + 1;
        Coord scale = reach / vmag(a.direction);
        intersection_t<Coord> r = segment_intersection(a.origin,a.at(scale),b.a,b.b,epsilon);
        if(auto *ph = std::get_if<point_hit<Coord>>(&r)) {
            ph->ta *= scale;
        } else if(auto *oh = std::get_if<overlap_hit<Coord>>(&r)) {
            oh->ta[0] *= scale;
            oh->ta[1] *= scale;
        }
        return r;
    }

    intersection_t<Coord> operator()(const ray_t<Coord> &a,const ray_t<Coord> &b) const {
        Coord reach = distance(a.origin,b.origin) + 1;
        segment_t<Coord> sb{b.origin,b.at(reach / vmag(b.direction))};
        intersection_t<Coord> r = operator()(a,sb);
        Coord scale = reach / vmag(b.direction);
        if(auto *ph = std::get_if<point_hit<Coord>>(&r)) {
            ph->tb *= scale;
        } else if(auto *oh = std::get_if<overlap_hit<Coord>>(&r)) {
            /* collinear rays pointing the same way overlap to infinity; only
            the shared start is reported */
            oh->tb[0] *= scale;
            oh->tb[1] *= scale;
        }
        return r;
    }

    intersection_t<Coord> operator()(const segment_t<Coord> &a,const point_t<Coord> &b) const {
        return swapped(operator()(b,a));
    }
    intersection_t<Coord> operator()(const ray_t<Coord> &a,const point_t<Coord> &b) const {
        return swapped(operator()(b,a));
    }
    intersection_t<Coord> operator()(const segment_t<Coord> &a,const ray_t<Coord> &b) const {
        return swapped(operator()(b,a));
    }
};

} // namespace detail

/**
 * Intersect any two supported geometry kinds.
 *
 * The pair of kinds selects the routine through `std::visit`.
 */
template<coordinate Coord> intersection_t<Coord> intersect(
    const shape_t<Coord> &a,
    const shape_t<Coord> &b,
    Coord epsilon = coord_ops<Coord>::epsilon())
{
    return std::visit(detail::intersect_dispatch<Coord>{epsilon},a,b);
}

/* Where a point is relative to a closed region */
enum class point_location {outside,inside,boundary};

/**
 * The winding number of a closed ring around "p".
 *
 * Each edge is tested against a ray cast straight up from "p". An edge going
 * in the negative X direction that the ray crosses counts +1, in the positive
 * X direction -1. The ranges are half-open so that a ray passing through a
 * vertex is counted once. A counter-clockwise ring around "p" yields 1.
 */
template<coordinate Coord> int winding_number(std::span<const point_t<Coord>> points,const point_t<Coord> &p) {
    int w = 0;
    std::size_t n = points.size();
    for(std::size_t i=0; i<n; ++i) {
        const point_t<Coord> &a = points[i];
        const point_t<Coord> &b = points[(i+1) % n];
        if(a[0] <= p[0]) {
            if(b[0] > p[0] && triangle_winding(a,b,p) < 0) --w;
        } else if(b[0] <= p[0]) {
            if(triangle_winding(a,b,p) > 0) ++w;
        }
    }
    return w;
}

template<coordinate Coord> bool on_ring_boundary(
    std::span<const point_t<Coord>> points,
    const point_t<Coord> &p,
    Coord epsilon = coord_ops<Coord>::epsilon())
{
    std::size_t n = points.size();
    for(std::size_t i=0; i<n; ++i) {
        if(point_on_segment(p,points[i],points[(i+1) % n],epsilon)) return true;
    }
    return false;
}

/* Locate "p" relative to the area enclosed by a ring, regardless of the ring's
orientation */
template<coordinate Coord> point_location locate_in_ring(
    std::span<const point_t<Coord>> points,
    const point_t<Coord> &p,
    Coord epsilon = coord_ops<Coord>::epsilon())
{
    if(on_ring_boundary(points,p,epsilon)) return point_location::boundary;
    return winding_number(points,p) != 0 ? point_location::inside : point_location::outside;
}

} // namespace poly_bool

#endif
