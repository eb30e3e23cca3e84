#ifndef POLY_BOOL_POLYGON_HPP
#define POLY_BOOL_POLYGON_HPP

#include <vector>
#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <utility>
#include <span>

#include "base.hpp"
#include "primitives.hpp"


namespace poly_bool {

/**
 * A closed loop of points.
 *
 * The first and last points are implicitly connected; a closing point equal
 * to the first point is not stored. Counter-clockwise rings enclose area and
 * clockwise rings remove area. `hole()` is the producer's claim about which of
 * the two this ring is. The boolean operations compare the claim with the
 * actual winding and reconcile them.
 *
 * A ring is immutable after construction.
 */
template<coordinate Coord> class ring {
    std::vector<point_t<Coord>> _points;
    bool _hole;

    void validate() {
        for(const auto &p : _points) {
            if(!std::isfinite(p[0]) || !std::isfinite(p[1])) {
                throw std::invalid_argument("ring contains a non-finite coordinate");
            }
        }

        /* consecutive duplicates contribute nothing */
        _points.erase(std::unique(_points.begin(),_points.end()),_points.end());
        while(_points.size() > 1 && _points.back() == _points.front()) _points.pop_back();

        /* points that repeat further apart, as in A B A B, still only count
        once */
        std::vector<point_t<Coord>> distinct(_points);
        std::ranges::sort(distinct,point_less{});
        distinct.erase(std::unique(distinct.begin(),distinct.end()),distinct.end());

        if(distinct.size() < 3) {
            throw std::invalid_argument("a ring requires at least 3 distinct points");
        }
    }

public:
    using value_type = point_t<Coord>;
    using const_iterator = typename std::vector<point_t<Coord>>::const_iterator;
    using iterator = const_iterator;

    ring(std::initializer_list<point_t<Coord>> points,bool hole=false)
        : _points(points), _hole(hole)
    {
        validate();
    }

    template<point_range<Coord> R>
    requires (!std::same_as<std::remove_cvref_t<R>,ring>)
    explicit ring(R &&points,bool hole=false) : _hole(hole) {
        for(auto &&p : points) _points.emplace_back(p);
        validate();
    }

    ring(const ring&) = default;
    ring(ring&&) = default;
    ring &operator=(const ring&) = default;
    ring &operator=(ring&&) = default;

    std::size_t size() const noexcept { return _points.size(); }
    const point_t<Coord> &operator[](std::size_t i) const noexcept { return _points[i]; }
    const_iterator begin() const noexcept { return _points.begin(); }
    const_iterator end() const noexcept { return _points.end(); }
    std::span<const point_t<Coord>> points() const noexcept { return _points; }

    bool hole() const noexcept { return _hole; }

    /** Twice the signed area: positive if counter-clockwise */
    Coord winding() const { return winding_dir<Coord>(_points); }

    /** Positive if counter-clockwise, negative if clockwise */
    Coord signed_area() const { return winding() / 2; }

    Coord area() const { return coord_ops<Coord>::abs(signed_area()); }

    bool clockwise() const { return winding() < 0; }

    rect_t<Coord> bounds() const { return points_rect<Coord>(_points); }

    /** Locate a point relative to the area this ring encloses, ignoring the
    ring's orientation and hole flag */
    point_location locate(const point_t<Coord> &p,Coord epsilon = coord_ops<Coord>::epsilon()) const {
        if(!bounds().contains(p,epsilon)) return point_location::outside;
        return locate_in_ring<Coord>(_points,p,epsilon);
    }

    /** The same points in reverse order with the same hole flag */
    ring reversed() const {
        return ring(_points | std::views::reverse,_hole);
    }

    /** The same points in reverse order with the opposite hole flag. This turns
    a fill into a hole and vice versa. */
    ring inverted() const {
        return ring(_points | std::views::reverse,!_hole);
    }

    ring with_hole(bool hole) const {
        ring r = *this;
        r._hole = hole;
        return r;
    }

    friend bool operator==(const ring &a,const ring &b) {
        return a._hole == b._hole && a._points == b._points;
    }
};

/**
 * An ordered collection of rings.
 *
 * The order of the rings carries no geometric meaning. A polygon whose
 * outermost rings are holes covers the whole plane except those holes.
 */
template<coordinate Coord> class polygon {
    std::vector<ring<Coord>> _rings;

public:
    using value_type = ring<Coord>;
    using const_iterator = typename std::vector<ring<Coord>>::const_iterator;
    using iterator = const_iterator;

    polygon() = default;
    polygon(std::initializer_list<ring<Coord>> rings) : _rings(rings) {}
    explicit polygon(std::vector<ring<Coord>> rings) : _rings(std::move(rings)) {}
    explicit polygon(ring<Coord> r) { _rings.push_back(std::move(r)); }
    polygon(std::initializer_list<point_t<Coord>> points,bool hole=false) {
        _rings.emplace_back(points,hole);
    }

    template<std::ranges::range R>
    requires (std::convertible_to<std::ranges::range_value_t<R>,ring<Coord>>
        && !std::same_as<std::remove_cvref_t<R>,polygon>)
    explicit polygon(R &&rings) {
        for(auto &&r : rings) _rings.emplace_back(r);
    }

    std::size_t size() const noexcept { return _rings.size(); }
    bool empty() const noexcept { return _rings.empty(); }
    const ring<Coord> &operator[](std::size_t i) const noexcept { return _rings[i]; }
    const_iterator begin() const noexcept { return _rings.begin(); }
    const_iterator end() const noexcept { return _rings.end(); }

    /** Sum of the signed areas of all the rings */
    Coord signed_area() const {
        Coord r = 0;
        for(const auto &rg : _rings) r += rg.signed_area();
        return r;
    }

    rect_t<Coord> bounds() const {
        auto r = rect_t<Coord>::empty();
        for(const auto &rg : _rings) r.expand(rg.bounds());
        return r;
    }

    /** Locate a point relative to the area this polygon covers.

    Every call reconciles the hole flags and works out the nesting of the
    rings, which takes time quadratic in the number of rings. Use
    `polygon_locator` to query many points against the same polygon. */
    point_location locate(const point_t<Coord> &p,Coord epsilon = coord_ops<Coord>::epsilon()) const;

    bool contains(const point_t<Coord> &p,Coord epsilon = coord_ops<Coord>::epsilon()) const {
        return locate(p,epsilon) == point_location::inside;
    }

    friend bool operator==(const polygon &a,const polygon &b) {
        return a._rings == b._rings;
    }
};

namespace detail {

/* Is ring "inner" inside the area enclosed by ring "outer"? The first vertex of
"inner" that is not on the boundary of "outer" decides. If every vertex is on
the boundary, the midpoints of the edges are tried. Rings with the exact same
boundary are considered to be inside each other. */
template<coordinate Coord> bool ring_inside_ring(
    std::span<const point_t<Coord>> inner,
    std::span<const point_t<Coord>> outer,
    Coord epsilon)
{
    for(const auto &p : inner) {
        point_location loc = locate_in_ring(outer,p,epsilon);
        if(loc != point_location::boundary) return loc == point_location::inside;
    }
    for(std::size_t i=0; i<inner.size(); ++i) {
        point_t<Coord> mid = lerp(inner[i],inner[(i+1) % inner.size()],Coord(0.5));
        point_location loc = locate_in_ring(outer,mid,epsilon);
        if(loc != point_location::boundary) return loc == point_location::inside;
    }
    return true;
}

/* For each ring, the number of other rings that enclose it. Rings with the same
boundary as one another are only counted in one direction, the later ring being
inside the earlier one. */
template<coordinate Coord,typename RingSpans,typename Out> void nesting_depths(
    const RingSpans &rings,
    Out &depths,
    Coord epsilon)
{
    std::size_t n = std::ranges::size(rings);
    depths.assign(n,0);
    std::vector<rect_t<Coord>> bounds;
    bounds.reserve(n);
    for(const auto &r : rings) bounds.push_back(points_rect<Coord>(r));

    for(std::size_t i=0; i<n; ++i) {
        for(std::size_t j=0; j<n; ++j) {
            if(i == j || !bounds[j].overlaps(bounds[i],epsilon)) continue;
            if(!ring_inside_ring<Coord>(rings[i],rings[j],epsilon)) continue;
            if(ring_inside_ring<Coord>(rings[j],rings[i],epsilon) && i < j) continue;
            ++depths[i];
        }
    }
}

/* A set of oriented rings covers the plane outside of them if any of the rings
that is not enclosed by another ring is clockwise */
template<coordinate Coord,typename RingSpans,typename Depths> bool is_unbounded(
    const RingSpans &rings,
    const Depths &depths)
{
    std::size_t n = std::ranges::size(rings);
    for(std::size_t i=0; i<n; ++i) {
        if(depths[i] == 0 && winding_dir<Coord>(rings[i]) < 0) return true;
    }
    return false;
}

/**
 * Locate a point relative to the region covered by a set of oriented rings.
 *
 * The region is what the sum of the winding numbers says it is, shifted by one
 * when the rings are unbounded.
 */
template<coordinate Coord,typename RingSpans,typename Bounds> point_location locate_in_rings(
    const RingSpans &rings,
    const Bounds &bounds,
    bool unbounded,
    const point_t<Coord> &p,
    Coord epsilon)
{
    int w = unbounded ? 1 : 0;
    std::size_t n = std::ranges::size(rings);
    for(std::size_t i=0; i<n; ++i) {
        if(!bounds[i].contains(p,epsilon)) continue;
        std::span<const point_t<Coord>> pts = rings[i];
        if(on_ring_boundary(pts,p,epsilon)) return point_location::boundary;
        w += winding_number(pts,p);
    }
    return w > 0 ? point_location::inside : point_location::outside;
}

/* Copy the rings of a polygon into "out", each oriented to agree with its hole
flag, or with its nesting parity when the flag and the winding disagree */
template<coordinate Coord,typename Out> void oriented_rings(
    const polygon<Coord> &poly,
    Out &out,
    Coord epsilon)
{
    std::vector<std::span<const point_t<Coord>>> spans;
    for(const auto &r : poly) spans.push_back(r.points());
    std::vector<int> depths;
    nesting_depths<Coord>(spans,depths,epsilon);

    out.clear();
    for(std::size_t i=0; i<poly.size(); ++i) {
        const ring<Coord> &r = poly[i];
        bool hole = r.hole();
        bool cw = r.clockwise();
        if(hole != cw) {
            hole = (depths[i] % 2) == 1;
            POLY_BOOL_DEBUG_LOG("ring {}: hole flag disagrees with winding, nesting depth {} decides",i,depths[i]);
        }
        out.emplace_back(r.begin(),r.end());
        if(hole != cw) std::ranges::reverse(out.back());
    }
}

} // namespace detail

/**
 * Point queries against a polygon that is prepared once.
 *
 * The locator keeps its own oriented copy of the rings, so it stays valid after
 * the polygon it was made from is destroyed.
 */
template<coordinate Coord> class polygon_locator {
    std::vector<std::vector<point_t<Coord>>> rings;
    std::vector<rect_t<Coord>> bounds;
    bool unbounded;
    Coord epsilon;

public:
    explicit polygon_locator(const polygon<Coord> &poly,Coord _epsilon = coord_ops<Coord>::epsilon())
        : unbounded(false), epsilon(_epsilon)
    {
        detail::oriented_rings(poly,rings,epsilon);
        for(const auto &r : rings) bounds.push_back(points_rect<Coord>(r));
        std::vector<int> depths;
        detail::nesting_depths<Coord>(rings,depths,epsilon);
        unbounded = detail::is_unbounded<Coord>(rings,depths);
    }

    point_location locate(const point_t<Coord> &p) const {
        return detail::locate_in_rings<Coord>(rings,bounds,unbounded,p,epsilon);
    }

    bool contains(const point_t<Coord> &p) const {
        return locate(p) == point_location::inside;
    }

    bool is_unbounded() const noexcept { return unbounded; }
};

template<coordinate Coord>
point_location polygon<Coord>::locate(const point_t<Coord> &p,Coord epsilon) const {
    return polygon_locator<Coord>(*this,epsilon).locate(p);
}

} // namespace poly_bool

#endif
