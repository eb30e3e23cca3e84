#ifndef POLY_BOOL_CLASSIFY_HPP
#define POLY_BOOL_CLASSIFY_HPP

#include <vector>
#include <span>
#include <algorithm>
#include <memory_resource>

#include "base.hpp"
#include "primitives.hpp"
#include "crossings.hpp"


namespace poly_bool {

/** How a boundary fragment of one operand relates to the other operand */
enum class fragment_relation {
    inside,
    outside,

    /** lies on the other operand's boundary, both going the same way */
    coincident_same,

    /** lies on the other operand's boundary, going opposite ways */
    coincident_opposite};

namespace detail {

/* The arc of a ring between two consecutive crossings, or a whole ring that has
no crossings. The points of a fragment start at the start junction's point and
end at the end junction's point. */
template<coordinate Coord> struct fragment {
    bool_set set;
    std::size_t ring;

    /* both are npos for a ring without crossings */
    std::size_t start_junction;
    std::size_t end_junction;

    std::size_t point_begin;
    std::size_t point_end;

    fragment_relation relation;
    bool classified;

    bool closed() const noexcept { return start_junction == npos; }
    std::size_t size() const noexcept { return point_end - point_begin; }
};

/**
 * All the fragments of both operands.
 *
 * Fragments are addressed by their index in `fragments`, which is also the
 * order in which they were created: every fragment of the subject comes before
 * every fragment of the clip operand, ring by ring, in boundary order.
 */
template<coordinate Coord> class fragment_arena {
    std::pmr::vector<std::size_t> probe_order;

    void add_ring(
        const operand<Coord> &op,
        bool_set set,
        std::size_t ring,
        const crossing_finder<Coord> &cf,
        Coord epsilon);

    /* Append the vertices of "ring" that come strictly after "start" and
    strictly before "end", walking forward */
    void add_vertices(
        const std::pmr::vector<point_t<Coord>> &ring,
        const boundary_location<Coord> &start,
        const boundary_location<Coord> &end,
        Coord epsilon);

    void push_point(const point_t<Coord> &p,std::size_t first,Coord epsilon) {
        if(points.size() > first && approx_equal(points.back(),p,epsilon)) return;
        points.push_back(p);
    }

    /* The end of a fragment must be exactly the junction's point */
    void push_end(const point_t<Coord> &p,std::size_t first,Coord epsilon) {
        while(points.size() > first + 1 && approx_equal(points.back(),p,epsilon)) points.pop_back();
        points.push_back(p);
    }

    bool find_overlap(
        const crossing_finder<Coord> &cf,
        bool_set set,
        std::size_t ring,
        std::size_t segments,
        const boundary_location<Coord> &start,
        const boundary_location<Coord> &end,
        fragment_relation &rel) const;

public:
    std::pmr::vector<fragment<Coord>> fragments;
    std::pmr::vector<point_t<Coord>> points;

    explicit fragment_arena(std::pmr::memory_resource *contig_mem)
        : probe_order(contig_mem), fragments(contig_mem), points(contig_mem) {}

    void clear() {
        fragments.clear();
        points.clear();
    }

    std::span<const point_t<Coord>> points_of(const fragment<Coord> &f) const {
        return std::span<const point_t<Coord>>(points).subspan(f.point_begin,f.size());
    }

    /** Split every ring of "op" into fragments at its crossings. Fragments
    lying along a recorded overlap are classified as coincident here. */
    void build(const operand<Coord> &op,bool_set set,const crossing_finder<Coord> &cf,Coord epsilon) {
        for(std::size_t r=0; r<op.rings.size(); ++r) add_ring(op,set,r,cf,epsilon);
    }

    /** Classify the remaining fragments of "set" against "other" */
    void classify(bool_set set,const operand<Coord> &other,Coord epsilon,clip_diagnostics &diag);
};

template<coordinate Coord>
void fragment_arena<Coord>::add_vertices(
    const std::pmr::vector<point_t<Coord>> &ring,
    const boundary_location<Coord> &start,
    const boundary_location<Coord> &end,
    Coord epsilon)
{
    std::size_t n = ring.size();
    std::size_t s = std::size_t(start.segment());
    std::size_t e = std::size_t(end.segment());

    std::size_t d = (e + n - s) % n;
    if(d == 0 && !(start < end)) d = n;

    // vertex s+d is vertex e, which is only before "end" if "end" is past it
    std::size_t count = end.ratio() > 0 ? d : d - 1;

    std::size_t first = points.size() - 1;
    for(std::size_t i=1; i<=count; ++i) push_point(ring[(s + i) % n],first,epsilon);
}

template<coordinate Coord>
bool fragment_arena<Coord>::find_overlap(
    const crossing_finder<Coord> &cf,
    bool_set set,
    std::size_t ring,
    std::size_t segments,
    const boundary_location<Coord> &start,
    const boundary_location<Coord> &end,
    fragment_relation &rel) const
{
    std::size_t s = std::size_t(start.segment());
    Coord t1;
    if(std::size_t(end.segment()) == s && end.ratio() > start.ratio()) t1 = end.ratio();
    else if(end.ratio() == 0 && std::size_t(end.segment()) == (s + 1) % segments) t1 = 1;
    else return false;

    Coord mid = (start.ratio() + t1) / 2;
    int si = static_cast<int>(set);
    for(const auto &o : cf.overlaps) {
        if(o.ring[si] == ring && o.segment[si] == s && mid > o.lo[si] && mid < o.hi[si]) {
            rel = o.same_direction ? fragment_relation::coincident_same : fragment_relation::coincident_opposite;
            return true;
        }
    }
    return false;
}

template<coordinate Coord>
void fragment_arena<Coord>::add_ring(
    const operand<Coord> &op,
    bool_set set,
    std::size_t r,
    const crossing_finder<Coord> &cf,
    Coord epsilon)
{
    const auto &ring = op.rings[r];
    const auto &ns = cf.ring_nodes(set,r);

    if(ns.empty()) {
        fragment<Coord> f{set,r,npos,npos,points.size(),0,fragment_relation::outside,false};
        for(const auto &p : ring) push_point(p,f.point_begin,epsilon);
        f.point_end = points.size();
        fragments.push_back(f);
        return;
    }

    for(std::size_t i=0; i<ns.size(); ++i) {
        const crossing_node<Coord> &start = ns[i];
        const crossing_node<Coord> &end = ns[(i+1) % ns.size()];

        fragment<Coord> f{set,r,start.junction,end.junction,points.size(),0,fragment_relation::outside,false};
        points.push_back(cf.junctions[start.junction].p);
        add_vertices(ring,start.loc,end.loc,epsilon);
        push_end(cf.junctions[end.junction].p,f.point_begin,epsilon);
        f.point_end = points.size();

        if(f.size() < 2 || (f.start_junction == f.end_junction && f.size() < 3)) {
            POLY_BOOL_DEBUG_LOG("discarding degenerate fragment of ring {} at node {}",r,i);
            points.resize(f.point_begin);
            continue;
        }

        if(f.size() == 2 && find_overlap(cf,set,r,ring.size(),start.loc,end.loc,f.relation)) {
            f.classified = true;
        }
        fragments.push_back(f);
    }
}

template<coordinate Coord>
void fragment_arena<Coord>::classify(
    bool_set set,
    const operand<Coord> &other,
    Coord epsilon,
    clip_diagnostics &diag)
{
    for(std::size_t fi=0; fi<fragments.size(); ++fi) {
        fragment<Coord> &f = fragments[fi];
        if(f.set != set || f.classified) continue;

        auto pts = points_of(f);
        std::size_t edges = f.closed() ? pts.size() : pts.size() - 1;

        /* the midpoint of the longest edge is the point least likely to be
        near the other operand's boundary */
        probe_order.resize(edges);
        for(std::size_t i=0; i<edges; ++i) probe_order[i] = i;
        std::ranges::stable_sort(probe_order,[&](std::size_t a,std::size_t b) {
            return square(pts[(a+1) % pts.size()] - pts[a]) > square(pts[(b+1) % pts.size()] - pts[b]);
        });

        point_location loc = point_location::boundary;
        for(std::size_t e : probe_order) {
            loc = other.locate(lerp(pts[e],pts[(e+1) % pts.size()],Coord(0.5)),epsilon);
            if(loc != point_location::boundary) break;
        }

        if(loc == point_location::boundary) {
            POLY_BOOL_DEBUG_LOG("fragment {} lies on the other boundary without an overlap",fi);
            ++diag.ambiguous_fragments;
            loc = point_location::outside;
        }

        f.relation = loc == point_location::inside ? fragment_relation::inside : fragment_relation::outside;
        f.classified = true;
        POLY_BOOL_DEBUG_LOG("fragment {} (set {}, ring {}): {}",
            fi,static_cast<int>(f.set),f.ring,static_cast<int>(f.relation));
    }
}

} // namespace detail

} // namespace poly_bool

#endif
