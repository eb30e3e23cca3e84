#ifndef POLY_BOOL_CROSSINGS_HPP
#define POLY_BOOL_CROSSINGS_HPP

#include <vector>
#include <map>
#include <span>
#include <limits>
#include <variant>
#include <algorithm>
#include <memory_resource>

#include "base.hpp"
#include "primitives.hpp"
#include "polygon.hpp"
#include "boundary_location.hpp"


namespace poly_bool {

/** The two operands of a binary operation. "subject" is the left-hand operand
(A) and "clip" is the right-hand operand (B). */
enum class bool_set {subject=0,clip=1};

constexpr bool_set opposite(bool_set s) noexcept {
    return s == bool_set::subject ? bool_set::clip : bool_set::subject;
}

/**
 * Counters of the numerical and topological conditions that an operation
 * resolved on its own instead of failing.
 */
struct clip_diagnostics {
    /** Segment pairs skipped because one of the segments was shorter than the
    tolerance */
    std::size_t degenerate_pairs = 0;

    /** Fragments whose every probe point landed on the other operand's
    boundary without being a recorded overlap */
    std::size_t ambiguous_fragments = 0;

    /** Ring walks that reached a junction with no way to continue */
    std::size_t broken_walks = 0;

    /** Input or output rings discarded for enclosing no area */
    std::size_t dropped_rings = 0;

    void clear() noexcept { *this = {}; }
};

namespace detail {

constexpr std::size_t npos = std::numeric_limits<std::size_t>::max();

/* One operand of an operation, with each ring oriented so that the winding is
authoritative */
template<coordinate Coord> struct operand {
    std::pmr::vector<std::pmr::vector<point_t<Coord>>> rings;
    std::pmr::vector<rect_t<Coord>> bounds;
    bool unbounded;

    explicit operand(std::pmr::memory_resource *contig_mem)
        : rings(contig_mem), bounds(contig_mem), unbounded(false) {}

    void clear() {
        rings.clear();
        bounds.clear();
        unbounded = false;
    }

    void load(const polygon<Coord> &p,Coord epsilon,clip_diagnostics &diag) {
        oriented_rings(p,rings,epsilon);

        /* rings that enclose no area have no boundary to speak of */
        std::size_t kept = 0;
        for(std::size_t i=0; i<rings.size(); ++i) {
            Coord w = winding_dir<Coord>(rings[i]);
            if(coord_ops<Coord>::abs(w) <= epsilon) {
                POLY_BOOL_DEBUG_LOG("dropping input ring {} with area {}",i,w/2);
                ++diag.dropped_rings;
                continue;
            }
            if(kept != i) rings[kept] = std::move(rings[i]);
            ++kept;
        }
        rings.erase(rings.begin() + kept,rings.end());

        bounds.clear();
        for(const auto &r : rings) bounds.push_back(points_rect<Coord>(r));

        std::vector<int> depths;
        nesting_depths<Coord>(rings,depths,epsilon);
        unbounded = is_unbounded<Coord>(rings,depths);
    }

    point_location locate(const point_t<Coord> &p,Coord epsilon) const {
        return locate_in_rings<Coord>(rings,bounds,unbounded,p,epsilon);
    }

    std::size_t segment_count(std::size_t ring) const { return rings[ring].size(); }
};

/* A crossing on one ring */
template<coordinate Coord> struct crossing_node {
    boundary_location<Coord> loc;
    std::size_t junction;
};

struct node_ref {
    std::size_t ring;
    std::size_t index;

    friend bool operator==(const node_ref&,const node_ref&) = default;
};

/* A point where the boundaries of the two operands meet. Every crossing node
refers to exactly one junction, and every junction has at least one node on
each operand. */
template<coordinate Coord> struct junction_t {
    point_t<Coord> p;
    node_ref on[2];
};

/* Two collinear segments, one from each operand, sharing an interval. The
interval on each segment is given as ascending ratios. */
template<coordinate Coord> struct overlap_record {
    std::size_t ring[2];
    std::size_t segment[2];
    Coord lo[2];
    Coord hi[2];
    bool same_direction;
};

/**
 * Find every point where the boundary of one operand meets the boundary of the
 * other.
 *
 * Every segment of every ring of one operand is tested against every segment of
 * every ring of the other, after rejecting pairs whose bounding rectangles are
 * apart. Hits closer than the tolerance to each other are merged into a single
 * junction.
 */
template<coordinate Coord> class crossing_finder {
    std::pmr::map<point_t<Coord>,std::size_t,point_less> junction_index;
    std::pmr::vector<std::size_t> seen;
    Coord epsilon;

    std::size_t junction_at(const point_t<Coord> &p) {
        constexpr Coord inf = std::numeric_limits<Coord>::infinity();

        /* any junction within the tolerance has an X coordinate in
        [p.x-epsilon, p.x+epsilon], so only that part of the map is scanned */
        auto itr = junction_index.lower_bound(point_t<Coord>(p[0] - epsilon,-inf));
        for(; itr != junction_index.end() && itr->first[0] <= p[0] + epsilon; ++itr) {
            if(coord_ops<Coord>::abs(itr->first[1] - p[1]) <= epsilon) return itr->second;
        }

        std::size_t j = junctions.size();
        junctions.push_back({p,{{npos,npos},{npos,npos}}});
        junction_index.emplace(p,j);
        return j;
    }

    void add_hit(
        const operand<Coord> &a,
        const operand<Coord> &b,
        const point_t<Coord> &p,
        std::size_t ra,std::size_t sa,Coord ta,
        std::size_t rb,std::size_t sb,Coord tb)
    {
        std::size_t j = junction_at(p);
        nodes[0][ra].push_back({
            boundary_location<Coord>(long(ra),long(sa),ta).canonical(long(a.segment_count(ra))),
            j});
        nodes[1][rb].push_back({
            boundary_location<Coord>(long(rb),long(sb),tb).canonical(long(b.segment_count(rb))),
            j});
    }

    void finalize(std::size_t s) {
        seen.assign(junctions.size(),npos);
        for(std::size_t r=0; r<nodes[s].size(); ++r) {
            auto &ns = nodes[s][r];
            auto by_loc = [](const auto &x,const auto &y) { return x.loc < y.loc; };
            std::ranges::stable_sort(ns,by_loc);

            /* a junction met several times by one ring, as happens when
            adjacent segments touch the other boundary at a shared vertex, is a
            single crossing of that ring */
            std::erase_if(ns,[&](const auto &n) {
                if(seen[n.junction] == r) return true;
                seen[n.junction] = r;
                return false;
            });

            POLY_BOOL_ASSERT_SLOW(std::ranges::is_sorted(ns,by_loc));

            for(std::size_t i=0; i<ns.size(); ++i) {
                POLY_BOOL_ASSERT(ns[i].junction < junctions.size());
                auto &on = junctions[ns[i].junction].on[s];
                if(on.ring == npos) on = {r,i};
            }
        }
    }

public:
    std::pmr::vector<junction_t<Coord>> junctions;

    /* crossings of each ring of each operand, sorted by location */
    std::pmr::vector<std::pmr::vector<crossing_node<Coord>>> nodes[2];

    std::pmr::vector<overlap_record<Coord>> overlaps;

    explicit crossing_finder(std::pmr::memory_resource *contig_mem)
        : junction_index(contig_mem),
          seen(contig_mem),
          epsilon(coord_ops<Coord>::epsilon()),
          junctions(contig_mem),
          nodes{
            std::pmr::vector<std::pmr::vector<crossing_node<Coord>>>(contig_mem),
            std::pmr::vector<std::pmr::vector<crossing_node<Coord>>>(contig_mem)},
          overlaps(contig_mem) {}

    void clear() {
        junction_index.clear();
        junctions.clear();
        nodes[0].clear();
        nodes[1].clear();
        overlaps.clear();
    }

    void find(const operand<Coord> &a,const operand<Coord> &b,Coord _epsilon,clip_diagnostics &diag);

    const std::pmr::vector<crossing_node<Coord>> &ring_nodes(bool_set s,std::size_t ring) const {
        return nodes[static_cast<int>(s)][ring];
    }

    /** The node on the other operand at the same junction as the given node */
    node_ref counterpart(bool_set s,node_ref n) const {
        const auto &node = nodes[static_cast<int>(s)][n.ring][n.index];
        return junctions[node.junction].on[static_cast<int>(opposite(s))];
    }
};

template<coordinate Coord>
void crossing_finder<Coord>::find(
    const operand<Coord> &a,
    const operand<Coord> &b,
    Coord _epsilon,
    clip_diagnostics &diag)
{
    clear();
    epsilon = _epsilon;
    nodes[0].resize(a.rings.size());
    nodes[1].resize(b.rings.size());

    for(std::size_t ra=0; ra<a.rings.size(); ++ra) {
        const auto &ring_a = a.rings[ra];
        std::size_t na = ring_a.size();
        for(std::size_t sa=0; sa<na; ++sa) {
            const point_t<Coord> &a0 = ring_a[sa];
            const point_t<Coord> &a1 = ring_a[(sa+1) % na];
            rect_t<Coord> ra_rect = segment_rect(a0,a1);
            bool a_degenerate = vmag(a1 - a0) <= epsilon;

            for(std::size_t rb=0; rb<b.rings.size(); ++rb) {
                if(!b.bounds[rb].overlaps(ra_rect,epsilon)) continue;

                const auto &ring_b = b.rings[rb];
                std::size_t nb = ring_b.size();
                for(std::size_t sb=0; sb<nb; ++sb) {
                    const point_t<Coord> &b0 = ring_b[sb];
                    const point_t<Coord> &b1 = ring_b[(sb+1) % nb];
                    if(!ra_rect.overlaps(segment_rect(b0,b1),epsilon)) continue;

                    if(a_degenerate || vmag(b1 - b0) <= epsilon) {
                        POLY_BOOL_DEBUG_LOG("skipping degenerate segment pair ({},{}) ({},{})",ra,sa,rb,sb);
                        ++diag.degenerate_pairs;
                        continue;
                    }

                    auto r = segment_intersection(a0,a1,b0,b1,epsilon);
                    if(auto *ph = std::get_if<point_hit<Coord>>(&r)) {
                        add_hit(a,b,ph->p,ra,sa,ph->ta,rb,sb,ph->tb);
                    } else if(auto *oh = std::get_if<overlap_hit<Coord>>(&r)) {
                        add_hit(a,b,oh->p[0],ra,sa,oh->ta[0],rb,sb,oh->tb[0]);
                        add_hit(a,b,oh->p[1],ra,sa,oh->ta[1],rb,sb,oh->tb[1]);
                        overlaps.push_back({
                            {ra,rb},
                            {sa,sb},
                            {oh->ta[0],std::min(oh->tb[0],oh->tb[1])},
                            {oh->ta[1],std::max(oh->tb[0],oh->tb[1])},
                            oh->same_direction});
                    }
                }
            }
        }
    }

    finalize(0);
    finalize(1);

    POLY_BOOL_ASSERT(std::ranges::all_of(junctions,[](const auto &j) {
        return j.on[0].ring != npos && j.on[1].ring != npos;
    }));

    POLY_BOOL_DEBUG_LOG("found {} junctions and {} overlapping segment pairs",junctions.size(),overlaps.size());
}

} // namespace detail

} // namespace poly_bool

#endif
