#ifndef POLY_BOOL_ASSEMBLE_HPP
#define POLY_BOOL_ASSEMBLE_HPP

#include <vector>
#include <map>
#include <span>
#include <numbers>
#include <algorithm>
#include <memory_resource>

#include "base.hpp"
#include "polygon.hpp"
#include "classify.hpp"


namespace poly_bool {
namespace detail {

/* A kept fragment in the direction the result ring traverses it */
struct directed_fragment {
    std::size_t source;
    std::size_t start_junction;
    std::size_t end_junction;
    std::size_t point_begin;
    std::size_t point_end;
};

template<coordinate Coord> struct walk_point {
    point_t<Coord> p;

    /* true if the point is where two fragments were joined */
    bool junction;
};

/* The angle between the direction a walk arrives at a junction and the
direction it leaves by, in (-pi,pi]. Positive angles turn left. Going straight
back is the least preferred continuation and is mapped to -pi. */
template<coordinate Coord> Coord turn_angle(const point_t<Coord> &d_in,const point_t<Coord> &d_out) {
    Coord c = vcross(d_in,d_out);
    Coord d = vdot(d_in,d_out);
    if(c == 0 && d < 0) return -std::numbers::pi_v<Coord>;
    return coord_ops<Coord>::atan2(c,d);
}

/**
 * Join kept fragments into closed rings.
 *
 * Fragments meet at junctions. A walk starts at the first unvisited fragment
 * and, at the end of each fragment, continues with the unvisited fragment
 * leaving the same junction that makes the sharpest left turn. Since every
 * kept fragment has the result's filled area on its left, this keeps each
 * traced ring as tight as possible. A walk ends when it gets back to its first
 * fragment.
 */
template<coordinate Coord> class ring_assembler {
    std::pmr::vector<directed_fragment> kept;
    std::pmr::vector<point_t<Coord>> points;
    std::pmr::vector<std::pmr::vector<std::size_t>> outgoing;
    std::pmr::vector<bool> visited;

    std::pmr::vector<walk_point<Coord>> walk;
    std::pmr::vector<walk_point<Coord>> stack;
    std::pmr::map<point_t<Coord>,std::size_t,point_less> stack_index;
    std::pmr::vector<std::pmr::vector<walk_point<Coord>>> loops;

    std::span<const point_t<Coord>> points_of(const directed_fragment &f) const {
        return std::span<const point_t<Coord>>(points).subspan(f.point_begin,f.point_end - f.point_begin);
    }

    point_t<Coord> out_direction(const directed_fragment &f) const {
        return points[f.point_begin+1] - points[f.point_begin];
    }

    point_t<Coord> in_direction(const directed_fragment &f) const {
        return points[f.point_end-1] - points[f.point_end-2];
    }

    std::size_t next_fragment(std::size_t current,std::size_t start) const;
    void trace(std::size_t start,clip_diagnostics &diag);
    void split_pinches();
    void clean_up(std::pmr::vector<walk_point<Coord>> &loop,Coord epsilon) const;

public:
    explicit ring_assembler(std::pmr::memory_resource *contig_mem)
        : kept(contig_mem),
          points(contig_mem),
          outgoing(contig_mem),
          visited(contig_mem),
          walk(contig_mem),
          stack(contig_mem),
          stack_index(contig_mem),
          loops(contig_mem) {}

    void clear() {
        kept.clear();
        points.clear();
        outgoing.clear();
        visited.clear();
        loops.clear();
    }

    std::size_t size() const noexcept { return kept.size(); }

    /** Add a fragment to the result, reversed if "reverse" is true */
    void add(std::size_t id,const fragment<Coord> &f,std::span<const point_t<Coord>> pts,bool reverse) {
        POLY_BOOL_ASSERT(pts.size() >= 2);
        POLY_BOOL_ASSERT((f.start_junction == npos) == (f.end_junction == npos));
        directed_fragment d{id,f.start_junction,f.end_junction,points.size(),0};
        if(reverse) {
            std::swap(d.start_junction,d.end_junction);
            points.insert(points.end(),pts.rbegin(),pts.rend());
        } else {
            points.insert(points.end(),pts.begin(),pts.end());
        }
        d.point_end = points.size();
        kept.push_back(d);
    }

    /** Trace all the rings and append them, with their hole flags set, to
    "out" */
    void assemble(std::size_t junction_count,Coord epsilon,clip_diagnostics &diag,std::vector<ring<Coord>> &out);
};

template<coordinate Coord>
std::size_t ring_assembler<Coord>::next_fragment(std::size_t current,std::size_t start) const {
    const directed_fragment &cur = kept[current];
    point_t<Coord> d_in = in_direction(cur);

    std::size_t best = npos;
    Coord best_angle = 0;
    auto consider = [&,this](std::size_t c) {
        Coord a = turn_angle(d_in,out_direction(kept[c]));
        if(best == npos || a > best_angle || (a == best_angle && c < best)) {
            best = c;
            best_angle = a;
        }
    };

    POLY_BOOL_ASSERT(cur.end_junction < outgoing.size());
    for(std::size_t c : outgoing[cur.end_junction]) {
        if(!visited[c]) consider(c);
    }
    if(kept[start].start_junction == cur.end_junction) consider(start);

    return best;
}

template<coordinate Coord>
void ring_assembler<Coord>::trace(std::size_t start,clip_diagnostics &diag) {
    walk.clear();

    std::size_t current = start;
    for(;;) {
        visited[current] = true;
        auto pts = points_of(kept[current]);
        walk.push_back({pts[0],true});
        for(std::size_t i=1; i<pts.size()-1; ++i) walk.push_back({pts[i],false});

        std::size_t next = next_fragment(current,start);
        if(next == start) break;
        if(next == npos) {
            POLY_BOOL_DEBUG_LOG("walk from fragment {} stopped at junction {}",
                kept[start].source,kept[current].end_junction);
            ++diag.broken_walks;
            break;
        }
        current = next;
    }
    POLY_BOOL_DEBUG_LOG("traced ring of {} points starting at fragment {}",walk.size(),kept[start].source);
}

/* A walk that passes through the same point twice is split there into
separate loops */
template<coordinate Coord>
void ring_assembler<Coord>::split_pinches() {
    stack.clear();
    stack_index.clear();

    for(const auto &wp : walk) {
        auto itr = stack_index.find(wp.p);
        if(itr == stack_index.end()) {
            stack_index.emplace(wp.p,stack.size());
            stack.push_back(wp);
            continue;
        }

        std::size_t k = itr->second;
        if(stack.size() - k >= 3) {
            POLY_BOOL_DEBUG_LOG("splitting pinched loop of {} points",stack.size() - k);
            loops.emplace_back(stack.begin() + k,stack.end());
        }
        for(std::size_t i=k+1; i<stack.size(); ++i) stack_index.erase(stack[i].p);
        stack.resize(k+1);
        stack[k].junction = true;
    }

    if(stack.size() >= 3) loops.emplace_back(stack.begin(),stack.end());
}

/* Remove join points that lie on the straight line between their neighbours,
and any point where the ring doubles back on itself */
template<coordinate Coord>
void ring_assembler<Coord>::clean_up(std::pmr::vector<walk_point<Coord>> &loop,Coord epsilon) const {
    bool changed = true;
    while(changed && loop.size() >= 3) {
        changed = false;
        for(std::size_t i=0; i<loop.size() && loop.size() >= 3; ++i) {
            const point_t<Coord> &prev = loop[(i + loop.size() - 1) % loop.size()].p;
            const point_t<Coord> &p = loop[i].p;
            const point_t<Coord> &next = loop[(i+1) % loop.size()].p;

            Coord span = distance(prev,next);
            bool on_line = span == 0
                ? true
                : coord_ops<Coord>::abs(triangle_winding(prev,p,next)) <= epsilon * span;
            if(!on_line) continue;

            bool spike = vdot(p - prev,next - p) <= 0;
            if(spike || loop[i].junction) {
                loop.erase(loop.begin() + i);
                changed = true;
                --i;
            }
        }
    }
}

template<coordinate Coord>
void ring_assembler<Coord>::assemble(
    std::size_t junction_count,
    Coord epsilon,
    clip_diagnostics &diag,
    std::vector<ring<Coord>> &out)
{
    outgoing.resize(junction_count);
    for(auto &o : outgoing) o.clear();
    visited.assign(kept.size(),false);
    loops.clear();

    for(std::size_t i=0; i<kept.size(); ++i) {
        if(kept[i].start_junction == npos) continue;
        POLY_BOOL_ASSERT(kept[i].start_junction < junction_count && kept[i].end_junction < junction_count);
        outgoing[kept[i].start_junction].push_back(i);
    }

    for(std::size_t i=0; i<kept.size(); ++i) {
        if(visited[i]) continue;

        if(kept[i].start_junction == npos) {
            visited[i] = true;
            walk.clear();
            for(const auto &p : points_of(kept[i])) walk.push_back({p,false});
        } else {
            trace(i,diag);
        }
        split_pinches();
    }

    std::pmr::vector<std::pmr::vector<point_t<Coord>>> rings(points.get_allocator());
    for(auto &loop : loops) {
        clean_up(loop,epsilon);
        if(loop.size() < 3) {
            ++diag.dropped_rings;
            continue;
        }

        std::pmr::vector<point_t<Coord>> r(points.get_allocator());
        for(const auto &wp : loop) r.push_back(wp.p);
        if(coord_ops<Coord>::abs(winding_dir<Coord>(r)) <= epsilon) {
            POLY_BOOL_DEBUG_LOG("dropping output ring of {} points with no area",r.size());
            ++diag.dropped_rings;
            continue;
        }
        rings.push_back(std::move(r));
    }

    std::vector<int> depths;
    nesting_depths<Coord>(rings,depths,epsilon);

    /* A ring that no other ring encloses is a hole exactly when it is
    clockwise; that is the case for unbounded results. Below it, fill and hole
    alternate with the nesting depth. */
    std::vector<char> hole(rings.size(),0);
    for(std::size_t i=0; i<rings.size(); ++i) {
        if(depths[i] == 0) hole[i] = winding_dir<Coord>(rings[i]) < 0;
    }
    for(std::size_t i=0; i<rings.size(); ++i) {
        if(depths[i] == 0) continue;
        bool top_hole = false;
        for(std::size_t j=0; j<rings.size(); ++j) {
            if(depths[j] == 0 && ring_inside_ring<Coord>(rings[i],rings[j],epsilon)) {
                top_hole = hole[j];
                break;
            }
        }
        hole[i] = top_hole != (depths[i] % 2 == 1);
    }

    for(std::size_t i=0; i<rings.size(); ++i) {
        bool cw = winding_dir<Coord>(rings[i]) < 0;
        if(cw != bool(hole[i])) std::ranges::reverse(rings[i]);
        out.emplace_back(rings[i],bool(hole[i]));
    }

    POLY_BOOL_DEBUG_LOG("assembled {} rings from {} fragments",rings.size(),kept.size());
}

} // namespace detail
} // namespace poly_bool

#endif
