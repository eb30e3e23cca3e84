#ifndef POLY_BOOL_CLIP_HPP
#define POLY_BOOL_CLIP_HPP

#include <vector>
#include <optional>
#include <memory_resource>

#include "base.hpp"
#include "polygon.hpp"
#include "crossings.hpp"
#include "classify.hpp"
#include "assemble.hpp"


namespace poly_bool {

enum class bool_op {
    union_,
    intersection,
    xor_,

    /** The subject minus the clip operand */
    difference};

enum class fragment_action {discard,keep,keep_reversed};

/**
 * Decide what becomes of a fragment in the result of an operation.
 *
 * Fragments coincident with the other operand's boundary appear once in each
 * operand's fragments. Where such an edge belongs to the result, only the
 * subject's copy is kept.
 */
constexpr fragment_action select_fragment(bool_op op,bool_set set,fragment_relation rel) noexcept {
    using enum fragment_relation;

    bool subject = set == bool_set::subject;
    switch(op) {
    case bool_op::union_:
        if(rel == outside) return fragment_action::keep;
        if(rel == coincident_same && subject) return fragment_action::keep;
        return fragment_action::discard;
    case bool_op::intersection:
        if(rel == inside) return fragment_action::keep;
        if(rel == coincident_same && subject) return fragment_action::keep;
        return fragment_action::discard;
    case bool_op::xor_:
        if(rel == outside) return fragment_action::keep;
        if(rel == inside) return fragment_action::keep_reversed;
        return fragment_action::discard;
    case bool_op::difference:
        if(subject) {
            return (rel == outside || rel == coincident_opposite)
                ? fragment_action::keep : fragment_action::discard;
        }
        return rel == inside ? fragment_action::keep_reversed : fragment_action::discard;
    }
    return fragment_action::discard;
}

/**
 * Performs boolean operations on pairs of polygons.
 *
 * Instances keep their working storage between operations, so one instance
 * can run many operations without reallocating. An instance must not be used
 * by more than one thread at a time.
 */
template<coordinate Coord> class clipper {
    std::pmr::memory_resource *contig_mem;
    Coord epsilon;

    detail::operand<Coord> operands[2];
    detail::crossing_finder<Coord> crossings;
    detail::fragment_arena<Coord> arena;
    detail::ring_assembler<Coord> assembler;
    clip_diagnostics diag;

public:
    explicit clipper(
        std::pmr::memory_resource *_contig_mem=nullptr,
        Coord _epsilon=coord_ops<Coord>::epsilon()) :
        contig_mem(_contig_mem == nullptr ? std::pmr::get_default_resource() : _contig_mem),
        epsilon(_epsilon),
        operands{detail::operand<Coord>(contig_mem),detail::operand<Coord>(contig_mem)},
        crossings(contig_mem),
        arena(contig_mem),
        assembler(contig_mem) {}

    clipper(clipper &&b) = default;

    /**
     * Set one of the operands.
     *
     * The rings are copied. Each ring's hole flag is compared with its
     * winding; where they disagree, the ring's nesting depth among the other
     * rings of the polygon decides.
     */
    void add_polygon(const polygon<Coord> &p,bool_set set) {
        operands[static_cast<int>(set)].load(p,epsilon,diag);
    }

    void add_polygon_subject(const polygon<Coord> &p) { add_polygon(p,bool_set::subject); }
    void add_polygon_clip(const polygon<Coord> &p) { add_polygon(p,bool_set::clip); }

    /**
     * Perform a boolean operation on the operands and return the result.
     *
     * An empty polygon is returned when the result has no area, and also
     * when it covers the entire plane.
     */
    polygon<Coord> execute(bool_op op);

    /** Discard the operands and the diagnostics */
    void reset() {
        operands[0].clear();
        operands[1].clear();
        crossings.clear();
        arena.clear();
        assembler.clear();
        diag.clear();
    }

    /** Counters accumulated since construction or the last call to `reset` */
    const clip_diagnostics &diagnostics() const noexcept { return diag; }

    Coord tolerance() const noexcept { return epsilon; }
};

template<coordinate Coord>
polygon<Coord> clipper<Coord>::execute(bool_op op) {
    crossings.find(operands[0],operands[1],epsilon,diag);

    arena.clear();
    arena.build(operands[0],bool_set::subject,crossings,epsilon);
    arena.build(operands[1],bool_set::clip,crossings,epsilon);
    arena.classify(bool_set::subject,operands[1],epsilon,diag);
    arena.classify(bool_set::clip,operands[0],epsilon,diag);

    assembler.clear();
    for(std::size_t i=0; i<arena.fragments.size(); ++i) {
        const auto &f = arena.fragments[i];
        fragment_action act = select_fragment(op,f.set,f.relation);
        if(act == fragment_action::discard) continue;
        assembler.add(i,f,arena.points_of(f),act == fragment_action::keep_reversed);
    }
    POLY_BOOL_DEBUG_LOG("operation {}: kept {} of {} fragments",
        static_cast<int>(op),assembler.size(),arena.fragments.size());

    std::vector<ring<Coord>> out;
    assembler.assemble(crossings.junctions.size(),epsilon,diag,out);
    return polygon<Coord>(std::move(out));
}

/**
 * Perform a boolean operation on two polygons.
 *
 * The inputs are not modified. The result is a new polygon whose rings have
 * hole flags that agree with their winding: counter-clockwise fills and
 * clockwise holes.
 */
template<coordinate Coord> polygon<Coord> boolean_op(
    const polygon<Coord> &subject,
    const polygon<Coord> &clip,
    bool_op op,
    std::pmr::memory_resource *contig_mem=nullptr)
{
    clipper<Coord> n(contig_mem);
    n.add_polygon_subject(subject);
    n.add_polygon_clip(clip);
    return n.execute(op);
}

template<coordinate Coord> polygon<Coord> union_op(
    const polygon<Coord> &a,
    const polygon<Coord> &b,
    std::pmr::memory_resource *contig_mem=nullptr)
{
    return boolean_op(a,b,bool_op::union_,contig_mem);
}

template<coordinate Coord> polygon<Coord> intersection_op(
    const polygon<Coord> &a,
    const polygon<Coord> &b,
    std::pmr::memory_resource *contig_mem=nullptr)
{
    return boolean_op(a,b,bool_op::intersection,contig_mem);
}

template<coordinate Coord> polygon<Coord> xor_op(
    const polygon<Coord> &a,
    const polygon<Coord> &b,
    std::pmr::memory_resource *contig_mem=nullptr)
{
    return boolean_op(a,b,bool_op::xor_,contig_mem);
}

/**
 * Compute "a" minus "b".
 *
 * Returns `std::nullopt` when nothing of "a" remains, which includes the case
 * of "a" and "b" being the same polygon.
 */
template<coordinate Coord> std::optional<polygon<Coord>> difference_op(
    const polygon<Coord> &a,
    const polygon<Coord> &b,
    std::pmr::memory_resource *contig_mem=nullptr)
{
    polygon<Coord> r = boolean_op(a,b,bool_op::difference,contig_mem);
    if(r.empty()) return std::nullopt;
    return r;
}

/** Swap the filled and empty parts of the plane by reversing every ring and
flipping its hole flag */
template<coordinate Coord> polygon<Coord> invert_op(const polygon<Coord> &a) {
    std::vector<ring<Coord>> rings;
    rings.reserve(a.size());
    for(const auto &r : a) rings.push_back(r.inverted());
    return polygon<Coord>(std::move(rings));
}

} // namespace poly_bool

#endif
