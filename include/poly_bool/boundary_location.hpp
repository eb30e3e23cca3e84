#ifndef POLY_BOOL_BOUNDARY_LOCATION_HPP
#define POLY_BOOL_BOUNDARY_LOCATION_HPP

#include <compare>
#include <stdexcept>
#include <cmath>

#include "base.hpp"


namespace poly_bool {

/**
 * A position on the boundary of a polygon.
 *
 * The position is the ring, the segment of that ring (segment i goes from
 * point i to point i+1, wrapping around) and the ratio along the segment, where
 * 0 is the segment's start vertex and 1 its end vertex.
 *
 * The ratio 1 of segment i and the ratio 0 of segment i+1 are the same physical
 * vertex. `canonical` converts the former into the latter. Locations must be
 * canonical before they are compared, otherwise one vertex would sort as two
 * distinct locations.
 *
 * Locations are only meaningful relative to the indexing of one polygon.
 */
template<coordinate Coord> class boundary_location {
    long _ring;
    long _segment;
    Coord _ratio;

public:
    boundary_location(long ring,long segment,Coord ratio)
        : _ring(ring), _segment(segment), _ratio(ratio)
    {
        if(ring < 0) throw std::invalid_argument("negative ring index");
        if(segment < 0) throw std::invalid_argument("negative segment index");
        if(!(ratio >= 0 && ratio <= 1)) throw std::invalid_argument("segment ratio must be between 0 and 1");
    }

    long ring() const noexcept { return _ring; }
    long segment() const noexcept { return _segment; }
    Coord ratio() const noexcept { return _ratio; }

    bool at_vertex() const noexcept { return _ratio == 0 || _ratio == 1; }

    /** Express a location at the end of a segment as the start of the next
    segment. "segments" is the number of segments in the ring. */
    boundary_location canonical(long segments) const {
        if(_ratio != 1) return *this;
        return {_ring,(_segment + 1) % segments,0};
    }

    friend bool operator==(const boundary_location &a,const boundary_location &b) noexcept {
        return a._ring == b._ring && a._segment == b._segment && a._ratio == b._ratio;
    }

    friend std::partial_ordering operator<=>(const boundary_location &a,const boundary_location &b) noexcept {
        if(auto c = a._ring <=> b._ring; c != 0) return c;
        if(auto c = a._segment <=> b._segment; c != 0) return c;
        return a._ratio <=> b._ratio;
    }
};

} // namespace poly_bool

#endif
