
#include <stdexcept>
#include <vector>
#include <numbers>
#include <cmath>
#include <iostream>

#define POLY_BOOL_ASSERT(X) ((X) ? void(0) : throw std::logic_error("assertion failed: " #X))
#define POLY_BOOL_ASSERT_SLOW POLY_BOOL_ASSERT

#include "../include/poly_bool/poly_bool.hpp"

#define BOOST_TEST_MODULE PolyBoolPropertyTests
#include <boost/test/unit_test.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

typedef double coord_t;

#include "stream_output.hpp"

using namespace poly_bool;
namespace bdata = boost::unit_test::data;

ring<coord_t> regular(int sides,point_t<coord_t> center,coord_t radius,coord_t rotation) {
    std::vector<point_t<coord_t>> pts;
    for(int i=0; i<sides; ++i) {
        coord_t a = rotation + 2 * std::numbers::pi_v<coord_t> * i / sides;
        pts.emplace_back(center[0] + radius*std::cos(a),center[1] + radius*std::sin(a));
    }
    return ring<coord_t>(pts);
}

const std::vector<polygon<coord_t>> &shapes() {
    static const std::vector<polygon<coord_t>> r{
        polygon<coord_t>{regular(6,{0,0},1,0.1)},
        polygon<coord_t>{regular(5,{0.6,0.3},0.9,0.7)},
        polygon<coord_t>{regular(3,{-0.4,0.5},1.3,0.33)},
        polygon<coord_t>{regular(8,{0.2,-0.5},0.6,0.05)},
        polygon<coord_t>{
            ring<coord_t>{{-1.1,-0.9},{0.9,-0.9},{0.9,1.05},{-1.1,1.05}},
            regular(7,{-0.05,0.1},0.45,0.2).inverted()},
        polygon<coord_t>{regular(5,{0.1,0.1},0.8,0.5).inverted()},
        polygon<coord_t>{regular(4,{1.4,1.3},0.3,0.25),regular(12,{-1.2,-1.1},0.5,0.01)}};
    return r;
}

constexpr int shape_count = 7;

/* points on a grid that is offset so that it does not line up with any of the
shapes */
std::vector<point_t<coord_t>> probes() {
    std::vector<point_t<coord_t>> r;
    constexpr int n = 23;
    for(int i=0; i<n; ++i) {
        for(int j=0; j<n; ++j) {
            r.emplace_back(-2 + (i + 0.37)*4/n,-2 + (j + 0.61)*4/n);
        }
    }
    return r;
}

bool filled(const polygon<coord_t> &p,const point_t<coord_t> &x) {
    return p.locate(x) == point_location::inside;
}

bool expected(bool_op op,bool a,bool b) {
    switch(op) {
    case bool_op::union_: return a || b;
    case bool_op::intersection: return a && b;
    case bool_op::xor_: return a != b;
    case bool_op::difference: return a && !b;
    }
    throw std::logic_error("unknown operation");
}

const bool_op all_ops[] = {bool_op::union_,bool_op::intersection,bool_op::xor_,bool_op::difference};

/* the probe is not within the tolerance of either boundary */
bool clear_of(const polygon<coord_t> &a,const polygon<coord_t> &b,const point_t<coord_t> &x) {
    return a.locate(x,1e-6) != point_location::boundary && b.locate(x,1e-6) != point_location::boundary;
}

BOOST_DATA_TEST_CASE(matches_point_oracle,bdata::xrange(shape_count) * bdata::xrange(shape_count),i,j) {
    const auto &a = shapes()[i];
    const auto &b = shapes()[j];
    auto pts = probes();

    polygon_locator<coord_t> in_a(a), in_b(b);

    for(bool_op op : all_ops) {
        polygon<coord_t> r = boolean_op(a,b,op);
        polygon_locator<coord_t> in_r(r);
        for(const auto &x : pts) {
            if(!clear_of(a,b,x)) continue;
            bool want = expected(op,in_a.contains(x),in_b.contains(x));
            BOOST_CHECK_MESSAGE(in_r.contains(x) == want,
                "operation " << static_cast<int>(op) << " at " << x << " gave " << in_r.locate(x));
        }
    }
}

BOOST_DATA_TEST_CASE(orientation_agrees_with_hole_flag,bdata::xrange(shape_count) * bdata::xrange(shape_count),i,j) {
    for(bool_op op : all_ops) {
        polygon<coord_t> r = boolean_op(shapes()[i],shapes()[j],op);
        for(const auto &rg : r) {
            BOOST_TEST(rg.size() >= 3u);
            BOOST_TEST(rg.clockwise() == rg.hole());
        }
    }
}

BOOST_DATA_TEST_CASE(symmetric_operations_commute,bdata::xrange(shape_count) * bdata::xrange(shape_count),i,j) {
    const auto &a = shapes()[i];
    const auto &b = shapes()[j];
    auto pts = probes();

    for(bool_op op : {bool_op::union_,bool_op::intersection,bool_op::xor_}) {
        polygon<coord_t> ab = boolean_op(a,b,op);
        polygon<coord_t> ba = boolean_op(b,a,op);
        for(const auto &x : pts) {
            if(!clear_of(a,b,x)) continue;
            BOOST_TEST(filled(ab,x) == filled(ba,x));
        }
    }
}

BOOST_DATA_TEST_CASE(xor_is_union_minus_intersection,bdata::xrange(shape_count) * bdata::xrange(shape_count),i,j) {
    const auto &a = shapes()[i];
    const auto &b = shapes()[j];

    polygon<coord_t> x = xor_op(a,b);
    polygon<coord_t> u = union_op(a,b);
    polygon<coord_t> n = intersection_op(a,b);
    for(const auto &p : probes()) {
        if(!clear_of(a,b,p)) continue;
        BOOST_TEST(filled(x,p) == (filled(u,p) && !filled(n,p)));
    }
}

BOOST_DATA_TEST_CASE(difference_is_intersection_with_complement,bdata::xrange(shape_count) * bdata::xrange(shape_count),i,j) {
    const auto &a = shapes()[i];
    const auto &b = shapes()[j];

    polygon<coord_t> d = difference_op(a,b).value_or(polygon<coord_t>{});
    polygon<coord_t> ic = intersection_op(a,invert_op(b));
    for(const auto &x : probes()) {
        if(!clear_of(a,b,x)) continue;
        BOOST_TEST(filled(d,x) == filled(ic,x));
    }
}

BOOST_DATA_TEST_CASE(deterministic,bdata::xrange(shape_count) * bdata::xrange(shape_count),i,j) {
    for(bool_op op : all_ops) {
        BOOST_TEST(boolean_op(shapes()[i],shapes()[j],op) == boolean_op(shapes()[i],shapes()[j],op));
    }
}

BOOST_DATA_TEST_CASE(double_inversion,bdata::xrange(shape_count),i) {
    BOOST_TEST(invert_op(invert_op(shapes()[i])) == shapes()[i]);

    polygon<coord_t> inv = invert_op(shapes()[i]);
    for(const auto &x : probes()) {
        if(shapes()[i].locate(x,1e-6) == point_location::boundary) continue;
        BOOST_TEST(filled(inv,x) != filled(shapes()[i],x));
    }
}

BOOST_DATA_TEST_CASE(self_operations,bdata::xrange(shape_count),i) {
    const auto &a = shapes()[i];
    BOOST_TEST(!difference_op(a,a).has_value());
    BOOST_TEST(xor_op(a,a).empty());

    polygon<coord_t> u = union_op(a,a);
    for(const auto &x : probes()) {
        if(a.locate(x,1e-6) == point_location::boundary) continue;
        BOOST_TEST(filled(u,x) == filled(a,x));
    }
}
