#ifndef POLY_BOOL_POLY_BOOL_HPP
#define POLY_BOOL_POLY_BOOL_HPP

#include "base.hpp"
#include "primitives.hpp"
#include "polygon.hpp"
#include "boundary_location.hpp"
#include "clip.hpp"

#endif
