#ifndef BOUNDARY_OFFSET_HPP
#define BOUNDARY_OFFSET_HPP

#include "geometry.hpp"

// The largest factor by which a reflex vertex is moved further than the
// offset distance.
static const double max_miter_multiplier = 4.0;

// Moves every vertex of the loop inward by distance.  Each vertex moves
// along the bisector of the inward normals of its two edges by
// distance / cos(phi/2), where phi is the angle between the normals, so
// convex vertices land exactly distance away from both edges.  At
// reflex vertices the multiplier is clamped to max_miter_multiplier and
// the loop may overlap itself locally.  The result has
// as many vertices as the input, in the same order.  A distance of 0
// returns the input unchanged.  If the loop collapses, that is its
// orientation flips, its area vanishes or none of its edges keep their
// direction, the result is empty.
loop_type_fp offset_boundary(const loop_type_fp& loop, double distance);

// As above with a border of distance_x from the edges that the x axis
// crosses and distance_y from those that the y axis crosses.  A slanted
// edge with inward normal n moves by sqrt((n.x distance_x)^2 +
// (n.y distance_y)^2) and each vertex lands on both of its moved edges.
loop_type_fp offset_boundary(const loop_type_fp& loop, double distance_x, double distance_y);

#endif // BOUNDARY_OFFSET_HPP
