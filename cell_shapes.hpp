#ifndef CELL_SHAPES_HPP
#define CELL_SHAPES_HPP

#include "geometry.hpp"
#include "pattern_spec.hpp"

// All the shapes are counterclockwise loops centred on (0,0).

// Number of segments in each rounded corner of a rectangle.
static const unsigned int fillet_segments = 8;

// A regular polygon with the given inscribed diameter.  The first
// vertex is at angle phase (radians, counterclockwise from +x).
loop_type_fp regular_polygon(unsigned int sides, double width, double phase);

// A regular polygon whose first edge is perpendicular to +x, so that
// its width along x is the flat-to-flat width for even sides.
loop_type_fp flat_sided_polygon(unsigned int sides, double width);

loop_type_fp rectangle(double width, double height);

// The corner radius is clamped to just under half of the smaller side.
loop_type_fp rounded_rectangle(double width, double height, double radius);

// Parallelogram: the top edge is moved along x by height * tan(shear).
loop_type_fp sheared_rectangle(double width, double height, double shear_degrees);

// A rectangle along y with semicircular ends, length overall.
loop_type_fp stadium(double width, double length);

// The outline of one cell of the pattern, before it is rotated and
// moved into place.  line_length is the length of LINE cells.
loop_type_fp cell_outline(const pattern_spec& spec, double line_length);

#endif // CELL_SHAPES_HPP
