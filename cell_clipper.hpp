#ifndef CELL_CLIPPER_HPP
#define CELL_CLIPPER_HPP

#include <vector>

#include "geometry.hpp"
#include "pattern_spec.hpp"
#include "pattern_tiler.hpp"

// Partial pieces smaller than this are dropped.
static const double min_cell_area = 1e-6;
// Vertices this close to the boundary count as inside it.
static const double boundary_tolerance = 1e-6;
// Slack allowed by ClipMode::NONE around the boundary's envelope.
static const double envelope_tolerance = 0.1;

// Turns a loop that may overlap itself, as produced by offset_boundary
// at sharp reflex corners, into a valid multipolygon.  The loop is made
// counterclockwise and united with Boost.Polygon at a resolution of
// 1/polygon_int_scale.  Only the regions that the loop winds around
// positively are kept, so inverted slivers are dropped.
multi_polygon_type_fp normalize_boundary(const loop_type_fp& loop);

// Keeps or trims the candidate cells according to clip:
//  NONE    - cells whose envelope is inside the boundary's envelope.
//  WHOLE   - cells with every vertex inside or on the boundary.
//  PARTIAL - the part of each cell inside the boundary, one cell per
//            piece, each with the centre of the candidate.
std::vector<cell> clip_cells(const std::vector<cell>& candidates,
                             const loop_type_fp& boundary,
                             ClipMode::ClipMode clip);

#endif // CELL_CLIPPER_HPP
