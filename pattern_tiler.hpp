#ifndef PATTERN_TILER_HPP
#define PATTERN_TILER_HPP

#include <vector>

#include "geometry.hpp"
#include "pattern_spec.hpp"

// One opening of a pattern, in face coordinates.
struct cell {
  loop_type_fp polygon;
  point_type_fp center;
};

// The most candidate cells that a single pattern may produce.
static const size_t max_candidate_cells = 1000000;

// Number of cells of size spaced by pitch that fit in extent; at least 1.
unsigned int fit_count(double extent, double size, double pitch);

// The columns x rows boxes that region is split into, row by row from
// the lower left, separated by the column and row gaps.  Empty when the
// gaps leave no room.
std::vector<box_type_fp> group_regions(const box_type_fp& region, const pattern_spec& spec);

// Candidate cells covering each group of region.  A single group gets
// a margin of one pitch on every side; with several groups only the
// cells that fit inside a group are kept.  Each group's lattice is centred on the group:
// along each axis the cells that fit are symmetric about the centre,
// and angle rotates the lattice about that centre.  LINE cells span the
// whole group along the lattice's v axis unless spec.length is set.
// Throws facecut_exception(ERR_INVALIDPATTERNSPEC) if the
// pattern would have more than max_candidate_cells cells.
std::vector<cell> tile_cells(const box_type_fp& region, const pattern_spec& spec);

#endif // PATTERN_TILER_HPP
