#ifndef PATTERN_LAYOUT_HPP
#define PATTERN_LAYOUT_HPP

#include <vector>

#include "geometry.hpp"
#include "pattern_spec.hpp"
#include "pattern_tiler.hpp"

// The 2D part of patterning one face.
struct face_layout {
  loop_type_fp boundary;
  // boundary moved inward by the border, empty if it collapsed.
  loop_type_fp offset;
  std::vector<cell> cells;
};

// Offsets the boundary, tiles its envelope and clips the cells.  The
// spec must already be validated.
face_layout layout_pattern(const loop_type_fp& boundary, const pattern_spec& spec);

#endif // PATTERN_LAYOUT_HPP
