#include "boundary_offset.hpp"
#include "cell_clipper.hpp"
#include "face_frame.hpp"
#include "pattern_layout.hpp"

face_layout layout_pattern(const loop_type_fp& boundary, const pattern_spec& spec) {
  face_layout layout;
  layout.boundary = boundary;
  layout.offset = offset_boundary(boundary, spec.x_border(), spec.y_border());
  if (layout.offset.empty()) {
    return layout;
  }
  const std::vector<cell> candidates = tile_cells(loop_envelope(layout.offset), spec);
  layout.cells = clip_cells(candidates, layout.offset, spec.clip);
  return layout;
}
