#include <algorithm>
#include <cmath>
#include <utility>
#include <boost/format.hpp>

#include "bg_operators.hpp"
#include "cell_shapes.hpp"
#include "face_frame.hpp"
#include "facecut_exception.hpp"
#include "pattern_tiler.hpp"

using std::vector;

static void check_cell_count(double count) {
  if (!(count <= max_candidate_cells)) {
    throw facecut_exception(str(boost::format("Pattern would need %1% cells, the limit is %2%")
                                % count % max_candidate_cells),
                            ERR_INVALIDPATTERNSPEC);
  }
}

unsigned int fit_count(double extent, double size, double pitch) {
  if (extent < size) {
    return 1;
  }
  const double count = std::floor((extent - size) / pitch + 1e-9) + 1;
  check_cell_count(count);
  return static_cast<unsigned int>(count);
}

// Offset of the lattice from the centre so that the fitting cells are
// symmetric: on the centre for an odd count, straddling it otherwise.
static double lattice_phase(unsigned int count, double pitch) {
  return count % 2 == 1 ? 0 : pitch / 2;
}

// Kept in double so that it can be checked before any integer cast.
static double lattice_reach(double half_extent, double pitch) {
  return std::ceil(half_extent / pitch) + 1;
}

// Tiles one group.  The lattice is centred on the group and rotated
// about its centre.  tiled is the number of cells of earlier groups.
static vector<cell> tile_group(const box_type_fp& region, const pattern_spec& spec, size_t tiled) {
  point_type_fp center;
  bg::centroid(region, center);
  const double angle = spec.angle * M_PI / 180;

  // Half extents of the region measured along the lattice axes.
  const loop_type_fp corners = rotate_loop(
      loop_type_fp{region.min_corner(),
                   point_type_fp(region.max_corner().x(), region.min_corner().y()),
                   region.max_corner(),
                   point_type_fp(region.min_corner().x(), region.max_corner().y())},
      center, -angle);
  double half_u = 0;
  double half_v = 0;
  for (const auto& corner : corners) {
    half_u = std::max(half_u, std::abs(corner.x() - center.x()));
    half_v = std::max(half_v, std::abs(corner.y() - center.y()));
  }

  const double pitch_u = spec.width + spec.x_gap();
  double pitch_v;
  double line_length = 0;
  if (spec.shape == PatternShape::LINE) {
    line_length = spec.length ? *spec.length : 2 * half_v;
    pitch_v = line_length;
  } else if (spec.triangular_lattice()) {
    pitch_v = (spec.width + spec.y_gap()) * std::sqrt(3.0) / 2;
  } else {
    pitch_v = spec.cell_height() + spec.y_gap();
  }

  const double reach_u = lattice_reach(half_u, pitch_u) + (spec.stagger ? 1 : 0);
  const double reach_v = spec.shape == PatternShape::LINE ? 0 : lattice_reach(half_v, pitch_v);
  const double candidates = (2 * reach_u + 1) * (2 * reach_v + 1);
  check_cell_count(tiled + candidates);

  const unsigned int count_u = fit_count(2 * half_u, spec.width, pitch_u);
  const double phase_u = lattice_phase(count_u, pitch_u);
  double phase_v = 0;
  if (spec.shape != PatternShape::LINE) {
    const unsigned int count_v = fit_count(2 * half_v, spec.cell_height(), pitch_v);
    phase_v = lattice_phase(count_v, pitch_v);
  }

  const int rows = static_cast<int>(reach_v);
  const int columns = static_cast<int>(reach_u);
  const loop_type_fp outline = rotate_loop(cell_outline(spec, line_length), point_type_fp(0, 0),
                                           angle + spec.rotation * M_PI / 180);
  const bool stagger = spec.stagger && spec.shape != PatternShape::LINE;
  vector<cell> cells;
  cells.reserve(static_cast<size_t>(candidates));
  for (int row = -rows; row <= rows; row++) {
    const double y = phase_v + row * pitch_v;
    const double shift = (stagger && std::abs(row) % 2 == 1) ? spec.stagger_amount * pitch_u : 0;
    for (int column = -columns; column <= columns; column++) {
      const double x = phase_u + column * pitch_u + shift;
      const point_type_fp position = rotate_loop(loop_type_fp{point_type_fp(x, y)},
                                                 point_type_fp(0, 0), angle).front() + center;
      cells.push_back(cell{translate_loop(outline, position), position});
    }
  }
  return cells;
}

vector<box_type_fp> group_regions(const box_type_fp& region, const pattern_spec& spec) {
  const double column_gaps = (spec.columns - 1) * spec.column_gap;
  const double row_gaps = (spec.rows - 1) * spec.y_row_gap();
  const double column_width =
      (region.max_corner().x() - region.min_corner().x() - column_gaps) / spec.columns;
  const double row_height =
      (region.max_corner().y() - region.min_corner().y() - row_gaps) / spec.rows;
  vector<box_type_fp> groups;
  if (!(column_width > 0 && row_height > 0)) {
    return groups;
  }
  for (unsigned int row = 0; row < spec.rows; row++) {
    const double y = region.min_corner().y() + row * (row_height + spec.y_row_gap());
    for (unsigned int column = 0; column < spec.columns; column++) {
      const double x = region.min_corner().x() + column * (column_width + spec.column_gap);
      groups.push_back(box_type_fp(point_type_fp(x, y), point_type_fp(x + column_width, y + row_height)));
    }
  }
  return groups;
}

vector<cell> tile_cells(const box_type_fp& region, const pattern_spec& spec) {
  check_cell_count(static_cast<double>(spec.columns) * spec.rows);
  const vector<box_type_fp> groups = group_regions(region, spec);
  if (groups.size() == 1) {
    return tile_group(groups.front(), spec, 0);
  }
  // With several groups the margin cells would spill into the gaps and
  // the neighbouring groups, so only the cells inside a group are kept.
  vector<cell> cells;
  for (const auto& group : groups) {
    box_type_fp inside = group;
    inside.min_corner() = inside.min_corner() - point_type_fp(1e-9, 1e-9);
    inside.max_corner() = inside.max_corner() + point_type_fp(1e-9, 1e-9);
    for (auto& c : tile_group(group, spec, cells.size())) {
      if (bg::covered_by(loop_envelope(c.polygon), inside)) {
        cells.push_back(std::move(c));
      }
    }
  }
  return cells;
}
