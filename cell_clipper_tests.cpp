#define BOOST_TEST_MODULE cell_clipper tests
#include <boost/test/unit_test.hpp>

#include <algorithm>
#include <limits>
#include <vector>

#include "geometry.hpp"
#include "bg_operators.hpp"
#include "cell_shapes.hpp"
#include "face_frame.hpp"
#include "boundary_offset.hpp"
#include "pattern_layout.hpp"

#include "cell_clipper.hpp"

using namespace std;

static cell square_cell(double x, double y, double size) {
  return cell{translate_loop(rectangle(size, size), point_type_fp(x, y)), point_type_fp(x, y)};
}

static double closest_to_edge(const vector<cell>& cells, const loop_type_fp& face) {
  linestring_type_fp edges(face.begin(), face.end());
  edges.push_back(face.front());
  double closest = std::numeric_limits<double>::max();
  for (const auto& c : cells) {
    for (const auto& p : c.polygon) {
      closest = std::min(closest, bg::distance(p, edges));
    }
  }
  return closest;
}

static double lowest_vertex(const vector<cell>& cells) {
  double lowest = std::numeric_limits<double>::max();
  for (const auto& c : cells) {
    for (const auto& p : c.polygon) {
      lowest = std::min(lowest, p.y());
    }
  }
  return lowest;
}

static const loop_type_fp l_shape{{0, 0}, {20, 0}, {20, 10}, {10, 10}, {10, 20}, {0, 20}};
static const loop_type_fp square_face{{-20, -20}, {20, -20}, {20, 20}, {-20, 20}};

BOOST_AUTO_TEST_SUITE(cell_clipper_tests)

BOOST_AUTO_TEST_CASE(normalize) {
  const multi_polygon_type_fp square = normalize_boundary(square_face);
  BOOST_REQUIRE_EQUAL(square.size(), 1);
  BOOST_CHECK_CLOSE(bg::area(square), 1600, 1e-9);

  const loop_type_fp clockwise(l_shape.rbegin(), l_shape.rend());
  BOOST_CHECK_CLOSE(bg::area(normalize_boundary(clockwise)), 300, 1e-9);

  BOOST_CHECK(normalize_boundary(loop_type_fp{{0, 0}, {1, 1}}).empty());
}

// A slot from the top edge down to (5, 1) leaves 1 of material under it,
// so a border of 1 splits the face in two.  The clamped reflex corner
// at the bottom of the slot ends at (5, -3) and the offset loop crosses
// its own bottom edge.
BOOST_AUTO_TEST_CASE(normalize_inverted_lobe) {
  const loop_type_fp slot{{0, 0}, {10, 0}, {10, 10}, {5.5, 10}, {5, 1}, {4.5, 10}, {0, 10}};
  const loop_type_fp inset = offset_boundary(slot, 1);
  BOOST_REQUIRE_EQUAL(inset.size(), 7);
  BOOST_CHECK_SMALL(inset[4].y() + 3, 1e-9);

  const multi_polygon_type_fp region = normalize_boundary(inset);
  BOOST_CHECK(bg::is_valid(region));
  BOOST_REQUIRE_EQUAL(region.size(), 2);
  box_type_fp envelope;
  bg::envelope(region, envelope);
  BOOST_CHECK_SMALL(envelope.min_corner().y() - 1, 1e-4);

  // Each half is a trapezoid between y = 1 and y = 9.
  const point_type_fp& tip = inset[4];
  const auto crossing = [&tip](const point_type_fp& top) {
    return top.x() + (tip.x() - top.x()) * (top.y() - 1) / (top.y() - tip.y());
  };
  const double right = (9 - crossing(inset[3]) + 9 - inset[3].x()) / 2 * 8;
  const double left = (crossing(inset[5]) - 1 + inset[5].x() - 1) / 2 * 8;
  BOOST_CHECK_CLOSE(bg::area(region), left + right, 1e-2);

  pattern_spec spec;
  spec.shape = PatternShape::SQUARE;
  spec.width = 0.3;
  spec.spacing = 0.2;
  spec.border = 1;
  for (const auto clip : {ClipMode::WHOLE, ClipMode::PARTIAL}) {
    spec.clip = clip;
    const face_layout layout = layout_pattern(slot, spec);
    BOOST_REQUIRE_GT(layout.cells.size(), 0);
    BOOST_CHECK_GE(lowest_vertex(layout.cells), 1 - 1e-4);
  }
}

BOOST_AUTO_TEST_CASE(none) {
  const vector<cell> candidates{square_cell(15, 15, 2), square_cell(5, 5, 2), square_cell(19.5, 5, 2)};
  const vector<cell> kept = clip_cells(candidates, l_shape, ClipMode::NONE);
  // Only the envelope of the boundary is checked.
  BOOST_REQUIRE_EQUAL(kept.size(), 2);
  BOOST_CHECK_EQUAL(kept[0].center, point_type_fp(15, 15));
  BOOST_CHECK_EQUAL(kept[1].center, point_type_fp(5, 5));
}

BOOST_AUTO_TEST_CASE(none_tolerance) {
  const vector<cell> candidates{square_cell(19.05, 5, 2), square_cell(19.2, 5, 2)};
  const vector<cell> kept = clip_cells(candidates, l_shape, ClipMode::NONE);
  BOOST_REQUIRE_EQUAL(kept.size(), 1);
  BOOST_CHECK_EQUAL(kept[0].center, point_type_fp(19.05, 5));
}

BOOST_AUTO_TEST_CASE(whole) {
  const vector<cell> candidates{
    square_cell(15, 15, 2),
    square_cell(5, 5, 2),
    square_cell(19, 5, 2),
    square_cell(15, 10, 2),
    square_cell(9, 15, 2),
  };
  const vector<cell> kept = clip_cells(candidates, l_shape, ClipMode::WHOLE);
  // (19, 5) and (9, 15) touch the boundary from inside.
  BOOST_REQUIRE_EQUAL(kept.size(), 3);
  BOOST_CHECK_EQUAL(kept[0].center, point_type_fp(5, 5));
  BOOST_CHECK_EQUAL(kept[1].center, point_type_fp(19, 5));
  BOOST_CHECK_EQUAL(kept[2].center, point_type_fp(9, 15));
}

BOOST_AUTO_TEST_CASE(partial) {
  const vector<cell> candidates{
    square_cell(15, 15, 2),
    square_cell(5, 5, 2),
    square_cell(20, 5, 4),
    square_cell(40, 5, 2),
  };
  const vector<cell> kept = clip_cells(candidates, l_shape, ClipMode::PARTIAL);
  BOOST_REQUIRE_EQUAL(kept.size(), 2);
  BOOST_CHECK_EQUAL(kept[0].center, point_type_fp(5, 5));
  BOOST_CHECK_CLOSE(signed_area(kept[0].polygon), 4, 1e-6);
  // Half of the cell is left, with the centre of the whole one.
  BOOST_CHECK_EQUAL(kept[1].center, point_type_fp(20, 5));
  BOOST_CHECK_CLOSE(signed_area(kept[1].polygon), 8, 1e-6);
  const box_type_fp envelope = loop_envelope(kept[1].polygon);
  BOOST_CHECK_CLOSE(envelope.max_corner().x(), 20, 1e-6);
}

BOOST_AUTO_TEST_CASE(partial_split) {
  // The cell covers the inner corner of the L, which takes 5 x 5 out of it.
  const vector<cell> candidates{square_cell(12, 12, 6)};
  const vector<cell> kept = clip_cells(candidates, l_shape, ClipMode::PARTIAL);
  BOOST_REQUIRE_EQUAL(kept.size(), 1);
  BOOST_CHECK_CLOSE(signed_area(kept[0].polygon), 36 - 25, 1e-6);

  // Across both arms of a U it becomes two cells.

  const loop_type_fp u_shape{{0, 0}, {30, 0}, {30, 20}, {20, 20}, {20, 10}, {10, 10}, {10, 20}, {0, 20}};
  const vector<cell> across{cell{translate_loop(rectangle(30, 4), point_type_fp(15, 15)), point_type_fp(15, 15)}};
  const vector<cell> pieces = clip_cells(across, u_shape, ClipMode::PARTIAL);
  BOOST_REQUIRE_EQUAL(pieces.size(), 2);
  for (const auto& piece : pieces) {
    BOOST_CHECK_EQUAL(piece.center, point_type_fp(15, 15));
    BOOST_CHECK_CLOSE(signed_area(piece.polygon), 40, 1e-6);
  }
}

BOOST_AUTO_TEST_CASE(empty_boundary) {
  const vector<cell> candidates{square_cell(0, 0, 1)};
  BOOST_CHECK(clip_cells(candidates, loop_type_fp(), ClipMode::NONE).empty());
  BOOST_CHECK(clip_cells(candidates, loop_type_fp(), ClipMode::WHOLE).empty());
  BOOST_CHECK(clip_cells(candidates, loop_type_fp(), ClipMode::PARTIAL).empty());
}

BOOST_AUTO_TEST_CASE(default_layout) {
  const face_layout layout = layout_pattern(square_face, pattern_spec());
  BOOST_CHECK_EQUAL(layout.offset.size(), 4);
  BOOST_CHECK_EQUAL(layout.cells.size(), 18);
  for (const auto& c : layout.cells) {
    const box_type_fp envelope = loop_envelope(c.polygon);
    BOOST_CHECK_GE(envelope.min_corner().x(), -18.1);
    BOOST_CHECK_LE(envelope.max_corner().x(), 18.1);
    BOOST_CHECK_CLOSE(envelope.max_corner().y() - envelope.min_corner().y(), 36, 1e-9);
  }
}

BOOST_AUTO_TEST_CASE(single_line_layout) {
  pattern_spec spec;
  spec.width = 5;
  spec.spacing = 100.0;
  spec.border = 5;
  const face_layout layout = layout_pattern(square_face, spec);
  BOOST_REQUIRE_EQUAL(layout.cells.size(), 1);
  BOOST_CHECK_SMALL(layout.cells[0].center.x(), 1e-9);
  BOOST_CHECK_SMALL(layout.cells[0].center.y(), 1e-9);
}

BOOST_AUTO_TEST_CASE(per_axis_border_layout) {
  pattern_spec spec;
  spec.border_x = 5.0;
  spec.border_y = 1.0;
  const face_layout layout = layout_pattern(square_face, spec);
  const box_type_fp envelope = loop_envelope(layout.offset);
  BOOST_CHECK_SMALL(envelope.min_corner().x() + 15, 1e-9);
  BOOST_CHECK_SMALL(envelope.max_corner().x() - 15, 1e-9);
  BOOST_CHECK_SMALL(envelope.min_corner().y() + 19, 1e-9);
  BOOST_CHECK_SMALL(envelope.max_corner().y() - 19, 1e-9);
  BOOST_CHECK_EQUAL(layout.cells.size(), 15);
  for (const auto& c : layout.cells) {
    BOOST_CHECK_GE(loop_envelope(c.polygon).min_corner().x(), -15 - 1e-4);
  }
}

BOOST_AUTO_TEST_CASE(collapsed_layout) {
  pattern_spec spec;
  spec.border = 25;
  const face_layout layout = layout_pattern(square_face, spec);
  BOOST_CHECK(layout.offset.empty());
  BOOST_CHECK(layout.cells.empty());
}

BOOST_AUTO_TEST_CASE(clip_modes_layout) {
  const loop_type_fp triangle{{-20, -15}, {20, -15}, {0, 20}};
  pattern_spec spec;
  spec.shape = PatternShape::HEXAGON;
  spec.width = 3;
  spec.wall_thickness = 1.0;
  spec.border = 1;

  spec.clip = ClipMode::WHOLE;
  const face_layout whole = layout_pattern(triangle, spec);
  spec.clip = ClipMode::PARTIAL;
  const face_layout partial = layout_pattern(triangle, spec);

  BOOST_CHECK_GT(whole.cells.size(), 0);
  BOOST_CHECK_GT(partial.cells.size(), whole.cells.size());

  const multi_polygon_type_fp region = normalize_boundary(whole.offset);
  for (const auto& c : whole.cells) {
    for (const auto& p : c.polygon) {
      BOOST_CHECK(bg::covered_by(p, region) || bg::distance(p, region) <= boundary_tolerance);
    }
  }
  double total = 0;
  for (const auto& c : partial.cells) {
    total += signed_area(c.polygon);
  }
  BOOST_CHECK_LE(total, bg::area(region) + 1e-6);
}

BOOST_AUTO_TEST_CASE(acute_wedge_layout) {
  const loop_type_fp wedge{{0, 0}, {60, -6}, {60, 6}};
  pattern_spec spec;
  spec.shape = PatternShape::CIRCLE;
  spec.width = 0.5;
  spec.wall_thickness = 0.2;
  spec.border = 2;
  for (const auto clip : {ClipMode::WHOLE, ClipMode::PARTIAL}) {
    spec.clip = clip;
    const face_layout layout = layout_pattern(wedge, spec);
    BOOST_REQUIRE_GT(layout.cells.size(), 0);
    BOOST_CHECK_GE(closest_to_edge(layout.cells, wedge), 2 - 1e-4);
  }
}

BOOST_AUTO_TEST_SUITE_END()
