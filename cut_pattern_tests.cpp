#define BOOST_TEST_MODULE cut_pattern tests
#include <boost/test/unit_test.hpp>

#include <cmath>
#include <string>
#include <vector>

#include <BRepAlgoAPI_Common.hxx>
#include <BRepBuilderAPI_Transform.hxx>
#include <BRepGProp.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <GProp_GProps.hxx>
#include <gp_Trsf.hxx>
#include <gp_Vec.hxx>

#include "geometry.hpp"
#include "facecut_exception.hpp"
#include "mesh_stats.hpp"
#include "primitives.hpp"

#include "cut_pattern.hpp"

using namespace std;

static bool invalid_pattern(const facecut_exception& e) {
  return e.code() == ERR_INVALIDPATTERNSPEC;
}

static double volume(const TopoDS_Shape& shape) {
  GProp_GProps props;
  BRepGProp::VolumeProperties(shape, props);
  return props.Mass();
}

static gp_Pnt centre_of_mass(const TopoDS_Shape& shape) {
  GProp_GProps props;
  BRepGProp::VolumeProperties(shape, props);
  return props.CentreOfMass();
}

static double size_along(const box_type_3d& box, unsigned int axis) {
  switch (axis) {
    case 0:
      return box.max_corner().get<0>() - box.min_corner().get<0>();
    case 1:
      return box.max_corner().get<1>() - box.min_corner().get<1>();
    default:
      return box.max_corner().get<2>() - box.min_corner().get<2>();
  }
}

BOOST_AUTO_TEST_SUITE(cut_pattern_tests)

BOOST_AUTO_TEST_CASE(single_line_on_every_face) {
  const TopoDS_Shape cube = make_box(40, 40, 40);
  const size_t base_vertices = tessellate(cube).vertices;
  pattern_spec spec;
  spec.width = 5;
  spec.spacing = 100.0;
  spec.border = 5;
  spec.depth = 3.0;
  for (const string selector : {">X", "<X", ">Y", "<Y", ">Z", "<Z"}) {
    BOOST_TEST_MESSAGE("Face " << selector);
    const cut_result result = cut_pattern(cube, selector, spec);
    BOOST_CHECK_EQUAL(result.cell_count, 1);
    BOOST_CHECK_GT(tessellate(result.solid).vertices, base_vertices);
    BOOST_CHECK_CLOSE(volume(result.solid), 64000 - 5 * 30 * 3, 1e-6);
  }
}

BOOST_AUTO_TEST_CASE(depth_containment) {
  const TopoDS_Shape cube = make_box(40, 40, 40);
  pattern_spec spec;
  spec.depth = 0.2;
  const cut_result result = cut_pattern(cube, ">X,<X,>Y,<Y,>Z,<Z", spec);
  BOOST_CHECK_EQUAL(result.cell_count, 6 * 18);

  const TopoDS_Shape core = BRepPrimAPI_MakeBox(gp_Pnt(-19.75, -19.75, 0.25), 39.5, 39.5, 39.5).Shape();
  BRepAlgoAPI_Common common(result.solid, core);
  BOOST_REQUIRE(common.IsDone());
  const box_type_3d bounds = bounding_box(common.Shape());
  for (unsigned int axis = 0; axis < 3; axis++) {
    BOOST_CHECK_SMALL(size_along(bounds, axis) - 39.5, 0.01);
  }
  BOOST_CHECK_CLOSE(volume(common.Shape()), 39.5 * 39.5 * 39.5, 1e-6);
}

BOOST_AUTO_TEST_CASE(border_containment) {
  const TopoDS_Shape disc = make_cylinder(30, 4);
  pattern_spec spec;
  spec.shape = PatternShape::HEXAGON;
  spec.width = 3;
  spec.wall_thickness = 1.0;
  spec.border = 10;
  spec.clip = ClipMode::PARTIAL;
  const cut_result result = cut_pattern(disc, ">Z", spec);
  BOOST_CHECK_GT(result.cell_count, 0);

  const mesh_stats stats = tessellate(result.solid);
  for (const auto& node : stats.nodes) {
    const double z = node.get<2>();
    const double radius = std::hypot(node.get<0>(), node.get<1>());
    if (z > 1e-6 && z < 4 - 1e-6 && std::abs(radius - 30) > 0.01) {
      BOOST_CHECK_LE(radius, 22);
    }
  }
  BOOST_CHECK_LT(volume(result.solid), M_PI * 30 * 30 * 4);
}

BOOST_AUTO_TEST_CASE(through_cut) {
  const TopoDS_Shape plate = make_box(1, 40, 40);
  pattern_spec spec;
  spec.width = 2;
  spec.spacing = 4.0;
  spec.border = 3;
  const size_t base_vertices = tessellate(plate).vertices;
  const box_type_3d base_bounds = bounding_box(plate);

  const cut_result result = cut_pattern(plate, ">X", spec);
  BOOST_CHECK_EQUAL(result.cell_count, 6);
  BOOST_CHECK_GE(tessellate(result.solid).vertices, 2 * base_vertices);
  const box_type_3d bounds = bounding_box(result.solid);
  for (unsigned int axis = 0; axis < 3; axis++) {
    BOOST_CHECK_SMALL(size_along(bounds, axis) - size_along(base_bounds, axis), 0.1);
  }
  // Six slots 2 wide and 34 long, right through the plate.
  BOOST_CHECK_CLOSE(volume(result.solid), 1600 - 6 * 2 * 34, 1e-6);
}

BOOST_AUTO_TEST_CASE(translated_solid) {
  const TopoDS_Shape cube = make_box(40, 40, 40);
  gp_Trsf move;
  move.SetTranslation(gp_Vec(5, -7, 3));
  const TopoDS_Shape moved = BRepBuilderAPI_Transform(cube, move, Standard_True).Shape();

  pattern_spec spec;
  spec.shape = PatternShape::HEXAGON;
  spec.width = 4;
  spec.wall_thickness = 1.0;
  spec.clip = ClipMode::PARTIAL;
  spec.depth = 2.0;
  spec.angle = 15;
  const cut_result here = cut_pattern(cube, ">Z,<Y", spec);
  const cut_result there = cut_pattern(moved, ">Z,<Y", spec);

  BOOST_CHECK_EQUAL(here.cell_count, there.cell_count);
  BOOST_CHECK_CLOSE(volume(here.solid), volume(there.solid), 1e-4);
  const gp_Pnt a = centre_of_mass(here.solid);
  const gp_Pnt b = centre_of_mass(there.solid);
  BOOST_CHECK_SMALL(b.X() - a.X() - 5, 1e-4);
  BOOST_CHECK_SMALL(b.Y() - a.Y() + 7, 1e-4);
  BOOST_CHECK_SMALL(b.Z() - a.Z() - 3, 1e-4);
}

BOOST_AUTO_TEST_CASE(nothing_fits) {
  const TopoDS_Shape cube = make_box(40, 40, 40);
  pattern_spec spec;
  spec.border = 30;
  const cut_result result = cut_pattern(cube, ">Z", spec);
  BOOST_CHECK_EQUAL(result.cell_count, 0);
  BOOST_CHECK(result.solid.IsSame(cube));

  spec.border = 2;
  spec.width = 50;
  const cut_result too_wide = cut_pattern(cube, ">Z", spec);
  BOOST_CHECK_EQUAL(too_wide.cell_count, 0);
}

BOOST_AUTO_TEST_CASE(errors) {
  const TopoDS_Shape cube = make_box(40, 40, 40);
  pattern_spec spec;
  spec.width = 0;
  BOOST_CHECK_EXCEPTION(cut_pattern(cube, ">Z", spec), facecut_exception, invalid_pattern);

  spec = pattern_spec();
  BOOST_CHECK_EXCEPTION(cut_pattern(cube, "#42", spec), facecut_exception,
                        [](const facecut_exception& e) { return e.code() == ERR_NOMATCHINGFACE; });
  BOOST_CHECK_EXCEPTION(cut_pattern(cube, "top", spec), facecut_exception, invalid_pattern);
}

BOOST_AUTO_TEST_CASE(reach) {
  const TopoDS_Shape cube = make_box(40, 40, 40);
  BOOST_CHECK_EQUAL(cut_reach(cube, 3.0), 3);
  BOOST_CHECK_CLOSE(cut_reach(cube, boost::none), 40 * std::sqrt(3.0) + 1, 1e-6);
}

BOOST_AUTO_TEST_CASE(plan) {
  const TopoDS_Shape cube = make_box(40, 40, 40);
  const vector<face_plan> plans = plan_pattern(cube, ">Z,<Z", pattern_spec());
  BOOST_REQUIRE_EQUAL(plans.size(), 2);
  for (const auto& plan : plans) {
    BOOST_CHECK_EQUAL(plan.layout.cells.size(), 18);
    BOOST_CHECK_EQUAL(plan.layout.offset.size(), 4);
  }
}

BOOST_AUTO_TEST_CASE(border) {
  const TopoDS_Shape cube = make_box(40, 40, 40);
  const cut_result pocket = cut_border(cube, ">Z", 5, 2.0);
  BOOST_CHECK_EQUAL(pocket.cell_count, 1);
  BOOST_CHECK_CLOSE(volume(pocket.solid), 64000 - 30 * 30 * 2, 1e-6);

  const cut_result frame = cut_border(make_box(40, 40, 2), ">Z", 5, boost::none);
  BOOST_CHECK_CLOSE(volume(frame.solid), 40 * 40 * 2 - 30 * 30 * 2, 1e-6);

  const cut_result nothing = cut_border(cube, ">Z", 25, 2.0);
  BOOST_CHECK_EQUAL(nothing.cell_count, 0);

  BOOST_CHECK_EXCEPTION(cut_border(cube, ">Z", 0, 2.0), facecut_exception, invalid_pattern);
  BOOST_CHECK_EXCEPTION(cut_border(cube, ">Z", 5, -1.0), facecut_exception, invalid_pattern);
}

BOOST_AUTO_TEST_SUITE_END()
