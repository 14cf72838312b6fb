#ifndef MESH_STATS_HPP
#define MESH_STATS_HPP

#include <ostream>
#include <vector>

#include <TopoDS_Shape.hxx>

#include "geometry.hpp"

typedef boost::geometry::model::box<point_type_3d> box_type_3d;

struct mesh_stats {
  // Sum of the triangulation nodes of every face.
  size_t vertices;
  size_t triangles;
  box_type_3d bounds;
  std::vector<point_type_3d> nodes;
};

// Meshes the solid and counts the result.  The triangulation is stored
// on the shape, so this must not run at the same time as other work on
// the same solid.  Throws facecut_exception(ERR_GEOMETRYCUTFAILED) if
// meshing fails.
mesh_stats tessellate(const TopoDS_Shape& solid,
                      double linear_deflection = 0.1,
                      double angular_deflection = 0.5);

// The exact bounding box of the solid, without tolerance gaps.
box_type_3d bounding_box(const TopoDS_Shape& solid);

double diagonal(const box_type_3d& box);

std::ostream& operator<<(std::ostream& out, const box_type_3d& box);

#endif // MESH_STATS_HPP
