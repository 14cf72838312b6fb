#include <cmath>
#include <string>

#include <BRepBndLib.hxx>
#include <BRepMesh_IncrementalMesh.hxx>
#include <BRep_Tool.hxx>
#include <Bnd_Box.hxx>
#include <Poly_Triangulation.hxx>
#include <Standard_Failure.hxx>
#include <TopExp_Explorer.hxx>
#include <TopLoc_Location.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>

#include "facecut_exception.hpp"
#include "mesh_stats.hpp"

mesh_stats tessellate(const TopoDS_Shape& solid,
                      double linear_deflection,
                      double angular_deflection) {
  mesh_stats stats;
  stats.vertices = 0;
  stats.triangles = 0;
  bg::assign_inverse(stats.bounds);
  try {
    BRepMesh_IncrementalMesh mesher(solid, linear_deflection, Standard_False, angular_deflection, Standard_False);
    if (!mesher.IsDone()) {
      throw facecut_exception("Meshing failed", ERR_GEOMETRYCUTFAILED);
    }
    for (TopExp_Explorer explorer(solid, TopAbs_FACE); explorer.More(); explorer.Next()) {
      const TopoDS_Face& face = TopoDS::Face(explorer.Current());
      TopLoc_Location location;
      const Handle(Poly_Triangulation)& triangulation = BRep_Tool::Triangulation(face, location);
      if (triangulation.IsNull()) {
        continue;
      }
      const gp_Trsf transform = location.Transformation();
      stats.vertices += triangulation->NbNodes();
      stats.triangles += triangulation->NbTriangles();
      for (int i = 1; i <= triangulation->NbNodes(); i++) {
        const gp_Pnt p = triangulation->Node(i).Transformed(transform);
        const point_type_3d node(p.X(), p.Y(), p.Z());
        stats.nodes.push_back(node);
        bg::expand(stats.bounds, node);
      }
    }
  } catch (const Standard_Failure& e) {
    throw facecut_exception(std::string("Kernel failure while meshing: ") + e.GetMessageString(),
                            ERR_GEOMETRYCUTFAILED);
  }
  return stats;
}

box_type_3d bounding_box(const TopoDS_Shape& solid) {
  Bnd_Box box;
  BRepBndLib::AddOptimal(solid, box, Standard_False, Standard_False);
  if (box.IsVoid()) {
    throw facecut_exception("Can't measure an empty shape", ERR_GEOMETRYCUTFAILED);
  }
  double xmin, ymin, zmin, xmax, ymax, zmax;
  box.Get(xmin, ymin, zmin, xmax, ymax, zmax);
  return box_type_3d(point_type_3d(xmin, ymin, zmin), point_type_3d(xmax, ymax, zmax));
}

double diagonal(const box_type_3d& box) {
  return bg::distance(box.min_corner(), box.max_corner());
}

std::ostream& operator<<(std::ostream& out, const box_type_3d& box) {
  out << "(" << box.min_corner().get<0>() << ", " << box.min_corner().get<1>() << ", "
      << box.min_corner().get<2>() << ") - (" << box.max_corner().get<0>() << ", "
      << box.max_corner().get<1>() << ", " << box.max_corner().get<2>() << ")";
  return out;
}
