#include <string>
#include <boost/format.hpp>

#include <BRepAlgoAPI_Cut.hxx>
#include <ShapeUpgrade_UnifySameDomain.hxx>
#include <Standard_Failure.hxx>
#include <TopExp_Explorer.hxx>
#include <TopTools_ListOfShape.hxx>

#include "facecut_exception.hpp"
#include "primitives.hpp"
#include "cell_solids.hpp"

using std::string;
using std::vector;

static gp_Pnt to_gp(const point_type_3d& p) {
  return gp_Pnt(p.get<0>(), p.get<1>(), p.get<2>());
}

TopoDS_Shape extrude_cell(const face_frame& frame, const loop_type_fp& polygon, double depth) {
  vector<gp_Pnt> points;
  points.reserve(polygon.size());
  for (const auto& p : polygon) {
    points.push_back(to_gp(frame.to_world(p, prism_clearance)));
  }
  const point_type_3d& n = frame.normal;
  const double length = prism_clearance + depth;
  return extrude_polygon(points, gp_Vec(-n.get<0>() * length, -n.get<1>() * length, -n.get<2>() * length));
}

vector<TopoDS_Shape> build_cell_prisms(const face_frame& frame,
                                       const vector<cell>& cells,
                                       double depth) {
  vector<TopoDS_Shape> prisms;
  prisms.reserve(cells.size());
  for (const auto& c : cells) {
    prisms.push_back(extrude_cell(frame, c.polygon, depth));
  }
  return prisms;
}

TopoDS_Shape cut_solids(const TopoDS_Shape& base, const vector<TopoDS_Shape>& tools) {
  if (tools.empty()) {
    return base;
  }
  try {
    TopTools_ListOfShape arguments;
    arguments.Append(base);
    TopTools_ListOfShape tool_list;
    for (const auto& tool : tools) {
      tool_list.Append(tool);
    }
    BRepAlgoAPI_Cut cut;
    cut.SetArguments(arguments);
    cut.SetTools(tool_list);
    cut.Build();
    if (!cut.IsDone() || cut.HasErrors()) {
      throw facecut_exception(str(boost::format("Boolean cut of %1% tools failed") % tools.size()),
                              ERR_GEOMETRYCUTFAILED);
    }
    const TopoDS_Shape result = cut.Shape();
    if (result.IsNull()) {
      throw facecut_exception("Boolean cut returned nothing", ERR_GEOMETRYCUTFAILED);
    }
    TopExp_Explorer solids(result, TopAbs_SOLID);
    if (!solids.More()) {
      throw facecut_exception("Boolean cut left no solid", ERR_GEOMETRYCUTFAILED);
    }
    return result;
  } catch (const Standard_Failure& e) {
    throw facecut_exception(string("Kernel failure while cutting: ") + e.GetMessageString(),
                            ERR_GEOMETRYCUTFAILED);
  }
}

TopoDS_Shape clean(const TopoDS_Shape& solid, const clean_options& options) {
  try {
    ShapeUpgrade_UnifySameDomain unifier(solid, options.unify_edges, options.unify_faces,
                                         options.concat_bsplines);
    unifier.SetLinearTolerance(options.linear_tolerance);
    unifier.SetAngularTolerance(options.angular_tolerance);
    unifier.Build();
    const TopoDS_Shape result = unifier.Shape();
    if (result.IsNull()) {
      throw facecut_exception("Cleaning returned nothing", ERR_GEOMETRYCUTFAILED);
    }
    return result;
  } catch (const Standard_Failure& e) {
    throw facecut_exception(string("Kernel failure while cleaning: ") + e.GetMessageString(),
                            ERR_GEOMETRYCUTFAILED);
  }
}
