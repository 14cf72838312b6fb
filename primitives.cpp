/*
 * This file is part of facecut.
 *
 * facecut is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * facecut is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with facecut.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <cmath>
#include <boost/format.hpp>

#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakePolygon.hxx>
#include <BRepPrimAPI_MakeBox.hxx>
#include <BRepPrimAPI_MakeCylinder.hxx>
#include <BRepPrimAPI_MakePrism.hxx>
#include <Standard_Failure.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Wire.hxx>

#include "cell_shapes.hpp"
#include "facecut_exception.hpp"
#include "primitives.hpp"

using std::string;
using std::vector;

TopoDS_Shape extrude_polygon(const vector<gp_Pnt>& points, const gp_Vec& direction) {
  try {
    BRepBuilderAPI_MakePolygon polygon;
    for (const auto& p : points) {
      polygon.Add(p);
    }
    polygon.Close();
    if (!polygon.IsDone()) {
      throw facecut_exception(str(boost::format("Can't build a wire through %1% points") % points.size()),
                              ERR_GEOMETRYCUTFAILED);
    }
    BRepBuilderAPI_MakeFace face(polygon.Wire(), Standard_True);
    if (!face.IsDone()) {
      throw facecut_exception("Can't build a planar face from the wire", ERR_GEOMETRYCUTFAILED);
    }
    BRepPrimAPI_MakePrism prism(face.Face(), direction);
    if (!prism.IsDone() || prism.Shape().IsNull()) {
      throw facecut_exception("Can't extrude the face", ERR_GEOMETRYCUTFAILED);
    }
    return prism.Shape();
  } catch (const Standard_Failure& e) {
    throw facecut_exception(string("Kernel failure while extruding: ") + e.GetMessageString(),
                            ERR_GEOMETRYCUTFAILED);
  }
}

loop_type_fp prism_profile(unsigned int sides, double width) {
  return regular_polygon(sides, width, M_PI / sides + M_PI / 2);
}

TopoDS_Shape polygon_prism(unsigned int sides, double width, double height) {
  if (sides < 3) {
    throw facecut_exception(str(boost::format("A prism needs at least 3 sides, got %1%") % sides),
                            ERR_INVALIDPATTERNSPEC);
  }
  if (!(width > 0) || !(height > 0)) {
    throw facecut_exception(str(boost::format("Prism width and height must be positive, got %1% and %2%")
                                % width % height),
                            ERR_INVALIDPATTERNSPEC);
  }
  vector<gp_Pnt> points;
  for (const auto& p : prism_profile(sides, width)) {
    points.push_back(gp_Pnt(p.x(), p.y(), 0));
  }
  return extrude_polygon(points, gp_Vec(0, 0, height));
}

TopoDS_Shape make_box(double length, double width, double height) {
  if (!(length > 0) || !(width > 0) || !(height > 0)) {
    throw facecut_exception(str(boost::format("Box dimensions must be positive, got %1% x %2% x %3%")
                                % length % width % height),
                            ERR_INVALIDPATTERNSPEC);
  }
  return BRepPrimAPI_MakeBox(gp_Pnt(-length / 2, -width / 2, 0), length, width, height).Shape();
}

TopoDS_Shape make_cylinder(double radius, double height) {
  if (!(radius > 0) || !(height > 0)) {
    throw facecut_exception(str(boost::format("Cylinder radius and height must be positive, got %1% and %2%")
                                % radius % height),
                            ERR_INVALIDPATTERNSPEC);
  }
  return BRepPrimAPI_MakeCylinder(radius, height).Shape();
}
