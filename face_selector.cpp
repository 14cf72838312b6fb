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

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include <BRepAdaptor_Curve.hxx>
#include <BRepAdaptor_Surface.hxx>
#include <BRepLProp_SLProps.hxx>
#include <BRepTools.hxx>
#include <BRepTools_WireExplorer.hxx>
#include <BRep_Tool.hxx>
#include <Precision.hxx>
#include <Standard_Failure.hxx>
#include <TopExp.hxx>
#include <TopExp_Explorer.hxx>
#include <TopTools_IndexedMapOfShape.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Edge.hxx>
#include <TopoDS_Wire.hxx>

#include "bg_operators.hpp"
#include "facecut_exception.hpp"
#include "face_selector.hpp"

using std::string;
using std::vector;

// Faces whose normal is this close to the best one also match.
static const double direction_tolerance = 1e-6;
// Points taken along curved edges other than circles.
static const unsigned int curve_samples = 16;

face_selector::face_selector(const string& expression) : expression(expression) {
  parse(expression);
}

face_selector::face_selector(const char* expression) : expression(expression) {
  parse(this->expression);
}

face_selector::face_selector(const TopoDS_Face& face) : expression("<face>") {
  term t;
  t.kind = term::FACE;
  t.index = 0;
  t.face = face;
  terms.push_back(t);
}

void face_selector::parse(const string& text) {
  vector<string> words;
  boost::split(words, text, boost::is_any_of(","));
  for (auto& word : words) {
    boost::trim(word);
    term t;
    t.index = 0;
    if (word.size() == 2 && (word[0] == '>' || word[0] == '<')) {
      const double sign = word[0] == '>' ? 1 : -1;
      const char axis = static_cast<char>(std::toupper(static_cast<unsigned char>(word[1])));
      t.kind = term::DIRECTION;
      if (axis == 'X') {
        t.direction = gp_Dir(sign, 0, 0);
      } else if (axis == 'Y') {
        t.direction = gp_Dir(0, sign, 0);
      } else if (axis == 'Z') {
        t.direction = gp_Dir(0, 0, sign);
      } else {
        throw facecut_exception("Unknown axis in face selector \"" + text + "\": " + word,
                                ERR_INVALIDPATTERNSPEC);
      }
    } else if (word.size() > 1 && word[0] == '#') {
      t.kind = term::INDEX;
      // lexical_cast<unsigned> wraps a leading minus around.
      if (!std::isdigit(static_cast<unsigned char>(word[1]))) {
        throw facecut_exception("Bad face index in face selector \"" + text + "\": " + word,
                                ERR_INVALIDPATTERNSPEC);
      }
      try {
        t.index = boost::lexical_cast<unsigned int>(word.substr(1));
      } catch (const boost::bad_lexical_cast& e) {
        throw facecut_exception("Bad face index in face selector \"" + text + "\": " + word,
                                ERR_INVALIDPATTERNSPEC);
      }
    } else {
      throw facecut_exception("Can't parse face selector \"" + text + "\" at \"" + word + "\"",
                              ERR_INVALIDPATTERNSPEC);
    }
    terms.push_back(t);
  }
}

vector<TopoDS_Face> face_selector::select(const TopoDS_Shape& solid) const {
  TopTools_IndexedMapOfShape faces;
  TopExp::MapShapes(solid, TopAbs_FACE, faces);

  vector<gp_Dir> normals;
  for (int i = 1; i <= faces.Extent(); i++) {
    gp_Pnt at;
    normals.push_back(face_normal(TopoDS::Face(faces(i)), at));
  }

  vector<int> selected;
  std::set<int> seen;
  auto add = [&](int index) {
    if (seen.insert(index).second) {
      selected.push_back(index);
    }
  };
  for (const auto& t : terms) {
    switch (t.kind) {
      case term::DIRECTION: {
        double best = -std::numeric_limits<double>::infinity();
        for (const auto& normal : normals) {
          best = std::max(best, normal.Dot(t.direction));
        }
        for (size_t i = 0; i < normals.size(); i++) {
          if (normals[i].Dot(t.direction) >= best - direction_tolerance) {
            add(i + 1);
          }
        }
        break;
      }
      case term::INDEX:
        if (t.index < static_cast<unsigned int>(faces.Extent())) {
          add(t.index + 1);
        }
        break;
      case term::FACE: {
        const int index = faces.FindIndex(t.face);
        if (index > 0) {
          add(index);
        }
        break;
      }
    }
  }

  if (selected.empty()) {
    throw facecut_exception("No face matches the selector \"" + expression + "\"",
                            ERR_NOMATCHINGFACE);
  }
  vector<TopoDS_Face> ret;
  for (int index : selected) {
    ret.push_back(TopoDS::Face(faces(index)));
  }
  return ret;
}

gp_Dir face_normal(const TopoDS_Face& face, gp_Pnt& at) {
  double umin, umax, vmin, vmax;
  BRepTools::UVBounds(face, umin, umax, vmin, vmax);
  BRepAdaptor_Surface surface(face);
  BRepLProp_SLProps props(surface, (umin + umax) / 2, (vmin + vmax) / 2, 1, Precision::Confusion());
  if (!props.IsNormalDefined()) {
    throw facecut_exception("Face normal is undefined at the centre of the face",
                            ERR_UNSUPPORTEDFACETOPOLOGY);
  }
  gp_Dir normal = props.Normal();
  if (face.Orientation() == TopAbs_REVERSED) {
    normal.Reverse();
  }
  at = props.Value();
  return normal;
}

static point_type_3d to_point_3d(const gp_Pnt& p) {
  return make_point_3d(p.X(), p.Y(), p.Z());
}

static vector<point_type_3d> wire_points(const TopoDS_Wire& wire, const TopoDS_Face& face) {
  vector<point_type_3d> points;
  for (BRepTools_WireExplorer explorer(wire, face); explorer.More(); explorer.Next()) {
    const TopoDS_Edge& edge = explorer.Current();
    if (BRep_Tool::Degenerated(edge)) {
      continue;
    }
    BRepAdaptor_Curve curve(edge);
    if (curve.GetType() == GeomAbs_Line) {
      points.push_back(to_point_3d(BRep_Tool::Pnt(explorer.CurrentVertex())));
      continue;
    }
    const double first = curve.FirstParameter();
    const double last = curve.LastParameter();
    unsigned int samples = curve_samples;
    if (curve.GetType() == GeomAbs_Circle) {
      samples = std::max(2u, static_cast<unsigned int>(
          std::ceil(points_per_circle * (last - first) / (2 * M_PI) - 1e-9)));
    }
    const bool reversed = edge.Orientation() == TopAbs_REVERSED;
    for (unsigned int i = 0; i < samples; i++) {
      const double t = reversed ?
          last - (last - first) * i / samples :
          first + (last - first) * i / samples;
      points.push_back(to_point_3d(curve.Value(t)));
    }
  }
  return points;
}

vector<point_type_3d> outer_wire_points(const TopoDS_Face& face) {
  const TopoDS_Wire outer = BRepTools::OuterWire(face);
  if (outer.IsNull()) {
    throw facecut_exception("Face has no outer wire", ERR_UNSUPPORTEDFACETOPOLOGY);
  }
  return wire_points(outer, face);
}

face_frame resolve_frame(const TopoDS_Face& face) {
  gp_Pnt at;
  const gp_Dir normal = face_normal(face, at);
  const face_frame frame = make_face_frame(to_point_3d(at),
                                           make_point_3d(normal.X(), normal.Y(), normal.Z()),
                                           outer_wire_points(face));

  // Holes are allowed but every other wire must be inside the outer one.
  polygon_type_fp outline;
  outline.outer() = loop_to_ring(frame.boundary);
  const TopoDS_Wire outer = BRepTools::OuterWire(face);
  for (TopExp_Explorer explorer(face, TopAbs_WIRE); explorer.More(); explorer.Next()) {
    const TopoDS_Wire& wire = TopoDS::Wire(explorer.Current());
    if (wire.IsSame(outer)) {
      continue;
    }
    for (const auto& p : wire_points(wire, face)) {
      const point_type_fp local = frame.to_local(p);
      if (!bg::covered_by(local, outline) && bg::distance(local, outline) > 1e-6) {
        throw facecut_exception(str(boost::format("Face has a wire outside of its outer wire, at (%1%, %2%)")
                                    % local.x() % local.y()),
                                ERR_UNSUPPORTEDFACETOPOLOGY);
      }
    }
  }
  return frame;
}

vector<face_frame> resolve_frames(const TopoDS_Shape& solid, const face_selector& selector) {
  try {
    vector<face_frame> frames;
    for (const auto& face : selector.select(solid)) {
      frames.push_back(resolve_frame(face));
    }
    return frames;
  } catch (const Standard_Failure& e) {
    throw facecut_exception(string("Kernel failure while resolving faces: ") + e.GetMessageString(),
                            ERR_GEOMETRYCUTFAILED);
  }
}
