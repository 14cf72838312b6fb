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

#ifndef FACE_SELECTOR_HPP
#define FACE_SELECTOR_HPP

#include <string>
#include <vector>

#include <gp_Dir.hxx>
#include <gp_Pnt.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>

#include "face_frame.hpp"

// Picks faces of a solid.  The text form is a comma separated list of
//   >X <X >Y <Y >Z <Z  faces whose outward normal points most nearly
//                      along (>) or against (<) the axis,
//   #N                 the N-th face, counting from 0, in the order in
//                      which the kernel explores them.
// A selector can also hold a face directly.
class face_selector {
 public:
  // Throws facecut_exception(ERR_INVALIDPATTERNSPEC) if the text can't
  // be parsed.
  face_selector(const std::string& expression);
  face_selector(const char* expression);
  face_selector(const TopoDS_Face& face);

  // The matching faces, in the order of the terms and without
  // duplicates.  Throws facecut_exception(ERR_NOMATCHINGFACE) if there
  // are none.
  std::vector<TopoDS_Face> select(const TopoDS_Shape& solid) const;
  const std::string& to_string() const {
    return expression;
  }

 private:
  struct term {
    enum kind_t {DIRECTION, INDEX, FACE};
    kind_t kind;
    gp_Dir direction;
    unsigned int index;
    TopoDS_Face face;
  };
  void parse(const std::string& text);
  std::string expression;
  std::vector<term> terms;
};

// Outward normal of the face at the centre of its parameter range and
// the point where it was measured.  Throws
// facecut_exception(ERR_UNSUPPORTEDFACETOPOLOGY) where the normal is
// undefined.
gp_Dir face_normal(const TopoDS_Face& face, gp_Pnt& at);

// Points of the outer wire of the face in traversal order: the start of
// every straight edge and uniform samples along curved edges, excluding
// their ends.
std::vector<point_type_3d> outer_wire_points(const TopoDS_Face& face);

// The frame of one face.  Throws
// facecut_exception(ERR_UNSUPPORTEDFACETOPOLOGY) if the face has no outer
// wire, has a wire outside of it or its boundary is degenerate.
face_frame resolve_frame(const TopoDS_Face& face);

std::vector<face_frame> resolve_frames(const TopoDS_Shape& solid, const face_selector& selector);

#endif // FACE_SELECTOR_HPP
