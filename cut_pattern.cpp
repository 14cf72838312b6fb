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

#include <iostream>
#include <boost/format.hpp>

#include "boundary_offset.hpp"
#include "cell_clipper.hpp"
#include "facecut_exception.hpp"
#include "mesh_stats.hpp"
#include "cut_pattern.hpp"

using std::cerr;
using std::endl;
using std::vector;

vector<face_plan> plan_pattern(const TopoDS_Shape& solid,
                               const face_selector& selector,
                               const pattern_spec& spec) {
  spec.validate();
  vector<face_plan> plans;
  for (const auto& frame : resolve_frames(solid, selector)) {
    face_plan plan;
    plan.frame = frame;
    plan.layout = layout_pattern(frame.boundary, spec);
    if (plan.layout.offset.empty()) {
      cerr << "Warning: a border of " << spec.border << " leaves no room on a face matched by \""
           << selector.to_string() << "\"" << endl;
    }
    plans.push_back(plan);
  }
  return plans;
}

double cut_reach(const TopoDS_Shape& solid, const boost::optional<double>& depth) {
  if (depth) {
    return *depth;
  }
  return diagonal(bounding_box(solid)) + 1;
}

static TopoDS_Shape finish(const TopoDS_Shape& cut, const cut_options& options) {
  if (options.clean_after) {
    return clean(cut, options.clean);
  }
  return cut;
}

cut_result cut_pattern(const TopoDS_Shape& solid,
                       const face_selector& selector,
                       const pattern_spec& spec,
                       const cut_options& options) {
  const vector<face_plan> plans = plan_pattern(solid, selector, spec);
  const double reach = cut_reach(solid, spec.depth);

  vector<TopoDS_Shape> prisms;
  for (const auto& plan : plans) {
    const vector<TopoDS_Shape> face_prisms = build_cell_prisms(plan.frame, plan.layout.cells, reach);
    prisms.insert(prisms.end(), face_prisms.begin(), face_prisms.end());
  }

  cut_result result;
  result.cell_count = prisms.size();
  if (prisms.empty()) {
    cerr << "Warning: no cells of the pattern fit on the faces matched by \""
         << selector.to_string() << "\"" << endl;
    result.solid = solid;
    return result;
  }
  result.solid = finish(cut_solids(solid, prisms), options);
  return result;
}

cut_result cut_border(const TopoDS_Shape& solid,
                      const face_selector& selector,
                      double width,
                      const boost::optional<double>& depth,
                      const cut_options& options) {
  if (!(width > 0)) {
    throw facecut_exception(str(boost::format("Invalid border cut: width must be positive, got %1%") % width),
                            ERR_INVALIDPATTERNSPEC);
  }
  if (depth && !(*depth > 0)) {
    throw facecut_exception(str(boost::format("Invalid border cut: depth must be positive, got %1%") % *depth),
                            ERR_INVALIDPATTERNSPEC);
  }
  const double reach = cut_reach(solid, depth);

  vector<TopoDS_Shape> prisms;
  for (const auto& frame : resolve_frames(solid, selector)) {
    const loop_type_fp inside = offset_boundary(frame.boundary, width);
    if (inside.empty()) {
      cerr << "Warning: a border cut of " << width << " leaves no room on a face matched by \""
           << selector.to_string() << "\"" << endl;
      continue;
    }
    for (const auto& piece : normalize_boundary(inside)) {
      loop_type_fp loop(piece.outer().begin(), piece.outer().end() - 1);
      prisms.push_back(extrude_cell(frame, loop, reach));
    }
  }

  cut_result result;
  result.cell_count = prisms.size();
  if (prisms.empty()) {
    result.solid = solid;
    return result;
  }
  result.solid = finish(cut_solids(solid, prisms), options);
  return result;
}
