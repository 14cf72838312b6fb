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

#ifndef CUT_PATTERN_HPP
#define CUT_PATTERN_HPP

#include <vector>
#include <boost/optional.hpp>

#include <TopoDS_Shape.hxx>

#include "cell_solids.hpp"
#include "face_frame.hpp"
#include "face_selector.hpp"
#include "pattern_layout.hpp"
#include "pattern_spec.hpp"

struct cut_options {
  cut_options() : clean_after(false) {}
  // Run clean() on the result.
  bool clean_after;
  clean_options clean;
};

struct cut_result {
  TopoDS_Shape solid;
  // Number of prisms that were cut, 0 if nothing fit.
  size_t cell_count;
};

// A face and the cells planned on it.
struct face_plan {
  face_frame frame;
  face_layout layout;
};

// Resolves the faces and lays out the pattern on each of them without
// touching the solid.
std::vector<face_plan> plan_pattern(const TopoDS_Shape& solid,
                                    const face_selector& selector,
                                    const pattern_spec& spec);

// How far below the face plane a cut reaches: depth, or past the far
// side of the solid for a through cut.
double cut_reach(const TopoDS_Shape& solid, const boost::optional<double>& depth);

// Cuts the pattern into every face matched by the selector, all in one
// boolean operation.  Throws facecut_exception with
// ERR_INVALIDPATTERNSPEC, ERR_NOMATCHINGFACE,
// ERR_UNSUPPORTEDFACETOPOLOGY or ERR_GEOMETRYCUTFAILED.
cut_result cut_pattern(const TopoDS_Shape& solid,
                       const face_selector& selector,
                       const pattern_spec& spec,
                       const cut_options& options = cut_options());

// Cuts away the inside of each matched face, leaving a frame of the
// given width around its edge.  depth of boost::none cuts through.
cut_result cut_border(const TopoDS_Shape& solid,
                      const face_selector& selector,
                      double width,
                      const boost::optional<double>& depth,
                      const cut_options& options = cut_options());

#endif // CUT_PATTERN_HPP
