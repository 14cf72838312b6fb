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

#ifndef PRIMITIVES_HPP
#define PRIMITIVES_HPP

#include <vector>

#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>
#include <TopoDS_Shape.hxx>

#include "geometry.hpp"

// A planar polygon through the points, in order, swept along direction.
// Throws facecut_exception(ERR_GEOMETRYCUTFAILED) if the kernel can't
// build it.
TopoDS_Shape extrude_polygon(const std::vector<gp_Pnt>& points, const gp_Vec& direction);

// Outline of the ends of polygon_prism: a regular polygon with an edge
// parallel to x.
loop_type_fp prism_profile(unsigned int sides, double width);

// Regular prism standing on z = 0, its ends measured flat-to-flat by
// width.  Throws facecut_exception(ERR_INVALIDPATTERNSPEC) unless
// sides >= 3, width > 0 and height > 0.
TopoDS_Shape polygon_prism(unsigned int sides, double width, double height);

// Box centred on the z axis with its bottom on z = 0.
TopoDS_Shape make_box(double length, double width, double height);

// Cylinder around the z axis with its bottom on z = 0.
TopoDS_Shape make_cylinder(double radius, double height);

#endif // PRIMITIVES_HPP
