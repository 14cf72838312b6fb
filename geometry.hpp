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

#ifndef GEOMETRY_H
#define GEOMETRY_H

#include <vector>
#include <boost/geometry.hpp>
#include <boost/geometry/arithmetic/cross_product.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/geometries.hpp>
#include <boost/geometry/geometries/register/point.hpp>
#include <boost/geometry/geometries/register/ring.hpp>
#include <boost/polygon/polygon.hpp>

// This one chooses the actual size of the output (width and height).
#define SVG_PIX_PER_MM 4
// This one chooses the resolution of the output (viewBox).
#define SVG_DOTS_PER_MM 100

// Number of segments used when a circle is approximated by a polygon.
static const unsigned int points_per_circle = 64;

typedef double coordinate_type_fp;

typedef boost::geometry::model::d2::point_xy<coordinate_type_fp> point_type_fp;
typedef boost::geometry::model::multi_point<point_type_fp> multi_point_type_fp;
typedef boost::geometry::model::segment<point_type_fp> segment_type_fp;
typedef boost::geometry::model::ring<point_type_fp> ring_type_fp;
typedef boost::geometry::model::box<point_type_fp> box_type_fp;
typedef boost::geometry::model::linestring<point_type_fp> linestring_type_fp;
typedef boost::geometry::model::polygon<point_type_fp> polygon_type_fp;
typedef boost::geometry::model::multi_polygon<polygon_type_fp> multi_polygon_type_fp;

// An ordered loop of points, implicitly closed (the last point connects
// to the first) and of either orientation.  Face boundaries and cell
// outlines are kept in this form so that their traversal order is never
// changed by boost::geometry's orientation correction.
typedef std::vector<point_type_fp> loop_type_fp;

typedef boost::geometry::model::point<coordinate_type_fp, 3, boost::geometry::cs::cartesian> point_type_3d;

namespace bg = boost::geometry;

// Boost.Polygon works on integers; 2D coordinates are scaled by this
// factor (10nm resolution for millimetre input) before being handed over.
static const coordinate_type_fp polygon_int_scale = 1e5;

typedef boost::polygon::point_data<int> point_type_p;
typedef boost::polygon::polygon_data<int> polygon_type_p;
typedef boost::polygon::polygon_with_holes_data<int> polygon_with_holes_type_p;
typedef boost::polygon::polygon_set_data<int> polygon_set_type_p;

#endif
