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

#ifndef FACE_FRAME_HPP
#define FACE_FRAME_HPP

#include <vector>

#include "geometry.hpp"

// A 2D coordinate system on a face.  (u, v, normal) is right-handed and
// orthonormal; boundary is the outer wire of the face in (u, v)
// coordinates relative to origin, in the order in which the wire is
// traversed.
struct face_frame {
  point_type_3d origin;
  point_type_3d u;
  point_type_3d v;
  point_type_3d normal;
  loop_type_fp boundary;
  box_type_fp bbox;

  // Point of the face plane at (p.x, p.y), moved by height along the
  // normal.
  point_type_3d to_world(const point_type_fp& p, double height = 0) const;
  // Orthogonal projection onto the face plane.
  point_type_fp to_local(const point_type_3d& p) const;
};

// u and v for a face with this normal.  The two axes that aren't the
// dominant axis of the normal are tried in the order X, Y, Z and the
// first is projected onto the plane to make u; v = normal x u.
void frame_axes(const point_type_3d& normal, point_type_3d& u, point_type_3d& v);

// Builds the frame of a face lying in the plane through plane_point
// with the given normal.  wire_points are the outer wire's points in
// traversal order; they are projected, consecutive duplicates are
// dropped and the origin is put at the centre of their bounding box.
// Throws facecut_exception(ERR_UNSUPPORTEDFACETOPOLOGY) if fewer than
// three distinct points remain or they enclose no area.
face_frame make_face_frame(const point_type_3d& plane_point,
                           const point_type_3d& normal,
                           const std::vector<point_type_3d>& wire_points);

// Positive for counterclockwise loops.
double signed_area(const loop_type_fp& loop);

box_type_fp loop_envelope(const loop_type_fp& loop);

// Closed ring with the points of the loop, clockwise like ring_type_fp.
ring_type_fp loop_to_ring(const loop_type_fp& loop);

loop_type_fp translate_loop(const loop_type_fp& loop, const point_type_fp& offset);
// Rotates counterclockwise around center by angle, in radians.
loop_type_fp rotate_loop(const loop_type_fp& loop, const point_type_fp& center, double angle);

point_type_3d make_point_3d(double x, double y, double z);
double dot_3d(const point_type_3d& a, const point_type_3d& b);
point_type_3d cross_3d(const point_type_3d& a, const point_type_3d& b);
point_type_3d add_3d(const point_type_3d& a, const point_type_3d& b);
point_type_3d scale_3d(const point_type_3d& a, double factor);
double length_3d(const point_type_3d& a);
point_type_3d normalize_3d(const point_type_3d& a);

#endif // FACE_FRAME_HPP
