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

#include "bg_operators.hpp"
#include "facecut_exception.hpp"
#include "face_frame.hpp"

using std::vector;

// Points closer than this are the same point.
static const double duplicate_tolerance = 1e-7;

point_type_3d make_point_3d(double x, double y, double z) {
  return point_type_3d(x, y, z);
}

double dot_3d(const point_type_3d& a, const point_type_3d& b) {
  return bg::dot_product(a, b);
}

point_type_3d cross_3d(const point_type_3d& a, const point_type_3d& b) {
  return bg::cross_product(a, b);
}

point_type_3d add_3d(const point_type_3d& a, const point_type_3d& b) {
  point_type_3d ret = a;
  bg::add_point(ret, b);
  return ret;
}

point_type_3d scale_3d(const point_type_3d& a, double factor) {
  point_type_3d ret = a;
  bg::multiply_value(ret, factor);
  return ret;
}

double length_3d(const point_type_3d& a) {
  return std::sqrt(dot_3d(a, a));
}

point_type_3d normalize_3d(const point_type_3d& a) {
  return scale_3d(a, 1.0 / length_3d(a));
}

point_type_3d face_frame::to_world(const point_type_fp& p, double height) const {
  return add_3d(add_3d(origin, scale_3d(u, p.x())),
                add_3d(scale_3d(v, p.y()), scale_3d(normal, height)));
}

point_type_fp face_frame::to_local(const point_type_3d& p) const {
  point_type_3d relative = p;
  bg::subtract_point(relative, origin);
  return point_type_fp(dot_3d(relative, u), dot_3d(relative, v));
}

void frame_axes(const point_type_3d& normal, point_type_3d& u, point_type_3d& v) {
  const point_type_3d n = normalize_3d(normal);
  const double components[3] = {std::abs(n.get<0>()), std::abs(n.get<1>()), std::abs(n.get<2>())};
  unsigned int dominant = 0;
  for (unsigned int i = 1; i < 3; i++) {
    if (components[i] > components[dominant]) {
      dominant = i;
    }
  }
  const point_type_3d axes[3] = {make_point_3d(1, 0, 0),
                                 make_point_3d(0, 1, 0),
                                 make_point_3d(0, 0, 1)};
  const point_type_3d& first = axes[dominant == 0 ? 1 : 0];
  // Remove the normal component.  first is never parallel to n because
  // n's largest component is along another axis.
  u = normalize_3d(add_3d(first, scale_3d(n, -dot_3d(first, n))));
  v = cross_3d(n, u);
}

double signed_area(const loop_type_fp& loop) {
  double twice_area = 0;
  for (size_t i = 0; i < loop.size(); i++) {
    const point_type_fp& a = loop[i];
    const point_type_fp& b = loop[(i + 1) % loop.size()];
    twice_area += a.x() * b.y() - b.x() * a.y();
  }
  return twice_area / 2;
}

box_type_fp loop_envelope(const loop_type_fp& loop) {
  box_type_fp ret;
  bg::assign_inverse(ret);
  for (const auto& p : loop) {
    bg::expand(ret, p);
  }
  return ret;
}

ring_type_fp loop_to_ring(const loop_type_fp& loop) {
  ring_type_fp ring;
  if (signed_area(loop) >= 0) {
    // ring_type_fp is clockwise, so a counterclockwise loop is reversed.
    ring.assign(loop.rbegin(), loop.rend());
  } else {
    ring.assign(loop.begin(), loop.end());
  }
  if (ring.size() > 0) {
    ring.push_back(ring.front());
  }
  return ring;
}

loop_type_fp translate_loop(const loop_type_fp& loop, const point_type_fp& offset) {
  loop_type_fp ret;
  ret.reserve(loop.size());
  for (const auto& p : loop) {
    ret.push_back(p + offset);
  }
  return ret;
}

loop_type_fp rotate_loop(const loop_type_fp& loop, const point_type_fp& center, double angle) {
  if (angle == 0) {
    return loop;
  }
  const double c = std::cos(angle);
  const double s = std::sin(angle);
  loop_type_fp ret;
  ret.reserve(loop.size());
  for (const auto& p : loop) {
    const point_type_fp d = p - center;
    ret.push_back(center + point_type_fp(d.x() * c - d.y() * s, d.x() * s + d.y() * c));
  }
  return ret;
}

face_frame make_face_frame(const point_type_3d& plane_point,
                           const point_type_3d& normal,
                           const vector<point_type_3d>& wire_points) {
  face_frame frame;
  frame.normal = normalize_3d(normal);
  frame_axes(frame.normal, frame.u, frame.v);

  loop_type_fp projected;
  for (const auto& p : wire_points) {
    const point_type_fp local(dot_3d(p, frame.u), dot_3d(p, frame.v));
    if (projected.empty() || bg::distance(projected.back(), local) > duplicate_tolerance) {
      projected.push_back(local);
    }
  }
  while (projected.size() > 1 &&
         bg::distance(projected.back(), projected.front()) <= duplicate_tolerance) {
    projected.pop_back();
  }
  if (projected.size() < 3) {
    throw facecut_exception(str(boost::format("Face boundary has %1% distinct points, at least 3 are needed")
                                % projected.size()),
                            ERR_UNSUPPORTEDFACETOPOLOGY);
  }

  const box_type_fp envelope = loop_envelope(projected);
  point_type_fp center;
  bg::centroid(envelope, center);
  frame.boundary = translate_loop(projected, point_type_fp(-center.x(), -center.y()));
  frame.bbox = loop_envelope(frame.boundary);
  if (std::abs(signed_area(frame.boundary)) < 1e-12) {
    throw facecut_exception("Face boundary encloses no area", ERR_UNSUPPORTEDFACETOPOLOGY);
  }

  frame.origin = add_3d(add_3d(scale_3d(frame.u, center.x()), scale_3d(frame.v, center.y())),
                        scale_3d(frame.normal, dot_3d(plane_point, frame.normal)));
  return frame;
}
