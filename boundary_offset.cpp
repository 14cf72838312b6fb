#include <algorithm>
#include <cmath>

#include "bg_operators.hpp"
#include "face_frame.hpp"
#include "boundary_offset.hpp"

static point_type_fp unit(const point_type_fp& p) {
  const double length = std::sqrt(p.x() * p.x() + p.y() * p.y());
  return point_type_fp(p.x() / length, p.y() / length);
}

// Normal of the edge from a to b that points into the loop.
// orientation is 1 for counterclockwise loops, -1 for clockwise.
static point_type_fp inward_normal(const point_type_fp& a, const point_type_fp& b, double orientation) {
  const point_type_fp edge = unit(b - a);
  return point_type_fp(-edge.y() * orientation, edge.x() * orientation);
}

// How far an edge with this inward normal moves when the border is
// distance_x from edges across the x axis and distance_y from edges
// across the y axis.
static double edge_distance(const point_type_fp& normal, double distance_x, double distance_y) {
  return std::sqrt(normal.x() * normal.x() * distance_x * distance_x +
                   normal.y() * normal.y() * distance_y * distance_y);
}

loop_type_fp offset_boundary(const loop_type_fp& loop, double distance) {
  return offset_boundary(loop, distance, distance);
}

loop_type_fp offset_boundary(const loop_type_fp& loop, double distance_x, double distance_y) {
  if (distance_x == 0 && distance_y == 0) {
    return loop;
  }
  const double area = signed_area(loop);
  if (loop.size() < 3 || area == 0) {
    return loop_type_fp();
  }
  const double orientation = area > 0 ? 1 : -1;
  const size_t n = loop.size();
  const double limit = max_miter_multiplier * std::max(distance_x, distance_y);

  loop_type_fp ret;
  ret.reserve(n);
  for (size_t i = 0; i < n; i++) {
    const point_type_fp& previous = loop[(i + n - 1) % n];
    const point_type_fp& current = loop[i];
    const point_type_fp& next = loop[(i + 1) % n];
    const point_type_fp n1 = inward_normal(previous, current, orientation);
    const point_type_fp n2 = inward_normal(current, next, orientation);
    const double d1 = edge_distance(n1, distance_x, distance_y);
    const double d2 = edge_distance(n2, distance_x, distance_y);
    const point_type_fp in = current - previous;
    const point_type_fp out = next - current;
    const bool convex = (in.x() * out.y() - in.y() * out.x()) * orientation > 0;

    // The move m satisfies m.n1 = d1 and m.n2 = d2, putting the vertex
    // on both moved edges.
    const double det = n1.x() * n2.y() - n1.y() * n2.x();
    point_type_fp move;
    if (std::abs(det) < 1e-12) {
      if (n1.x() * n2.x() + n1.y() * n2.y() > 0) {
        move = n1 * std::max(d1, d2);
      } else {
        // The edges fold back on each other; retreat along the incoming edge.
        move = unit(previous - current) * limit;
      }
    } else {
      move = point_type_fp((d1 * n2.y() - d2 * n1.y()) / det,
                           (n1.x() * d2 - n2.x() * d1) / det);
      const double length = std::sqrt(move.x() * move.x() + move.y() * move.y());
      if (!convex && length > limit) {
        move = move * (limit / length);
      }
    }
    ret.push_back(current + move);
  }

  const double offset_area = signed_area(ret);
  if (offset_area * orientation <= 1e-9) {
    return loop_type_fp();
  }
  // Past the inradius of a regular polygon the loop turns inside out
  // without changing orientation, and every edge runs backwards.
  for (size_t i = 0; i < n; i++) {
    const point_type_fp before = loop[(i + 1) % n] - loop[i];
    const point_type_fp after = ret[(i + 1) % n] - ret[i];
    if (before.x() * after.x() + before.y() * after.y() > 0) {
      return ret;
    }
  }
  return loop_type_fp();
}
