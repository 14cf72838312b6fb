#include <algorithm>
#include <cmath>

#include "cell_shapes.hpp"

loop_type_fp regular_polygon(unsigned int sides, double width, double phase) {
  const double circumradius = width / 2 / std::cos(M_PI / sides);
  loop_type_fp ret;
  ret.reserve(sides);
  for (unsigned int i = 0; i < sides; i++) {
    const double angle = phase + 2 * M_PI * i / sides;
    ret.push_back(point_type_fp(circumradius * std::cos(angle), circumradius * std::sin(angle)));
  }
  return ret;
}

loop_type_fp flat_sided_polygon(unsigned int sides, double width) {
  // The vertices at -pi/sides and pi/sides make an edge crossing +x.
  return regular_polygon(sides, width, -M_PI / sides);
}

loop_type_fp rectangle(double width, double height) {
  const double x = width / 2;
  const double y = height / 2;
  return loop_type_fp{
    point_type_fp(-x, -y),
    point_type_fp(x, -y),
    point_type_fp(x, y),
    point_type_fp(-x, y)};
}

loop_type_fp rounded_rectangle(double width, double height, double radius) {
  radius = std::min(radius, std::min(width, height) / 2 - 0.01);
  if (radius <= 0) {
    return rectangle(width, height);
  }
  const double x = width / 2 - radius;
  const double y = height / 2 - radius;
  // Corner centres, counterclockwise from the bottom right.
  const point_type_fp centers[4] = {
    point_type_fp(x, -y),
    point_type_fp(x, y),
    point_type_fp(-x, y),
    point_type_fp(-x, -y)};
  loop_type_fp ret;
  ret.reserve(4 * (fillet_segments + 1));
  for (unsigned int corner = 0; corner < 4; corner++) {
    const double start = -M_PI / 2 + corner * M_PI / 2;
    for (unsigned int i = 0; i <= fillet_segments; i++) {
      const double angle = start + M_PI / 2 * i / fillet_segments;
      ret.push_back(point_type_fp(centers[corner].x() + radius * std::cos(angle),
                                  centers[corner].y() + radius * std::sin(angle)));
    }
  }
  return ret;
}

loop_type_fp sheared_rectangle(double width, double height, double shear_degrees) {
  const double slope = std::tan(shear_degrees * M_PI / 180);
  loop_type_fp ret = rectangle(width, height);
  for (auto& p : ret) {
    p.x(p.x() + p.y() * slope);
  }
  return ret;
}

loop_type_fp stadium(double width, double length) {
  const double radius = width / 2;
  const double straight = length / 2 - radius;
  if (straight <= 0) {
    return regular_polygon(points_per_circle, width, 0);
  }
  const unsigned int half_circle = points_per_circle / 2;
  loop_type_fp ret;
  ret.reserve(2 * (half_circle + 1));
  for (unsigned int i = 0; i <= half_circle; i++) {
    const double angle = M_PI * i / half_circle;
    ret.push_back(point_type_fp(radius * std::cos(angle), straight + radius * std::sin(angle)));
  }
  for (unsigned int i = 0; i <= half_circle; i++) {
    const double angle = M_PI + M_PI * i / half_circle;
    ret.push_back(point_type_fp(radius * std::cos(angle), -straight + radius * std::sin(angle)));
  }
  return ret;
}

loop_type_fp cell_outline(const pattern_spec& spec, double line_length) {
  switch (spec.shape) {
    case PatternShape::LINE:
      if (spec.round_ends) {
        return stadium(spec.width, line_length);
      }
      return rectangle(spec.width, line_length);
    case PatternShape::RECT:
    case PatternShape::SQUARE:
      if (spec.fillet > 0) {
        return rounded_rectangle(spec.width, spec.cell_height(), spec.fillet);
      }
      if (spec.shear != 0) {
        return sheared_rectangle(spec.width, spec.cell_height(), spec.shear);
      }
      return rectangle(spec.width, spec.cell_height());
    case PatternShape::CIRCLE:
      // Inscribed in the circle, so the polygon never cuts outside it.
      return regular_polygon(points_per_circle, spec.width * std::cos(M_PI / points_per_circle), 0);
    case PatternShape::HEXAGON:
    case PatternShape::TRIANGLE:
    case PatternShape::OCTAGON:
    case PatternShape::POLYGON:
      return flat_sided_polygon(spec.polygon_sides(), spec.width);
  }
  return loop_type_fp();
}
