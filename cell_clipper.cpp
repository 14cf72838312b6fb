#include <algorithm>
#include <cmath>

#include "bg_operators.hpp"
#include "face_frame.hpp"
#include "cell_clipper.hpp"

using std::vector;

static point_type_p to_int(const point_type_fp& p) {
  return point_type_p(static_cast<int>(std::lround(p.x() * polygon_int_scale)),
                      static_cast<int>(std::lround(p.y() * polygon_int_scale)));
}

static point_type_fp from_int(const point_type_p& p) {
  return point_type_fp(p.x() / polygon_int_scale, p.y() / polygon_int_scale);
}

template <typename iterator_t>
static ring_type_fp ring_from_int(iterator_t begin, iterator_t end) {
  ring_type_fp ring;
  for (iterator_t it = begin; it != end; it++) {
    ring.push_back(from_int(*it));
  }
  return ring;
}

multi_polygon_type_fp normalize_boundary(const loop_type_fp& loop) {
  multi_polygon_type_fp ret;
  if (loop.size() < 3) {
    return ret;
  }
  vector<point_type_p> points;
  points.reserve(loop.size());
  if (signed_area(loop) < 0) {
    for (auto it = loop.rbegin(); it != loop.rend(); it++) {
      points.push_back(to_int(*it));
    }
  } else {
    for (const auto& p : loop) {
      points.push_back(to_int(p));
    }
  }
  polygon_type_p polygon;
  polygon.set(points.begin(), points.end());
  polygon_set_type_p polygon_set;
  polygon_set.insert(polygon);

  // The union keeps every region with a nonzero winding number, which
  // includes the inverted lobes that a clamped reflex corner may push
  // across the opposite edge.  Those wind -1; adding a frame around the
  // loop brings them to 0, so intersecting with it leaves the regions
  // that wind positively.
  int min_x = points.front().x();
  int min_y = points.front().y();
  int max_x = min_x;
  int max_y = min_y;
  for (const auto& p : points) {
    min_x = std::min(min_x, p.x());
    min_y = std::min(min_y, p.y());
    max_x = std::max(max_x, p.x());
    max_y = std::max(max_y, p.y());
  }
  const vector<point_type_p> corners{point_type_p(min_x - 1, min_y - 1), point_type_p(max_x + 1, min_y - 1),
                                     point_type_p(max_x + 1, max_y + 1), point_type_p(min_x - 1, max_y + 1)};
  polygon_type_p frame;
  frame.set(corners.begin(), corners.end());
  polygon_set_type_p framed;
  framed.insert(polygon);
  framed.insert(frame);
  {
    using namespace boost::polygon::operators;
    polygon_set &= framed;
  }

  vector<polygon_with_holes_type_p> united;
  polygon_set.get(united);
  for (const auto& p : united) {
    polygon_type_fp poly;
    poly.outer() = ring_from_int(p.begin(), p.end());
    for (auto hole = p.begin_holes(); hole != p.end_holes(); hole++) {
      poly.inners().push_back(ring_from_int(hole->begin(), hole->end()));
    }
    bg::correct(poly);
    if (bg::area(poly) > 0) {
      ret.push_back(poly);
    }
  }
  return ret;
}

static bool inside_or_on(const point_type_fp& p, const multi_polygon_type_fp& region) {
  return bg::covered_by(p, region) || bg::distance(p, region) <= boundary_tolerance;
}

// The outer ring of a piece as a counterclockwise loop.
static loop_type_fp piece_to_loop(const polygon_type_fp& piece) {
  const ring_type_fp& outer = piece.outer();
  loop_type_fp loop(outer.begin(), outer.end());
  if (loop.size() > 1 && bg::equals(loop.front(), loop.back())) {
    loop.pop_back();
  }
  if (signed_area(loop) < 0) {
    std::reverse(loop.begin(), loop.end());
  }
  return loop;
}

vector<cell> clip_cells(const vector<cell>& candidates,
                        const loop_type_fp& boundary,
                        ClipMode::ClipMode clip) {
  vector<cell> kept;
  if (boundary.size() < 3) {
    return kept;
  }
  if (clip == ClipMode::NONE) {
    box_type_fp envelope = loop_envelope(boundary);
    envelope.min_corner() = envelope.min_corner() - point_type_fp(envelope_tolerance, envelope_tolerance);
    envelope.max_corner() = envelope.max_corner() + point_type_fp(envelope_tolerance, envelope_tolerance);
    for (const auto& candidate : candidates) {
      if (bg::covered_by(loop_envelope(candidate.polygon), envelope)) {
        kept.push_back(candidate);
      }
    }
    return kept;
  }

  const multi_polygon_type_fp region = normalize_boundary(boundary);
  if (region.empty()) {
    return kept;
  }
  box_type_fp region_envelope;
  bg::envelope(region, region_envelope);
  for (const auto& candidate : candidates) {
    if (candidate.polygon.size() < 3 ||
        bg::disjoint(loop_envelope(candidate.polygon), region_envelope)) {
      continue;
    }
    if (clip == ClipMode::WHOLE) {
      bool inside = true;
      for (const auto& vertex : candidate.polygon) {
        if (!inside_or_on(vertex, region)) {
          inside = false;
          break;
        }
      }
      if (inside) {
        kept.push_back(candidate);
      }
    } else {
      polygon_type_fp cell_polygon;
      cell_polygon.outer() = loop_to_ring(candidate.polygon);
      const multi_polygon_type_fp pieces = cell_polygon & region;
      for (const auto& piece : pieces) {
        if (bg::area(piece) < min_cell_area) {
          continue;
        }
        const loop_type_fp loop = piece_to_loop(piece);
        if (loop.size() >= 3) {
          kept.push_back(cell{loop, candidate.center});
        }
      }
    }
  }
  return kept;
}
