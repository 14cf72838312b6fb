#ifndef SVG_WRITER_HPP
#define SVG_WRITER_HPP

#include <fstream>
#include <memory>
#include <string>

#include "geometry.hpp"
#include "pattern_layout.hpp"

class svg_writer {
 public:
  svg_writer(std::string filename, box_type_fp bounding_box);
  void add(const multi_polygon_type_fp& geometry, double opacity, bool stroke);
  // Outline of a closed loop.
  void add(const loop_type_fp& loop, coordinate_type_fp width, unsigned int r, unsigned int g, unsigned int b);

 protected:
  std::ofstream output_file;
  const box_type_fp bounding_box;
  std::unique_ptr<bg::svg_mapper<point_type_fp> > mapper;
};

// Draws the face boundary, the border and every cell of the layout.
void write_layout_svg(const std::string& filename, const face_layout& layout);

#endif //SVG_WRITER_HPP
