#include <cstdlib>
#include <string>
#include <boost/format.hpp>
#include <memory>
#include "geometry.hpp"
#include "bg_operators.hpp"
#include "face_frame.hpp"
#include "svg_writer.hpp"

using std::string;
using std::unique_ptr;
using std::make_unique;

svg_writer::svg_writer(string filename, box_type_fp bounding_box) :
    output_file(filename),
    bounding_box(bounding_box)
{
    const coordinate_type_fp width =
        (bounding_box.max_corner().x() - bounding_box.min_corner().x()) * SVG_PIX_PER_MM;
    const coordinate_type_fp height =
        (bounding_box.max_corner().y() - bounding_box.min_corner().y()) * SVG_PIX_PER_MM;
    const coordinate_type_fp viewBox_width =
        (bounding_box.max_corner().x() - bounding_box.min_corner().x()) * SVG_DOTS_PER_MM;
    const coordinate_type_fp viewBox_height =
        (bounding_box.max_corner().y() - bounding_box.min_corner().y()) * SVG_DOTS_PER_MM;

    //Some SVG readers does not behave well when viewBox is not specified
    const string svg_dimensions =
        str(boost::format("width=\"%1%\" height=\"%2%\" viewBox=\"0 0 %3% %4%\"") % width % height % viewBox_width % viewBox_height);

    mapper = make_unique<bg::svg_mapper<point_type_fp>>(
        output_file, viewBox_width, viewBox_height, svg_dimensions);
    mapper->add(bounding_box);
}

void svg_writer::add(const multi_polygon_type_fp& geometry, double opacity, bool stroke)
{
    string stroke_str = stroke ? "stroke:rgb(0,0,0);stroke-width:2" : "";

    for (const auto& poly : geometry)
    {
        const unsigned int r = rand() % 256;
        const unsigned int g = rand() % 256;
        const unsigned int b = rand() % 256;

        mapper->map(poly & bounding_box,
            str(boost::format("fill-opacity:%f;fill:rgb(%u,%u,%u);" + stroke_str) %
            opacity % r % g % b));
    }
}

void svg_writer::add(const loop_type_fp& loop, coordinate_type_fp width, unsigned int r, unsigned int g, unsigned int b) {
  if (loop.empty()) {
    return;
  }
  linestring_type_fp path(loop.begin(), loop.end());
  path.push_back(loop.front());
  mapper->map(path,
              str(boost::format("stroke:rgb(%u,%u,%u);stroke-width:%f;fill:none;"
                                "stroke-opacity:1;stroke-linejoin:round;") % r % g % b % (width * SVG_DOTS_PER_MM)));
}

void write_layout_svg(const string& filename, const face_layout& layout) {
  box_type_fp bounds = loop_envelope(layout.boundary);
  // A little room around the face so that its outline isn't clipped.
  const double margin = 1;
  bounds.min_corner() = bounds.min_corner() - point_type_fp(margin, margin);
  bounds.max_corner() = bounds.max_corner() + point_type_fp(margin, margin);

  svg_writer writer(filename, bounds);
  multi_polygon_type_fp cells;
  for (const auto& c : layout.cells) {
    polygon_type_fp poly;
    poly.outer() = loop_to_ring(c.polygon);
    cells.push_back(poly);
  }
  writer.add(cells, 0.7, true);
  writer.add(layout.boundary, 0.2, 0, 0, 0);
  writer.add(layout.offset, 0.1, 255, 0, 0);
}
