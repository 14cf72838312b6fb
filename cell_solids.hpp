#ifndef CELL_SOLIDS_HPP
#define CELL_SOLIDS_HPP

#include <vector>

#include <TopoDS_Shape.hxx>

#include "face_frame.hpp"
#include "pattern_tiler.hpp"

// Cutting prisms start this far outside of the face so that their caps
// never lie on the face itself.
static const double prism_clearance = 1.0;

// The loop, drawn on the face, extruded into the solid: from
// prism_clearance outside the face to depth below it.
TopoDS_Shape extrude_cell(const face_frame& frame, const loop_type_fp& polygon, double depth);

std::vector<TopoDS_Shape> build_cell_prisms(const face_frame& frame,
                                            const std::vector<cell>& cells,
                                            double depth);

// Subtracts all the tools from base in one boolean operation.  With no
// tools base is returned.  Throws facecut_exception(ERR_GEOMETRYCUTFAILED)
// if the operation fails or leaves no solid.
TopoDS_Shape cut_solids(const TopoDS_Shape& base, const std::vector<TopoDS_Shape>& tools);

struct clean_options {
  clean_options() :
      unify_faces(true), unify_edges(true), concat_bsplines(false),
      linear_tolerance(1e-6), angular_tolerance(1e-6) {}
  bool unify_faces;
  bool unify_edges;
  bool concat_bsplines;
  double linear_tolerance;
  // Radians.
  double angular_tolerance;
};

// Merges faces that lie on the same surface and edges that lie on the
// same curve.  Throws facecut_exception(ERR_GEOMETRYCUTFAILED) if the
// kernel fails.
TopoDS_Shape clean(const TopoDS_Shape& solid, const clean_options& options = clean_options());

#endif // CELL_SOLIDS_HPP
