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

#include "options.hpp"
#include "version.hpp"

#include <fstream>
#include <sstream>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include "units.hpp"

#include <iostream>
using std::cerr;
using std::endl;
using std::string;
using std::vector;

/******************************************************************************/
/*
 */
/******************************************************************************/
options& options::instance() {
    static options singleton;
    return singleton;
}

void options::maybe_throw(const std::string& what, ErrorCodes error_code) {
  if (instance().vm["ignore-warnings"].as<bool>()) {
    cerr << "Ignoring error code " << error_code << ": " << what << endl;
  } else {
    throw facecut_exception(what, error_code);
  }
}

/* parse options, both command line and from the facecut.cfg file if it
 * exists.  Throws on error.
 */
void options::parse(int argc, const char** argv) {
    // guessing causes problems when one option is the start of another
    // (--border, --border-cut)
    int style = po::command_line_style::default_style
                & ~po::command_line_style::allow_guessing;

    po::options_description generic;
    generic.add(instance().cli_options).add(instance().cfg_options);

    try {
      po::store(po::parse_command_line(argc, argv, generic, style),
                instance().vm);
    } catch (std::logic_error& e) {
      throw facecut_exception(std::string("Error: You've supplied an invalid parameter.\n"
                                          "Details: ")
                              + e.what(), ERR_UNKNOWNPARAMETER);
    }

    po::notify(instance().vm);

    if( !instance().vm["noconfigfile"].as<bool>() )
        parse_files();

    po::notify(instance().vm);
}

/******************************************************************************/
/*
 */
/******************************************************************************/
string options::help()
{
    std::stringstream msg;
    msg << AutoVersion::NAME << " " << AutoVersion::FULLVERSION_STRING << "\n\n";
    msg << instance().cli_options << instance().cfg_options;
    return msg.str();
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::parse_files()
{

    std::string file("facecut.cfg");

    try {
        std::ifstream stream(file.c_str());
        po::store(po::parse_config_file(stream, instance().cfg_options),
                  instance().vm);
    } catch (std::exception& e) {
      maybe_throw("Error parsing configuration file \"" + file + "\": " +
                  e.what(), ERR_INVALIDPARAMETER);
    }

    po::notify(instance().vm);
}

/******************************************************************************/
/*
 */
/******************************************************************************/
options::options()
         : cli_options("command line only options"), cfg_options("generic options (CLI and config files)") {

   cli_options.add_options()
       ("noconfigfile", po::value<bool>()->default_value(false)->implicit_value(true), "ignore any configuration file")
       ("help,?", "produce help message")
       ("version,V", "show the current software version");
   cfg_options.add_options()
       ("ignore-warnings", po::value<bool>()->default_value(false)->implicit_value(true), "Ignore warnings")
       ("solid", po::value<SolidKind::SolidKind>()->default_value(SolidKind::BOX), "base solid; valid choices are box (default), cylinder and prism")
       ("solid-size", po::value<CommaSeparated<Length>>(), "size of the base solid: length,width,height for a box, radius,height for a cylinder and width,height for a prism")
       ("solid-sides", po::value<unsigned int>()->default_value(6), "number of sides of a prism solid")
       ("faces", po::value<string>()->default_value(">Z"), "faces to cut, for example >Z, <X, #3 or >Z,<Z")
       ("shape", po::value<PatternShape::PatternShape>()->default_value(PatternShape::LINE), "cell shape; valid choices are line, rect, square, circle, hexagon, triangle, octagon and polygon")
       ("sides", po::value<unsigned int>()->default_value(6), "number of sides of polygon cells")
       ("width", po::value<Length>()->default_value(parse_unit<Length>("1mm")), "cell width: line width, rectangle width, circle diameter or polygon flat-to-flat size")
       ("height", po::value<Length>(), "rectangle height, defaults to the width")
       ("spacing", po::value<Length>(), "gap between cells, defaults to the width")
       ("wall-thickness", po::value<Length>(), "gap between cells, overrides spacing")
       ("spacing-x", po::value<Length>(), "gap between cells along the face's x axis, overrides spacing")
       ("spacing-y", po::value<Length>(), "gap between rows of cells along the face's y axis, overrides spacing")
       ("border", po::value<Length>()->default_value(parse_unit<Length>("2mm")), "margin kept free of cells along the edge of the face")
       ("border-x", po::value<Length>(), "border along the face's x axis, overrides border")
       ("border-y", po::value<Length>(), "border along the face's y axis, overrides border")
       ("columns", po::value<unsigned int>()->default_value(1), "split the pattern into this many groups side by side")
       ("column-gap", po::value<Length>()->default_value(parse_unit<Length>("5mm")), "gap between column groups")
       ("rows", po::value<unsigned int>()->default_value(1), "split the pattern into this many groups on top of each other")
       ("row-gap", po::value<Length>(), "gap between row groups, defaults to column-gap")
       ("length", po::value<Length>(), "length of line cells, defaults to the whole group")
       ("stagger", po::value<bool>()->default_value(false)->implicit_value(true), "shift every other row of cells")
       ("stagger-amount", po::value<Percent>()->default_value(parse_unit<Percent>("50%")), "how far staggered rows are shifted, as a part of the column pitch")
       ("clip", po::value<ClipMode::ClipMode>()->default_value(ClipMode::NONE), "how cells at the edge are handled; valid choices are none (default), whole and partial")
       ("depth", po::value<Depth>()->default_value(Depth()), "cut depth, or \"through\" to cut across the whole solid")
       ("fillet", po::value<Length>()->default_value(Length(0)), "corner radius of rectangle cells")
       ("angle", po::value<Angle>()->default_value(Angle(0)), "rotation of the whole pattern, in degrees unless units are given")
       ("rotation", po::value<Angle>()->default_value(Angle(0)), "rotation of each cell around its centre")
       ("round-ends", po::value<bool>()->default_value(false)->implicit_value(true), "give line cells semicircular ends")
       ("shear", po::value<Angle>()->default_value(Angle(0)), "shear angle of rectangle cells")
       ("border-cut", po::value<Length>(), "instead of a pattern, cut away the inside of the faces leaving a frame of this width")
       ("clean", po::value<bool>()->default_value(false)->implicit_value(true), "merge coplanar faces and collinear edges after cutting")
       ("deflection", po::value<Length>()->default_value(parse_unit<Length>("0.1mm")), "linear deflection used to mesh the result for the statistics")
       ("svg", po::value<string>(), "write the layout of the pattern on each face to this SVG file");
}

/******************************************************************************/
/*
 */
/******************************************************************************/
static void check_solid_parameters(po::variables_map const& vm)
{
    if (vm.count("solid-size")) {
        const size_t expected = vm["solid"].as<SolidKind::SolidKind>() == SolidKind::BOX ? 3 : 2;
        const vector<Length>& size = vm["solid-size"].as<CommaSeparated<Length>>().get();
        if (size.size() != expected) {
            // Not a warning: the solid can't be built from the wrong number of sizes.
            throw facecut_exception(str(boost::format("A %1% needs %2% sizes, got %3%")
                                        % vm["solid"].as<SolidKind::SolidKind>() % expected % size.size()),
                                    ERR_NOSOLIDSIZE);
        }
        for (const auto& s : size) {
            if (s.asMillimeter(1) <= 0) {
                options::maybe_throw("solid-size must be positive!", ERR_NEGATIVESOLIDSIZE);
            }
        }
    }

    if (vm["solid"].as<SolidKind::SolidKind>() == SolidKind::PRISM &&
        vm["solid-sides"].as<unsigned int>() < 3) {
        options::maybe_throw("solid-sides must be at least 3!", ERR_INVALIDPARAMETER);
    }
}

/******************************************************************************/
/*
 */
/******************************************************************************/
static void check_pattern_parameters(po::variables_map const& vm)
{
    if (vm["width"].as<Length>().asMillimeter(1) <= 0) {
        options::maybe_throw("width must be positive!", ERR_NEGATIVEWIDTH);
    }

    if (vm.count("height") && vm["height"].as<Length>().asMillimeter(1) <= 0) {
        options::maybe_throw("height must be positive!", ERR_NEGATIVEWIDTH);
    }

    if (vm["border"].as<Length>().asMillimeter(1) < 0) {
        options::maybe_throw("border can't be negative!", ERR_NEGATIVEBORDER);
    }

    if (vm.count("spacing") && vm["spacing"].as<Length>().asMillimeter(1) <= 0) {
        options::maybe_throw("spacing must be positive!", ERR_NEGATIVESPACING);
    }

    if (vm.count("wall-thickness") && vm["wall-thickness"].as<Length>().asMillimeter(1) < 0) {
        options::maybe_throw("wall-thickness can't be negative!", ERR_NEGATIVESPACING);
    }

    for (const char* axis : {"spacing-x", "spacing-y"}) {
        if (vm.count(axis) && vm[axis].as<Length>().asMillimeter(1) <= 0) {
            options::maybe_throw(string(axis) + " must be positive!", ERR_NEGATIVESPACING);
        }
    }

    for (const char* axis : {"border-x", "border-y"}) {
        if (vm.count(axis) && vm[axis].as<Length>().asMillimeter(1) < 0) {
            options::maybe_throw(string(axis) + " can't be negative!", ERR_NEGATIVEBORDER);
        }
    }

    if (vm["columns"].as<unsigned int>() < 1 || vm["rows"].as<unsigned int>() < 1) {
        options::maybe_throw("columns and rows must be at least 1!", ERR_INVALIDPARAMETER);
    }

    if (vm["column-gap"].as<Length>().asMillimeter(1) < 0 ||
        (vm.count("row-gap") && vm["row-gap"].as<Length>().asMillimeter(1) < 0)) {
        options::maybe_throw("column-gap and row-gap can't be negative!", ERR_NEGATIVESPACING);
    }

    if (vm.count("length") && vm["length"].as<Length>().asMillimeter(1) <= 0) {
        options::maybe_throw("length must be positive!", ERR_NEGATIVEWIDTH);
    }

    const boost::optional<double> depth = vm["depth"].as<Depth>().asMillimeter(1);
    if (depth && *depth <= 0) {
        options::maybe_throw("depth must be positive!", ERR_NEGATIVEDEPTH);
    }

    if (vm["deflection"].as<Length>().asMillimeter(1) <= 0) {
        options::maybe_throw("deflection must be positive!", ERR_NEGATIVEDEFLECTION);
    }

    if (vm.count("border-cut")) {
        if (vm["border-cut"].as<Length>().asMillimeter(1) <= 0) {
            options::maybe_throw("border-cut must be positive!", ERR_NEGATIVEWIDTH);
        }
        if (!vm["shape"].defaulted()) {
            options::maybe_throw("You can't specify both border-cut and shape!", ERR_BORDERCUTANDSHAPE);
        }
    }
}

/******************************************************************************/
/*
 */
/******************************************************************************/
void options::check_parameters()
{
    po::variables_map const& vm = instance().vm;

    try {
        check_solid_parameters(vm);
        check_pattern_parameters(vm);
    } catch (po::required_option& e) {
        cerr << "Error: You did not specify the required parameter \""
             << e.get_option_name() << "\".\n";
        throw facecut_exception(e.what(), ERR_INVALIDPARAMETER);
    }
}

/******************************************************************************/
/*
 */
/******************************************************************************/
pattern_spec options::pattern()
{
    po::variables_map const& vm = instance().vm;

    pattern_spec spec;
    spec.shape = vm["shape"].as<PatternShape::PatternShape>();
    spec.sides = vm["sides"].as<unsigned int>();
    spec.width = vm["width"].as<Length>().asMillimeter(1);
    if (vm.count("height")) {
        spec.height = vm["height"].as<Length>().asMillimeter(1);
    }
    if (vm.count("spacing")) {
        spec.spacing = vm["spacing"].as<Length>().asMillimeter(1);
    }
    if (vm.count("wall-thickness")) {
        spec.wall_thickness = vm["wall-thickness"].as<Length>().asMillimeter(1);
    }
    if (vm.count("spacing-x")) {
        spec.spacing_x = vm["spacing-x"].as<Length>().asMillimeter(1);
    }
    if (vm.count("spacing-y")) {
        spec.spacing_y = vm["spacing-y"].as<Length>().asMillimeter(1);
    }
    spec.border = vm["border"].as<Length>().asMillimeter(1);
    if (vm.count("border-x")) {
        spec.border_x = vm["border-x"].as<Length>().asMillimeter(1);
    }
    if (vm.count("border-y")) {
        spec.border_y = vm["border-y"].as<Length>().asMillimeter(1);
    }
    spec.columns = vm["columns"].as<unsigned int>();
    spec.column_gap = vm["column-gap"].as<Length>().asMillimeter(1);
    spec.rows = vm["rows"].as<unsigned int>();
    if (vm.count("row-gap")) {
        spec.row_gap = vm["row-gap"].as<Length>().asMillimeter(1);
    }
    if (vm.count("length")) {
        spec.length = vm["length"].as<Length>().asMillimeter(1);
    }
    spec.stagger = vm["stagger"].as<bool>();
    spec.stagger_amount = vm["stagger-amount"].as<Percent>().asFraction(0.01);
    spec.clip = vm["clip"].as<ClipMode::ClipMode>();
    spec.depth = vm["depth"].as<Depth>().asMillimeter(1);
    spec.fillet = vm["fillet"].as<Length>().asMillimeter(1);
    spec.angle = vm["angle"].as<Angle>().asDegree(1);
    spec.rotation = vm["rotation"].as<Angle>().asDegree(1);
    spec.round_ends = vm["round-ends"].as<bool>();
    spec.shear = vm["shear"].as<Angle>().asDegree(1);
    return spec;
}

/******************************************************************************/
/*
 */
/******************************************************************************/
vector<double> options::solid_size()
{
    po::variables_map const& vm = instance().vm;

    if (vm.count("solid-size")) {
        vector<double> ret;
        for (const auto& s : vm["solid-size"].as<CommaSeparated<Length>>().get()) {
            ret.push_back(s.asMillimeter(1));
        }
        return ret;
    }
    switch (vm["solid"].as<SolidKind::SolidKind>()) {
        case SolidKind::BOX:
            return {40, 40, 40};
        case SolidKind::CYLINDER:
            return {30, 4};
        case SolidKind::PRISM:
            return {20, 4};
    }
    return {};
}
