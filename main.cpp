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

#include <iostream>
#include <string>
#include <vector>

using std::cout;
using std::cerr;
using std::endl;
using std::flush;
using std::string;
using std::vector;

#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <boost/version.hpp>

#include <Standard_Version.hxx>

#include "cut_pattern.hpp"
#include "mesh_stats.hpp"
#include "options.hpp"
#include "primitives.hpp"
#include "svg_writer.hpp"
#include "units.hpp"
#include "version.hpp"

static TopoDS_Shape make_solid(po::variables_map& vm) {
    const vector<double> size = options::solid_size();
    switch (vm["solid"].as<SolidKind::SolidKind>()) {
        case SolidKind::BOX:
            return make_box(size[0], size[1], size[2]);
        case SolidKind::CYLINDER:
            return make_cylinder(size[0], size[1]);
        case SolidKind::PRISM:
            return polygon_prism(vm["solid-sides"].as<unsigned int>(), size[0], size[1]);
    }
    throw facecut_exception("Unknown solid", ERR_INVALIDPARAMETER);
}

// name.svg for a single face, name_0.svg, name_1.svg... for more.
static string svg_filename(const string& name, size_t index, size_t count) {
    if (count == 1) {
        return name;
    }
    string stem = name;
    if (boost::algorithm::iends_with(stem, ".svg")) {
        boost::algorithm::erase_tail(stem, 4);
    }
    return str(boost::format("%1%_%2%.svg") % stem % index);
}

static void print_stats(const string& label, const mesh_stats& stats) {
    cout << label << ": " << stats.vertices << " vertices, "
         << stats.triangles << " triangles, bounds " << stats.bounds << endl;
}

void do_facecut(int argc, const char* argv[]) {
    options::parse(argc, argv);      //parse the command line parameters

    po::variables_map& vm = options::get_vm();      //get the cli parameters

    if (vm.count("version")) {       //return version and quit
      cout << AutoVersion::FULLVERSION_STRING << endl;
      cout << "Boost: " << BOOST_VERSION << endl;
      cout << "OpenCASCADE: " << OCC_VERSION_COMPLETE << endl;
      return;
    }

    if (vm.count("help")) {       //return help and quit
      cout << options::help();
      return;
    }

    options::check_parameters();      //check the cli parameters

    const face_selector selector(vm["faces"].as<string>());
    const double deflection = vm["deflection"].as<Length>().asMillimeter(1);
    cut_options cut;
    cut.clean_after = vm["clean"].as<bool>();

    cout << "Building " << vm["solid"].as<SolidKind::SolidKind>() << "... " << flush;
    const TopoDS_Shape solid = make_solid(vm);
    cout << "DONE." << endl;
    print_stats("Base solid", tessellate(solid, deflection));

    cut_result result;
    if (vm.count("border-cut")) {
        const double width = vm["border-cut"].as<Length>().asMillimeter(1);
        cout << "Cutting a " << width << "mm border into " << selector.to_string()
             << "... " << flush;
        result = cut_border(solid, selector, width,
                            vm["depth"].as<Depth>().asMillimeter(1), cut);
        cout << "DONE." << endl;
    } else {
        const pattern_spec spec = options::pattern();
        cout << "Pattern: " << spec << endl;

        if (vm.count("svg")) {
            const vector<face_plan> plans = plan_pattern(solid, selector, spec);
            const string name = vm["svg"].as<string>();
            for (size_t i = 0; i < plans.size(); i++) {
                const string filename = svg_filename(name, i, plans.size());
                cout << "Writing layout to " << filename << "... " << flush;
                write_layout_svg(filename, plans[i].layout);
                cout << "DONE." << endl;
            }
        }

        cout << "Cutting pattern into " << selector.to_string() << "... " << flush;
        result = cut_pattern(solid, selector, spec, cut);
        cout << "DONE. " << result.cell_count << " cells cut." << endl;
    }

    print_stats("Result", tessellate(result.solid, deflection));
    cout << "END." << endl;
}

int main(int argc, const char* argv[]) {
  try {
    do_facecut(argc, argv);
  } catch (const facecut_exception& e) {
    cerr << e.what() << endl;
    return e.code();
  }
  return 0;
}
