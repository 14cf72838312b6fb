#define BOOST_TEST_MODULE units tests
#include <boost/test/included/unit_test.hpp>

#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include "units.hpp"

using namespace std;

BOOST_AUTO_TEST_SUITE(units_tests);

template <typename dimension_t>
dimension_t parse_option(const std::string& s) {
  po::options_description desc("Allowed options");
  desc.add_options()
      ("test_option", po::value<dimension_t>(), "test option");
  po::variables_map vm;
  po::store(po::command_line_parser(vector<std::string>{"--test_option", s}).options(desc).run(), vm);
  return vm["test_option"].as<dimension_t>();
}

BOOST_AUTO_TEST_CASE(parse_length) {
  BOOST_CHECK_EQUAL(parse_option<Length>("4").asMillimeter(2), 8);
  BOOST_CHECK_CLOSE(parse_option<Length>("1in").asMillimeter(200), 25.4, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Length>("+2 inches").asMillimeter(200), 50.8, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Length>(" 0.04 m ").asMillimeter(0), 40, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Length>("  \t12.5\tmm\t").asMillimeter(0), 12.5, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Length>("1000thou").asMillimeter(0), 25.4, 1e-9);
  std::stringstream ss;
  ss << parse_option<Length>("4");
  BOOST_CHECK_EQUAL(ss.str(), "4");

  BOOST_CHECK_THROW(parse_option<Length>("50.8mm/s"), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Length>("50.8seconds"), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Length>("50.8deg"), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Length>(""), po::validation_error);
}

BOOST_AUTO_TEST_CASE(parse_angle) {
  BOOST_CHECK_EQUAL(parse_option<Angle>("30").asDegree(1), 30);
  BOOST_CHECK_CLOSE(parse_option<Angle>("45deg").asDegree(1), 45, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Angle>("-15 degrees").asDegree(1), -15, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Angle>("3.14159265358979 rad").asDegree(1), 180, 1e-6);

  BOOST_CHECK_THROW(parse_option<Angle>("10mm"), po::validation_error);
  BOOST_CHECK_THROW(parse_option<Angle>("blahblah"), po::validation_error);
}

BOOST_AUTO_TEST_CASE(parse_percent) {
  BOOST_CHECK_CLOSE(parse_option<Percent>("50%").asFraction(0.01), 0.5, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Percent>(" 25 % ").asPercent(1), 25, 1e-9);
  BOOST_CHECK_CLOSE(parse_option<Percent>("30").asFraction(0.01), 0.3, 1e-9);

  BOOST_CHECK_THROW(parse_option<Percent>("30mm"), po::validation_error);
}

BOOST_AUTO_TEST_CASE(parse_depth) {
  BOOST_CHECK(parse_option<Depth>("through").is_through());
  BOOST_CHECK(parse_option<Depth>("THRU").is_through());
  BOOST_CHECK(!parse_option<Depth>("through").asMillimeter(1));
  BOOST_CHECK_CLOSE(*parse_option<Depth>("2.5mm").asMillimeter(1), 2.5, 1e-9);
  BOOST_CHECK_EQUAL(*parse_option<Depth>("3").asMillimeter(1), 3);
  BOOST_CHECK(parse_option<Depth>("3mm") == Depth(parse_unit<Length>("3mm")));
  BOOST_CHECK(!(parse_option<Depth>("3mm") == Depth()));

  std::stringstream ss;
  ss << Depth();
  BOOST_CHECK_EQUAL(ss.str(), "through");

  BOOST_CHECK_THROW(parse_option<Depth>("deep"), po::validation_error);
}

BOOST_AUTO_TEST_CASE(parse_comma_separated) {
  auto size = parse_option<CommaSeparated<Length>>("40mm,20mm, 1in");
  BOOST_REQUIRE_EQUAL(size.get().size(), 3);
  BOOST_CHECK_CLOSE(size.get()[0].asMillimeter(1), 40, 1e-9);
  BOOST_CHECK_CLOSE(size.get()[1].asMillimeter(1), 20, 1e-9);
  BOOST_CHECK_CLOSE(size.get()[2].asMillimeter(1), 25.4, 1e-9);

  std::stringstream ss;
  ss << CommaSeparated<Length>{Length(1), Length(2)};
  BOOST_CHECK_EQUAL(ss.str(), "1, 2");
}

BOOST_AUTO_TEST_CASE(parse_choices) {
  BOOST_CHECK_EQUAL(parse_option<PatternShape::PatternShape>("hexagon"), PatternShape::HEXAGON);
  BOOST_CHECK_EQUAL(parse_option<PatternShape::PatternShape>("Hex"), PatternShape::HEXAGON);
  BOOST_CHECK_EQUAL(parse_option<PatternShape::PatternShape>("rectangle"), PatternShape::RECT);
  BOOST_CHECK_THROW(parse_option<PatternShape::PatternShape>("star"), po::validation_error);

  BOOST_CHECK_EQUAL(parse_option<ClipMode::ClipMode>("partial"), ClipMode::PARTIAL);
  BOOST_CHECK_EQUAL(parse_option<ClipMode::ClipMode>("WHOLE"), ClipMode::WHOLE);
  BOOST_CHECK_THROW(parse_option<ClipMode::ClipMode>("some"), po::validation_error);

  BOOST_CHECK_EQUAL(parse_option<SolidKind::SolidKind>("cylinder"), SolidKind::CYLINDER);
  BOOST_CHECK_THROW(parse_option<SolidKind::SolidKind>("sphere"), po::validation_error);
}

BOOST_AUTO_TEST_CASE(compare) {
  BOOST_CHECK_LT(parse_unit<Length>("3mm"),  parse_unit<Length>("1in"));
  BOOST_CHECK_THROW(parse_unit<Length>("3") < parse_unit<Length>("4mm"), comparison_exception);
}

BOOST_AUTO_TEST_SUITE_END()
