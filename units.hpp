#ifndef UNITS_HPP
#define UNITS_HPP

#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <boost/units/quantity.hpp>
#include <boost/optional.hpp>
#include <boost/units/systems/si.hpp>
#include <boost/units/base_units/angle/degree.hpp>
#include <boost/units/base_units/imperial/inch.hpp>
#include <boost/units/base_units/imperial/thou.hpp>
#include <boost/units/io.hpp>
#include <boost/algorithm/string.hpp>

#include "pattern_spec.hpp"

struct units_parse_exception : public std::exception {
  units_parse_exception(const std::string& get_what, const std::string& from_what) {
    what_string = "Can't get " + get_what + " from: " + from_what;
  }
  units_parse_exception(const std::string& what) {
    what_string = what;
  }

  virtual const char* what() const throw()
  {
    return what_string.c_str();
  }
 private:
  std::string what_string;
};

struct comparison_exception : public std::exception {
  comparison_exception(const std::string& what) {
    what_string = what;
  }

  virtual const char* what() const throw()
  {
    return what_string.c_str();
  }
 private:
  std::string what_string;
};

// Given a string, provide methods to extract successive numbers,
// words, etc from it.
class Lexer {
 public:
  Lexer(const std::string& s) : pos(0), input(s) {}
  std::string get_whitespace() {
    return get_string<int>(std::isspace);
  }
  std::string get_word() {
    get_whitespace();
    return get_string<int>(std::isalpha);
  }
  double get_double() {
    get_whitespace();
    std::string text = get_string<bool>([](int c) {
        return std::isdigit(c) || c == '-' || c == '.' || c == '+';
      });
    try {
      return boost::lexical_cast<double>(text);
    } catch (const boost::bad_lexical_cast& e) {
      throw units_parse_exception("double", text);
    }
  }
  void get_percent() {
    get_whitespace();
    if (!get_exact("%")) {
      throw units_parse_exception("percent", input.substr(pos));
    }
  }

  bool at_end() {
    return pos == input.size();
  }
  size_t pos;
 private:
  // Gets all characters from current position until the first that
  // doesn't pass test_fn or end of input.
  template <typename test_return_type>
  std::string get_string(test_return_type (*test_fn)(int)) {
    size_t start = pos;
    while (pos < input.size() && test_fn(input[pos])) {
      pos++;
    }
    return input.substr(start, pos-start);
  }
  // Returns number of characters advanced if string is found at
  // current position.  If not found, returns 0.
  int get_exact(const std::string& s) {
    if (input.compare(pos, s.size(), s) == 0) {
      pos += s.size();
      return s.size();
    }
    return 0;
  }
  std::string input;
};

template <typename dimension_t>
class UnitBase;

// dimension_t is "length" or "plane_angle", for example.
template <typename dimension_t>
class Unit : public UnitBase<dimension_t> {
};

template <typename dimension_t>
class UnitBase {
 public:
  typedef boost::units::quantity<dimension_t> quantity;
  typedef dimension_t dimension;
  UnitBase(double value = 0, boost::optional<quantity> one = boost::none) : value(value), one(one) {}

  double asDouble() const {
    return value;
  }
  friend std::ostream& operator<<(std::ostream& s, const UnitBase<dimension_t>& unit) {
    if (unit.one) {
      s << unit.value * *unit.one;
    } else {
      s << unit.value;
    }
    return s;
  }
  bool operator<(const UnitBase<dimension_t>& other) const {
    if (std::isinf(this->value) || this->value == 0 ||
        std::isinf(other.value) || other.value == 0) {
      // inf, -inf, and zero times anything is unchanged so the units don't matter
      return this->value < other.value;
    } else if (!this->one && !other.one) {
      return this->value < other.value;
    } else if (this->one && other.one) {
      return this->value * *this->one < other.value * *other.one;
    } else {
      throw comparison_exception("Can't compare with units and without.");
    }
  }
  bool operator>=(const UnitBase<dimension_t>& other) const {
    return !(*this < other);
  }
  bool operator==(const UnitBase<dimension_t>& other) const {
    return (*this >= other && other >= *this);
  }

 protected:
  double as(double factor, quantity wanted_unit) const {
    if (!one) {
      // We don't know the units so just use whatever factor was supplied.
      return value*factor;
    }
    return value*(*one)/wanted_unit;
  }
  double value;
  boost::optional<quantity> one;
};

// Any non-SI base units that you want to use go here.
const boost::units::quantity<boost::units::si::length> inch(1*boost::units::imperial::inch_base_unit::unit_type());
const boost::units::quantity<boost::units::si::length> thou(1*boost::units::imperial::thou_base_unit::unit_type());
const boost::units::quantity<boost::units::si::plane_angle> degree(1*boost::units::angle::degree_base_unit::unit_type());

struct percent_base_dimension :
    boost::units::base_dimension<percent_base_dimension, 3> {};
typedef percent_base_dimension::dimension_type percent_type;

struct percent_base_unit :
    boost::units::base_unit<percent_base_unit, percent_type, 3> {
  static std::string name() {return "percent";}
  static std::string symbol() {return "%";}
};
typedef percent_base_unit::unit_type percent_unit;
const boost::units::quantity<percent_unit> percent(1*percent_base_unit::unit_type());

// shortcuts for Units defined below.
typedef Unit<boost::units::si::length> Length;
typedef Unit<boost::units::si::plane_angle> Angle;
typedef Unit<percent_unit> Percent;

template<>
class Unit<boost::units::si::length> : public UnitBase<boost::units::si::length> {
 public:
  Unit(double value = 0, boost::optional<quantity> one = boost::none) : UnitBase(value, one) {}
  double asMillimeter(double factor) const {
    return as(factor, boost::units::si::meter/1000.0);
  }
  static quantity get_unit(Lexer& lex) {
    std::string unit = lex.get_word();
    if (unit == "mm" ||
        unit == "millimeter" ||
        unit == "millimeters") {
      return boost::units::si::meter/1000.0;
    }
    if (unit == "m" ||
        unit == "meter" ||
        unit == "meters") {
      return 1 * boost::units::si::meter;
    }
    if (unit == "in" ||
        unit == "inch" ||
        unit == "inches") {
      return inch;
    }
    if (unit == "thou" ||
        unit == "thous" ||
        unit == "mil" ||
        unit == "mils") {
      return thou;
    }
    throw units_parse_exception("length units", unit);
  }
  Length operator-() const {
    return Length(-value, one);
  }
};

template<>
class Unit<boost::units::si::plane_angle> : public UnitBase<boost::units::si::plane_angle> {
 public:
  Unit(double value = 0, boost::optional<quantity> one = boost::none) : UnitBase(value, one) {}
  double asDegree(double factor) const {
    return as(factor, degree);
  }
  static quantity get_unit(Lexer& lex) {
    std::string unit = lex.get_word();
    if (unit == "deg" ||
        unit == "degree" ||
        unit == "degrees") {
      return degree;
    }
    if (unit == "rad" ||
        unit == "radian" ||
        unit == "radians") {
      return 1 * boost::units::si::radian;
    }
    throw units_parse_exception("angle units", unit);
  }
};

template<>
class Unit<percent_unit> : public UnitBase<percent_unit> {
 public:
  Unit(double value = 0, boost::optional<quantity> one = boost::none) : UnitBase(value, one) {}
  using UnitBase::as;
  double asPercent(double factor) const {
    return as(factor, 1.0 * percent);
  }
  double asFraction(double factor) const {
    return as(factor, 100.0 * percent);
  }
  static quantity get_unit(Lexer& lex) {
    lex.get_percent();
    return 1.0*percent;
  }
};

template <typename unit_t>
unit_t parse_unit(const std::string& s) {
  Lexer lex(s);
  double value;
  boost::optional<boost::units::quantity<typename unit_t::dimension>> one = boost::make_optional(false, boost::units::quantity<typename unit_t::dimension>());
  try {
    value = lex.get_double();
    lex.get_whitespace();
    if (!lex.at_end()) {
      one = unit_t::get_unit(lex);
    }
  } catch (units_parse_exception& e) {
    throw boost::program_options::invalid_option_value("While parsing \"" + s + "\": " + e.what());
  }
  lex.get_whitespace();
  if (!lex.at_end()) {
    throw boost::program_options::invalid_option_value("While parsing \"" + s + "\": Extra characters at end of option");
  }
  return unit_t(value, one);
}

template <typename dimension_t>
inline std::istream& operator>>(std::istream& in, Unit<dimension_t>& unit) {
  std::string s(std::istreambuf_iterator<char>(in), {});
  unit = parse_unit<Unit<dimension_t>>(s);
  return in;
}

// A cut depth: either a length or "through", which cuts across the
// whole solid.
class Depth {
 public:
  Depth() {}
  Depth(const Length& length) : length(length) {}

  bool is_through() const {
    return !length;
  }
  // boost::none for a through cut.
  boost::optional<double> asMillimeter(double factor) const {
    if (!length) {
      return boost::none;
    }
    return length->asMillimeter(factor);
  }
  bool operator==(const Depth& other) const {
    if (is_through() || other.is_through()) {
      return is_through() == other.is_through();
    }
    return *length == *other.length;
  }
  friend std::ostream& operator<<(std::ostream& out, const Depth& depth) {
    if (depth.is_through()) {
      out << "through";
    } else {
      out << *depth.length;
    }
    return out;
  }

 private:
  boost::optional<Length> length;
};

inline std::istream& operator>>(std::istream& in, Depth& depth) {
  std::string token(std::istreambuf_iterator<char>(in), {});
  boost::trim(token);
  if (boost::iequals(token, "through") || boost::iequals(token, "thru")) {
    depth = Depth();
  } else {
    depth = Depth(parse_unit<Length>(token));
  }
  return in;
}

// Represents a few of the base unit, which can be input or output as a
// comma-separated list.
template <typename base_unit>
class CommaSeparated {
 public:
  CommaSeparated(const std::vector<base_unit>& units) :
      units(units) {}
  CommaSeparated(std::initializer_list<base_unit> units) :
      units(units) {}
  CommaSeparated() {}

  bool operator==(const CommaSeparated<base_unit>& other) const {
    return units == other.units;
  }
  const std::vector<base_unit>& get() const {
    return units;
  }
  std::ostream& write(std::ostream& out) const {
    for (auto it = units.begin(); it != units.end(); it++) {
      if (it != units.begin()) {
        out << ", ";
      }
      out << *it;
    }
    return out;
  }
  std::istream& read(std::istream& in) {
    std::vector<std::string> unit_strings;
    std::string input_string(std::istreambuf_iterator<char>(in), {});
    boost::split(unit_strings, input_string, boost::is_any_of(","));
    for (const auto& unit_string : unit_strings) {
      base_unit unit;
      std::stringstream(unit_string) >> unit;
      units.push_back(unit);
    }
    return in;
  }
 private:
  std::vector<base_unit> units;
};

template <typename unit_base>
inline std::istream& operator>>(std::istream& in, CommaSeparated<unit_base>& units) {
  return units.read(in);
}

template <typename unit_base>
inline std::ostream& operator<<(std::ostream& out, const CommaSeparated<unit_base>& units) {
  return units.write(out);
}

namespace PatternShape {

inline std::istream& operator>>(std::istream& in, PatternShape& shape)
{
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (!parse(token, shape)) {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

}; // namespace PatternShape

namespace ClipMode {

inline std::istream& operator>>(std::istream& in, ClipMode& clip)
{
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (boost::iequals(token, "none")) {
    clip = ClipMode::NONE;
  } else if (boost::iequals(token, "whole")) {
    clip = ClipMode::WHOLE;
  } else if (boost::iequals(token, "partial")) {
    clip = ClipMode::PARTIAL;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

}; // namespace ClipMode

namespace SolidKind {
enum SolidKind {
  BOX,
  CYLINDER,
  PRISM
};

inline std::istream& operator>>(std::istream& in, SolidKind& solid)
{
  std::string token(std::istreambuf_iterator<char>(in), {});
  if (boost::iequals(token, "box")) {
    solid = SolidKind::BOX;
  } else if (boost::iequals(token, "cylinder")) {
    solid = SolidKind::CYLINDER;
  } else if (boost::iequals(token, "prism")) {
    solid = SolidKind::PRISM;
  } else {
    throw boost::program_options::invalid_option_value(token);
  }
  return in;
}

inline std::ostream& operator<<(std::ostream& out, const SolidKind& solid)
{
  switch (solid) {
    case SolidKind::BOX:
      out << "box";
      break;
    case SolidKind::CYLINDER:
      out << "cylinder";
      break;
    case SolidKind::PRISM:
      out << "prism";
      break;
  }
  return out;
}
}; // namespace SolidKind

#endif // UNITS_HPP
