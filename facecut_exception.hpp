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

#ifndef FACECUT_EXCEPTION_HPP
#define FACECUT_EXCEPTION_HPP

#include <stdexcept>
#include <string>

enum ErrorCodes {
    ERR_OK = 0,
    ERR_INVALIDPATTERNSPEC = 1,
    ERR_NOMATCHINGFACE = 2,
    ERR_UNSUPPORTEDFACETOPOLOGY = 3,
    ERR_GEOMETRYCUTFAILED = 4,
    ERR_NOSOLIDSIZE = 20,
    ERR_NEGATIVESOLIDSIZE = 21,
    ERR_NEGATIVEWIDTH = 23,
    ERR_NEGATIVEBORDER = 24,
    ERR_NEGATIVESPACING = 25,
    ERR_NEGATIVEDEPTH = 26,
    ERR_NEGATIVEDEFLECTION = 27,
    ERR_BORDERCUTANDSHAPE = 28,
    ERR_INVALIDPARAMETER = 100,
    ERR_UNKNOWNPARAMETER = 101
};

class facecut_exception : public std::exception {
 public:
  facecut_exception(const std::string& what, ErrorCodes error_code) {
    what_string = what;
    this->error_code = error_code;
  }
  virtual const char* what() const throw() {
    return what_string.c_str();
  }
  virtual ErrorCodes code() const throw() {
    return error_code;
  }

 private:
  std::string what_string;
  ErrorCodes error_code;
};

#endif // FACECUT_EXCEPTION_HPP
