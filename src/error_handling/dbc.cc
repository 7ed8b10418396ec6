/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "dbc.hh"

#include <sstream>

namespace DBC {

Assertion::Assertion(const char* assertion, const char* filename, unsigned int line_number)
  : assertion_(assertion), filename_(filename), line_number_(line_number)
{
  std::ostringstream message;
  message << "Assertion: \"" << assertion_ << "\" failed in file: " << filename_
          << ", at line: " << line_number_ << std::endl;
  message_ = message.str();
}


const char*
Assertion::what() const noexcept
{
  return message_.c_str();
}


void
farquhar_assert(const char* cond, const char* file, unsigned int line)
{
  Exceptions::farquhar_throw(Assertion(cond, file, line));
}

} // namespace DBC
