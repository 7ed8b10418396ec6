/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Base exception type for everything thrown by Farquhar.

#ifndef FARQUHAR_EXCEPTIONS_HH_
#define FARQUHAR_EXCEPTIONS_HH_

#include <exception>

namespace Exceptions {

class Farquhar_exception : public std::exception {
 public:
  const char* what() const noexcept override { return "Farquhar exception"; }
};

// All throws go through this so that a debugger breakpoint here catches
// every error raised by the library.
template <typename E>
void
farquhar_throw(const E& exception)
{
  throw exception;
}

} // namespace Exceptions

#endif
