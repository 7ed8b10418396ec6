/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#ifndef FARQUHAR_DBC_HH_
#define FARQUHAR_DBC_HH_

#include <string>

#include "exceptions.hh"

namespace DBC {

/* Assertion
 *
 * An exception class for DBC assertion violations.
 *
 */
class Assertion : public Exceptions::Farquhar_exception {
 public:
  Assertion(const char* condition, const char* file, unsigned int line);
  const char* what() const noexcept override;

 public:
  const char* assertion_;
  const char* filename_;
  unsigned int line_number_;

 private:
  std::string message_;
};

void
farquhar_assert(const char* cond, const char* file, unsigned int line);

} // namespace DBC


// ---------------------------------
// Macros for DBC checks in the code
// ---------------------------------

// The do wrapper prevents the if statement from grabbing subsequent
// else statements away from enclosing ifs.  The version when DBC is
// not enabled compiles away to nothing, but surpresses warning about
// unused variables in the expression a.

#ifdef ENABLE_DBC
#  define FARQUHAR_ASSERT(bool_expression)                                                         \
    do {                                                                                           \
      if (!(bool_expression)) DBC::farquhar_assert(#bool_expression, __FILE__, __LINE__);          \
    } while (0)
#else
#  define FARQUHAR_ASSERT(a)                                                                       \
    do {                                                                                           \
      (void)sizeof(a);                                                                             \
    } while (0)
#endif /* ENABLE_DBC */


#endif /* FARQUHAR_DBC_HH_ */
