/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

/*
  Solvers

*/

#ifndef FARQUHAR_ORGAN_SOLVER_DEFS_HH_
#define FARQUHAR_ORGAN_SOLVER_DEFS_HH_

namespace Farquhar {
namespace Solvers {

const int SOLVER_CONVERGED = 0;
const int SOLVER_MAX_ITERATIONS = -1;

// which quantities failed to converge
const int SOLVER_CI_UNCONVERGED = 1;
const int SOLVER_TS_UNCONVERGED = 2;

} // namespace Solvers
} // namespace Farquhar

#endif
