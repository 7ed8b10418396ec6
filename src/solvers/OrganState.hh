/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Inputs and outputs of one organ solve.

#ifndef FARQUHAR_ORGAN_STATE_HH_
#define FARQUHAR_ORGAN_STATE_HH_

#include "organ_type.hh"

namespace Farquhar {
namespace Solvers {

// Weather shared by every organ of a timestep.
struct AmbientConditions {
  double Ta;  // air temperature [C]
  double CO2; // ambient CO2 [umol mol^-1]
  double RH;  // relative humidity [-]
  double Ur;  // wind at the reference height [m s^-1]
};

struct OrganState {
  Relations::OrganType organ_type;
  double width;             // width or diameter [m]
  double height;            // height above soil [m]
  double canopy_height;     // [m]
  double PAR;               // absorbed [umol m^-2 s^-1]
  double surfacic_nitrogen; // capacity driver [g m^-2]
  AmbientConditions ambient;
};

struct OrganSolution {
  double Ag, An, Rd; // umol m^-2 s^-1
  double Tr;         // mmol m^-2 s^-1
  double Ts;         // C
  double gsw;        // mol m^-2 s^-1
  double Ci;         // umol mol^-1

  int num_itrs;
  int returned_code;
  int unconverged; // SOLVER_CI_UNCONVERGED | SOLVER_TS_UNCONVERGED

  // last two iterates, reported when not converged
  double prev_Ci, prev_Ts;
};

} // namespace Solvers
} // namespace Farquhar

#endif
