/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Fixed-point solver for the temperature and internal CO2 of an organ.
/*!

Photosynthesis depends on organ temperature Ts and internal CO2 Ci,
stomatal conductance on photosynthesis, Ci on conductance, and Ts on the
transpiration that conductance allows.  The steady state is found by
successive substitution, starting from Ci = 0.7 Ca and Ts = Ta:

  1. assimilation at (Ts, Ci) gives Ag, An, Rd
  2. stomatal conductance gives gsw
  3. the CO2 diffusion balance gives the new Ci
  4. the energy balance gives the new Ts and the transpiration Tr

The iteration stops when the relative changes of Ci and Ts both drop below
the tolerance, or after the iteration limit.  Hitting the limit is not an
error: the last iterate is returned, with the quantities that did not
converge flagged in the solution.

On exit Tr is converted from mm s^-1 to mmol m^-2 s^-1 and Ag is multiplied
by the photosynthetic efficiency of the organ type.  An and Rd are left as
computed.

Tolerance, iteration limit, initial Ci fraction and stem efficiency are read
from the PhotosynthesisParameters, see photosynthesis-parameters-spec.

*/

#ifndef FARQUHAR_ORGAN_SOLVER_HH_
#define FARQUHAR_ORGAN_SOLVER_HH_

#include <string>

#include "Teuchos_RCP.hpp"

#include "VerboseObject.hh"

#include "assimilation_model.hh"
#include "organ_energy_balance.hh"
#include "organ_type.hh"
#include "photosynthesis_parameters.hh"
#include "stomatal_conductance_model.hh"

#include "OrganSolverDefs.hh"
#include "OrganState.hh"

namespace Farquhar {
namespace Solvers {

class OrganSolver {
 public:
  explicit OrganSolver(const Teuchos::RCP<const Relations::PhotosynthesisParameters>& params);

  // Solves with the traits of the organ type of state.
  OrganSolution Solve(const OrganState& state) const;

  // Solves with explicit convection regime and efficiency.
  OrganSolution Solve(const OrganState& state, const Relations::OrganTypeTraits& traits) const;

 private:
  Teuchos::RCP<const Relations::PhotosynthesisParameters> params_;

  Relations::AssimilationModel assimilation_;
  Relations::StomatalConductanceModel stomata_;
  Relations::OrganEnergyBalance energy_balance_;
};


// One warning per quantity that did not converge, naming the organ.
void
WriteNonConvergence(const VerboseObject& vo, const std::string& organ, const OrganSolution& soln);

} // namespace Solvers
} // namespace Farquhar

#endif
