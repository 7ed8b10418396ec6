/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <cmath>
#include <sstream>

#include "dbc.hh"

#include "OrganSolver.hh"

namespace Farquhar {
namespace Solvers {

OrganSolver::OrganSolver(const Teuchos::RCP<const Relations::PhotosynthesisParameters>& params)
  : params_(params), assimilation_(params), stomata_(params), energy_balance_(params)
{}


OrganSolution
OrganSolver::Solve(const OrganState& state) const
{
  return Solve(state, Relations::GetOrganTypeTraits(state.organ_type, *params_));
}


/* ******************************************************************
* Successive substitution over (Ts, Ci).
****************************************************************** */
OrganSolution
OrganSolver::Solve(const OrganState& state, const Relations::OrganTypeTraits& traits) const
{
  const AmbientConditions& amb = state.ambient;
  const double N = state.surfacic_nitrogen;
  const double tol = params_->tolerance;

  OrganSolution soln;
  soln.num_itrs = 0;
  soln.returned_code = SOLVER_CONVERGED;
  soln.unconverged = 0;

  double Ci = params_->ci_init_fraction * amb.CO2;
  double Ts = amb.Ta;
  double Tr = 0.;
  double prev_Ci, prev_Ts;
  Relations::AssimilationRates rates;
  double gsw;

  while (true) {
    prev_Ci = Ci;
    prev_Ts = Ts;

    rates = assimilation_.Assimilation(state.PAR, N, Ts, Ci);
    gsw = stomata_.Conductance(rates.Ag, rates.An, N, amb.CO2, amb.RH);
    FARQUHAR_ASSERT(gsw > 0.);

    Ci = stomata_.InternalCO2(amb.CO2, rates.An, gsw);

    Relations::EnergyBalanceResult eb = energy_balance_.Solve(state.width,
                                                              state.height,
                                                              state.canopy_height,
                                                              amb.Ur,
                                                              state.PAR,
                                                              gsw,
                                                              amb.Ta,
                                                              Ts,
                                                              amb.RH,
                                                              traits.convection);
    Ts = eb.Ts;
    Tr = eb.Tr;
    soln.num_itrs++;

    FARQUHAR_ASSERT(prev_Ci != 0.);
    double dCi = std::abs((Ci - prev_Ci) / prev_Ci);

    if (soln.num_itrs >= params_->max_itrs) {
      if (dCi >= tol) soln.unconverged |= SOLVER_CI_UNCONVERGED;
      if (prev_Ts != 0. && std::abs((Ts - prev_Ts) / prev_Ts) >= tol)
        soln.unconverged |= SOLVER_TS_UNCONVERGED;
      if (soln.unconverged) soln.returned_code = SOLVER_MAX_ITERATIONS;
      break;
    }

    // Sharp edge: Ts is in C, so a zero previous temperature is physical.
    // Any change away from exactly zero gives an infinite relative change
    // and the loop continues.
    if (dCi < tol &&
        ((prev_Ts == 0. && Ts - prev_Ts == 0.) || std::abs((Ts - prev_Ts) / prev_Ts) < tol))
      break;
  }

  soln.Ag = rates.Ag * traits.efficiency;
  soln.An = rates.An;
  soln.Rd = rates.Rd;
  soln.Tr = (Tr * 1.e6) / params_->water_molar_mass; // 1 mm = 1 kg m^-2
  soln.Ts = Ts;
  soln.gsw = gsw;
  soln.Ci = Ci;
  soln.prev_Ci = prev_Ci;
  soln.prev_Ts = prev_Ts;
  return soln;
}


void
WriteNonConvergence(const VerboseObject& vo, const std::string& organ, const OrganSolution& soln)
{
  if (soln.unconverged & SOLVER_CI_UNCONVERGED) {
    std::stringstream ss;
    ss << organ << ", Ci cannot converge, prev_Ci=" << soln.prev_Ci << ", Ci=" << soln.Ci
       << std::endl;
    vo.WriteWarning(Teuchos::VERB_LOW, ss);
  }
  if (soln.unconverged & SOLVER_TS_UNCONVERGED) {
    std::stringstream ss;
    ss << organ << ", Ts cannot converge, prev_Ts=" << soln.prev_Ts << ", Ts=" << soln.Ts
       << std::endl;
    vo.WriteWarning(Teuchos::VERB_LOW, ss);
  }
}

} // namespace Solvers
} // namespace Farquhar
