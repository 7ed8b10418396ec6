/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <vector>

#include "Kokkos_Core.hpp"
#include "Teuchos_Array.hpp"

#include "errors.hh"

#include "nitrogen_model_factory.hh"
#include "organ_type.hh"

#include "OrganSolverDefs.hh"
#include "Simulation.hh"

namespace Farquhar {

Simulation::Simulation(Teuchos::ParameterList& plist)
  : num_solved_(0), num_bypassed_(0), num_unconverged_(0)
{
  vo_ = Teuchos::rcp(new VerboseObject("Simulation", plist));
  Setup_(plist);
}


void
Simulation::UpdateParameters(Teuchos::ParameterList& plist)
{
  Setup_(plist);
}


/* ******************************************************************
* Build the constants, the model version and the solver.  Nothing is
* replaced unless all of them are valid.
****************************************************************** */
void
Simulation::Setup_(Teuchos::ParameterList& plist)
{
  Teuchos::ParameterList& param_list = plist.sublist("photosynthesis parameters");
  auto params = Teuchos::rcp(new Relations::PhotosynthesisParameters(param_list));

  std::string model_version = plist.get<std::string>("model version", "Barillot2016");
  Relations::NitrogenModelFactory fac;
  Teuchos::RCP<Relations::NitrogenModel> nitrogen_model =
    fac.createNitrogenModel(model_version, param_list);

  auto axes = plist.get<Teuchos::Array<std::string>>("simulated axes",
                                                     Teuchos::Array<std::string>(1, "MS"));
  std::set<std::string> simulated_axes(axes.begin(), axes.end());
  Validate_(inputs_, simulated_axes);

  params_ = params;
  model_version_ = model_version;
  nitrogen_model_ = nitrogen_model;
  simulated_axes_ = simulated_axes;
  solver_ = Teuchos::rcp(new Solvers::OrganSolver(params_));

  if (vo_->os_OK(Teuchos::VERB_LOW)) {
    Teuchos::OSTab tab = vo_->getOSTab();
    *vo_->os() << "model version \"" << model_version_ << "\", simulated axes:";
    for (const auto& axis : simulated_axes_) *vo_->os() << " " << axis;
    *vo_->os() << std::endl;
  }
}


void
Simulation::Validate_(const SimulationInputs& inputs,
                      const std::set<std::string>& simulated_axes) const
{
  for (const auto& entry : inputs.elements) {
    const OrganKey& key = entry.first;
    const ElementInputs& element = entry.second;
    if (!simulated_axes.count(key.axis)) continue;

    // throws on unknown organ names
    Relations::OrganTypeFromString(key.organ);

    if (!inputs.axes.count(GetAxisKey(key))) {
      Errors::InvalidConfiguration msg;
      msg << "Simulation: element " << to_string(key) << " has no inputs for its axis";
      Exceptions::farquhar_throw(msg);
    }

    if (element.has_height && !element.has_surfacic_nitrogen && element.has_nitrogen_pools &&
        !(element.nitrogen.green_area > 0.)) {
      Errors::InvalidConfiguration msg;
      msg << "Simulation: element " << to_string(key) << " has nitrogen pools but no green area";
      Exceptions::farquhar_throw(msg);
    }
  }
}


void
Simulation::Initialize(const SimulationInputs& inputs)
{
  Validate_(inputs, simulated_axes_);
  inputs_ = inputs;
  outputs_.clear();
}


double
Simulation::CapacityDriver(const ElementInputs& element) const
{
  if (element.has_surfacic_nitrogen) {
    return element.surfacic_nitrogen;
  } else if (element.has_nitrogen_pools) {
    return nitrogen_model_->CapacityDriver(element.nitrogen);
  }
  return params_->NA_0;
}


/* ******************************************************************
* Solve every element of the simulated axes.
****************************************************************** */
void
Simulation::Run(const Solvers::AmbientConditions& ambient)
{
  Teuchos::OSTab tab = vo_->getOSTab();
  outputs_.clear();

  // sort elements into solved and bypassed
  std::vector<OrganKey> solved, bypassed;
  std::vector<Solvers::OrganState> states;
  for (const auto& entry : inputs_.elements) {
    const OrganKey& key = entry.first;
    const ElementInputs& element = entry.second;
    if (!IsSimulated(key)) continue;

    if (!element.has_height) {
      bypassed.push_back(key);
      continue;
    }

    const AxisInputs& axis = inputs_.axes.at(GetAxisKey(key));
    Solvers::OrganState state;
    state.organ_type = Relations::OrganTypeFromString(key.organ);
    state.width = element.width;
    state.height = element.height;
    state.canopy_height = axis.canopy_height;
    state.PAR = element.PAR;
    state.surfacic_nitrogen = CapacityDriver(element);
    state.ambient = ambient;

    solved.push_back(key);
    states.push_back(state);
  }

  // each task writes only its own slot
  const int n = states.size();
  std::vector<Solvers::OrganSolution> solutions(n);
  const Solvers::OrganSolver& solver = *solver_;
  Kokkos::parallel_for(
    "Farquhar::Simulation::Run",
    Kokkos::RangePolicy<Kokkos::DefaultHostExecutionSpace>(0, n),
    [&](const int i) { solutions[i] = solver.Solve(states[i]); });
  Kokkos::fence();

  // collect
  num_solved_ = n;
  num_bypassed_ = bypassed.size();
  num_unconverged_ = 0;
  for (int i = 0; i != n; ++i) {
    const Solvers::OrganSolution& soln = solutions[i];
    const ElementInputs& element = inputs_.elements.at(solved[i]);

    ElementOutputs& out = outputs_[solved[i]];
    out.Ag = soln.Ag;
    out.An = soln.An;
    out.Rd = soln.Rd;
    out.Tr = soln.Tr;
    out.Ts = soln.Ts;
    out.gs = soln.gsw;
    out.width = element.width;
    out.has_height = true;
    out.height = element.height;

    if (soln.returned_code != Solvers::SOLVER_CONVERGED) {
      num_unconverged_++;
      Solvers::WriteNonConvergence(*vo_, to_string(solved[i]), soln);
    }
    if (vo_->os_OK(Teuchos::VERB_HIGH)) {
      *vo_->os() << to_string(solved[i]) << ": " << soln.num_itrs << " itrs, Ag=" << soln.Ag
                 << " Ts=" << soln.Ts << " gs=" << soln.gsw << std::endl;
    }
  }

  for (const auto& key : bypassed) {
    const ElementInputs& element = inputs_.elements.at(key);

    ElementOutputs& out = outputs_[key];
    out.Ag = out.An = out.Rd = out.Tr = out.gs = 0.;
    out.Ts = inputs_.axes.at(GetAxisKey(key)).SAM_temperature;
    out.width = element.width;
    out.has_height = false;
    out.height = 0.;
  }

  if (vo_->os_OK(Teuchos::VERB_MEDIUM)) {
    *vo_->os() << "solved " << num_solved_ << " elements, bypassed " << num_bypassed_
               << ", not converged " << num_unconverged_ << std::endl;
  }
}

} // namespace Farquhar
