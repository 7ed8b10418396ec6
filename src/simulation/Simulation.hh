/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Runs the organ solver on every element of a timestep.
/*!

The simulation holds the inputs of one timestep, keyed by element, and
produces one set of outputs per element of the simulated axes.  For every
element it

* skips it if its axis is not simulated,
* bypasses the solver if it has no height: all fluxes and the conductance
  are zero and its temperature is the SAM temperature of its axis,
* otherwise reduces its nitrogen to the capacity driver of the model
  version and solves its temperature and internal CO2.

Organ solves are independent and run in parallel.  Non-convergence warnings
are written once all solves are done.

.. _simulation-spec:
.. admonition:: simulation-spec

   * `"model version`" ``[string]`` **Barillot2016** One of
     `"Barillot2016`", `"SurfacicProteins`" or
     `"SurfacicProteins_Retroinhibition`".

   * `"simulated axes`" ``[Array(string)]`` **{MS}** Labels of the axes
     whose elements are computed.

   * `"photosynthesis parameters`" ``[photosynthesis-parameters-spec]``
     Overrides of the model constants.  Also holds the parameters of the
     model version.

   * `"verbose object`" ``[verbose-object-spec]`` See `Verbose Object`_.

*/

#ifndef FARQUHAR_SIMULATION_HH_
#define FARQUHAR_SIMULATION_HH_

#include <set>
#include <string>

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"

#include "VerboseObject.hh"

#include "nitrogen_model.hh"
#include "photosynthesis_parameters.hh"

#include "OrganSolver.hh"
#include "OrganState.hh"
#include "SimulationInputs.hh"

namespace Farquhar {

class Simulation {
 public:
  explicit Simulation(Teuchos::ParameterList& plist);

  // Replaces the constants, the model version and the simulated axes.
  // Never called while a batch is running.
  void UpdateParameters(Teuchos::ParameterList& plist);

  // Replaces the inputs.  Throws Errors::InvalidConfiguration if an element
  // of a simulated axis has an unknown organ type, no axis inputs, or
  // nitrogen pools without green area.
  void Initialize(const SimulationInputs& inputs);

  void Run(const Solvers::AmbientConditions& ambient);

  // access
  const SimulationInputs& inputs() const { return inputs_; }
  const SimulationOutputs& outputs() const { return outputs_; }
  const std::string& model_version() const { return model_version_; }
  const Relations::PhotosynthesisParameters& parameters() const { return *params_; }
  int num_solved() const { return num_solved_; }
  int num_bypassed() const { return num_bypassed_; }
  int num_unconverged() const { return num_unconverged_; }

  bool IsSimulated(const OrganKey& key) const { return simulated_axes_.count(key.axis) > 0; }

  // Surfacic nitrogen driving the capacities of an element [g m^-2].
  double CapacityDriver(const ElementInputs& element) const;

 private:
  void Setup_(Teuchos::ParameterList& plist);
  void Validate_(const SimulationInputs& inputs,
                 const std::set<std::string>& simulated_axes) const;

 private:
  std::string model_version_;
  std::set<std::string> simulated_axes_;

  Teuchos::RCP<const Relations::PhotosynthesisParameters> params_;
  Teuchos::RCP<Relations::NitrogenModel> nitrogen_model_;
  Teuchos::RCP<Solvers::OrganSolver> solver_;

  SimulationInputs inputs_;
  SimulationOutputs outputs_;
  int num_solved_, num_bypassed_, num_unconverged_;

  Teuchos::RCP<VerboseObject> vo_;
};

} // namespace Farquhar

#endif
