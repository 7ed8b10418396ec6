/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <UnitTest++.h>

#include "Teuchos_Array.hpp"
#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"

#include "errors.hh"

#include "OrganSolver.hh"
#include "Simulation.hh"

using namespace Farquhar;

namespace {

OrganKey
Key(const std::string& axis, int metamer, const std::string& organ, const std::string& element)
{
  OrganKey key;
  key.plant = 1;
  key.axis = axis;
  key.metamer = metamer;
  key.organ = organ;
  key.element = element;
  return key;
}

ElementInputs
Element(double width, double N)
{
  ElementInputs element;
  element.width = width;
  element.has_height = true;
  element.height = 0.5;
  element.PAR = 500.;
  element.has_surfacic_nitrogen = true;
  element.surfacic_nitrogen = N;
  return element;
}

Solvers::AmbientConditions
Weather()
{
  Solvers::AmbientConditions ambient;
  ambient.Ta = 20.;
  ambient.CO2 = 380.;
  ambient.RH = 0.6;
  ambient.Ur = 3.;
  return ambient;
}

// a main stem with a blade, a sheath, an internode, an ear and a hidden
// sheath element, plus a tiller blade
SimulationInputs
Plant()
{
  SimulationInputs inputs;

  AxisInputs ms;
  ms.SAM_temperature = 18.5;
  ms.canopy_height = 0.7;
  inputs.axes[AxisKey(1, "MS")] = ms;

  AxisInputs t1;
  t1.SAM_temperature = 17.;
  t1.canopy_height = 0.7;
  inputs.axes[AxisKey(1, "T1")] = t1;

  inputs.elements[Key("MS", 4, "blade", "LeafElement1")] = Element(0.018, 2.0);
  inputs.elements[Key("MS", 4, "sheath", "StemElement")] = Element(0.018, 2.0);
  inputs.elements[Key("MS", 3, "internode", "StemElement")] = Element(0.3, 2.0);
  inputs.elements[Key("MS", 5, "ear", "StemElement")] = Element(0.01, 1.5);

  ElementInputs hidden = Element(0.004, 2.0);
  hidden.has_height = false;
  inputs.elements[Key("MS", 5, "sheath", "HiddenElement")] = hidden;

  inputs.elements[Key("T1", 3, "blade", "LeafElement1")] = Element(0.012, 1.8);
  return inputs;
}

} // namespace


SUITE(SIMULATION_BATCH)
{
  TEST(REFERENCE_VALUES)
  {
    Teuchos::ParameterList plist;
    Simulation sim(plist);
    sim.Initialize(Plant());
    sim.Run(Weather());

    const SimulationOutputs& out = sim.outputs();
    const ElementOutputs& blade = out.at(Key("MS", 4, "blade", "LeafElement1"));
    CHECK_CLOSE(20.004845789604424, blade.Ag, 1.e-9);
    CHECK_CLOSE(19.748899569136356, blade.An, 1.e-9);
    CHECK_CLOSE(0.2559462204680673, blade.Rd, 1.e-11);
    CHECK_CLOSE(3.3343982473928726, blade.Tr, 1.e-9);
    CHECK_CLOSE(21.2457218085997, blade.Ts, 1.e-9);
    CHECK_CLOSE(0.374176587981017, blade.gs, 1.e-11);
    CHECK_EQUAL(0.018, blade.width);
    CHECK(blade.has_height);
    CHECK_EQUAL(0.5, blade.height);

    const ElementOutputs& sheath = out.at(Key("MS", 4, "sheath", "StemElement"));
    CHECK_CLOSE(15.681887581444952, sheath.Ag, 1.e-9);
    CHECK_CLOSE(22.747522757829614, sheath.Ts, 1.e-9);

    const ElementOutputs& internode = out.at(Key("MS", 3, "internode", "StemElement"));
    CHECK_CLOSE(14.460478646162068, internode.Ag, 1.e-9);
    CHECK_CLOSE(30.614858481874776, internode.Ts, 1.e-9);

    CHECK_EQUAL(4, sim.num_solved());
    CHECK_EQUAL(1, sim.num_bypassed());
    CHECK_EQUAL(0, sim.num_unconverged());
  }

  TEST(BATCH_EQUALS_INDIVIDUAL_SOLVES)
  {
    Teuchos::ParameterList plist;
    Simulation sim(plist);
    SimulationInputs inputs = Plant();
    sim.Initialize(inputs);
    sim.Run(Weather());

    auto params = Teuchos::rcp(new Relations::PhotosynthesisParameters());
    Solvers::OrganSolver solver(params);

    int count = 0;
    for (const auto& entry : inputs.elements) {
      const OrganKey& key = entry.first;
      const ElementInputs& element = entry.second;
      if (key.axis != "MS" || !element.has_height) continue;

      Solvers::OrganState state;
      state.organ_type = Relations::OrganTypeFromString(key.organ);
      state.width = element.width;
      state.height = element.height;
      state.canopy_height = 0.7;
      state.PAR = element.PAR;
      state.surfacic_nitrogen = element.surfacic_nitrogen;
      state.ambient = Weather();
      Solvers::OrganSolution soln = solver.Solve(state);

      const ElementOutputs& out = sim.outputs().at(key);
      CHECK_EQUAL(soln.Ag, out.Ag);
      CHECK_EQUAL(soln.An, out.An);
      CHECK_EQUAL(soln.Rd, out.Rd);
      CHECK_EQUAL(soln.Tr, out.Tr);
      CHECK_EQUAL(soln.Ts, out.Ts);
      CHECK_EQUAL(soln.gsw, out.gs);
      count++;
    }
    CHECK_EQUAL(4, count);
  }

  TEST(DEGENERATE_ELEMENT)
  {
    Teuchos::ParameterList plist;
    Simulation sim(plist);
    sim.Initialize(Plant());
    sim.Run(Weather());

    const ElementOutputs& hidden = sim.outputs().at(Key("MS", 5, "sheath", "HiddenElement"));
    CHECK_EQUAL(0., hidden.Ag);
    CHECK_EQUAL(0., hidden.An);
    CHECK_EQUAL(0., hidden.Rd);
    CHECK_EQUAL(0., hidden.Tr);
    CHECK_EQUAL(0., hidden.gs);
    CHECK_EQUAL(18.5, hidden.Ts);
    CHECK_EQUAL(0.004, hidden.width);
    CHECK(!hidden.has_height);
  }

  TEST(SIMULATED_AXES)
  {
    {
      Teuchos::ParameterList plist;
      Simulation sim(plist);
      sim.Initialize(Plant());
      sim.Run(Weather());
      CHECK_EQUAL(5, sim.outputs().size());
      CHECK(!sim.outputs().count(Key("T1", 3, "blade", "LeafElement1")));
    }

    {
      Teuchos::ParameterList plist;
      Teuchos::Array<std::string> axes(2);
      axes[0] = "MS";
      axes[1] = "T1";
      plist.set<Teuchos::Array<std::string>>("simulated axes", axes);
      Simulation sim(plist);
      sim.Initialize(Plant());
      sim.Run(Weather());
      CHECK_EQUAL(6, sim.outputs().size());
      CHECK(sim.outputs().at(Key("T1", 3, "blade", "LeafElement1")).Ag > 0.);
    }
  }

  TEST(NITROGEN_SOURCES)
  {
    Teuchos::ParameterList plist;
    Simulation sim(plist);

    // no nitrogen at all: default surfacic nitrogen
    ElementInputs element = Element(0.018, 0.);
    element.has_surfacic_nitrogen = false;
    CHECK_EQUAL(2.0, sim.CapacityDriver(element));

    // pools through the model version
    element.has_nitrogen_pools = true;
    element.nitrogen.nitrates = 100.;
    element.nitrogen.amino_acids = 200.;
    element.nitrogen.proteins = 300.;
    element.nitrogen.Nstruct = 0.01;
    element.nitrogen.green_area = 0.002;
    CHECK_CLOSE(9.2, sim.CapacityDriver(element), 1.e-12);

    // an explicit value wins
    element.has_surfacic_nitrogen = true;
    element.surfacic_nitrogen = 1.7;
    CHECK_EQUAL(1.7, sim.CapacityDriver(element));

    Teuchos::ParameterList plist2;
    plist2.set<std::string>("model version", "SurfacicProteins");
    Simulation sim2(plist2);
    element.has_surfacic_nitrogen = false;
    CHECK_CLOSE(2.1, sim2.CapacityDriver(element), 1.e-12);
    CHECK_EQUAL("SurfacicProteins", sim2.model_version());
  }

  TEST(DEFAULT_NITROGEN_IN_A_BATCH)
  {
    Teuchos::ParameterList plist;
    Simulation sim(plist);
    SimulationInputs inputs = Plant();
    inputs.elements[Key("MS", 4, "blade", "LeafElement1")].has_surfacic_nitrogen = false;
    sim.Initialize(inputs);
    sim.Run(Weather());

    // N = 2 is the default
    CHECK_CLOSE(20.004845789604424,
                sim.outputs().at(Key("MS", 4, "blade", "LeafElement1")).Ag,
                1.e-9);
  }

  TEST(INVALID_CONFIGURATION)
  {
    {
      Teuchos::ParameterList plist;
      plist.set<std::string>("model version", "Barillot2014");
      CHECK_THROW(Simulation sim(plist), Errors::InvalidConfiguration);
    }

    Teuchos::ParameterList plist;
    Simulation sim(plist);
    {
      SimulationInputs inputs = Plant();
      inputs.elements[Key("MS", 6, "lamina", "LeafElement1")] = Element(0.018, 2.0);
      CHECK_THROW(sim.Initialize(inputs), Errors::InvalidConfiguration);
    }
    {
      SimulationInputs inputs = Plant();
      inputs.axes.erase(AxisKey(1, "MS"));
      CHECK_THROW(sim.Initialize(inputs), Errors::InvalidConfiguration);
    }
    {
      // elements of axes that are not simulated are not checked
      SimulationInputs inputs = Plant();
      inputs.axes.erase(AxisKey(1, "T1"));
      inputs.elements[Key("T1", 6, "lamina", "LeafElement1")] = Element(0.018, 2.0);
      sim.Initialize(inputs);
      sim.Run(Weather());
      CHECK_EQUAL(5, sim.outputs().size());
    }
  }

  TEST(UPDATE_PARAMETERS)
  {
    Teuchos::ParameterList plist;
    Simulation sim(plist);
    sim.Initialize(Plant());
    sim.Run(Weather());
    double Ag = sim.outputs().at(Key("MS", 4, "sheath", "StemElement")).Ag;

    Teuchos::ParameterList update;
    update.sublist("photosynthesis parameters").set<double>("stem efficiency [-]", 0.39);
    sim.UpdateParameters(update);
    CHECK_EQUAL(0.39, sim.parameters().stem_efficiency);
    sim.Run(Weather());
    CHECK_CLOSE(0.5 * Ag, sim.outputs().at(Key("MS", 4, "sheath", "StemElement")).Ag, 1.e-12);

    // a rejected update keeps the previous parameters
    Teuchos::ParameterList bad;
    bad.set<std::string>("model version", "unknown");
    CHECK_THROW(sim.UpdateParameters(bad), Errors::InvalidConfiguration);
    CHECK_EQUAL(0.39, sim.parameters().stem_efficiency);
    CHECK_EQUAL("Barillot2016", sim.model_version());
  }

  TEST(NON_CONVERGENCE_IS_NOT_FATAL)
  {
    Teuchos::ParameterList plist;
    plist.sublist("photosynthesis parameters").set<int>("limit iterations", 1);
    plist.sublist("verbose object").set<std::string>("verbosity level", "none");
    Simulation sim(plist);
    sim.Initialize(Plant());
    sim.Run(Weather());

    CHECK_EQUAL(4, sim.num_unconverged());
    CHECK_EQUAL(5, sim.outputs().size());
    CHECK_CLOSE(19.35534855689394,
                sim.outputs().at(Key("MS", 4, "blade", "LeafElement1")).Ag,
                1.e-9);
  }
}
