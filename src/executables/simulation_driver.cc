/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <fstream>
#include <iostream>

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_XMLParameterListHelpers.hpp"

#include "VerboseObject.hh"
#include "errors.hh"
#include "exceptions.hh"

#include "Simulation.hh"
#include "SimulationIO.hh"
#include "simulation_driver.hh"

namespace Farquhar {

int
SimulationDriver::Run(Teuchos::ParameterList& plist)
{
  VerboseObject vo("Simulation Driver", plist);
  Teuchos::OSTab tab = vo.getOSTab();

  // print header material
  if (vo.os_OK(Teuchos::VERB_EXTREME)) {
    *vo.os() << "======================> dumping parameter list <======================"
             << std::endl;
    Teuchos::writeParameterListToXmlOStream(plist, *vo.os());
    *vo.os() << "======================> done dumping parameter list. <================"
             << std::endl;
  }

  // read the timestep
  SimulationInputs inputs = ReadSimulationInputs(plist);
  Solvers::AmbientConditions ambient = ReadAmbientConditions(plist);

  // create the simulation and run it
  Simulation sim(plist.sublist("simulation"));
  sim.Initialize(inputs);
  sim.Run(ambient);

  // write the outputs
  if (plist.isParameter("output filename")) {
    std::string filename = plist.get<std::string>("output filename");
    std::ofstream out(filename.c_str());
    if (!out.good()) {
      Errors::Message msg;
      msg << "SimulationDriver: cannot open output file \"" << filename << "\"";
      Exceptions::farquhar_throw(msg);
    }
    WriteOutputs(out, sim.outputs());

    if (vo.os_OK(Teuchos::VERB_LOW)) {
      *vo.os() << "wrote " << sim.outputs().size() << " elements to \"" << filename << "\""
               << std::endl;
    }
  } else {
    WriteOutputs(std::cout, sim.outputs());
  }
  return 0;
}

} // namespace Farquhar
