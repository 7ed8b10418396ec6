/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <iostream>

#include "Kokkos_Core.hpp"

#include "Teuchos_CommandLineProcessor.hpp"
#include "Teuchos_ParameterList.hpp"
#include "Teuchos_VerboseObjectParameterListHelpers.hpp"
#include "Teuchos_XMLParameterListHelpers.hpp"

#include "VerboseObject_objs.hh"

#include "errors.hh"
#include "simulation_driver.hh"

// registration files
#include "farquhar_relations_registration.hh"

#include "boost/filesystem.hpp"

int
main(int argc, char* argv[])
{
  std::string input_filename;
  if ((argc >= 2) && (argv[argc - 1][0] != '-')) {
    input_filename = std::string(argv[argc - 1]);
    argc--;
  }

  Teuchos::CommandLineProcessor clp;
  clp.setDocString("Run the Farquhar-Wheat organ photosynthesis model on one timestep.\n\n"
                   "Standard usage: farquhar input.xml\n");

  std::string opt_input_filename = "";
  clp.setOption("xml_file", &opt_input_filename, "XML input file");

  std::string verbosity;
  clp.setOption("verbosity",
                &verbosity,
                "Default verbosity level: \"none\", \"low\", \"medium\", \"high\", \"extreme\".");

  clp.throwExceptions(false);
  clp.recogniseAllOptions(true);

  auto parseReturn = clp.parse(argc, argv);
  if (parseReturn == Teuchos::CommandLineProcessor::PARSE_HELP_PRINTED) { return 0; }
  if (parseReturn != Teuchos::CommandLineProcessor::PARSE_SUCCESSFUL) { return 1; }

  // parse the verbosity level
  Teuchos::EVerbosityLevel opt_level = Teuchos::VERB_DEFAULT;
  if (verbosity.empty()) {
    // pass
  } else if (verbosity == "none") {
    opt_level = Teuchos::VERB_NONE;
  } else if (verbosity == "low") {
    opt_level = Teuchos::VERB_LOW;
  } else if (verbosity == "medium") {
    opt_level = Teuchos::VERB_MEDIUM;
  } else if (verbosity == "high") {
    opt_level = Teuchos::VERB_HIGH;
  } else if (verbosity == "extreme") {
    opt_level = Teuchos::VERB_EXTREME;
  } else {
    std::cerr << "ERROR: invalid verbosity level \"" << verbosity << "\"" << std::endl;
    clp.printHelpMessage("farquhar", std::cerr);
    return 1;
  }

  // parse the input file and check validity
  if (input_filename.empty() && !opt_input_filename.empty()) input_filename = opt_input_filename;
  if (input_filename.empty()) {
    std::cerr << "ERROR: no input file provided" << std::endl;
    clp.printHelpMessage("farquhar", std::cerr);
    return 1;
  } else if (!boost::filesystem::exists(input_filename)) {
    std::cerr << "ERROR: input file \"" << input_filename << "\" does not exist." << std::endl;
    return 1;
  }

  Kokkos::initialize(argc, argv);
  int ret = 0;
  try {
    // -- parse input file
    Teuchos::RCP<Teuchos::ParameterList> plist = Teuchos::getParametersFromXmlFile(input_filename);

    // -- set default verbosity level
    Teuchos::RCP<Teuchos::FancyOStream> fos;
    Teuchos::EVerbosityLevel verbosity_from_list;
    Teuchos::readVerboseObjectSublist(&*plist, &fos, &verbosity_from_list);
    if (verbosity_from_list != Teuchos::VERB_DEFAULT)
      Farquhar::VerboseObject::global_default_level = verbosity_from_list;
    if (!verbosity.empty()) Farquhar::VerboseObject::global_default_level = opt_level;

    // -- run
    Farquhar::SimulationDriver simulator;
    ret = simulator.Run(*plist);
  } catch (Errors::Message& e) {
    std::cerr << "ERROR:" << std::endl << e.what() << std::endl;
    ret = 1;
  } catch (std::exception& e) {
    std::cerr << "ERROR: " << e.what() << std::endl;
    ret = 1;
  }
  Kokkos::finalize();
  return ret;
}
