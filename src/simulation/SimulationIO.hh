/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Reading a timestep from a parameter list and writing its outputs.
/*!

.. _weather-spec:
.. admonition:: weather-spec

   * `"air temperature [C]`" ``[double]``
   * `"ambient CO2 [umol mol^-1]`" ``[double]``
   * `"relative humidity [-]`" ``[double]``
   * `"wind speed [m s^-1]`" ``[double]`` at the reference height.

.. _axes-spec:
.. admonition:: axes-spec

   One sublist per axis, with any name:

   * `"plant`" ``[int]``
   * `"axis`" ``[string]`` e.g. `"MS`", `"T1`"
   * `"SAM temperature [C]`" ``[double]``
   * `"canopy height [m]`" ``[double]``

.. _elements-spec:
.. admonition:: elements-spec

   One sublist per element, with any name:

   * `"plant`" ``[int]``
   * `"axis`" ``[string]``
   * `"metamer`" ``[int]``
   * `"organ`" ``[string]`` one of `"blade`", `"internode`", `"sheath`",
     `"peduncle`", `"ear`"
   * `"element`" ``[string]`` e.g. `"LeafElement1`", `"HiddenElement`"
   * `"width [m]`" ``[double]`` width, or diameter of cylindrical organs
   * `"height [m]`" ``[double]`` **optional** Elements without height are not
     solved.
   * `"PARa [umol m^-2 s^-1]`" ``[double]`` **0**
   * `"surfacic nitrogen [g m^-2]`" ``[double]`` **optional**
   * `"green area [m^2]`" ``[double]`` **optional** If given, the nitrogen
     pools below are read, each defaulting to 0, and the model version
     computes the surfacic nitrogen from them.

     * `"nitrates [umol N]`", `"amino acids [umol N]`", `"proteins [umol N]`"
     * `"Nstruct [g]`"
     * `"sucrose [umol C]`", `"starch [umol C]`", `"fructan [umol C]`"

Outputs are written as comma separated values, one row per element:
`plant,axis,metamer,organ,element,Ag,An,Rd,Tr,Ts,gs,width,height`.  The
height is left empty for elements without one.

*/

#ifndef FARQUHAR_SIMULATION_IO_HH_
#define FARQUHAR_SIMULATION_IO_HH_

#include <ostream>

#include "Teuchos_ParameterList.hpp"

#include "OrganState.hh"
#include "SimulationInputs.hh"

namespace Farquhar {

// Reads the "axes" and "elements" sublists.  Throws
// Errors::InvalidConfiguration on missing or mistyped entries.
SimulationInputs
ReadSimulationInputs(Teuchos::ParameterList& plist);

// Reads the "weather" sublist.
Solvers::AmbientConditions
ReadAmbientConditions(Teuchos::ParameterList& plist);

void
WriteOutputs(std::ostream& os, const SimulationOutputs& outputs);

} // namespace Farquhar

#endif
