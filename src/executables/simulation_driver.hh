/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Runs one timestep of the photosynthesis model from an input list.
/*!

The top-level main accepts an XML list including a few required elements.

.. _main-spec:
.. admonition:: main-spec

    * `"simulation`" ``[simulation-spec]`` See Simulation_.
    * `"weather`" ``[weather-spec]`` Ambient conditions of the timestep.
    * `"axes`" ``[axis-spec-list]`` SAM temperature and canopy height of
      each axis.
    * `"elements`" ``[element-spec-list]`` Geometry, light and nitrogen of
      each element.
    * `"output filename`" ``[string]`` **optional** CSV file receiving one
      row per computed element.  Written to standard out if not given.

*/

#ifndef FARQUHAR_SIMULATION_DRIVER_HH_
#define FARQUHAR_SIMULATION_DRIVER_HH_

#include "Teuchos_ParameterList.hpp"

namespace Farquhar {

struct SimulationDriver {
  int Run(Teuchos::ParameterList& input_parameter_list);
};

} // namespace Farquhar

#endif
