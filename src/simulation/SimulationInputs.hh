/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Per-element and per-axis data of one timestep, keyed by organ identity.

#ifndef FARQUHAR_SIMULATION_INPUTS_HH_
#define FARQUHAR_SIMULATION_INPUTS_HH_

#include <map>
#include <string>
#include <tuple>
#include <utility>

#include "nitrogen_normalization.hh"

namespace Farquhar {

// Location of an element in the plant: plant index, axis label, metamer
// index, organ label and element label.
struct OrganKey {
  int plant;
  std::string axis;
  int metamer;
  std::string organ;
  std::string element;

  bool operator<(const OrganKey& other) const
  {
    return std::tie(plant, axis, metamer, organ, element) <
           std::tie(other.plant, other.axis, other.metamer, other.organ, other.element);
  }
};

std::string
to_string(const OrganKey& key);

// plant index, axis label
typedef std::pair<int, std::string> AxisKey;

inline AxisKey
GetAxisKey(const OrganKey& key)
{
  return AxisKey(key.plant, key.axis);
}

struct ElementInputs {
  double width = 0.; // width or diameter [m]

  // elements too small to have a resolved geometry have no height
  bool has_height = false;
  double height = 0.; // [m]

  double PAR = 0.; // absorbed [umol m^-2 s^-1]

  // Either the surfacic nitrogen itself, or the pools the model version
  // derives it from.  With neither, the default surfacic nitrogen is used.
  bool has_surfacic_nitrogen = false;
  double surfacic_nitrogen = 0.; // [g m^-2]

  bool has_nitrogen_pools = false;
  Relations::OrganNitrogen nitrogen = {};
};

struct AxisInputs {
  double SAM_temperature; // shoot apical meristem [C]
  double canopy_height;   // [m]
};

struct ElementOutputs {
  double Ag, An, Rd; // umol m^-2 s^-1
  double Tr;         // mmol m^-2 s^-1
  double Ts;         // C
  double gs;         // mol m^-2 s^-1

  // pass-through geometry
  double width;
  bool has_height;
  double height;
};

struct SimulationInputs {
  std::map<OrganKey, ElementInputs> elements;
  std::map<AxisKey, AxisInputs> axes;
};

typedef std::map<OrganKey, ElementOutputs> SimulationOutputs;

} // namespace Farquhar

#endif
