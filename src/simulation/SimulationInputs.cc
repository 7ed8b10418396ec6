/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <sstream>

#include "SimulationInputs.hh"

namespace Farquhar {

std::string
to_string(const OrganKey& key)
{
  std::stringstream ss;
  ss << "(" << key.plant << ", " << key.axis << ", " << key.metamer << ", " << key.organ << ", "
     << key.element << ")";
  return ss.str();
}

} // namespace Farquhar
