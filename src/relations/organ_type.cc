/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "organ_type.hh"

namespace Farquhar {
namespace Relations {

OrganType
OrganTypeFromString(const std::string& name)
{
  if (name == "blade") {
    return OrganType::BLADE;
  } else if (name == "internode") {
    return OrganType::INTERNODE;
  } else if (name == "sheath") {
    return OrganType::SHEATH;
  } else if (name == "peduncle") {
    return OrganType::PEDUNCLE;
  } else if (name == "ear") {
    return OrganType::EAR;
  }

  Errors::InvalidConfiguration msg;
  msg << "unknown organ type \"" << name << "\", valid options are: "
      << "\"blade\", \"internode\", \"sheath\", \"peduncle\", \"ear\"";
  Exceptions::farquhar_throw(msg);
  return OrganType::BLADE;
}


std::string
to_string(OrganType type)
{
  switch (type) {
  case OrganType::BLADE:
    return "blade";
  case OrganType::INTERNODE:
    return "internode";
  case OrganType::SHEATH:
    return "sheath";
  case OrganType::PEDUNCLE:
    return "peduncle";
  case OrganType::EAR:
    return "ear";
  }
  return "unknown";
}


OrganTypeTraits
GetOrganTypeTraits(OrganType type, const PhotosynthesisParameters& params)
{
  OrganTypeTraits traits;
  if (type == OrganType::BLADE) {
    traits.convection = ConvectionRegime::FLAT_PLATE;
    traits.efficiency = 1.0;
  } else {
    traits.convection = ConvectionRegime::CYLINDER;
    traits.efficiency = params.stem_efficiency;
  }
  return traits;
}

} // namespace Relations
} // namespace Farquhar
