/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Photosynthetic organ types and what each implies for the models.
/*!

Blades exchange heat as horizontal flat plates and photosynthesize at full
efficiency.  Internodes, sheaths, peduncles and ears are vertical cylinders
and their gross assimilation is discounted by the stem efficiency.

Organ names in input lists are `"blade`", `"internode`", `"sheath`",
`"peduncle`" and `"ear`".

*/

#ifndef FARQUHAR_RELATIONS_ORGAN_TYPE_HH_
#define FARQUHAR_RELATIONS_ORGAN_TYPE_HH_

#include <string>

#include "photosynthesis_parameters.hh"

namespace Farquhar {
namespace Relations {

enum class OrganType { BLADE, INTERNODE, SHEATH, PEDUNCLE, EAR };

enum class ConvectionRegime { FLAT_PLATE, CYLINDER };

struct OrganTypeTraits {
  ConvectionRegime convection;
  double efficiency;
};

// Throws Errors::InvalidConfiguration on an unknown name.
OrganType
OrganTypeFromString(const std::string& name);

std::string
to_string(OrganType type);

OrganTypeTraits
GetOrganTypeTraits(OrganType type, const PhotosynthesisParameters& params);

} // namespace Relations
} // namespace Farquhar

#endif
