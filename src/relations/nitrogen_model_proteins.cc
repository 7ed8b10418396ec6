/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "nitrogen_model_proteins.hh"

namespace Farquhar {
namespace Relations {

NitrogenModelProteins::NitrogenModelProteins(Teuchos::ParameterList& plist)
{
  slope_ = plist.get<double>("surfacic proteins slope [-]", 1.);
  intercept_ = plist.get<double>("surfacic proteins intercept [g m^-2]", 0.);
}


double
NitrogenModelProteins::CapacityDriver(const OrganNitrogen& n) const
{
  return slope_ * SurfacicPhotosyntheticProteins(n.proteins, n.green_area) + intercept_;
}

} // namespace Relations
} // namespace Farquhar
