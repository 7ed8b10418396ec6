/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "nitrogen_model_proteins_retroinhibition.hh"

namespace Farquhar {
namespace Relations {

NitrogenModelProteinsRetroinhibition::NitrogenModelProteinsRetroinhibition(
  Teuchos::ParameterList& plist)
  : NitrogenModelProteins(plist)
{
  K_ = plist.get<double>("retroinhibition constant [g C m^-2]", 20.);
  if (!(K_ > 0.)) {
    Errors::InvalidConfiguration msg;
    msg << "NitrogenModelProteinsRetroinhibition: \"retroinhibition constant [g C m^-2]\" "
        << "must be positive, got " << K_;
    Exceptions::farquhar_throw(msg);
  }
}


double
NitrogenModelProteinsRetroinhibition::CapacityDriver(const OrganNitrogen& n) const
{
  // assumed hyperbolic inhibition, see the header
  double wsc = SurfacicWSC(n.sucrose, n.starch, n.fructan, n.green_area);
  return NitrogenModelProteins::CapacityDriver(n) * K_ / (K_ + wsc);
}

} // namespace Relations
} // namespace Farquhar
