/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <cmath>

#include "stomatal_conductance_model.hh"

namespace Farquhar {
namespace Relations {

double
StomatalConductanceModel::Conductance(double Ag, double An, double N, double CO2, double RH) const
{
  const PhotosynthesisParameters& p = *params_;
  double gsw = p.gs_min;

  // With Ag = 0 the assimilation term vanishes.  It is skipped rather than
  // evaluated since m is infinite at N = 0.
  if (Ag > 0.) {
    double Cs = CO2 - An * (1.37 / p.gb);
    double m = p.delta1 * std::pow(N, p.delta2);
    gsw += m * ((Ag * RH) / Cs);
  }
  return gsw;
}


double
StomatalConductanceModel::InternalCO2(double CO2, double An, double gsw) const
{
  return CO2 - An * ((1.6 / gsw) + (1.37 / params_->gb));
}

} // namespace Relations
} // namespace Farquhar
