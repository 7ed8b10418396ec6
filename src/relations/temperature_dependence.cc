/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <cmath>

#include "temperature_dependence.hh"

namespace Farquhar {
namespace Relations {

double
TemperatureDependence::Adjust(TemperatureParameter p, double p25, double T) const
{
  const TemperatureResponse& response = params_->temperature_response(p);
  double Tk = T + KELVIN;
  double Tref = params_->Tref;
  double R = params_->R * 1.e-3;

  double f_act = std::exp((response.deltaHa * (Tk - Tref)) / (R * Tref * Tk));

  double f_deact = 1.0;
  if (response.deactivation) {
    f_deact = (1. + std::exp((Tref * response.deltaS - response.deltaHd) / (Tref * R))) /
              (1. + std::exp((Tk * response.deltaS - response.deltaHd) / (Tk * R)));
  }
  return p25 * f_act * f_deact;
}

} // namespace Relations
} // namespace Farquhar
