/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <algorithm>
#include <cmath>

#include "organ_energy_balance.hh"
#include "temperature_dependence.hh"

namespace Farquhar {
namespace Relations {

double
OrganEnergyBalance::ClampedWind_(double Ur) const
{
  return std::max(Ur, params_->min_wind);
}


double
OrganEnergyBalance::WindAtHeight(double z, double Zh, double Ur) const
{
  const PhotosynthesisParameters& p = *params_;
  Ur = ClampedWind_(Ur);

  double d = 0.7 * Zh;
  double z0 = 0.1 * Zh;

  double u_star = (Ur * p.K) / std::log((p.zr - d) / z0);
  double Uh = (u_star / p.K) * std::log((Zh - d) / z0);
  return Uh * std::exp(p.A * (z / Zh - 1.));
}


double
OrganEnergyBalance::BoundaryLayerResistance(double w, double u, ConvectionRegime regime) const
{
  if (regime == ConvectionRegime::FLAT_PLATE) {
    return 154. * std::sqrt(w / u);
  } else {
    return w / (1.2e-5 * std::pow((u * w) / 1.5e-5, 0.47));
  }
}


double
OrganEnergyBalance::AerodynamicResistance(double Zh, double Ur) const
{
  const PhotosynthesisParameters& p = *params_;
  Ur = ClampedWind_(Ur);

  double d = 0.7 * Zh;
  double z0 = 0.1 * Zh;
  double log_z = std::log((p.zr - d) / z0);
  return 1. / (p.K * p.K * Ur) * log_z * log_z;
}


double
OrganEnergyBalance::SaturatedVaporPressure(double T)
{
  return 0.611 * std::exp((17.4 * T) / (239. + T));
}


EnergyBalanceResult
OrganEnergyBalance::Solve(double w,
                          double z,
                          double Zh,
                          double Ur,
                          double PAR,
                          double gsw,
                          double Ta,
                          double Ts,
                          double RH,
                          ConvectionRegime regime) const
{
  const PhotosynthesisParameters& p = *params_;

  double u = WindAtHeight(z, Zh, Ur);
  double rbh = BoundaryLayerResistance(w, u, regime);
  double ra = AerodynamicResistance(Zh, Ur);

  // shortwave only
  double Rn = (PAR * p.par_to_rg) / 4.55;

  double es_Ta = SaturatedVaporPressure(Ta);
  double V = RH * es_Ta;

  // slope of the saturated vapour pressure curve [kPa K^-1]
  double s;
  double Ta_K = Ta + KELVIN;
  if (Ts == Ta) {
    s = ((17.4 * 239.) / ((Ta_K + 239.) * (Ta_K + 239.))) * es_Ta;
  } else {
    double Ts_K = Ts + KELVIN;
    s = (SaturatedVaporPressure(Ts) - es_Ta) / (Ts_K - Ta_K);
  }

  double VPD = es_Ta - V;
  double rbw = 0.96 * rbh;
  double gsw_physical = (gsw * p.R * (Ts + KELVIN)) / p.patm; // m s^-1
  double rsw = 1. / gsw_physical;

  EnergyBalanceResult result;
  result.Tr = std::max(0.,
                       (s * Rn + (p.rhocp * VPD) / (rbh + ra)) /
                         (p.lambda * (s + p.gamma * ((rbw + ra + rsw) / (rbh + ra)))));
  result.Ts = Ta + ((rbh + ra) * (Rn - p.lambda * result.Tr)) / p.rhocp;
  return result;
}

} // namespace Relations
} // namespace Farquhar
