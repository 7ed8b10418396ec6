/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Penman-Monteith energy balance of a single organ.
/*!

Given the current stomatal conductance and organ temperature, computes the
transpiration rate and the organ temperature that closes the energy balance.

Wind at organ height follows a log profile above the canopy (zero plane
displacement d = 0.7 Zh, roughness length z0 = 0.1 Zh) and an exponential
attenuation inside it (Campbell and Norman 1998).  The boundary layer
resistance to heat uses forced convection over a horizontal flat plate for
blades and around a vertical cylinder for every other organ (Monteith 1973,
Finnigan and Raupach 1987).

Net radiation is the absorbed shortwave only, converted from absorbed PAR
assuming 4.55 umol of PAR per J.  Longwave exchange with the sky and the
neighbouring organs is not included.

The slope of the saturated vapour pressure curve is the analytic derivative
at air temperature when Ts equals Ta, which is always the case on the first
iteration, and the finite difference between Ts and Ta otherwise.

Transpiration is returned in mm s^-1 (kg m^-2 s^-1) and is never negative.

*/

#ifndef FARQUHAR_RELATIONS_ORGAN_ENERGY_BALANCE_HH_
#define FARQUHAR_RELATIONS_ORGAN_ENERGY_BALANCE_HH_

#include "Teuchos_RCP.hpp"

#include "organ_type.hh"
#include "photosynthesis_parameters.hh"

namespace Farquhar {
namespace Relations {

struct EnergyBalanceResult {
  double Ts; // C
  double Tr; // mm s^-1
};

class OrganEnergyBalance {
 public:
  explicit OrganEnergyBalance(const Teuchos::RCP<const PhotosynthesisParameters>& params)
    : params_(params){};

  // w organ width or diameter [m], z organ height [m], Zh canopy height [m],
  // Ur wind at the reference height [m s^-1], PAR absorbed [umol m^-2 s^-1],
  // gsw [mol m^-2 s^-1], Ta and Ts [C], RH [-]
  EnergyBalanceResult Solve(double w,
                            double z,
                            double Zh,
                            double Ur,
                            double PAR,
                            double gsw,
                            double Ta,
                            double Ts,
                            double RH,
                            ConvectionRegime regime) const;

  // wind speed at organ height [m s^-1]
  double WindAtHeight(double z, double Zh, double Ur) const;

  // boundary layer resistance to heat [s m^-1]
  double BoundaryLayerResistance(double w, double u, ConvectionRegime regime) const;

  // aerodynamic resistance between the reference height and d + z0 [s m^-1]
  double AerodynamicResistance(double Zh, double Ur) const;

  // Tetens formula [kPa], T in C
  static double SaturatedVaporPressure(double T);

 private:
  double ClampedWind_(double Ur) const;

 private:
  Teuchos::RCP<const PhotosynthesisParameters> params_;
};

} // namespace Relations
} // namespace Farquhar

#endif
