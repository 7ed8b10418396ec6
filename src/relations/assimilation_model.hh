/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Farquhar, von Caemmerer and Berry (1980) model of gross assimilation.
/*!

Gross assimilation is the minimum of three limitations, each scaled by
surfacic nitrogen and organ temperature:

* Ac, RuBisCO-limited carboxylation,
  :math:`A_c = V_{c,max} (C_i - \Gamma) / (C_i + K_c (1 + O/K_o))`
* Aj, RuBP regeneration limited by electron transport,
  :math:`A_j = J (C_i - \Gamma) / (4 C_i + 8 \Gamma)` where J is the smaller
  root of the non-rectangular hyperbola with curvature theta,
* Ap, triose phosphate utilisation,
  :math:`A_p = (1 - \Gamma / C_i)(3 TPU + V_o)`.

Respiration in the light decays from Rdark towards a fraction of it as PAR
increases (Muller et al. 2005, eq. 19).  Whenever Ag is not positive, both
Ag and An are zero; otherwise An = Ag - Rd.

*/

#ifndef FARQUHAR_RELATIONS_ASSIMILATION_MODEL_HH_
#define FARQUHAR_RELATIONS_ASSIMILATION_MODEL_HH_

#include "Teuchos_RCP.hpp"

#include "photosynthesis_parameters.hh"
#include "temperature_dependence.hh"

namespace Farquhar {
namespace Relations {

// umol CO2 m^-2 s^-1
struct LimitationRates {
  double Ac;
  double Aj;
  double Ap;
};

// umol CO2 m^-2 s^-1
struct AssimilationRates {
  double Ag;
  double An;
  double Rd;
};

class AssimilationModel {
 public:
  explicit AssimilationModel(const Teuchos::RCP<const PhotosynthesisParameters>& params);

  // PAR [umol m^-2 s^-1], N surfacic nitrogen [g m^-2], Ts [C], Ci [umol mol^-1]
  LimitationRates Limitations(double PAR, double N, double Ts, double Ci) const;
  AssimilationRates Assimilation(double PAR, double N, double Ts, double Ci) const;

  double Respiration(double PAR, double N, double Ts) const;

 private:
  Teuchos::RCP<const PhotosynthesisParameters> params_;
  TemperatureDependence temperature_;
};

} // namespace Relations
} // namespace Farquhar

#endif
