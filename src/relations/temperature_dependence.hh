/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Arrhenius temperature response of the photosynthetic parameters.
/*!

.. math::

   p(T) = p_{25} \, f_{act}(T) \, f_{deact}(T)

   f_{act} = \exp\left( \frac{\Delta H_a (T_k - T_{ref})}{R \, T_{ref} T_k} \right)

   f_{deact} = \frac{1 + \exp\left( \frac{T_{ref} \Delta S - \Delta H_d}{R \, T_{ref}} \right)}
                    {1 + \exp\left( \frac{T_k \Delta S - \Delta H_d}{R \, T_k} \right)}

The deactivation factor applies to the capacities Vc_max, Jmax and TPU only;
it is 1 for Kc, Ko, Gamma and Rdark.  Enthalpies are in kJ, so R is scaled
by 1e-3.

*/

#ifndef FARQUHAR_RELATIONS_TEMPERATURE_DEPENDENCE_HH_
#define FARQUHAR_RELATIONS_TEMPERATURE_DEPENDENCE_HH_

#include "Teuchos_RCP.hpp"

#include "photosynthesis_parameters.hh"

namespace Farquhar {
namespace Relations {

const double KELVIN = 273.15;

class TemperatureDependence {
 public:
  explicit TemperatureDependence(const Teuchos::RCP<const PhotosynthesisParameters>& params)
    : params_(params){};

  // Value of parameter p at organ temperature T [C] given its value at 25 C.
  double Adjust(TemperatureParameter p, double p25, double T) const;

 private:
  Teuchos::RCP<const PhotosynthesisParameters> params_;
};

} // namespace Relations
} // namespace Farquhar

#endif
