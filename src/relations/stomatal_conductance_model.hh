/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Ball, Woodrow and Berry (1987) stomatal conductance and the CO2 drawdown.
/*!

.. math::

   C_s = C_a - 1.37 A_n / g_b

   g_{sw} = g_{s,min} + m \frac{A_g \, RH}{C_s}, \qquad m = \delta_1 N^{\delta_2}

   C_i = C_a - A_n \left( \frac{1.6}{g_{sw}} + \frac{1.37}{g_b} \right)

Gross rather than net assimilation drives the conductance (Braune et al.
2009).  1.6 converts conductance to water into conductance to CO2 and 1.37
is 1.6^(2/3).

*/

#ifndef FARQUHAR_RELATIONS_STOMATAL_CONDUCTANCE_MODEL_HH_
#define FARQUHAR_RELATIONS_STOMATAL_CONDUCTANCE_MODEL_HH_

#include "Teuchos_RCP.hpp"

#include "photosynthesis_parameters.hh"

namespace Farquhar {
namespace Relations {

class StomatalConductanceModel {
 public:
  explicit StomatalConductanceModel(const Teuchos::RCP<const PhotosynthesisParameters>& params)
    : params_(params){};

  // Conductance to water vapour [mol m^-2 s^-1], never below the dark
  // conductance.
  double Conductance(double Ag, double An, double N, double CO2, double RH) const;

  // Internal CO2 [umol mol^-1]
  double InternalCO2(double CO2, double An, double gsw) const;

 private:
  Teuchos::RCP<const PhotosynthesisParameters> params_;
};

} // namespace Relations
} // namespace Farquhar

#endif
