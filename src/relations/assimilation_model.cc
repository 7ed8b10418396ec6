/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <algorithm>
#include <cmath>

#include "assimilation_model.hh"

namespace Farquhar {
namespace Relations {

AssimilationModel::AssimilationModel(const Teuchos::RCP<const PhotosynthesisParameters>& params)
  : params_(params), temperature_(params)
{}


/* ******************************************************************
* The three competing limitations of carboxylation.
****************************************************************** */
LimitationRates
AssimilationModel::Limitations(double PAR, double N, double Ts, double Ci) const
{
  const PhotosynthesisParameters& p = *params_;

  // RuBisCO kinetics
  double Kc = temperature_.Adjust(TemperatureParameter::KC, p.Kc25, Ts);
  double Ko = temperature_.Adjust(TemperatureParameter::KO, p.Ko25, Ts);
  double Gamma = temperature_.Adjust(TemperatureParameter::GAMMA, p.Gamma25, Ts);

  LimitationRates rates;

  // RuBisCO-limited
  double Vc_max = temperature_.Adjust(TemperatureParameter::VC_MAX, p.Vc_max25(N), Ts);
  rates.Ac = (Vc_max * (Ci - Gamma)) / (Ci + Kc * (1. + p.O / Ko));

  // electron transport limited
  double alpha = p.alpha_slope * N + p.beta;
  double Jmax = temperature_.Adjust(TemperatureParameter::JMAX, p.Jmax25(N), Ts);
  double b = Jmax + alpha * PAR;
  double J = (b - std::sqrt(b * b - 4. * p.theta * alpha * PAR * Jmax)) / (2. * p.theta);
  rates.Aj = (J * (Ci - Gamma)) / (4. * Ci + 8. * Gamma);

  // triose phosphate utilisation limited
  double TPU = temperature_.Adjust(TemperatureParameter::TPU, p.TPU25(N), Ts);
  double Vomax = (Vc_max * Ko * Gamma) / (0.5 * Kc * p.O);
  double Vo = (Vomax * p.O) / (p.O + Ko * (1. + Ci / Kc));
  rates.Ap = (1. - Gamma / Ci) * (3. * TPU + Vo);

  return rates;
}


double
AssimilationModel::Respiration(double PAR, double N, double Ts) const
{
  const PhotosynthesisParameters& p = *params_;
  double Rdark = temperature_.Adjust(TemperatureParameter::RDARK, p.Rdark25(N), Ts);
  return Rdark *
         (p.rd_light_fraction + (1. - p.rd_light_fraction) * std::pow(0.5, PAR / p.rd_half_par));
}


AssimilationRates
AssimilationModel::Assimilation(double PAR, double N, double Ts, double Ci) const
{
  LimitationRates lim = Limitations(PAR, N, Ts, Ci);

  AssimilationRates rates;
  rates.Ag = std::min({ lim.Ac, lim.Aj, lim.Ap });
  rates.Rd = Respiration(PAR, N, Ts);

  // below the compensation point, or below the nitrogen thresholds
  if (rates.Ag <= 0.) {
    rates.Ag = 0.;
    rates.An = 0.;
  } else {
    rates.An = rates.Ag - rates.Rd;
  }
  return rates;
}

} // namespace Relations
} // namespace Farquhar
