/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Constant table shared by the formula library and the organ solver.
/*!

All constants of the photosynthesis, stomatal conductance and energy balance
models.  The table is built once from a parameter list and is never modified
afterwards; every entry has a default and may be overridden by name.

.. _photosynthesis-parameters-spec:
.. admonition:: photosynthesis-parameters-spec

   RuBisCO kinetics and electron transport (Bernacchi et al. 2001, Braune et
   al. 2009):

   * `"O2 concentration [umol mol^-1]`" ``[double]`` **21000**
   * `"Kc25 [umol mol^-1]`" ``[double]`` **404**
   * `"Ko25 [umol mol^-1]`" ``[double]`` **278400**
   * `"Gamma25 [umol mol^-1]`" ``[double]`` **39**
   * `"J curvature [-]`" ``[double]`` **0.72**

   Nitrogen dependence of the capacity parameters (Braune et al. 2009, Evers
   et al. 2010).  Each capacity has a slope against surfacic nitrogen and a
   minimum surfacic nitrogen below which it is non-positive:

   * `"Vc_max25 nitrogen slope [umol g^-1 s^-1]`" ``[double]`` **84.965**
   * `"Jmax25 nitrogen slope [umol g^-1 s^-1]`" ``[double]`` **117.6**
   * `"TPU25 nitrogen slope [umol g^-1 s^-1]`" ``[double]`` **9.25**
   * `"Rdark25 nitrogen slope [umol g^-1 s^-1]`" ``[double]`` **0.493**
   * `"Vc_max25 minimum surfacic nitrogen [g m^-2]`" ``[double]`` **0**
   * `"Jmax25 minimum surfacic nitrogen [g m^-2]`" ``[double]`` **0**
   * `"TPU25 minimum surfacic nitrogen [g m^-2]`" ``[double]`` **0**
   * `"Rdark25 minimum surfacic nitrogen [g m^-2]`" ``[double]`` **0**
   * `"alpha nitrogen slope [m^2 g^-1]`" ``[double]`` **0.0413**
   * `"alpha intercept [-]`" ``[double]`` **0.2184**
   * `"gs scaling delta1 [m^2 g^-1]`" ``[double]`` **14.7**
   * `"gs scaling delta2 [-]`" ``[double]`` **-0.548**
   * `"default surfacic nitrogen [g m^-2]`" ``[double]`` **2** used for
     organs with no nitrogen input.

   Respiration in the light (Muller et al. 2005):

   * `"respiration light fraction [-]`" ``[double]`` **0.33**
   * `"respiration half-inhibition PAR [umol m^-2 s^-1]`" ``[double]`` **15**

   Stomatal conductance:

   * `"minimum stomatal conductance [mol m^-2 s^-1]`" ``[double]`` **0.05**
   * `"boundary layer conductance [mol m^-2 s^-1]`" ``[double]`` **3.5**

   Physics of the energy balance:

   * `"wind attenuation coefficient [-]`" ``[double]`` **2.5**
   * `"psychrometric constant [kPa K^-1]`" ``[double]`` **0.066**
   * `"von Karman constant [-]`" ``[double]`` **0.40**
   * `"latent heat of vaporization [J kg^-1]`" ``[double]`` **2.26e6**
   * `"volumetric heat capacity of air [J m^-3 K^-1]`" ``[double]`` **1256**
   * `"wind reference height [m]`" ``[double]`` **2**
   * `"gas constant [J mol^-1 K^-1]`" ``[double]`` **8.3144**
   * `"atmospheric pressure [Pa]`" ``[double]`` **101325**
   * `"PAR to global radiation ratio [-]`" ``[double]`` **1.53**
   * `"minimum wind speed [m s^-1]`" ``[double]`` **0.1**
   * `"water molar mass [g mol^-1]`" ``[double]`` **18**

   Temperature dependence (Braune et al. 2009, Bernacchi et al. 2001):

   * `"reference temperature [K]`" ``[double]`` **298.15**
   * `"temperature dependence`" ``[list]`` one sublist per parameter, named
     `"Vc_max`", `"Jmax`", `"TPU`", `"Kc`", `"Ko`", `"Gamma`" and `"Rdark`",
     each with

     * `"deltaHa [kJ mol^-1]`" ``[double]`` activation enthalpy
     * `"deltaHd [kJ mol^-1]`" ``[double]`` deactivation enthalpy, capacity
       parameters only
     * `"deltaS [kJ mol^-1 K^-1]`" ``[double]`` entropy term, capacity
       parameters only

   Solver:

   * `"initial Ci fraction [-]`" ``[double]`` **0.7**
   * `"convergence tolerance [-]`" ``[double]`` **0.01** relative change of
     Ci and Ts.
   * `"limit iterations`" ``[int]`` **30** May be lowered, never raised
     above 30.
   * `"stem efficiency [-]`" ``[double]`` **0.78** applied to the gross
     assimilation of non-blade organs.

*/

#ifndef FARQUHAR_RELATIONS_PHOTOSYNTHESIS_PARAMETERS_HH_
#define FARQUHAR_RELATIONS_PHOTOSYNTHESIS_PARAMETERS_HH_

#include <string>

#include "Teuchos_ParameterList.hpp"

namespace Farquhar {
namespace Relations {

// Parameters with an Arrhenius temperature response.  Only the first three
// also have a deactivation term.
enum class TemperatureParameter { VC_MAX = 0, JMAX, TPU, KC, KO, GAMMA, RDARK };

const int NUM_TEMPERATURE_PARAMETERS = 7;

// hard ceiling on the fixed-point iterations of one organ
const int MAX_ITERATIONS_CEILING = 30;

std::string
to_string(TemperatureParameter p);

struct TemperatureResponse {
  double deltaHa; // kJ mol^-1
  double deltaHd; // kJ mol^-1
  double deltaS;  // kJ mol^-1 K^-1
  bool deactivation;
};

// Linear response of a capacity parameter at 25 C to surfacic nitrogen.
struct NitrogenResponse {
  double slope;
  double N_min; // g m^-2

  double operator()(double N) const { return slope * (N - N_min); }
};

struct PhotosynthesisParameters {
  PhotosynthesisParameters();
  explicit PhotosynthesisParameters(Teuchos::ParameterList& plist);

  const TemperatureResponse& temperature_response(TemperatureParameter p) const
  {
    return temperature[static_cast<int>(p)];
  }

  // RuBisCO kinetics and electron transport
  double O;
  double Kc25, Ko25, Gamma25;
  double theta;

  // nitrogen dependence
  NitrogenResponse Vc_max25, Jmax25, TPU25, Rdark25;
  double alpha_slope, beta;
  double delta1, delta2;
  double NA_0;

  // respiration in the light
  double rd_light_fraction, rd_half_par;

  // stomatal conductance
  double gs_min, gb;

  // energy balance
  double A, gamma, K, lambda, rhocp, zr, R, patm;
  double par_to_rg;
  double min_wind;
  double water_molar_mass;

  // temperature dependence
  double Tref;
  TemperatureResponse temperature[NUM_TEMPERATURE_PARAMETERS];

  // solver
  double ci_init_fraction;
  double tolerance;
  int max_itrs;
  double stem_efficiency;

 private:
  void InitializeFromPlist_(Teuchos::ParameterList& plist);
  void Validate_() const;
};

} // namespace Relations
} // namespace Farquhar

#endif
