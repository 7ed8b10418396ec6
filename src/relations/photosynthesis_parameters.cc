/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "photosynthesis_parameters.hh"

namespace Farquhar {
namespace Relations {

std::string
to_string(TemperatureParameter p)
{
  switch (p) {
  case TemperatureParameter::VC_MAX:
    return "Vc_max";
  case TemperatureParameter::JMAX:
    return "Jmax";
  case TemperatureParameter::TPU:
    return "TPU";
  case TemperatureParameter::KC:
    return "Kc";
  case TemperatureParameter::KO:
    return "Ko";
  case TemperatureParameter::GAMMA:
    return "Gamma";
  case TemperatureParameter::RDARK:
    return "Rdark";
  }
  return "unknown";
}


namespace {

struct TemperatureDefaults {
  TemperatureParameter name;
  double deltaHa, deltaHd, deltaS;
  bool deactivation;
};

// Braune et al. (2009), except Kc, Ko and Rdark from Bernacchi et al. (2001)
const TemperatureDefaults temperature_defaults[NUM_TEMPERATURE_PARAMETERS] = {
  { TemperatureParameter::VC_MAX, 89.7, 149.3, 0.486, true },
  { TemperatureParameter::JMAX, 48.9, 152.3, 0.495, true },
  { TemperatureParameter::TPU, 47., 152.3, 0.495, true },
  { TemperatureParameter::KC, 79.43, 0., 0., false },
  { TemperatureParameter::KO, 36.38, 0., 0., false },
  { TemperatureParameter::GAMMA, 35., 0., 0., false },
  { TemperatureParameter::RDARK, 46.39, 0., 0., false }
};

void
CheckPositive(double value, const std::string& name)
{
  if (!(value > 0.)) {
    Errors::InvalidConfiguration msg;
    msg << "PhotosynthesisParameters: \"" << name << "\" must be positive, got " << value;
    Exceptions::farquhar_throw(msg);
  }
}

} // namespace


PhotosynthesisParameters::PhotosynthesisParameters()
{
  Teuchos::ParameterList plist;
  InitializeFromPlist_(plist);
  Validate_();
}


PhotosynthesisParameters::PhotosynthesisParameters(Teuchos::ParameterList& plist)
{
  InitializeFromPlist_(plist);
  Validate_();
}


/* ******************************************************************
* Read every constant, falling back on the published values.
****************************************************************** */
void
PhotosynthesisParameters::InitializeFromPlist_(Teuchos::ParameterList& plist)
{
  O = plist.get<double>("O2 concentration [umol mol^-1]", 21000.);
  Kc25 = plist.get<double>("Kc25 [umol mol^-1]", 404.);
  Ko25 = plist.get<double>("Ko25 [umol mol^-1]", 278.4e3);
  Gamma25 = plist.get<double>("Gamma25 [umol mol^-1]", 39.);
  theta = plist.get<double>("J curvature [-]", 0.72);

  Vc_max25.slope = plist.get<double>("Vc_max25 nitrogen slope [umol g^-1 s^-1]", 84.965);
  Jmax25.slope = plist.get<double>("Jmax25 nitrogen slope [umol g^-1 s^-1]", 117.6);
  TPU25.slope = plist.get<double>("TPU25 nitrogen slope [umol g^-1 s^-1]", 9.25);
  Rdark25.slope = plist.get<double>("Rdark25 nitrogen slope [umol g^-1 s^-1]", 0.493);
  Vc_max25.N_min = plist.get<double>("Vc_max25 minimum surfacic nitrogen [g m^-2]", 0.);
  Jmax25.N_min = plist.get<double>("Jmax25 minimum surfacic nitrogen [g m^-2]", 0.);
  TPU25.N_min = plist.get<double>("TPU25 minimum surfacic nitrogen [g m^-2]", 0.);
  Rdark25.N_min = plist.get<double>("Rdark25 minimum surfacic nitrogen [g m^-2]", 0.);
  alpha_slope = plist.get<double>("alpha nitrogen slope [m^2 g^-1]", 0.0413);
  beta = plist.get<double>("alpha intercept [-]", 0.2101 + 0.0083);
  delta1 = plist.get<double>("gs scaling delta1 [m^2 g^-1]", 14.7);
  delta2 = plist.get<double>("gs scaling delta2 [-]", -0.548);
  NA_0 = plist.get<double>("default surfacic nitrogen [g m^-2]", 2.);

  rd_light_fraction = plist.get<double>("respiration light fraction [-]", 0.33);
  rd_half_par = plist.get<double>("respiration half-inhibition PAR [umol m^-2 s^-1]", 15.);

  gs_min = plist.get<double>("minimum stomatal conductance [mol m^-2 s^-1]", 0.05);
  gb = plist.get<double>("boundary layer conductance [mol m^-2 s^-1]", 3.5);

  A = plist.get<double>("wind attenuation coefficient [-]", 2.5);
  gamma = plist.get<double>("psychrometric constant [kPa K^-1]", 66.e-3);
  K = plist.get<double>("von Karman constant [-]", 0.40);
  lambda = plist.get<double>("latent heat of vaporization [J kg^-1]", 2260.e3);
  rhocp = plist.get<double>("volumetric heat capacity of air [J m^-3 K^-1]", 1256.);
  zr = plist.get<double>("wind reference height [m]", 2.);
  R = plist.get<double>("gas constant [J mol^-1 K^-1]", 8.3144);
  patm = plist.get<double>("atmospheric pressure [Pa]", 1.01325e5);
  par_to_rg = plist.get<double>("PAR to global radiation ratio [-]", 1.53);
  min_wind = plist.get<double>("minimum wind speed [m s^-1]", 0.1);
  water_molar_mass = plist.get<double>("water molar mass [g mol^-1]", 18.);

  Tref = plist.get<double>("reference temperature [K]", 298.15);
  Teuchos::ParameterList& temp_list = plist.sublist("temperature dependence");
  for (const auto& defaults : temperature_defaults) {
    Teuchos::ParameterList& p_list = temp_list.sublist(to_string(defaults.name));
    TemperatureResponse& response = temperature[static_cast<int>(defaults.name)];
    response.deactivation = defaults.deactivation;
    response.deltaHa = p_list.get<double>("deltaHa [kJ mol^-1]", defaults.deltaHa);
    if (defaults.deactivation) {
      response.deltaHd = p_list.get<double>("deltaHd [kJ mol^-1]", defaults.deltaHd);
      response.deltaS = p_list.get<double>("deltaS [kJ mol^-1 K^-1]", defaults.deltaS);
    } else {
      response.deltaHd = 0.;
      response.deltaS = 0.;
    }
  }

  ci_init_fraction = plist.get<double>("initial Ci fraction [-]", 0.7);
  tolerance = plist.get<double>("convergence tolerance [-]", 0.01);
  max_itrs = plist.get<int>("limit iterations", 30);
  stem_efficiency = plist.get<double>("stem efficiency [-]", 0.78);
}


/* ******************************************************************
* Reject tables the models cannot work with.
****************************************************************** */
void
PhotosynthesisParameters::Validate_() const
{
  CheckPositive(O, "O2 concentration [umol mol^-1]");
  CheckPositive(Kc25, "Kc25 [umol mol^-1]");
  CheckPositive(Ko25, "Ko25 [umol mol^-1]");
  CheckPositive(Gamma25, "Gamma25 [umol mol^-1]");
  CheckPositive(theta, "J curvature [-]");
  CheckPositive(NA_0, "default surfacic nitrogen [g m^-2]");
  CheckPositive(rd_half_par, "respiration half-inhibition PAR [umol m^-2 s^-1]");
  CheckPositive(gs_min, "minimum stomatal conductance [mol m^-2 s^-1]");
  CheckPositive(gb, "boundary layer conductance [mol m^-2 s^-1]");
  CheckPositive(A, "wind attenuation coefficient [-]");
  CheckPositive(gamma, "psychrometric constant [kPa K^-1]");
  CheckPositive(K, "von Karman constant [-]");
  CheckPositive(lambda, "latent heat of vaporization [J kg^-1]");
  CheckPositive(rhocp, "volumetric heat capacity of air [J m^-3 K^-1]");
  CheckPositive(zr, "wind reference height [m]");
  CheckPositive(R, "gas constant [J mol^-1 K^-1]");
  CheckPositive(patm, "atmospheric pressure [Pa]");
  CheckPositive(par_to_rg, "PAR to global radiation ratio [-]");
  CheckPositive(min_wind, "minimum wind speed [m s^-1]");
  CheckPositive(water_molar_mass, "water molar mass [g mol^-1]");
  CheckPositive(Tref, "reference temperature [K]");
  CheckPositive(ci_init_fraction, "initial Ci fraction [-]");
  CheckPositive(tolerance, "convergence tolerance [-]");

  if (theta > 1.) {
    Errors::InvalidConfiguration msg;
    msg << "PhotosynthesisParameters: \"J curvature [-]\" must be in (0, 1], got " << theta;
    Exceptions::farquhar_throw(msg);
  }
  if (max_itrs < 1 || max_itrs > MAX_ITERATIONS_CEILING) {
    Errors::InvalidConfiguration msg;
    msg << "PhotosynthesisParameters: \"limit iterations\" must be in [1, "
        << MAX_ITERATIONS_CEILING << "], got " << max_itrs;
    Exceptions::farquhar_throw(msg);
  }
  if (!(stem_efficiency > 0.) || stem_efficiency > 1.) {
    Errors::InvalidConfiguration msg;
    msg << "PhotosynthesisParameters: \"stem efficiency [-]\" must be in (0, 1], got "
        << stem_efficiency;
    Exceptions::farquhar_throw(msg);
  }
}

} // namespace Relations
} // namespace Farquhar
