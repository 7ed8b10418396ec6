/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <UnitTest++.h>

#include "Teuchos_ParameterList.hpp"

#include "errors.hh"
#include "organ_type.hh"
#include "photosynthesis_parameters.hh"
#include "temperature_dependence.hh"

using namespace Farquhar::Relations;

SUITE(RELATIONS_PARAMETERS)
{
  TEST(DEFAULTS)
  {
    PhotosynthesisParameters p;
    CHECK_EQUAL(21000., p.O);
    CHECK_EQUAL(404., p.Kc25);
    CHECK_CLOSE(0.2184, p.beta, 1.e-12);
    CHECK_EQUAL(0.05, p.gs_min);
    CHECK_EQUAL(30, p.max_itrs);
    CHECK_EQUAL(0.01, p.tolerance);
    CHECK_EQUAL(0.78, p.stem_efficiency);
    CHECK_EQUAL(0.1, p.min_wind);
    CHECK_EQUAL(89.7, p.temperature_response(TemperatureParameter::VC_MAX).deltaHa);
    CHECK(p.temperature_response(TemperatureParameter::TPU).deactivation);
    CHECK(!p.temperature_response(TemperatureParameter::RDARK).deactivation);
  }

  TEST(OVERRIDES)
  {
    Teuchos::ParameterList plist;
    plist.set<double>("minimum stomatal conductance [mol m^-2 s^-1]", 0.08);
    plist.set<int>("limit iterations", 12);
    plist.sublist("temperature dependence").sublist("Jmax").set<double>("deltaHa [kJ mol^-1]", 50.);

    PhotosynthesisParameters p(plist);
    CHECK_EQUAL(0.08, p.gs_min);
    CHECK_EQUAL(12, p.max_itrs);
    CHECK_EQUAL(50., p.temperature_response(TemperatureParameter::JMAX).deltaHa);
    CHECK_EQUAL(152.3, p.temperature_response(TemperatureParameter::JMAX).deltaHd);

    // untouched entries keep their defaults
    CHECK_EQUAL(3.5, p.gb);
  }

  TEST(INVALID_VALUES)
  {
    {
      Teuchos::ParameterList plist;
      plist.set<double>("convergence tolerance [-]", 0.);
      CHECK_THROW(PhotosynthesisParameters p(plist), Errors::InvalidConfiguration);
    }
    {
      Teuchos::ParameterList plist;
      plist.set<int>("limit iterations", 0);
      CHECK_THROW(PhotosynthesisParameters p(plist), Errors::InvalidConfiguration);
    }
    {
      // the cap may be lowered but not raised
      Teuchos::ParameterList plist;
      plist.set<int>("limit iterations", 30);
      CHECK_EQUAL(30, PhotosynthesisParameters(plist).max_itrs);
      plist.set<int>("limit iterations", 31);
      CHECK_THROW(PhotosynthesisParameters p(plist), Errors::InvalidConfiguration);
    }
    {
      Teuchos::ParameterList plist;
      plist.set<double>("stem efficiency [-]", 1.2);
      CHECK_THROW(PhotosynthesisParameters p(plist), Errors::InvalidConfiguration);
    }
    {
      Teuchos::ParameterList plist;
      plist.set<double>("atmospheric pressure [Pa]", -1.);
      CHECK_THROW(PhotosynthesisParameters p(plist), Errors::Message);
    }
  }

  TEST(ORGAN_TYPES)
  {
    PhotosynthesisParameters p;
    CHECK(OrganType::BLADE == OrganTypeFromString("blade"));
    CHECK(OrganType::EAR == OrganTypeFromString("ear"));
    CHECK_EQUAL("peduncle", to_string(OrganTypeFromString("peduncle")));
    CHECK_THROW(OrganTypeFromString("lamina"), Errors::InvalidConfiguration);

    OrganTypeTraits blade = GetOrganTypeTraits(OrganType::BLADE, p);
    CHECK(blade.convection == ConvectionRegime::FLAT_PLATE);
    CHECK_EQUAL(1.0, blade.efficiency);

    for (auto type : { OrganType::INTERNODE, OrganType::SHEATH, OrganType::PEDUNCLE, OrganType::EAR }) {
      OrganTypeTraits traits = GetOrganTypeTraits(type, p);
      CHECK(traits.convection == ConvectionRegime::CYLINDER);
      CHECK_EQUAL(0.78, traits.efficiency);
    }
  }

  TEST(TEMPERATURE_DEPENDENCE)
  {
    auto p = Teuchos::rcp(new PhotosynthesisParameters());
    TemperatureDependence temp(p);

    // identity at the reference temperature
    CHECK_CLOSE(10.0, temp.Adjust(TemperatureParameter::VC_MAX, 10., 25.), 1.e-12);
    CHECK_CLOSE(39.0, temp.Adjust(TemperatureParameter::GAMMA, 39., 25.), 1.e-12);

    CHECK_CLOSE(685.3284248505645, temp.Adjust(TemperatureParameter::KC, 404., 30.), 1.e-9);
    CHECK_CLOSE(448230.99606068345, temp.Adjust(TemperatureParameter::KO, 278.4e3, 35.), 1.e-6);
    CHECK_CLOSE(0.5223374335814329, temp.Adjust(TemperatureParameter::RDARK, 1., 15.), 1.e-12);

    // deactivation makes the capacities peak then decline
    double v30 = temp.Adjust(TemperatureParameter::VC_MAX, 100., 30.);
    double v45 = temp.Adjust(TemperatureParameter::VC_MAX, 100., 45.);
    CHECK_CLOSE(145.7143965431357, v30, 1.e-9);
    CHECK_CLOSE(134.21218211039326, v45, 1.e-9);
  }
}
