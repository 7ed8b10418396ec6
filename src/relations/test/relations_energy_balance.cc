/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <cmath>

#include <UnitTest++.h>

#include "Teuchos_RCP.hpp"

#include "organ_energy_balance.hh"
#include "photosynthesis_parameters.hh"

using namespace Farquhar::Relations;

SUITE(RELATIONS_ENERGY_BALANCE)
{
  TEST(FIRST_ITERATION_BLADE)
  {
    auto p = Teuchos::rcp(new PhotosynthesisParameters());
    OrganEnergyBalance eb(p);

    // Ts == Ta uses the analytic slope
    EnergyBalanceResult result =
      eb.Solve(0.018, 0.5, 0.7, 3.0, 500., 0.3, 20., 20., 0.6, ConvectionRegime::FLAT_PLATE);
    CHECK_CLOSE(22.434478661419103, result.Ts, 1.e-10);
    CHECK_CLOSE(4.6301072978674545e-05, result.Tr, 1.e-16);
  }

  TEST(LATER_ITERATION_CYLINDER)
  {
    auto p = Teuchos::rcp(new PhotosynthesisParameters());
    OrganEnergyBalance eb(p);

    // Ts != Ta uses the finite difference slope
    EnergyBalanceResult result =
      eb.Solve(0.018, 0.5, 0.7, 3.0, 500., 0.3, 20., 22., 0.6, ConvectionRegime::CYLINDER);
    CHECK_CLOSE(23.38065948347514, result.Ts, 1.e-10);
    CHECK_CLOSE(5.400439378585387e-05, result.Tr, 1.e-16);
  }

  TEST(WIND_FLOOR)
  {
    auto p = Teuchos::rcp(new PhotosynthesisParameters());
    OrganEnergyBalance eb(p);

    EnergyBalanceResult still =
      eb.Solve(0.018, 0.5, 0.7, 0., 500., 0.3, 20., 20., 0.6, ConvectionRegime::FLAT_PLATE);
    EnergyBalanceResult floor =
      eb.Solve(0.018, 0.5, 0.7, 0.1, 500., 0.3, 20., 20., 0.6, ConvectionRegime::FLAT_PLATE);

    CHECK(std::isfinite(still.Ts));
    CHECK(std::isfinite(still.Tr));
    CHECK_EQUAL(floor.Ts, still.Ts);
    CHECK_EQUAL(floor.Tr, still.Tr);
    CHECK_CLOSE(80.84332452642184, still.Ts, 1.e-9);
    CHECK_CLOSE(2.905072799396931e-05, still.Tr, 1.e-16);

    CHECK_EQUAL(eb.WindAtHeight(0.5, 0.7, 0.1), eb.WindAtHeight(0.5, 0.7, -2.));
    CHECK_EQUAL(eb.AerodynamicResistance(0.7, 0.1), eb.AerodynamicResistance(0.7, 0.));
  }

  TEST(WIND_PROFILE)
  {
    auto p = Teuchos::rcp(new PhotosynthesisParameters());
    OrganEnergyBalance eb(p);

    // attenuated from the top of the canopy down
    double u_top = eb.WindAtHeight(0.7, 0.7, 3.);
    double u_mid = eb.WindAtHeight(0.35, 0.7, 3.);
    CHECK(u_top > u_mid);
    CHECK_CLOSE(u_top * std::exp(-1.25), u_mid, 1.e-12);

    // thinner organs have thinner boundary layers
    CHECK(eb.BoundaryLayerResistance(0.01, 1., ConvectionRegime::FLAT_PLATE) <
          eb.BoundaryLayerResistance(0.02, 1., ConvectionRegime::FLAT_PLATE));
    CHECK_CLOSE(15.4, eb.BoundaryLayerResistance(0.01, 1., ConvectionRegime::FLAT_PLATE), 1.e-12);
  }

  TEST(NO_CONDENSATION)
  {
    auto p = Teuchos::rcp(new PhotosynthesisParameters());
    OrganEnergyBalance eb(p);

    // saturated air and a cold organ would give a negative flux
    EnergyBalanceResult result =
      eb.Solve(0.018, 0.5, 0.7, 3.0, 0., 0.05, 20., 10., 1.0, ConvectionRegime::FLAT_PLATE);
    CHECK_EQUAL(0., result.Tr);
    CHECK_CLOSE(20., result.Ts, 1.e-12);
  }

  TEST(SATURATED_VAPOR_PRESSURE)
  {
    CHECK_CLOSE(0.611, OrganEnergyBalance::SaturatedVaporPressure(0.), 1.e-12);
    CHECK_CLOSE(0.611 * std::exp(17.4 * 20. / 259.), OrganEnergyBalance::SaturatedVaporPressure(20.), 1.e-12);
  }
}
