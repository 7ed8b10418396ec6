/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "nitrogen_normalization.hh"

namespace Farquhar {
namespace Relations {

double
SurfacicNitrogen(double nitrates,
                 double amino_acids,
                 double proteins,
                 double Nstruct,
                 double green_area)
{
  double mass_N = (nitrates + amino_acids + proteins) * 1.e-6 * N_MOLAR_MASS + Nstruct;
  return mass_N / green_area;
}


double
SurfacicNonstructuralNitrogen(double nitrates,
                              double amino_acids,
                              double proteins,
                              double green_area)
{
  double mass_N = (nitrates + amino_acids + proteins) * 1.e-6 * N_MOLAR_MASS;
  return mass_N / green_area;
}


double
SurfacicPhotosyntheticProteins(double proteins, double green_area)
{
  return proteins * 1.e-6 * N_MOLAR_MASS / green_area;
}


double
SurfacicWSC(double sucrose, double starch, double fructan, double green_area)
{
  return (sucrose + starch + fructan) * 1.e-6 * C_MOLAR_MASS / green_area;
}

} // namespace Relations
} // namespace Farquhar
