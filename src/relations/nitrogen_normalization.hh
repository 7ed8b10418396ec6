/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Conversion of organ nitrogen and carbohydrate pools to surfacic contents.
/*!

Pools are amounts per organ element (umol N or umol C, structural nitrogen
in g) and green area is in m^2.  All results are in g m^-2.

*/

#ifndef FARQUHAR_RELATIONS_NITROGEN_NORMALIZATION_HH_
#define FARQUHAR_RELATIONS_NITROGEN_NORMALIZATION_HH_

namespace Farquhar {
namespace Relations {

const double N_MOLAR_MASS = 14.; // g mol^-1
const double C_MOLAR_MASS = 12.; // g mol^-1

// Nitrogen and carbohydrate pools of one organ element.
struct OrganNitrogen {
  double nitrates;    // umol N
  double amino_acids; // umol N
  double proteins;    // umol N
  double Nstruct;     // g
  double green_area;  // m^2

  double sucrose; // umol C
  double starch;  // umol C
  double fructan; // umol C
};

// structural and non-structural nitrogen
double
SurfacicNitrogen(double nitrates,
                 double amino_acids,
                 double proteins,
                 double Nstruct,
                 double green_area);

double
SurfacicNonstructuralNitrogen(double nitrates,
                              double amino_acids,
                              double proteins,
                              double green_area);

double
SurfacicPhotosyntheticProteins(double proteins, double green_area);

// water soluble carbohydrates, in g C m^-2
double
SurfacicWSC(double sucrose, double starch, double fructan, double green_area);

} // namespace Relations
} // namespace Farquhar

#endif
