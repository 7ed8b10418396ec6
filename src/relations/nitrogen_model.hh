/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Base class for the nitrogen normalisation of a model version.
/*!

A model version decides which surfacic nitrogen content drives the
photosynthetic capacities.  Every implementation reduces the pools of an
organ element to that single scalar, in g m^-2, which the assimilation and
stomatal conductance models then consume unchanged.

Implementations are selected by `"model version`":

* `"Barillot2016`" total surfacic nitrogen, see NitrogenModelTotal
* `"SurfacicProteins`" see NitrogenModelProteins
* `"SurfacicProteins_Retroinhibition`" see
  NitrogenModelProteinsRetroinhibition

*/

#ifndef FARQUHAR_RELATIONS_NITROGEN_MODEL_HH_
#define FARQUHAR_RELATIONS_NITROGEN_MODEL_HH_

#include "nitrogen_normalization.hh"

namespace Farquhar {
namespace Relations {

class NitrogenModel {
 public:
  virtual ~NitrogenModel() = default;

  // surfacic nitrogen driving the capacities [g m^-2]
  virtual double CapacityDriver(const OrganNitrogen& n) const = 0;
};

} // namespace Relations
} // namespace Farquhar

#endif
