/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Capacities driven by total surfacic nitrogen (Barillot et al. 2016).
/*!

Structural and non-structural nitrogen of the element are summed, since the
published parameters were calibrated on total nitrogen measurements.

.. _nitrogen-model-total-spec:
.. admonition:: nitrogen-model-total-spec

   No parameters.

*/

#ifndef FARQUHAR_RELATIONS_NITROGEN_MODEL_TOTAL_HH_
#define FARQUHAR_RELATIONS_NITROGEN_MODEL_TOTAL_HH_

#include "Teuchos_ParameterList.hpp"

#include "Factory.hh"
#include "nitrogen_model.hh"

namespace Farquhar {
namespace Relations {

class NitrogenModelTotal : public NitrogenModel {
 public:
  explicit NitrogenModelTotal(Teuchos::ParameterList& plist) {}

  virtual double CapacityDriver(const OrganNitrogen& n) const override;

 private:
  static Utils::RegisteredFactory<NitrogenModel, NitrogenModelTotal> factory_;
};

} // namespace Relations
} // namespace Farquhar

#endif
