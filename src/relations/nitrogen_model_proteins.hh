/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Capacities driven by nitrogen estimated from photosynthetic proteins.
/*!

Only proteins are related to RuBisCO, so the capacity driver is the
non-structural nitrogen estimated linearly from the surfacic content of
photosynthetic proteins:

.. math::

   N = a \, P_{surf} + b

.. _nitrogen-model-proteins-spec:
.. admonition:: nitrogen-model-proteins-spec

   * `"surfacic proteins slope [-]`" ``[double]`` **1** a
   * `"surfacic proteins intercept [g m^-2]`" ``[double]`` **0** b

*/

#ifndef FARQUHAR_RELATIONS_NITROGEN_MODEL_PROTEINS_HH_
#define FARQUHAR_RELATIONS_NITROGEN_MODEL_PROTEINS_HH_

#include "Teuchos_ParameterList.hpp"

#include "Factory.hh"
#include "nitrogen_model.hh"

namespace Farquhar {
namespace Relations {

class NitrogenModelProteins : public NitrogenModel {
 public:
  explicit NitrogenModelProteins(Teuchos::ParameterList& plist);

  virtual double CapacityDriver(const OrganNitrogen& n) const override;

 protected:
  double slope_, intercept_;

 private:
  static Utils::RegisteredFactory<NitrogenModel, NitrogenModelProteins> factory_;
};

} // namespace Relations
} // namespace Farquhar

#endif
