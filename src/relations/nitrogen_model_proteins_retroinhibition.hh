/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Protein-driven capacities with retro-inhibition by carbohydrates.
/*!

As NitrogenModelProteins, with the driver reduced as water soluble
carbohydrates accumulate in the element:

.. math::

   N = (a \, P_{surf} + b) \frac{K}{K + WSC_{surf}}

The hyperbolic form and the default K are a working assumption, not a
calibrated response: the model version only names the retro-inhibition and
its carbohydrate input.  Recalibrate K before relying on this variant.

.. _nitrogen-model-proteins-retroinhibition-spec:
.. admonition:: nitrogen-model-proteins-retroinhibition-spec

   * `"surfacic proteins slope [-]`" ``[double]`` **1**
   * `"surfacic proteins intercept [g m^-2]`" ``[double]`` **0**
   * `"retroinhibition constant [g C m^-2]`" ``[double]`` **20** K, the
     surfacic carbohydrate content halving the driver.

*/

#ifndef FARQUHAR_RELATIONS_NITROGEN_MODEL_PROTEINS_RETROINHIBITION_HH_
#define FARQUHAR_RELATIONS_NITROGEN_MODEL_PROTEINS_RETROINHIBITION_HH_

#include "Teuchos_ParameterList.hpp"

#include "Factory.hh"
#include "nitrogen_model_proteins.hh"

namespace Farquhar {
namespace Relations {

class NitrogenModelProteinsRetroinhibition : public NitrogenModelProteins {
 public:
  explicit NitrogenModelProteinsRetroinhibition(Teuchos::ParameterList& plist);

  virtual double CapacityDriver(const OrganNitrogen& n) const override;

 private:
  double K_;

  static Utils::RegisteredFactory<NitrogenModel, NitrogenModelProteinsRetroinhibition> factory_;
};

} // namespace Relations
} // namespace Farquhar

#endif
