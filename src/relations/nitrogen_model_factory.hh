/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Self-registering factory for the nitrogen normalisation of a model version.

#ifndef FARQUHAR_RELATIONS_NITROGEN_MODEL_FACTORY_HH_
#define FARQUHAR_RELATIONS_NITROGEN_MODEL_FACTORY_HH_

#include <string>

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_RCP.hpp"

#include "Factory.hh"
#include "nitrogen_model.hh"

namespace Farquhar {
namespace Relations {

class NitrogenModelFactory : public Utils::Factory<NitrogenModel> {
 public:
  // Throws Errors::InvalidConfiguration if version is not registered.
  Teuchos::RCP<NitrogenModel> createNitrogenModel(const std::string& version,
                                                  Teuchos::ParameterList& plist);
};

} // namespace Relations
} // namespace Farquhar

#endif
