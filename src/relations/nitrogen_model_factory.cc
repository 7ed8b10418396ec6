/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "errors.hh"
#include "nitrogen_model_factory.hh"

namespace Farquhar {
namespace Relations {

Teuchos::RCP<NitrogenModel>
NitrogenModelFactory::createNitrogenModel(const std::string& version,
                                          Teuchos::ParameterList& plist)
{
  if (!IsRegistered(version)) {
    Errors::InvalidConfiguration msg;
    msg << "unknown \"model version\": \"" << version << "\", valid options are:";
    for (const auto& entry : *GetMap()) msg << " \"" << entry.first << "\"";
    Exceptions::farquhar_throw(msg);
  }
  return Teuchos::rcp(CreateInstance(version, plist));
}

} // namespace Relations
} // namespace Farquhar
