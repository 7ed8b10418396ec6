/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "nitrogen_model_total.hh"

namespace Farquhar {
namespace Relations {

Utils::RegisteredFactory<NitrogenModel, NitrogenModelTotal>
  NitrogenModelTotal::factory_("Barillot2016");

} // namespace Relations
} // namespace Farquhar
