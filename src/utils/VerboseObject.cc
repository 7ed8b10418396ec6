/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include "Teuchos_StandardParameterEntryValidators.hpp"
#include "Teuchos_VerboseObjectParameterListHelpers.hpp"

#include "VerboseObject.hh"

namespace Farquhar {

namespace {

const char* const WARNING_COLOR = "\033[1;33m";
const char* const RESET_COLOR = "\033[0m";

} // namespace


VerboseObject::VerboseObject(const std::string& name, const std::string& verbosity)
{
  setDefaultVerbLevel(global_default_level);
  SetLinePrefix_(name);

  auto validator = Teuchos::verbosityLevelParameterEntryValidator("verbosity level");
  setVerbLevel(validator->getIntegralValue(verbosity));

  getOStream()->setShowLinePrefix(!global_hide_line_prefix);
}


/* ******************************************************************
* Translate the "verbose object" sublist into the list understood by
* Teuchos::readVerboseObjectSublist.
****************************************************************** */
VerboseObject::VerboseObject(const std::string& name, Teuchos::ParameterList plist)
{
  setDefaultVerbLevel(global_default_level);

  Teuchos::ParameterList& vo_list = plist.sublist("verbose object");
  SetLinePrefix_(vo_list.get<std::string>("name", name));
  bool hide_prefix = vo_list.get<bool>("hide line prefix", global_hide_line_prefix);

  Teuchos::ParameterList teuchos_list;
  Teuchos::ParameterList& teuchos_vo = teuchos_list.sublist("VerboseObject");
  if (vo_list.isParameter("verbosity level"))
    teuchos_vo.set("Verbosity Level", vo_list.get<std::string>("verbosity level"));
  if (vo_list.isParameter("output filename"))
    teuchos_vo.set("Output File", vo_list.get<std::string>("output filename"));
  Teuchos::readVerboseObjectSublist(&teuchos_list, this);

  getOStream()->setShowLinePrefix(!hide_prefix);
}


// prefixes are cut or padded to the global width so columns line up
void
VerboseObject::SetLinePrefix_(const std::string& name)
{
  std::string prefix(name);
  prefix.resize(global_line_prefix_size, ' ');
  setLinePrefix(prefix);
}


void
VerboseObject::WriteWarning(Teuchos::EVerbosityLevel verbosity,
                            const std::stringstream& data) const
{
  if (!os_OK(verbosity)) return;

  Teuchos::OSTab tab = getOSTab();
  std::string line(data.str());
  if (!line.empty() && line.back() == '\n') line.pop_back();
  *os() << WARNING_COLOR << line << RESET_COLOR << std::endl;
}

} // namespace Farquhar
