/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

// Static members of VerboseObject; include once per executable.

#include "VerboseObject.hh"

// The default global verbosity level.
Teuchos::EVerbosityLevel Farquhar::VerboseObject::global_default_level = Teuchos::VERB_MEDIUM;

// Show or hide line prefixes
bool Farquhar::VerboseObject::global_hide_line_prefix = false;

// Size of the left column of names.
unsigned int Farquhar::VerboseObject::global_line_prefix_size = 18;
