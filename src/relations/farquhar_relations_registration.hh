/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

// Registers the model versions; include once per executable.

#include "nitrogen_model_total_reg.hh"
#include "nitrogen_model_proteins_reg.hh"
#include "nitrogen_model_proteins_retroinhibition_reg.hh"
