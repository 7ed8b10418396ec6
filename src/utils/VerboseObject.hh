/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

/*!

This allows control of log-file verbosity for the solver, the batch
simulation and the driver.

.. _verbose-object-spec:
.. admonition:: verbose-object-spec

   * `"verbosity level`" ``[string]`` **optional** valid options are:

     - `"none`"
     - `"low`"
     - `"medium`"
     - `"high`"
     - `"extreme`"

     The default is set by the global verbosity spec, which can be set on the
     command line, and defaults to `"medium`".

   * `"name`" ``[string]`` **optional** Overrides the line prefix.

   * `"hide line prefix`" ``[bool]`` **false**

   * `"output filename`" ``[string]`` **optional** Redirect this output to a
     specific file rather than writing to screen.

Levels used by this code:

   - `"none`" Silent, including non-convergence warnings.
   - `"low`" Non-convergence warnings, one per unconverged quantity, and the
     model version chosen by each simulation.
   - `"medium`" Adds a summary line per batch: elements solved, bypassed
     and not converged.
   - `"high`" Adds one line per solved element with its iteration count,
     Ag, Ts and gs.
   - `"extreme`" Adds a dump of the full input list by the driver.

Example:

.. code-block:: xml

  <ParameterList name="verbose object">
    <Parameter name="verbosity level" type="string" value="medium"/>
    <Parameter name="hide line prefix" type="bool" value="false"/>
  </ParameterList>

*/

/*

Developer notes:

Trilinos's VerboseObject is templated with the class and then requests that
the VerboseObject be inserted as a base class to the using class.  We use
composition instead.

Usage:

  class MyClass {
   public:
    MyClass(Teuchos::ParameterList& plist) {
      vo_ = Teuchos::rcp(new VerboseObject("my_class", plist));
      if (vo_->os_OK(Teuchos::VERB_MEDIUM)) {
        Teuchos::OSTab tab = vo_->getOSTab();
        *vo_->os() << "my string to print" << std::endl;
      }
    }

   protected:
    Teuchos::RCP<VerboseObject> vo_;
  }

*/

#ifndef FARQUHAR_VERBOSE_OBJECT_HH_
#define FARQUHAR_VERBOSE_OBJECT_HH_

#include <sstream>
#include <string>

#include "Teuchos_ParameterList.hpp"
#include "Teuchos_VerboseObject.hpp"

namespace Farquhar {

class VerboseObject : public Teuchos::VerboseObject<VerboseObject> {
 public:
  // Verbosity given directly, as a level name.
  VerboseObject(const std::string& name, const std::string& verbosity);

  // Verbosity read from the "verbose object" sublist of plist.
  VerboseObject(const std::string& name, Teuchos::ParameterList plist);

  // Is there a stream and is the verbosity included?
  bool os_OK(Teuchos::EVerbosityLevel verbosity) const
  {
    return getOStream().get() && Teuchos::includesVerbLevel(getVerbLevel(), verbosity, true);
  }

  Teuchos::RCP<Teuchos::FancyOStream> os() const { return getOStream(); }

  // Writes data as a single highlighted line.
  void WriteWarning(Teuchos::EVerbosityLevel verbosity, const std::stringstream& data) const;

 public:
  static Teuchos::EVerbosityLevel global_default_level;
  static bool global_hide_line_prefix;

  // Width of the left column of names.
  static unsigned int global_line_prefix_size;

 private:
  void SetLinePrefix_(const std::string& name);
};

} // namespace Farquhar

#endif
