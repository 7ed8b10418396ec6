/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <iomanip>
#include <string>

#include "errors.hh"

#include "SimulationIO.hh"

namespace Farquhar {

namespace {

template <typename T>
T
GetRequired(Teuchos::ParameterList& plist, const std::string& name)
{
  if (!plist.isParameter(name)) {
    Errors::InvalidConfiguration msg;
    msg << "list \"" << plist.name() << "\" is missing required parameter \"" << name << "\"";
    Exceptions::farquhar_throw(msg);
  } else if (!plist.isType<T>(name)) {
    Errors::InvalidConfiguration msg;
    msg << "list \"" << plist.name() << "\": parameter \"" << name << "\" has the wrong type";
    Exceptions::farquhar_throw(msg);
  }
  return plist.get<T>(name);
}


template <typename T>
T
GetOptional(Teuchos::ParameterList& plist, const std::string& name, const T& default_value)
{
  if (plist.isParameter(name)) return GetRequired<T>(plist, name);
  return default_value;
}


Teuchos::ParameterList&
GetSublist(Teuchos::ParameterList& plist, const std::string& name)
{
  if (!plist.isSublist(name)) {
    Errors::InvalidConfiguration msg;
    msg << "list \"" << plist.name() << "\" is missing required sublist \"" << name << "\"";
    Exceptions::farquhar_throw(msg);
  }
  return plist.sublist(name);
}

} // namespace


/* ******************************************************************
* One entry per sublist of "axes" and "elements".
****************************************************************** */
SimulationInputs
ReadSimulationInputs(Teuchos::ParameterList& plist)
{
  SimulationInputs inputs;

  Teuchos::ParameterList& axes_list = GetSublist(plist, "axes");
  for (auto it = axes_list.begin(); it != axes_list.end(); ++it) {
    std::string name = axes_list.name(it);
    Teuchos::ParameterList& axis_list = GetSublist(axes_list, name);

    AxisKey key(GetRequired<int>(axis_list, "plant"), GetRequired<std::string>(axis_list, "axis"));
    AxisInputs axis;
    axis.SAM_temperature = GetRequired<double>(axis_list, "SAM temperature [C]");
    axis.canopy_height = GetRequired<double>(axis_list, "canopy height [m]");

    if (!inputs.axes.insert(std::make_pair(key, axis)).second) {
      Errors::InvalidConfiguration msg;
      msg << "axes: axis (" << key.first << ", " << key.second << ") is given twice";
      Exceptions::farquhar_throw(msg);
    }
  }

  Teuchos::ParameterList& elements_list = GetSublist(plist, "elements");
  for (auto it = elements_list.begin(); it != elements_list.end(); ++it) {
    std::string name = elements_list.name(it);
    Teuchos::ParameterList& e_list = GetSublist(elements_list, name);

    OrganKey key;
    key.plant = GetRequired<int>(e_list, "plant");
    key.axis = GetRequired<std::string>(e_list, "axis");
    key.metamer = GetRequired<int>(e_list, "metamer");
    key.organ = GetRequired<std::string>(e_list, "organ");
    key.element = GetRequired<std::string>(e_list, "element");

    ElementInputs element;
    element.width = GetRequired<double>(e_list, "width [m]");
    if (e_list.isParameter("height [m]")) {
      element.has_height = true;
      element.height = GetRequired<double>(e_list, "height [m]");
    }
    element.PAR = GetOptional<double>(e_list, "PARa [umol m^-2 s^-1]", 0.);

    if (e_list.isParameter("surfacic nitrogen [g m^-2]")) {
      element.has_surfacic_nitrogen = true;
      element.surfacic_nitrogen = GetRequired<double>(e_list, "surfacic nitrogen [g m^-2]");
    }
    if (e_list.isParameter("green area [m^2]")) {
      Relations::OrganNitrogen& n = element.nitrogen;
      element.has_nitrogen_pools = true;
      n.green_area = GetRequired<double>(e_list, "green area [m^2]");
      n.nitrates = GetOptional<double>(e_list, "nitrates [umol N]", 0.);
      n.amino_acids = GetOptional<double>(e_list, "amino acids [umol N]", 0.);
      n.proteins = GetOptional<double>(e_list, "proteins [umol N]", 0.);
      n.Nstruct = GetOptional<double>(e_list, "Nstruct [g]", 0.);
      n.sucrose = GetOptional<double>(e_list, "sucrose [umol C]", 0.);
      n.starch = GetOptional<double>(e_list, "starch [umol C]", 0.);
      n.fructan = GetOptional<double>(e_list, "fructan [umol C]", 0.);
    }

    if (!inputs.elements.insert(std::make_pair(key, element)).second) {
      Errors::InvalidConfiguration msg;
      msg << "elements: element " << to_string(key) << " is given twice";
      Exceptions::farquhar_throw(msg);
    }
  }

  return inputs;
}


Solvers::AmbientConditions
ReadAmbientConditions(Teuchos::ParameterList& plist)
{
  Teuchos::ParameterList& weather = GetSublist(plist, "weather");

  Solvers::AmbientConditions ambient;
  ambient.Ta = GetRequired<double>(weather, "air temperature [C]");
  ambient.CO2 = GetRequired<double>(weather, "ambient CO2 [umol mol^-1]");
  ambient.RH = GetRequired<double>(weather, "relative humidity [-]");
  ambient.Ur = GetRequired<double>(weather, "wind speed [m s^-1]");

  if (!(ambient.CO2 > 0.)) {
    Errors::InvalidConfiguration msg;
    msg << "weather: \"ambient CO2 [umol mol^-1]\" must be positive, got " << ambient.CO2;
    Exceptions::farquhar_throw(msg);
  }
  return ambient;
}


void
WriteOutputs(std::ostream& os, const SimulationOutputs& outputs)
{
  os << "plant,axis,metamer,organ,element,Ag,An,Rd,Tr,Ts,gs,width,height" << std::endl;
  os << std::setprecision(12);
  for (const auto& entry : outputs) {
    const OrganKey& key = entry.first;
    const ElementOutputs& out = entry.second;
    os << key.plant << "," << key.axis << "," << key.metamer << "," << key.organ << ","
       << key.element << "," << out.Ag << "," << out.An << "," << out.Rd << "," << out.Tr << ","
       << out.Ts << "," << out.gs << "," << out.width << ",";
    if (out.has_height) os << out.height;
    os << std::endl;
  }
}

} // namespace Farquhar
