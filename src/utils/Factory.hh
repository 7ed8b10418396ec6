/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

//! Base factory for self-registering classes of a given base type.
/*!

  Several parts of the model come in interchangeable variants that inherit a
  common, purely virtual class.  The nitrogen normalisation is the main
  example: each model version maps the nitrogen inputs of an organ onto the
  single capacity driver used by the assimilation model.  We would like to:

   1. choose the implementation at run time, from a string in the input list
   2. add new implementations without touching the factory

  Implementations "register" themselves with the factory through a static
  RegisteredFactory member, and all constructors take a single
  Teuchos::ParameterList which they parse for their own parameters.  The
  registry is a static map keyed by the implementation name.

  Usage:

   // nitrogen_model_total.hh
   class NitrogenModelTotal : public NitrogenModel {
     explicit NitrogenModelTotal(Teuchos::ParameterList& plist);
     ...
    private:
     static Utils::RegisteredFactory<NitrogenModel, NitrogenModelTotal> factory_;
   };

   // nitrogen_model_total_reg.hh, included once per executable
   Utils::RegisteredFactory<NitrogenModel, NitrogenModelTotal>
     NitrogenModelTotal::factory_("Barillot2016");

   // user
   Utils::Factory<NitrogenModel> factory;
   NitrogenModel* model = factory.CreateInstance("Barillot2016", plist);

  An unknown name is a configuration error and throws, listing the
  registered names.
*/

#ifndef FARQUHAR_FACTORY_HH_
#define FARQUHAR_FACTORY_HH_

#include <map>
#include <string>
#include "Teuchos_ParameterList.hpp"

#include "errors.hh"

namespace Farquhar {
namespace Utils {

template <typename TBase>
class Factory {
 public:
  typedef std::map<std::string, TBase* (*)(Teuchos::ParameterList&)> map_type;

  static TBase* CreateInstance(const std::string& s, Teuchos::ParameterList& plist)
  {
    typename map_type::iterator iter = GetMap()->find(s);
    if (iter == GetMap()->end()) {
      Errors::InvalidConfiguration msg;
      msg << "Factory: cannot get item of type: \"" << s << "\"";
      for (typename map_type::iterator piter = GetMap()->begin(); piter != GetMap()->end();
           ++piter) {
        msg << "\n  option: \"" << piter->first << "\"";
      }
      Exceptions::farquhar_throw(msg);
    }
    return iter->second(plist);
  }

  static bool IsRegistered(const std::string& s) { return GetMap()->count(s) > 0; }

 protected:
  static map_type* GetMap()
  {
    static map_type* map_;
    if (!map_) { map_ = new map_type; }
    return map_;
  }
};

template <typename TBase, typename TDerived>
TBase*
CreateT(Teuchos::ParameterList& plist)
{
  return new TDerived(plist);
}


template <typename TBase, typename TDerived>
class RegisteredFactory : public Factory<TBase> {
 public:
  // A second registration under an existing name is ignored; the first one
  // wins.
  explicit RegisteredFactory(const std::string& s)
  {
    Factory<TBase>::GetMap()->insert(
      std::pair<std::string, TBase* (*)(Teuchos::ParameterList&)>(s, &CreateT<TBase, TDerived>));
  }
};

} // namespace Utils
} // namespace Farquhar

#endif
