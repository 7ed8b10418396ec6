/*
  Copyright 2010-202x held jointly by participating institutions.
  Farquhar is released under the three-clause BSD License.
  The terms of use and "as is" disclaimer for this license are
  provided in the top-level COPYRIGHT file.

  Authors:
*/

#include <iomanip>
#include <sstream>

#include "errors.hh"

namespace Errors {

namespace {

template <typename T>
std::string
Format(const T& datum)
{
  std::ostringstream ss;
  ss << std::setprecision(10) << datum;
  return ss.str();
}

} // namespace


Message&
operator<<(Message& message, const char* data)
{
  message.add_data(data);
  return message;
}

Message&
operator<<(Message& message, const std::string& data)
{
  message.add_data(data);
  return message;
}

Message&
operator<<(Message& message, int datum)
{
  message.add_data(Format(datum));
  return message;
}

Message&
operator<<(Message& message, std::size_t datum)
{
  message.add_data(Format(datum));
  return message;
}

// physical values keep enough digits to identify the offending input
Message&
operator<<(Message& message, double datum)
{
  message.add_data(Format(datum));
  return message;
}

} // namespace Errors
