/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   class definitions for the error exception class
*/

#pragma once

#include "common/common_pch.h"

#include <ostream>

namespace vmx {

class exception: public std::exception {
public:
  virtual const char *what() const throw() {
    return "unspecified vidmix error";
  }

  virtual std::string error() const throw() {
    return what();
  }
};

class invalid_parameter_x: public exception {
protected:
  std::string m_message;

public:
  invalid_parameter_x() = default;
  explicit invalid_parameter_x(std::string const &message)
    : m_message{message}
  {
  }

  virtual const char *what() const throw() {
    return m_message.empty() ? "invalid parameter in function call" : m_message.c_str();
  }
};

inline std::ostream &
operator <<(std::ostream &out,
            exception const &ex) {
  out << ex.error();
  return out;
}

}

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<vmx::exception> : ostream_formatter {};
#endif  // FMT_VERSION >= 90000
