/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions for string parsing functions
*/

#pragma once

#include "common/common_pch.h"

#include <locale>

namespace vmx::string::conversion {

template <bool is_unsigned>
struct unsigned_checker {
  template<typename StrT>
  static inline bool is_ok(StrT const &) { return true; }
};

template <>
struct unsigned_checker<true> {
  template<typename StrT>
  static inline bool is_ok(StrT const &str) {
    return str[0] != '-';
  }
};

}

namespace vmx::string {

template<typename StrT, typename ValueT>
bool
parse_number(StrT const &string,
             ValueT &value) {
  if (!vmx::string::conversion::unsigned_checker< std::is_unsigned<ValueT>::value >::is_ok(string))
    return false;

  std::istringstream in{string};
  in.imbue(std::locale::classic());

  in >> std::noskipws >> value;

  return !in.fail() && in.eof();
}

bool parse_floating_point_number(std::string const &string, double &value);

} // vmx::string
