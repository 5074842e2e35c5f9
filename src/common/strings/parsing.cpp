/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string parsing functions
*/

#include "common/common_pch.h"

#include <cmath>

#include <QRegularExpression>

#include "common/qt.h"
#include "common/strings/parsing.h"

namespace vmx::string {

// Accepts plain decimal notation with an optional exponent, e.g.
// "1", "0.7", ".5", "+2.", "1e-2". Rejects "nan", "inf" and hex floats.
bool
parse_floating_point_number(std::string const &string,
                            double &value) {
  static std::optional<QRegularExpression> s_number_re;

  if (!s_number_re)
    s_number_re = QRegularExpression{"^[+-]?(?:[0-9]+\\.?[0-9]*|\\.[0-9]+)(?:[eE][+-]?[0-9]+)?$"};

  if (!s_number_re->match(Q(string)).hasMatch())
    return false;

  double parsed{};
  if (!parse_number(string, parsed) || !std::isfinite(parsed))
    return false;

  value = parsed;

  return true;
}

} // vmx::string
