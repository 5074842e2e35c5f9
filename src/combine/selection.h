/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   the files and volume chosen for one invocation
*/

#pragma once

#include "common/common_pch.h"

#include "combine/config.h"

namespace vmx::combine {

enum class invocation_mode_e {
  cli,
  interactive,
};

class selection_c {
public:
  std::vector<boost::filesystem::path> m_inputs;
  boost::filesystem::path m_output;
  std::optional<double> m_volume;
  invocation_mode_e m_mode{invocation_mode_e::cli};

public:
  double effective_volume(config_c const &config) const;

  // Throws invalid_arguments_x describing the first problem found.
  void validate() const;

  void dump() const;

  static double parse_volume(std::string const &value);
  static void validate_volume(double volume);
};

}
