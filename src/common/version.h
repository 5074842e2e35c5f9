/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   version information
*/

#pragma once

#include "common/common_pch.h"

#include <boost/operators.hpp>

struct version_number_t: boost::totally_ordered<version_number_t> {
  std::vector<unsigned int> parts;
  std::string suffix;
  bool valid{};

  version_number_t() = default;
  version_number_t(const std::string &s);

  bool operator <(const version_number_t &cmp) const;
  bool operator ==(const version_number_t &cmp) const;
  int compare(const version_number_t &cmp) const;

  std::string to_string() const;
};

enum version_info_flags_e {
  vif_untranslated = 0x0001,
  vif_architecture = 0x0002,

  vif_none         = 0x0000,
  vif_default      = vif_architecture,
  vif_full         = (0xffff & ~vif_untranslated),
};

std::string get_version_info(const std::string &program, version_info_flags_e flags = vif_default);
