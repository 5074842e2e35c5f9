/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html
*/

#pragma once

#include "common/common_pch.h"

#include "combine/config.h"
#include "combine/selection.h"

class options_c {
public:
  vmx::combine::selection_c m_selection;
  vmx::combine::config_c m_config;
  boost::filesystem::path m_config_file_name;
  bool m_dry_run{};

public:
  bool is_cli_mode() const;
  void dump() const;
};
