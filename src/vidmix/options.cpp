/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html
*/

#include "common/common_pch.h"

#include "vidmix/options.h"

bool
options_c::is_cli_mode()
  const {
  return m_selection.m_mode == vmx::combine::invocation_mode_e::cli;
}

void
options_c::dump()
  const {
  mxinfo(fmt::format("options:\n"
                     "  config_file_name: {0}\n"
                     "  dry_run:          {1}\n",
                     m_config_file_name.string(), m_dry_run));

  m_selection.dump();
  m_config.dump();
}
