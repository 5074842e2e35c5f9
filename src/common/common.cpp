/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   helper functions, common variables
*/

#include "common/common_pch.h"

#include <iostream>

#include "common/fs_sys_helpers.h"
#include "common/logger.h"
#include "common/translation.h"

// Global and static variables

unsigned int verbose = 1;

extern bool g_warning_issued;
static std::string s_program_name;

// Functions

void
mxexit(int code) {
  std::cout.flush();

  if (code != -1)
    exit(code);

  if (g_warning_issued)
    exit(1);

  exit(0);
}

void
vmx_common_init(std::string const &program_name,
                char const *argv0) {
  s_program_name = program_name;

  debugging_c::init();
  vmx::log::init();

  vmx::sys::determine_path_to_current_executable(argv0 ? std::string{argv0} : std::string{});

  init_common_output();

  init_locales();
}

std::string const &
get_program_name() {
  return s_program_name;
}
