/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   Definitions for command line helper functions
*/

#pragma once

#include "common/common_pch.h"

namespace vmx::cli {

extern std::string g_usage_text;
extern bool g_abort_on_warnings;
extern std::function<std::string()> g_additional_version_info;

void display_usage(int exit_code = 0);
std::vector<std::string> args_in_utf8(int argc, char **argv);
bool handle_common_args(std::vector<std::string> &args);

}
