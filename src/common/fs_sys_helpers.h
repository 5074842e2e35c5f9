/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   Cross platform helper functions
*/

#pragma once

#include "common/common_pch.h"

namespace vmx::sys {

void determine_path_to_current_executable(std::string const &argv0);
boost::filesystem::path get_current_exe_path(std::string const &argv0);
boost::filesystem::path get_installation_path();
boost::filesystem::path find_exe_in_path(boost::filesystem::path const &exe);
bool is_executable_file(boost::filesystem::path const &file_name);
bool is_readable_file(boost::filesystem::path const &file_name);

std::string get_environment_variable(const std::string &key);
void set_environment_variable(std::string const &key, std::string const &value);
void unset_environment_variable(std::string const &key);

}
