/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   OS dependant file system & system helper functions
*/

#include "common/common_pch.h"

#include "common/fs_sys_helpers.h"
#include "common/path.h"
#include "common/strings/editing.h"

namespace vmx::sys {

namespace {

boost::filesystem::path s_current_executable_path;

} // anonymous

boost::filesystem::path
get_installation_path() {
  return s_current_executable_path;
}

void
determine_path_to_current_executable(std::string const &argv0) {
  s_current_executable_path = get_current_exe_path(argv0);
}

// PATH is looked up on every call as it may change at runtime.
boost::filesystem::path
find_exe_in_path(boost::filesystem::path const &exe) {
  if (exe.empty())
    return {};

  if (exe.has_parent_path())
    return is_executable_file(exe) ? exe : boost::filesystem::path{};

  auto paths = vmx::string::split(get_environment_variable("PATH"), ":");

  for (auto const &path : paths) {
    if (path.empty())
      continue;

    auto potential_exe = vmx::fs::to_path(path) / exe;
    if (is_executable_file(potential_exe))
      return potential_exe;
  }

  return {};
}

}
