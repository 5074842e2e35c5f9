/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   OS dependant file system & system helper functions
*/

#include "common/common_pch.h"

#include <stdlib.h>
#include <unistd.h>

#include "common/fs_sys_helpers.h"
#include "common/path.h"

namespace vmx::sys {

std::string
get_environment_variable(std::string const &key) {
  auto var = getenv(key.c_str());
  return var ? var : "";
}

void
set_environment_variable(std::string const &key,
                         std::string const &value) {
  setenv(key.c_str(), value.c_str(), 1);
}

void
unset_environment_variable(std::string const &key) {
  unsetenv(key.c_str());
}

bool
is_executable_file(boost::filesystem::path const &file_name) {
  boost::system::error_code ec;
  if (!boost::filesystem::is_regular_file(file_name, ec))
    return false;

  return 0 == access(file_name.c_str(), X_OK);
}

bool
is_readable_file(boost::filesystem::path const &file_name) {
  boost::system::error_code ec;
  if (!boost::filesystem::is_regular_file(file_name, ec))
    return false;

  return 0 == access(file_name.c_str(), R_OK);
}

boost::filesystem::path
get_current_exe_path([[maybe_unused]] std::string const &argv0) {
  boost::system::error_code ec;
  auto exe = vmx::fs::to_path("/proc/self/exe");
  if (boost::filesystem::exists(exe, ec)) {
    auto exe_path = boost::filesystem::read_symlink(exe, ec);
    if (!ec)
      return boost::filesystem::absolute(exe_path).parent_path();
  }

  if (argv0.empty())
    return boost::filesystem::current_path();

  exe = boost::filesystem::absolute(argv0);
  if (boost::filesystem::is_regular_file(exe, ec))
    return exe.parent_path();

  return boost::filesystem::current_path();
}

}
