/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   file system path helpers
*/

#pragma once

#include "common/common_pch.h"

#include <QString>

namespace vmx::fs {

boost::filesystem::path to_path(std::string const &name);
boost::filesystem::path to_path(std::wstring const &name);

inline boost::filesystem::path
to_path(char const *name) {
  return to_path(std::string{name});
}

inline boost::filesystem::path
to_path(QString const &name) {
  return to_path(name.toStdWString());
}

bool is_same_file(boost::filesystem::path const &a, boost::filesystem::path const &b);
boost::filesystem::path temporary_sibling(boost::filesystem::path const &file_name, std::string const &tag);

} // namespace vmx::fs

#if FMT_VERSION >= 90000
template <> struct fmt::formatter<boost::filesystem::path> : ostream_formatter {};
#endif  // FMT_VERSION >= 90000
