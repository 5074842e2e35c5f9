/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   file system path helpers
*/

#include "common/common_pch.h"

#include <QString>

#include "common/path.h"
#include "common/qt.h"

namespace vmx::fs {

boost::filesystem::path
to_path(std::string const &name) {
#if defined(SYS_WINDOWS)
  return boost::filesystem::path{Q(name).toStdWString()};
#else
  return boost::filesystem::path{name};
#endif
}

boost::filesystem::path
to_path(std::wstring const &name) {
#if defined(SYS_WINDOWS)
  return boost::filesystem::path{name};
#else
  return boost::filesystem::path{to_utf8(QString::fromStdWString(name))};
#endif
}

bool
is_same_file(boost::filesystem::path const &a,
             boost::filesystem::path const &b) {
  boost::system::error_code ec;

  if (boost::filesystem::exists(a, ec) && boost::filesystem::exists(b, ec)) {
    auto same = boost::filesystem::equivalent(a, b, ec);
    if (!ec)
      return same;
  }

  return boost::filesystem::absolute(a).lexically_normal() == boost::filesystem::absolute(b).lexically_normal();
}

// Returns a name next to 'file_name' that doesn't exist yet and keeps
// the extension, e.g. "out.mp4" -> "out.<tag>-1a2b3c4d.mp4".
boost::filesystem::path
temporary_sibling(boost::filesystem::path const &file_name,
                  std::string const &tag) {
  auto directory = file_name.parent_path();
  auto pattern   = fmt::format("{0}.{1}-%%%%%%%%{2}", file_name.stem().string(), tag, file_name.extension().string());
  boost::filesystem::path candidate;

  do {
    candidate = directory / boost::filesystem::unique_path(to_path(pattern));
  } while (boost::filesystem::exists(candidate));

  return candidate;
}

}
