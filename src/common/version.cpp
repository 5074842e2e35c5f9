/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   version information
*/

#include "common/common_pch.h"

#include <QRegularExpression>

#include "common/debugging.h"
#include "common/qt.h"
#include "common/strings/formatting.h"
#include "common/strings/parsing.h"
#include "common/version.h"

version_number_t::version_number_t(const std::string &s)
  : valid{}
{
  static debugging_option_c s_debug{"version_check"};

  mxdebug_if(s_debug, fmt::format("version check: Parsing {0}\n", s));

  // Match the following:
  // 0.3.1
  // vidmix v0.3.1
  // ffmpeg version 6.1.1-3ubuntu5 Copyright (c) 2000-2023 the FFmpeg developers
  // ffmpeg version n7.0.2
  // * Optional prefix "<name> v" or "<name> version "
  // * Optional "n" before the number (release tags)
  // * An arbitrary number of digits separated by dots
  // * Optional distribution suffix starting with "-", "~" or "+",
  //   optionally followed by arbitrary text after a space
  static QRegularExpression s_version_number_re{
    "^(?:[a-z][a-z0-9_-]*[ \\t]+(?:version[ \\t]+)?v?)?"  // Optional prefix; program name, "version" or "v"
    "n?"                                                  // Optional release tag prefix
    "((?:\\d+\\.)*)(\\d+)"                                // An arbitrary number of digits separated by dots; $1 & $2
    "([-~+][^ \\t]*)?"                                    // Optional suffix; $3
    "(?:[ \\t].*)?$"                                      // Anything following the version
  };

  auto matches = s_version_number_re.match(Q(vmx::string::strip_copy(s, true)));
  if (!matches.hasMatch())
    return;

  valid          = true;
  suffix         = to_utf8(matches.captured(3));
  auto str_parts = vmx::string::split(to_utf8(matches.captured(1)) + to_utf8(matches.captured(2)), ".");

  for (auto const &str_part : str_parts) {
    parts.push_back(0);
    if (!vmx::string::parse_number(str_part, parts.back())) {
      valid = false;
      break;
    }
  }

  if (parts.empty())
    valid = false;

  mxdebug_if(s_debug, fmt::format("version check: parse OK; result: {0}\n", to_string()));
}

int
version_number_t::compare(const version_number_t &cmp)
  const
{
  for (int idx = 0, num_parts = std::max(parts.size(), cmp.parts.size()); idx < num_parts; ++idx) {
    auto this_num = static_cast<unsigned int>(idx) < parts.size()     ? parts[idx]     : 0;
    auto cmp_num  = static_cast<unsigned int>(idx) < cmp.parts.size() ? cmp.parts[idx] : 0;

    if (this_num < cmp_num)
      return -1;

    if (this_num > cmp_num)
      return 1;
  }

  return 0;
}

bool
version_number_t::operator <(const version_number_t &cmp)
  const
{
  return compare(cmp) == -1;
}

bool
version_number_t::operator ==(const version_number_t &cmp)
  const
{
  return compare(cmp) == 0;
}

std::string
version_number_t::to_string()
  const
{
  if (!valid)
    return "<invalid>";

  return vmx::string::join(parts, ".") + suffix;
}

std::string
get_version_info(const std::string &program,
                 version_info_flags_e flags) {
  std::vector<std::string> info;

  if (!program.empty())
    info.push_back(program);
  info.push_back(fmt::format("v{0}", VIDMIX_VERSION));

  if (flags & vif_architecture)
    info.push_back(fmt::format("{0}-bit", __SIZEOF_POINTER__ * 8));

  return vmx::string::join(info, " ");
}
