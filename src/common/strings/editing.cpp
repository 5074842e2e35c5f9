/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string helper functions
*/

#include "common/common_pch.h"

#include "common/strings/editing.h"

namespace vmx::string {

std::vector<std::string>
split(std::string const &text,
      std::string const &pattern,
      std::size_t max) {
  if (text.empty())
    return { ""s };

  if (pattern.empty())
    return { text };

  std::vector<std::string> results;

  auto pos = text.find(pattern);
  std::size_t consumed_up_to = 0;

  while ((pos != std::string::npos) && ((results.size() + 1) < max)) {
    results.emplace_back(text.substr(consumed_up_to, pos - consumed_up_to));

    consumed_up_to = pos + pattern.size();
    pos            = text.find(pattern, consumed_up_to);
  }

  if (consumed_up_to <= text.size())
    results.emplace_back(text.substr(consumed_up_to));

  return results;
}

void
strip_back(std::string &s,
           bool newlines) {
  auto len = s.length();
  auto idx = len;

  while ((idx > 0) && (!s[idx - 1] || is_blank_or_tab(s[idx - 1]) || (newlines && is_newline(s[idx - 1]))))
    --idx;

  s.erase(idx);
}

void
strip(std::string &s,
      bool newlines) {
  std::size_t idx = 0;

  while ((idx < s.length()) && (!s[idx] || is_blank_or_tab(s[idx]) || (newlines && is_newline(s[idx]))))
    ++idx;

  if (idx > 0)
    s.erase(0, idx);

  strip_back(s, newlines);
}

std::string
strip_copy(std::string const &s,
           bool newlines) {
  auto new_s = s;
  strip(new_s, newlines);
  return new_s;
}

} // vmx::string
