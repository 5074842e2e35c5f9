/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string formatting functions
*/

#pragma once

#include "common/common_pch.h"

#include "common/strings/editing.h"

namespace vmx::string {

constexpr auto DEFAULT_WRAP_COLUMN = 79;

std::string format_paragraph(std::string const &text_to_wrap,
                             int indent_column                    = 0,
                             std::string const &indent_first_line = {},
                             std::string indent_following_lines   = {},
                             int wrap_column                      = DEFAULT_WRAP_COLUMN,
                             const char *break_chars              = " ,.)/:");

template<typename RangeT, typename SeparatorT>
std::string
join(RangeT const &range,
     SeparatorT const &separator) {
  return fmt::format("{}", fmt::join(range, separator));
}

std::string to_lower_ascii(std::string const &src);

std::string normalize_fmt_double_output_str(std::string const &formatted_value);

// Shortest representation that reads back as the same value,
// e.g. 1.5 -> "1.5", 1.0 -> "1", 0.7 -> "0.7".
inline std::string
format_shortest_double(double value) {
  return normalize_fmt_double_output_str(fmt::format("{}", value));
}

std::string shell_quote(std::string const &argument);
std::string format_command_line(std::vector<std::string> const &arguments);

} // vmx::string
