/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string formatting functions
*/

#include "common/common_pch.h"

#include <cctype>
#include <cstring>

#include "common/strings/formatting.h"

namespace vmx::string {

std::string
format_paragraph(std::string const &text_to_wrap,
                 int indent_column,
                 std::string const &indent_first_line,
                 std::string indent_following_lines,
                 int wrap_column,
                 const char *break_chars) {
  std::string text   = indent_first_line;
  int current_column = text.length();

  if ((0 != indent_column) && (current_column >= indent_column)) {
    text           += "\n";
    current_column  = 0;
  }

  if (indent_following_lines.empty())
    indent_following_lines = std::string(indent_column, ' ');

  text                               += std::string(indent_column - current_column, ' ');
  current_column                      = indent_column;
  std::string::size_type current_pos  = 0;
  bool first_word_in_line             = true;
  bool needs_space                    = false;

  while (text_to_wrap.length() > current_pos) {
    auto word_start = text_to_wrap.find_first_not_of(" ", current_pos);
    if (std::string::npos == word_start)
      break;

    if (word_start != current_pos)
      needs_space = true;

    auto word_end         = text_to_wrap.find_first_of(break_chars, word_start);
    bool next_needs_space = false;
    if (std::string::npos == word_end)
      word_end = text_to_wrap.length();

    else if (text_to_wrap[word_end] != ' ')
      ++word_end;

    else
      next_needs_space = true;

    auto word            = text_to_wrap.substr(word_start, word_end - word_start);
    bool needs_space_now = needs_space && (text_to_wrap.substr(word_start, 1).find_first_of(break_chars) == std::string::npos);
    auto new_column      = current_column + (needs_space_now ? 0 : 1) + static_cast<int>(word.length());

    if (!first_word_in_line && (new_column >= wrap_column)) {
      text               += "\n" + indent_following_lines;
      current_column      = indent_column;
      first_word_in_line  = true;
    }

    if (!first_word_in_line && needs_space_now) {
      text += " ";
      ++current_column;
    }

    text               += word;
    current_column     += word.length();
    current_pos         = word_end;
    first_word_in_line  = false;
    needs_space         = next_needs_space;
  }

  text += "\n";

  return text;
}

std::string
to_lower_ascii(std::string const &src) {
  auto dst = src;
  for (auto &c : dst)
    if ((c >= 'A') && (c <= 'Z'))
      c = c - 'A' + 'a';

  return dst;
}

std::string
normalize_fmt_double_output_str(std::string const &formatted_value) {
  // Some fmt library versions output a trailing ".0" even if the
  // decimal part is zero, others don't. Normalize to not include it.
  if (balg::ends_with(formatted_value, ".0"))
    return formatted_value.substr(0, formatted_value.length() - 2);

  return formatted_value;
}

std::string
shell_quote(std::string const &argument) {
  if (argument.empty())
    return "''";

  auto is_safe = std::all_of(argument.begin(), argument.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || std::strchr("@%_+=:,./-", c);
  });

  if (is_safe)
    return argument;

  return "'"s + balg::replace_all_copy(argument, "'", "'\\''") + "'"s;
}

std::string
format_command_line(std::vector<std::string> const &arguments) {
  std::vector<std::string> quoted;
  quoted.reserve(arguments.size());

  for (auto const &argument : arguments)
    quoted.emplace_back(shell_quote(argument));

  return join(quoted, " ");
}

} // vmx::string
