/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   string helper functions
*/

#pragma once

#include "common/common_pch.h"

namespace vmx::string {

constexpr auto is_blank_or_tab(char c) { return (c == ' ')   || (c == '\t'); }
constexpr auto is_newline(char c)      { return (c == '\n')  || (c == '\r'); }

std::vector<std::string> split(std::string const &text, std::string const &pattern = ",", std::size_t max = std::numeric_limits<std::size_t>::max());

void strip(std::string &s, bool newlines = false);
std::string strip_copy(std::string const &s, bool newlines = false);
void strip_back(std::string &s, bool newlines = false);

} // vmx::string
