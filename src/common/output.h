/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions used in all programs, helper functions
*/

#pragma once

#include "common/os.h"

#include <functional>
#include <string>

constexpr auto MXMSG_ERROR   =  5;
constexpr auto MXMSG_WARNING = 10;
constexpr auto MXMSG_INFO    = 15;

using mxmsg_handler_t = std::function<void(unsigned int level, std::string const &)>;
void set_mxmsg_handler(unsigned int level, mxmsg_handler_t const &handler);

extern bool g_suppress_info, g_suppress_warnings, g_warning_issued;

void init_common_output();

void mxmsg(unsigned int level, std::string message);

void mxinfo(const std::string &info);
void mxwarn(const std::string &warning);
void mxerror(const std::string &error);

