/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   helper functions, common variables
*/

#include "common/common_pch.h"

#include <iostream>

#include <QDateTime>

#include "common/command_line.h"
#include "common/debugging.h"
#include "common/qt.h"

bool g_suppress_info              = false;
bool g_suppress_warnings          = false;
bool g_warning_issued             = false;

static mxmsg_handler_t s_mxmsg_info_handler, s_mxmsg_warning_handler, s_mxmsg_error_handler;

void
set_mxmsg_handler(unsigned int level,
                  mxmsg_handler_t const &handler) {
  if (MXMSG_INFO == level)
    s_mxmsg_info_handler = handler;
  else if (MXMSG_WARNING == level)
    s_mxmsg_warning_handler = handler;
  else if (MXMSG_ERROR == level)
    s_mxmsg_error_handler = handler;
  else
    assert(false);
}

void
mxmsg(unsigned int level,
      std::string message) {
  static debugging_option_c s_timestamped_messages{"timestamped_messages"};

  if (g_suppress_info && (MXMSG_INFO == level))
    return;

  if (!message.empty() && ('\n' == message[0])) {
    message.erase(0, 1);
    std::cout << "\n";
  }

  std::string prefix;
  if (s_timestamped_messages)
    prefix += to_utf8(QDateTime::currentDateTime().toString(Q("yyyy-MM-dd HH:mm:ss.zzz ")));

  if (level == MXMSG_ERROR) {
    if (balg::starts_with(message, Y("Error:")))
      message.erase(0, std::string{Y("Error:")}.length());
    std::cout << fmt::format("{0}{1} ", prefix, Y("Error:"));

  } else if (level == MXMSG_WARNING)
    std::cout << fmt::format("{0}{1} ", prefix, Y("Warning:"));

  else if (!prefix.empty())
    std::cout << prefix;

  std::cout << message;
  std::cout.flush();
}

static void
default_mxinfo(unsigned int,
               std::string const &info) {
  mxmsg(MXMSG_INFO, info);
}

void
mxinfo(std::string const &info) {
  if (s_mxmsg_info_handler)
    s_mxmsg_info_handler(MXMSG_INFO, info);
}

static void
default_mxwarn(unsigned int,
               std::string const &warning) {
  if (g_suppress_warnings)
    return;

  mxmsg(MXMSG_WARNING, warning);

  if (vmx::cli::g_abort_on_warnings)
    mxexit(1);

  g_warning_issued = true;
}

void
mxwarn(std::string const &warning) {
  if (s_mxmsg_warning_handler)
    s_mxmsg_warning_handler(MXMSG_WARNING, warning);
}

static void
default_mxerror(unsigned int,
                std::string const &error) {
  mxmsg(MXMSG_ERROR, error);
  mxexit(2);
}

void
mxerror(std::string const &error) {
  if (s_mxmsg_error_handler)
    s_mxmsg_error_handler(MXMSG_ERROR, error);

  // The error handlers are expected never to return. If one does
  // nevertheless then fall back to the default behavior.
  default_mxerror(MXMSG_ERROR, error);
}

void
init_common_output() {
  set_mxmsg_handler(MXMSG_INFO,    default_mxinfo);
  set_mxmsg_handler(MXMSG_WARNING, default_mxwarn);
  set_mxmsg_handler(MXMSG_ERROR,   default_mxerror);
}
