/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   definitions used in all programs, helper functions
*/

#include "common/common_pch.h"

#include "common/command_line.h"
#include "common/translation.h"
#include "common/version.h"

namespace vmx::cli {

bool g_abort_on_warnings = false;
std::function<std::string()> g_additional_version_info;

/** \brief Collect the command line parameters

   Takes each command line paramter and puts it into a new array. An
   argument starting with "@@" is unescaped to a single "@".

   \param argc The number of arguments. This is the same argument that
     \c main normally receives.
   \param argv The arguments themselves. This is the same argument that
     \c main normally receives.
   \return An array of strings containing all the command line arguments
     except for the program name.
*/
std::vector<std::string>
args_in_utf8(int argc,
             char **argv) {
  std::vector<std::string> args;

  for (int i = 1; i < argc; i++) {
    auto s_arg = std::string{argv[i]};

    if (s_arg.substr(0, 2) == "@@"s)
      args.push_back(s_arg.substr(1));

    else
      args.push_back(s_arg);
  }

  return args;
}

std::string g_usage_text;

/** Handle command line arguments common to all programs

   Iterates over the list of command line arguments and handles the ones
   that are common to all programs. These include --debug, --help,
   --version, --verbose and --quiet.

   \param args A vector of strings containing the command line arguments.
     The ones that have been handled are removed from the vector.
   \returns \c true if the usage text must be regenerated and the
     function should be called again and \c false otherwise.
*/
bool
handle_common_args(std::vector<std::string> &args) {
  size_t i = 0;

  while (args.size() > i) {
    if (args[i] == "--debug") {
      if ((i + 1) == args.size())
        mxerror("Missing argument for '--debug'.\n");

      debugging_c::request(args[i + 1]);
      args.erase(args.begin() + i, args.begin() + i + 2);

    } else if (args[i] == "--abort-on-warnings") {
      g_abort_on_warnings = true;
      args.erase(args.begin() + i, args.begin() + i + 1);

    } else if (args[i] == "--verbose") {
      ++verbose;
      args.erase(args.begin() + i, args.begin() + i + 1);

    } else if ((args[i] == "-q") || (args[i] == "--quiet")) {
      verbose         = 0;
      g_suppress_info = true;
      args.erase(args.begin() + i, args.begin() + i + 1);

    } else
      ++i;
  }

  // Last find the --help and --version arguments.
  i = 0;
  while (args.size() > i) {
    if ((args[i] == "-V") || (args[i] == "--version")) {
      mxinfo(fmt::format("{0}\n", get_version_info(get_program_name(), vif_full)));
      if ((verbose > 1) && g_additional_version_info)
        mxinfo(g_additional_version_info());
      mxexit();

    } else if ((args[i] == "-h") || (args[i] == "-?") || (args[i] == "--help"))
      display_usage();

    else
      ++i;
  }

  return false;
}

void
display_usage(int exit_code) {
  if (!g_usage_text.empty()) {
    mxinfo(g_usage_text);
    if (g_usage_text.at(g_usage_text.size() - 1) != '\n')
      mxinfo("\n");
  }
  mxexit(exit_code);
}

}
