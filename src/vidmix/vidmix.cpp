/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   command line parsing, setup
*/

#include "common/common_pch.h"

#include <iostream>

#include <QCoreApplication>

#include "common/command_line.h"
#include "common/qt.h"
#include "common/strings/formatting.h"
#include "common/translation.h"
#include "common/version.h"
#include "combine/combine_x.h"
#include "combine/combiner.h"
#include "combine/process_runner.h"
#include "vidmix/vidmix_cli_parser.h"
#include "vidmix-gui/app.h"

namespace {

int s_argc{};
char **s_argv{};

bool
confirm_overwrite_on_terminal(boost::filesystem::path const &output) {
  std::cout << fmt::format(FY("The output file '{0}' exists already. Overwrite it? [y/N] "), output.string());
  std::cout.flush();

  std::string answer;
  if (!std::getline(std::cin, answer))
    return false;

  answer = vmx::string::to_lower_ascii(vmx::string::strip_copy(answer));

  return (answer == "y") || (answer == "yes");
}

// Used by '--version' together with '--verbose'.
std::string
tool_version_info() {
  std::unique_ptr<QCoreApplication> app;
  if (!QCoreApplication::instance())
    app = std::make_unique<QCoreApplication>(s_argc, s_argv);

  auto tool = vmx::combine::config_c::load_from(vmx::combine::config_c::default_file_name()).m_tool_executable;

  try {
    auto version = vmx::combine::process_runner_c{tool}.query_version();
    return fmt::format(FY("External tool: {0} version {1}\n"), tool, version.to_string());

  } catch (vmx::combine::exception const &ex) {
    return fmt::format(FY("External tool: {0}\n"), ex.what());
  }
}

void
show_tool_version(vmx::combine::config_c const &config) {
  try {
    auto version = vmx::combine::process_runner_c{config.m_tool_executable}.query_version();
    mxinfo(fmt::format(FY("Using {0} version {1}.\n"), config.m_tool_executable, version.to_string()));

  } catch (vmx::combine::exception const &ex) {
    mxwarn(fmt::format(FY("The version of the external tool could not be determined: {0}\n"), ex.what()));
  }
}

void
run_cli_mode(options_c const &options) {
  vmx::combine::combiner_c combiner{options.m_config};

  if (options.m_dry_run) {
    mxinfo(fmt::format("{0}\n", vmx::string::format_command_line(combiner.dry_run(options.m_selection))));
    return;
  }

  if (verbose >= 2) {
    show_tool_version(options.m_config);
    combiner.set_line_handler([](std::string const &line) { mxinfo(fmt::format("{0}\n", line)); });
  }

  combiner.set_confirm_overwrite(confirm_overwrite_on_terminal);

  auto const num_inputs = options.m_selection.m_inputs.size();
  mxinfo(fmt::format(FNY("Combining {0} file into '{1}'.\n", "Combining {0} files into '{1}'.\n", num_inputs), num_inputs, options.m_selection.m_output.string()));

  combiner.run(options.m_selection);

  mxinfo(Y("Done.\n"));
}

void
setup(int argc,
      char **argv) {
  s_argc = argc;
  s_argv = argv;

  QCoreApplication::setOrganizationName(Q("vidmix"));
  QCoreApplication::setApplicationName(Q("vidmix"));
  QCoreApplication::setApplicationVersion(Q(VIDMIX_VERSION));

  vmx_common_init("vidmix", argv[0]);

  vmx::cli::g_additional_version_info = tool_version_info;
}

}

int
main(int argc,
     char **argv) {
  setup(argc, argv);

  options_c options;

  try {
    options = vidmix_cli_parser_c{vmx::cli::args_in_utf8(argc, argv)}.run();

  } catch (vmx::combine::exception const &ex) {
    mxerror(fmt::format("{0}\n", ex.error()));
  }

  if (!options.is_cli_mode())
    return vmx::gui::run(argc, argv, options);

  QCoreApplication app{argc, argv};

  try {
    run_cli_mode(options);

  } catch (vmx::combine::exception const &ex) {
    mxerror(fmt::format("{0}\n", ex.error()));

  } catch (boost::filesystem::filesystem_error const &ex) {
    mxerror(fmt::format("{0}\n", ex.what()));
  }

  mxexit();
}
