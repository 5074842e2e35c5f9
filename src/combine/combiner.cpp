/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   validates a selection, runs the external tool and puts the result in place
*/

#include "common/common_pch.h"

#include "common/at_scope_exit.h"
#include "common/path.h"
#include "common/strings/formatting.h"
#include "combine/combine_x.h"
#include "combine/combiner.h"
#include "combine/command_builder.h"
#include "combine/selection.h"

namespace vmx::combine {

namespace {

void
remove_temporary_file(boost::filesystem::path const &file_name) {
  boost::system::error_code ec;
  if (!boost::filesystem::exists(file_name, ec))
    return;

  boost::filesystem::remove(file_name, ec);
  if (ec)
    mxwarn(fmt::format(FY("The temporary file '{0}' could not be removed: {1}\n"), file_name.string(), ec.message()));
}

// The tool takes arguments starting with '-' for options and a
// 'name:' prefix for a protocol. Absolute paths have neither.
selection_c
with_absolute_paths(selection_c selection) {
  for (auto &input : selection.m_inputs)
    input = boost::filesystem::absolute(input);

  selection.m_output = boost::filesystem::absolute(selection.m_output);

  return selection;
}

}

combiner_c::combiner_c(config_c config)
  : m_config{std::move(config)}
{
}

combiner_c &
combiner_c::set_confirm_overwrite(confirm_overwrite_cb_t const &callback) {
  m_confirm_overwrite = callback;
  return *this;
}

combiner_c &
combiner_c::set_line_handler(process_runner_c::line_handler_t const &handler) {
  m_line_handler = handler;
  return *this;
}

config_c const &
combiner_c::get_config()
  const {
  return m_config;
}

void
combiner_c::check_overwrite(boost::filesystem::path const &output)
  const {
  boost::system::error_code ec;
  if (!boost::filesystem::exists(output, ec))
    return;

  mxdebug_if(m_debug, fmt::format("output '{0}' exists; policy {1}\n", output.string(), to_string(m_config.m_overwrite_policy)));

  if (m_config.m_overwrite_policy == overwrite_policy_e::overwrite)
    return;

  if (m_config.m_overwrite_policy == overwrite_policy_e::refuse)
    throw invalid_arguments_x{fmt::format(FY("The output file '{0}' already exists."), output.string())};

  if (!m_confirm_overwrite || !m_confirm_overwrite(output))
    throw invalid_arguments_x{fmt::format(FY("The output file '{0}' already exists and has not been overwritten."), output.string())};
}

void
combiner_c::run(selection_c const &selection) {
  selection.validate();

  check_overwrite(selection.m_output);

  process_runner_c runner{m_config.m_tool_executable};
  runner.set_line_handler(m_line_handler);
  runner.locate_tool();

  auto absolute         = with_absolute_paths(selection);
  auto temporary_output = vmx::fs::temporary_sibling(absolute.m_output, "vidmix-tmp");
  auto args             = command_builder_c{absolute, m_config}.set_output(temporary_output).build();
  auto committed        = false;

  at_scope_exit_c cleanup{[&temporary_output, &committed]() {
    if (!committed)
      remove_temporary_file(temporary_output);
  }};

  mxdebug_if(m_debug, fmt::format("combining {0} file(s) into '{1}' via '{2}'\n", selection.m_inputs.size(), selection.m_output.string(), temporary_output.string()));
  mxdebug_if(m_debug, fmt::format("command: {0} {1}\n", m_config.m_tool_executable, vmx::string::format_command_line(args)));

  runner.run(args);

  boost::system::error_code ec;
  if (!boost::filesystem::is_regular_file(temporary_output, ec))
    throw processing_failed_x{fmt::format(FY("The external tool '{0}' did not create the output file."), m_config.m_tool_executable), 0, false, runner.get_output()};

  boost::filesystem::rename(temporary_output, selection.m_output, ec);
  if (ec)
    throw processing_failed_x{fmt::format(FY("The output file '{0}' could not be created: {1}"), selection.m_output.string(), ec.message())};

  committed = true;
}

std::vector<std::string>
combiner_c::dry_run(selection_c const &selection)
  const {
  selection.validate();

  auto args = command_builder_c{with_absolute_paths(selection), m_config}.build();
  args.insert(args.begin(), m_config.m_tool_executable);

  return args;
}

}
