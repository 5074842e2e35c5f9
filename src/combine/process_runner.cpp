/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   runs the external tool and collects its output
*/

#include "common/common_pch.h"

#include <QProcess>

#include "common/fs_sys_helpers.h"
#include "common/path.h"
#include "common/qt.h"
#include "common/strings/editing.h"
#include "common/strings/formatting.h"
#include "combine/combine_x.h"
#include "combine/process_runner.h"

namespace vmx::combine {

process_runner_c::process_runner_c(std::string tool)
  : m_tool{std::move(tool)}
{
}

void
process_runner_c::set_line_handler(line_handler_t const &handler) {
  m_line_handler = handler;
}

boost::filesystem::path
process_runner_c::locate_tool()
  const {
  if (m_tool.empty())
    throw tool_not_found_x{m_tool, Y("No executable has been configured for the external tool.")};

  auto tool = vmx::fs::to_path(m_tool);
  auto exe  = vmx::sys::find_exe_in_path(tool);

  mxdebug_if(m_debug, fmt::format("locate_tool: '{0}' -> '{1}'\n", m_tool, exe.string()));

  if (!exe.empty())
    return exe;

  if (tool.has_parent_path())
    throw tool_not_found_x{m_tool, fmt::format(FY("The executable '{0}' does not exist or is not executable."), m_tool)};

  throw tool_not_found_x{m_tool, fmt::format(FY("The executable '{0}' was not found in the search path (PATH)."), m_tool)};
}

void
process_runner_c::run(std::vector<std::string> const &args) {
  m_state = state_e::running;
  m_exit_code.reset();
  m_output.clear();
  m_pending.clear();

  boost::filesystem::path exe;

  try {
    exe = locate_tool();
  } catch (tool_not_found_x const &) {
    m_state = state_e::failed;
    throw;
  }

  mxdebug_if(m_debug, fmt::format("run: {0} {1}\n", vmx::string::shell_quote(exe.string()), vmx::string::format_command_line(args)));

  QProcess process;

  process.setProgram(to_qs(exe));
  process.setArguments(to_qs(args));
  process.setProcessChannelMode(QProcess::MergedChannels);
  process.setStandardInputFile(QProcess::nullDevice());
  process.start(QIODevice::ReadOnly);

  if (!process.waitForStarted(-1)) {
    m_state = state_e::failed;
    throw tool_not_found_x{m_tool, fmt::format(FY("The executable '{0}' could not be started: {1}"), exe.string(), to_utf8(process.errorString()))};
  }

  while (process.state() != QProcess::NotRunning) {
    process.waitForFinished(100);
    read_available(process);
  }

  read_available(process);
  flush_pending();

  auto crashed = process.exitStatus() != QProcess::NormalExit;
  m_exit_code  = crashed ? -1 : process.exitCode();

  mxdebug_if(m_debug, fmt::format("run: finished; crashed {0} exit code {1}\n", crashed, *m_exit_code));

  if (crashed)
    fail_with(fmt::format(FY("The external tool '{0}' crashed."), m_tool), -1, true);

  if (0 != *m_exit_code)
    fail_with(fmt::format(FY("The external tool '{0}' failed with exit code {1}."), m_tool, *m_exit_code), *m_exit_code, false);

  m_state = state_e::succeeded;
}

version_number_t
process_runner_c::query_version() {
  run({ "-hide_banner", "-version" });

  for (auto const &line : m_output)
    if (!vmx::string::strip_copy(line, true).empty())
      return version_number_t{line};

  return {};
}

void
process_runner_c::fail_with(std::string const &message,
                            int exit_code,
                            bool crashed) {
  m_state = state_e::failed;
  throw processing_failed_x{message, exit_code, crashed, get_output()};
}

void
process_runner_c::read_available(QProcess &process) {
  auto bytes = process.readAll();
  if (!bytes.isEmpty())
    process_bytes_read(std::string{bytes.constData(), static_cast<std::size_t>(bytes.size())});
}

// Progress lines are terminated by a lone carriage return.
void
process_runner_c::process_bytes_read(std::string const &bytes) {
  m_pending += bytes;
  balg::replace_all(m_pending, "\r\n", "\n");
  std::replace(m_pending.begin(), m_pending.end(), '\r', '\n');

  std::size_t start = 0;

  while (start < m_pending.size()) {
    auto pos = m_pending.find('\n', start);
    if (std::string::npos == pos)
      break;

    process_line(m_pending.substr(start, pos - start));

    start = pos + 1;
  }

  m_pending.erase(0, start);
}

void
process_runner_c::flush_pending() {
  if (!m_pending.empty())
    process_line(m_pending);
  m_pending.clear();
}

void
process_runner_c::process_line(std::string const &line) {
  if (line.empty())
    return;

  if (m_line_handler)
    m_line_handler(line);

  m_output.emplace_back(line);
  while (m_output.size() > MAX_KEPT_OUTPUT_LINES)
    m_output.pop_front();
}

process_runner_c::state_e
process_runner_c::get_state()
  const {
  return m_state;
}

std::optional<int>
process_runner_c::get_exit_code()
  const {
  return m_exit_code;
}

std::vector<std::string>
process_runner_c::get_output()
  const {
  return { m_output.begin(), m_output.end() };
}

std::string
to_string(process_runner_c::state_e state) {
  return state == process_runner_c::state_e::running   ? "running"
       : state == process_runner_c::state_e::succeeded ? "succeeded"
       : state == process_runner_c::state_e::failed    ? "failed"
       :                                                 "idle";
}

}
