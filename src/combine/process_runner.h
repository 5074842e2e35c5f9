/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   runs the external tool and collects its output
*/

#pragma once

#include "common/common_pch.h"

#include <deque>

#include "common/version.h"

class QProcess;

namespace vmx::combine {

constexpr auto MAX_KEPT_OUTPUT_LINES = 50u;

class process_runner_c {
public:
  enum class state_e {
    idle,
    running,
    succeeded,
    failed,
  };

  using line_handler_t = std::function<void(std::string const &)>;

protected:
  std::string m_tool;
  state_e m_state{state_e::idle};
  std::optional<int> m_exit_code;
  std::deque<std::string> m_output;
  std::string m_pending;
  line_handler_t m_line_handler;

  debugging_option_c m_debug{"process_runner"};

public:
  explicit process_runner_c(std::string tool);

  void set_line_handler(line_handler_t const &handler);

  // Resolves the tool to an executable file; an explicit path must exist,
  // a bare name is searched for in PATH. Throws tool_not_found_x.
  boost::filesystem::path locate_tool() const;

  // Blocks until the tool has exited. Throws tool_not_found_x or
  // processing_failed_x.
  void run(std::vector<std::string> const &args);

  version_number_t query_version();

  state_e get_state() const;
  std::optional<int> get_exit_code() const;
  std::vector<std::string> get_output() const;

protected:
  void read_available(QProcess &process);
  void process_bytes_read(std::string const &bytes);
  void process_line(std::string const &line);
  void flush_pending();
  [[noreturn]] void fail_with(std::string const &message, int exit_code, bool crashed);
};

std::string to_string(process_runner_c::state_e state);

}
