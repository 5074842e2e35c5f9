/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   logging targets
*/

#include "common/common_pch.h"

#include <iostream>

#include <boost/filesystem/fstream.hpp>

#include <QDateTime>

#include "common/fs_sys_helpers.h"
#include "common/logger.h"
#include "common/path.h"
#include "common/qt.h"
#include "common/strings/editing.h"

namespace vmx::log {

target_cptr target_c::s_default_logger;

static QDateTime s_program_start_time;

target_c::target_c() {
}

std::string
target_c::format_line(std::string const &message) {
  auto timestamp = to_utf8(QDateTime::currentDateTime().toString(Q("yyyy-MM-dd HH:mm:ss")));
  auto line      = fmt::format("[vmx] {0} +{1}ms {2}", timestamp, runtime(), message);

  if (message.size() && (message[message.size() - 1] != '\n'))
    line += "\n";

  return line;
}

target_c &
target_c::get_default_logger() {
  if (s_default_logger)
    return *s_default_logger;

  auto var = vmx::sys::get_environment_variable("VMX_LOGGER");
  if (var.empty())
    var = "stderr";

  auto spec = vmx::string::split(var, ":", 2);

  if (spec[0] == "file") {
    auto file = (spec.size() > 1) && !spec[1].empty() ? spec[1] : "vidmix-debug.txt"s;

    set_default_logger(target_cptr{new file_target_c{vmx::fs::to_path(file)}});

  } else
    set_default_logger(target_cptr{new stderr_target_c{}});

  return *s_default_logger;
}

void
target_c::set_default_logger(target_cptr const &logger) {
  s_default_logger = logger;
}

int64_t
target_c::runtime() {
  return s_program_start_time.msecsTo(QDateTime::currentDateTime());
}

// ----------------------------------------------------------------------

file_target_c::file_target_c(boost::filesystem::path file_name)
  : target_c{}
  , m_file_name{std::move(file_name)}
{
  if (!m_file_name.is_absolute())
    m_file_name = boost::filesystem::temp_directory_path() / m_file_name;

  if (boost::filesystem::is_regular_file(m_file_name)) {
    boost::system::error_code ec;
    boost::filesystem::remove(m_file_name, ec);
  }
}

void
file_target_c::log_line(std::string const &message) {
  boost::filesystem::ofstream out{m_file_name, std::ios::out | std::ios::app};
  if (out)
    out << format_line(message);
}

// ----------------------------------------------------------------------

stderr_target_c::stderr_target_c()
  : target_c{}
{
}

void
stderr_target_c::log_line(std::string const &message) {
  std::cerr << fmt::format("[vmx] +{0}ms {1}\n", runtime(), message);
}

// ----------------------------------------------------------------------

void
init() {
  s_program_start_time = QDateTime::currentDateTime();
}

}
