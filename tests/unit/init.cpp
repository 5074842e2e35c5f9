/*
   vidmix -- concatenate video files and mix their audio tracks

   Distributed under the GPL v2
   see the file COPYING for details
   or visit https://www.gnu.org/licenses/old-licenses/gpl-2.0.html

   helper functions for unit tests
*/

#include "common/common_pch.h"

#include <fstream>

#include <QCoreApplication>
#include <QStandardPaths>

#include "common/fs_sys_helpers.h"
#include "common/qt.h"
#include "tests/unit/init.h"

namespace vmxut {

static void
throw_mxerror(unsigned int,
              std::string const &error) {
  throw mxerror_x{error};
}

void
init_suite(char const *argv0) {
  QCoreApplication::setOrganizationName(Q("vidmix"));
  QCoreApplication::setApplicationName(Q("vidmix-unit-tests"));
  QStandardPaths::setTestModeEnabled(true);

  vmx_common_init("vidmix_unit_tests", argv0);

  // Never pick up a settings file of the user running the tests.
  vmx::sys::unset_environment_variable("VIDMIX_CONFIG_FILE");

  set_mxmsg_handler(MXMSG_ERROR, throw_mxerror);
  g_suppress_info = true;
}

void
init_case() {
  g_warning_issued = false;
}

temporary_directory_c::temporary_directory_c()
  : m_path{boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("vidmix-unit-test-%%%%-%%%%-%%%%")}
{
  boost::filesystem::create_directories(m_path);
}

temporary_directory_c::~temporary_directory_c() {
  boost::system::error_code ec;
  boost::filesystem::remove_all(m_path, ec);
}

boost::filesystem::path const &
temporary_directory_c::path()
  const {
  return m_path;
}

boost::filesystem::path
temporary_directory_c::file(std::string const &name)
  const {
  return m_path / name;
}

void
write_file(boost::filesystem::path const &file_name,
           std::string const &content) {
  std::ofstream out{file_name.string(), std::ios::binary | std::ios::trunc};
  out << content;
}

std::string
read_file(boost::filesystem::path const &file_name) {
  std::ifstream in{file_name.string(), std::ios::binary};
  return { std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{} };
}

boost::filesystem::path
write_script(boost::filesystem::path const &file_name,
             std::string const &body) {
  write_file(file_name, "#!/bin/sh\n" + body);
  boost::filesystem::permissions(file_name, boost::filesystem::owner_all | boost::filesystem::group_read | boost::filesystem::group_exe);

  return file_name;
}

std::vector<std::string>
directory_entries(boost::filesystem::path const &dir) {
  std::vector<std::string> entries;

  for (auto const &entry : boost::filesystem::directory_iterator{dir})
    entries.emplace_back(entry.path().filename().string());

  std::sort(entries.begin(), entries.end());

  return entries;
}

}

class vmxut_listener_c: public ::testing::EmptyTestEventListener {
public:
  virtual void OnTestStart(::testing::TestInfo const &) override {
    vmxut::init_case();
  }
};

int
main(int argc,
     char **argv) {
  QCoreApplication app{argc, argv};

  vmxut::init_suite(argv[0]);

  ::testing::InitGoogleTest(&argc, argv);
  ::testing::UnitTest::GetInstance()->listeners().Append(new vmxut_listener_c);

  return RUN_ALL_TESTS();
}
