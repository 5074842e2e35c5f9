#include "common/common_pch.h"

#include <QThread>

#include "common/qt.h"
#include "common/strings/formatting.h"
#include "common/version.h"
#include "combine/combine_x.h"
#include "combine/process_runner.h"
#include "vidmix-gui/main_window/main_window.h"
#include "vidmix-gui/util/installation_checker.h"

namespace vmx::gui::Util {

InstallationChecker::InstallationChecker(QString const &tool,
                                         QObject *parent)
  : QObject{parent}
  , m_tool{tool}
{
}

InstallationChecker::~InstallationChecker() {
}

void
InstallationChecker::runChecks() {
  m_problems.clear();
  m_toolVersion.clear();

  vmx::combine::process_runner_c runner{to_utf8(m_tool)};

  try {
    runner.locate_tool();

    auto version = runner.query_version();
    if (!version.valid)
      m_problems << Problem{ ProblemType::ToolVersionNotRecognized, Q(vmx::string::join(runner.get_output(), "\n")) };

    else {
      m_toolVersion = Q(version.to_string());
      Q_EMIT toolVersionFound(m_toolVersion);
    }

  } catch (vmx::combine::tool_not_found_x const &ex) {
    m_problems << Problem{ ProblemType::ToolNotFound, Q(ex.what()) };

  } catch (vmx::combine::processing_failed_x const &ex) {
    m_problems << Problem{ ProblemType::ToolCannotBeExecuted, Q(ex.error()) };
  }

  if (!m_problems.isEmpty())
    Q_EMIT problemsFound(m_problems);

  Q_EMIT finished();
}

void
InstallationChecker::checkInstallation(QString const &tool,
                                       MainWindow *mainWindow) {
  auto thread  = new QThread{};
  auto checker = new InstallationChecker{tool};

  checker->moveToThread(thread);

  connect(thread,  &QThread::started,                      checker,    &InstallationChecker::runChecks);
  connect(checker, &InstallationChecker::problemsFound,    mainWindow, &MainWindow::displayInstallationProblems);
  connect(checker, &InstallationChecker::toolVersionFound, mainWindow, &MainWindow::displayToolVersion);
  connect(checker, &InstallationChecker::finished,         checker,    &InstallationChecker::deleteLater);
  connect(checker, &InstallationChecker::finished,         thread,     &QThread::quit);
  connect(thread,  &QThread::finished,                     thread,     &QThread::deleteLater);

  thread->start();
}

QString
InstallationChecker::toolVersion()
  const {
  return m_toolVersion;
}

InstallationChecker::Problems
InstallationChecker::problems()
  const {
  return m_problems;
}

}
