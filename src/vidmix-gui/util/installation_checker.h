#pragma once

#include "common/common_pch.h"

#include <QObject>
#include <QVector>

class QString;

namespace vmx::gui {
class MainWindow;
}

namespace vmx::gui::Util {

class InstallationChecker: public QObject {
  Q_OBJECT

public:
  enum class ProblemType {
    ToolNotFound,
    ToolCannotBeExecuted,
    ToolVersionNotRecognized,
  };

  using Problem  = std::pair<ProblemType, QString>;
  using Problems = QVector<Problem>;

private:
  QString m_tool, m_toolVersion;
  Problems m_problems;

public:
  explicit InstallationChecker(QString const &tool, QObject *parent = nullptr);
  virtual ~InstallationChecker();

  QString toolVersion() const;
  Problems problems() const;

Q_SIGNALS:
  void problemsFound(vmx::gui::Util::InstallationChecker::Problems const &results);
  void toolVersionFound(QString const &version);
  void finished();

public Q_SLOTS:
  void runChecks();

public:
  static void checkInstallation(QString const &tool, MainWindow *mainWindow);
};

}

Q_DECLARE_METATYPE(vmx::gui::Util::InstallationChecker::Problems)
