#pragma once

#include "common/common_pch.h"

#include <QMainWindow>

#include "vidmix-gui/util/installation_checker.h"

class QCloseEvent;
class options_c;

namespace vmx::gui {

namespace Ui {
class MainWindow;
}

class MainWindowPrivate;
class MainWindow : public QMainWindow {
  Q_OBJECT

protected:
  VMX_DECLARE_PRIVATE(MainWindowPrivate)

  std::unique_ptr<MainWindowPrivate> const p_ptr;

public:
  explicit MainWindow(options_c const &options, QWidget *parent = nullptr);
  virtual ~MainWindow();

  virtual void setStatusBarMessage(QString const &message);

  void addFiles(QStringList const &fileNames);
  QStringList fileNames() const;

public Q_SLOTS:
  void importVideos();
  void removeSelected();
  void clearList();
  void combine();
  void updateActions();

  void displayInstallationProblems(vmx::gui::Util::InstallationChecker::Problems const &problems);
  void displayToolVersion(QString const &version);

protected:
  virtual void closeEvent(QCloseEvent *event) override;

  void setupConnections();
  void setupFromOptions(options_c const &options);
  bool confirmOverwrite(boost::filesystem::path const &output);
  QString requestOutputFileName();

public:
  static QString videoFileFilter();
};

}
