#include "common/common_pch.h"

#include <QApplication>
#include <QCloseEvent>
#include <QFileInfo>
#include <QListWidgetItem>

#include "common/at_scope_exit.h"
#include "common/path.h"
#include "common/qt.h"
#include "common/strings/formatting.h"
#include "combine/combine_x.h"
#include "combine/combiner.h"
#include "combine/selection.h"
#include "vidmix/options.h"
#include "vidmix-gui/forms/main_window/main_window.h"
#include "vidmix-gui/main_window/main_window.h"
#include "vidmix-gui/util/file_dialog.h"
#include "vidmix-gui/util/message_box.h"
#include "vidmix-gui/util/settings.h"

namespace vmx::gui {

class MainWindowPrivate {
  friend class MainWindow;

  std::unique_ptr<Ui::MainWindow> ui;
  vmx::combine::config_c config;
  QString presetOutput, toolVersion;
  debugging_option_c debug{"gui"};

  explicit MainWindowPrivate(options_c const &options)
    : ui{new Ui::MainWindow}
    , config{options.m_config}
  {
  }
};

MainWindow::MainWindow(options_c const &options,
                       QWidget *parent)
  : QMainWindow{parent}
  , p_ptr{new MainWindowPrivate{options}}
{
  auto p = p_func();

  p->ui->setupUi(this);

  setupConnections();
  setupFromOptions(options);
  updateActions();

  Util::InstallationChecker::checkInstallation(Q(p->config.m_tool_executable), this);
}

MainWindow::~MainWindow() {
}

void
MainWindow::setupConnections() {
  auto &ui = *p_func()->ui;

  connect(ui.actionImportVideos, &QAction::triggered,                this, &MainWindow::importVideos);
  connect(ui.actionClearList,    &QAction::triggered,                this, &MainWindow::clearList);
  connect(ui.actionQuit,         &QAction::triggered,                this, &MainWindow::close);

  connect(ui.pbImport,           &QPushButton::clicked,              this, &MainWindow::importVideos);
  connect(ui.pbRemove,           &QPushButton::clicked,              this, &MainWindow::removeSelected);
  connect(ui.pbCombine,          &QPushButton::clicked,              this, &MainWindow::combine);

  connect(ui.lwFiles,            &QListWidget::itemSelectionChanged, this, &MainWindow::updateActions);
}

void
MainWindow::setupFromOptions(options_c const &options) {
  auto p         = p_func();
  auto &settings = Util::Settings::get();
  auto &sel      = options.m_selection;

  QStringList fileNames;
  for (auto const &input : sel.m_inputs)
    fileNames << QDir::toNativeSeparators(Q(input));
  addFiles(fileNames);

  if (!sel.m_output.empty())
    p->presetOutput = QDir::toNativeSeparators(Q(sel.m_output));

  auto volume = sel.m_volume     ? *sel.m_volume
              : settings.m_volume ? *settings.m_volume
              :                     p->config.m_default_volume;

  p->ui->dsbVolume->setValue(volume);
}

void
MainWindow::setStatusBarMessage(QString const &message) {
  p_func()->ui->statusBar->showMessage(message, 5000);
}

void
MainWindow::addFiles(QStringList const &fileNames) {
  auto &ui = *p_func()->ui;

  for (auto const &fileName : fileNames)
    ui.lwFiles->addItem(fileName);

  updateActions();
}

QStringList
MainWindow::fileNames()
  const {
  auto &ui = *p_func()->ui;

  QStringList fileNames;
  for (auto row = 0, numRows = ui.lwFiles->count(); row < numRows; ++row)
    fileNames << ui.lwFiles->item(row)->text();

  return fileNames;
}

QString
MainWindow::videoFileFilter() {
  return Q("%1 (*.mkv *.mp4 *.mov *.avi *.webm);;%2 (*)").arg(QY("Video files")).arg(QY("All files"));
}

void
MainWindow::importVideos() {
  auto &settings  = Util::Settings::get();
  auto fileNames  = Util::getOpenFileNames(this, QY("Import videos"), settings.lastOpenDirPath(), videoFileFilter());

  if (fileNames.isEmpty())
    return;

  settings.m_lastOpenDir = QFileInfo{fileNames.last()}.absoluteDir();
  settings.save();

  mxdebug_if(p_func()->debug, fmt::format("importing {0} file(s)\n", fileNames.size()));

  addFiles(fileNames);
}

void
MainWindow::removeSelected() {
  auto &ui = *p_func()->ui;

  for (auto item : ui.lwFiles->selectedItems())
    delete ui.lwFiles->takeItem(ui.lwFiles->row(item));

  updateActions();
}

void
MainWindow::clearList() {
  p_func()->ui->lwFiles->clear();
  updateActions();
}

void
MainWindow::updateActions() {
  auto &ui     = *p_func()->ui;
  auto hasRows = ui.lwFiles->count() > 0;

  ui.pbRemove->setEnabled(!ui.lwFiles->selectedItems().isEmpty());
  ui.pbCombine->setEnabled(hasRows);
  ui.actionClearList->setEnabled(hasRows);
}

QString
MainWindow::requestOutputFileName() {
  auto p         = p_func();
  auto &settings = Util::Settings::get();
  auto dir       = settings.lastOutputDirPath();
  auto fileName  = QString{};

  if (!p->presetOutput.isEmpty()) {
    QFileInfo info{p->presetOutput};
    dir      = info.absolutePath();
    fileName = info.fileName();
  }

  // The combiner asks or refuses on its own unless existing files are simply overwritten.
  auto options = p->config.m_overwrite_policy == vmx::combine::overwrite_policy_e::overwrite ? QFileDialog::Options{} : QFileDialog::DontConfirmOverwrite;

  return Util::getSaveFileName(this, QY("Save combined video as"), dir, fileName, videoFileFilter(), Q("mkv"), nullptr, options);
}

bool
MainWindow::confirmOverwrite(boost::filesystem::path const &output) {
  auto answer = Util::MessageBox::question(this)
    ->title(QY("Overwrite existing file"))
    .text(QY("The output file '%1' exists already. Do you want to overwrite it?").arg(QDir::toNativeSeparators(Q(output))))
    .buttons(QMessageBox::Yes | QMessageBox::No)
    .exec(QMessageBox::No);

  return answer == QMessageBox::Yes;
}

void
MainWindow::combine() {
  auto p         = p_func();
  auto &settings = Util::Settings::get();
  auto volume    = p->ui->dsbVolume->value();

  settings.m_volume = volume;
  settings.save();

  auto outputFileName = requestOutputFileName();
  if (outputFileName.isEmpty())
    return;

  settings.m_lastOutputDir = QFileInfo{outputFileName}.absoluteDir();
  settings.save();

  vmx::combine::selection_c selection;
  selection.m_mode   = vmx::combine::invocation_mode_e::interactive;
  selection.m_output = vmx::fs::to_path(outputFileName);
  selection.m_volume = volume;

  for (auto const &fileName : fileNames())
    selection.m_inputs.emplace_back(vmx::fs::to_path(fileName));

  if (p->debug)
    selection.dump();

  vmx::combine::combiner_c combiner{p->config};
  combiner.set_confirm_overwrite([this](boost::filesystem::path const &output) { return confirmOverwrite(output); });

  setStatusBarMessage(QNY("Combining %1 file…", "Combining %1 files…", selection.m_inputs.size()).arg(selection.m_inputs.size()));

  try {
    QApplication::setOverrideCursor(Qt::WaitCursor);
    at_scope_exit_c restoreCursor{[]() { QApplication::restoreOverrideCursor(); }};

    combiner.run(selection);

  } catch (vmx::combine::processing_failed_x const &ex) {
    Util::MessageBox::critical(this)
      ->title(QY("Combining failed"))
      .text(Q(ex.what()))
      .detailedText(Q(vmx::string::join(ex.output(), "\n")))
      .exec();
    return;

  } catch (vmx::combine::exception const &ex) {
    Util::MessageBox::critical(this)->title(QY("Combining failed")).text(Q(ex.error())).exec();
    return;

  } catch (boost::filesystem::filesystem_error const &ex) {
    Util::MessageBox::critical(this)->title(QY("Combining failed")).text(Q(ex.what())).exec();
    return;
  }

  p->presetOutput = outputFileName;

  setStatusBarMessage(QY("The combined video has been written to '%1'.").arg(outputFileName));
}

void
MainWindow::displayInstallationProblems(Util::InstallationChecker::Problems const &problems) {
  if (problems.isEmpty())
    return;

  auto numProblems    = problems.size();
  auto problemsString = QString{};

  for (auto const &problem : problems) {
    auto description = QString{};

    switch (problem.first) {
      case Util::InstallationChecker::ProblemType::ToolNotFound:
        description = QY("The external tool was not found: %1").arg(problem.second);
        break;

      case Util::InstallationChecker::ProblemType::ToolCannotBeExecuted:
        description = QY("The external tool was found, but it couldn't be executed: %1").arg(problem.second);
        break;

      case Util::InstallationChecker::ProblemType::ToolVersionNotRecognized:
        description = QY("The version line reported by the external tool ('%1') could not be recognized.").arg(problem.second);
        break;
    }

    problemsString += Q("<li>%1</li>").arg(description.toHtmlEscaped());
  }

  Util::MessageBox::critical(this)
    ->title(QNY("Problem with the external tool", "Problems with the external tool", numProblems))
    .text(Q("<p>%1</p>"
            "<ul>%2</ul>"
            "<p>%3</p>")
          .arg(QNY("A problem has been detected with the external tool:", "Several problems have been detected with the external tool:", numProblems).toHtmlEscaped())
          .arg(problemsString)
          .arg(QY("Videos cannot be combined until this has been fixed.").toHtmlEscaped()))
    .exec();
}

void
MainWindow::displayToolVersion(QString const &version) {
  auto p = p_func();

  p->toolVersion = version;

  mxdebug_if(p->debug, fmt::format("external tool version {0}\n", version));
  setStatusBarMessage(QY("Using %1 version %2.").arg(Q(p->config.m_tool_executable)).arg(version));
}

void
MainWindow::closeEvent(QCloseEvent *event) {
  Util::Settings::get().m_volume = p_func()->ui->dsbVolume->value();
  Util::Settings::get().save();

  event->accept();
}

}
