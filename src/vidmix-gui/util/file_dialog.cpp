#include "common/common_pch.h"

#include <QDir>
#include <QStandardPaths>
#include <QString>

#include "common/path.h"
#include "common/qt.h"
#include "vidmix-gui/util/file_dialog.h"

namespace vmx::gui::Util {

QString
dirPath(QDir const &dir) {
  return dirPath(dir.path());
}

QString
dirPath(QString const &dir) {
  auto path = dir;

  if (path.isEmpty() || (path == Q(".")))
    path = QStandardPaths::writableLocation(QStandardPaths::MoviesLocation);

  if (path.isEmpty() || (path == Q(".")))
    path = QDir::currentPath();

  if (!QDir::toNativeSeparators(path).endsWith(QDir::separator()))
    path += Q("/");

  return QDir::fromNativeSeparators(path);
}

QString
sanitizeDirectory(QString const &directory,
                  bool withFileName) {
  auto dir     = to_utf8(directory.isEmpty() || (directory == Q(".")) ? QStandardPaths::writableLocation(QStandardPaths::MoviesLocation) : directory);
  auto oldPath = boost::filesystem::absolute(vmx::fs::to_path(dir));
  auto newPath = oldPath;
  auto ec      = boost::system::error_code{};

  while (   !boost::filesystem::is_directory(newPath, ec)
         && !newPath.parent_path().empty()
         && (newPath.parent_path() != newPath))
    newPath = newPath.parent_path();

  if (withFileName && (oldPath.filename() != "."))
    newPath /= oldPath.filename();

  return Q(newPath.string());
}

QStringList
getOpenFileNames(QWidget *parent,
                 QString const &caption,
                 QString const &dir,
                 QString const &filter,
                 QString *selectedFilter,
                 QFileDialog::Options options) {
  auto fileNames = QFileDialog::getOpenFileNames(parent, caption, sanitizeDirectory(dir, false), filter, selectedFilter, options);
  for (auto &fileName : fileNames)
    fileName = QDir::toNativeSeparators(fileName);

  return fileNames;
}

QString
getSaveFileName(QWidget *parent,
                QString const &caption,
                QString const &dir,
                QString const &defaultFileName,
                QString const &filter,
                QString const &defaultSuffix,
                QString *selectedFilter,
                QFileDialog::Options options) {
  auto defaultName = sanitizeDirectory(dir, false);
  if (!defaultFileName.isEmpty())
    defaultName = QDir::toNativeSeparators(Q(vmx::fs::to_path(defaultName) / vmx::fs::to_path(defaultFileName)));

  QFileDialog dlg{parent, caption, defaultName, filter};

  dlg.setDefaultSuffix(defaultSuffix);
  dlg.setOptions(options);
  dlg.setFileMode(QFileDialog::AnyFile);
  dlg.setAcceptMode(QFileDialog::AcceptSave);

  if (selectedFilter && !selectedFilter->isEmpty())
    dlg.selectNameFilter(*selectedFilter);

  if (dlg.exec() != QDialog::Accepted)
    return {};

  if (selectedFilter)
    *selectedFilter = dlg.selectedNameFilter();

  return QDir::toNativeSeparators(dlg.selectedFiles().value(0));
}

}
