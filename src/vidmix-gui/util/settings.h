#pragma once

#include "common/common_pch.h"

#include <QDir>
#include <QString>

class QSettings;

namespace vmx::gui::Util {

class Settings {
public:
  QDir m_lastOpenDir, m_lastOutputDir;
  std::optional<double> m_volume;

protected:
  static Settings s_settings;
  static QString s_iniFileName;

public:
  void load();
  void save() const;

  QString lastOpenDirPath() const;
  QString lastOutputDirPath() const;

public:
  static Settings &get();
  static std::unique_ptr<QSettings> registry();

  static void setIniFileName(QString const &fileName);
  static QString iniFileName();
};

}
