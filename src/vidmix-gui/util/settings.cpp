#include "common/common_pch.h"

#include <QSettings>

#include "common/qt.h"
#include "combine/config.h"
#include "vidmix-gui/util/file_dialog.h"
#include "vidmix-gui/util/settings.h"

namespace vmx::gui::Util {

static auto const s_grpGui           = Q("gui");
static auto const s_valLastOpenDir   = Q("lastOpenDir");
static auto const s_valLastOutputDir = Q("lastOutputDir");
static auto const s_valVolume        = Q("volume");

Settings Settings::s_settings;
QString Settings::s_iniFileName;

Settings &
Settings::get() {
  return s_settings;
}

void
Settings::setIniFileName(QString const &fileName) {
  s_iniFileName = fileName;
}

QString
Settings::iniFileName() {
  if (!s_iniFileName.isEmpty())
    return s_iniFileName;

  return to_qs(vmx::combine::config_c::default_file_name());
}

std::unique_ptr<QSettings>
Settings::registry() {
  auto reg = std::make_unique<QSettings>(iniFileName(), QSettings::IniFormat);
  return reg;
}

void
Settings::load() {
  auto regPtr = registry();
  auto &reg   = *regPtr;

  reg.beginGroup(s_grpGui);

  m_lastOpenDir   = QDir{reg.value(s_valLastOpenDir).toString()};
  m_lastOutputDir = QDir{reg.value(s_valLastOutputDir).toString()};

  auto ok     = false;
  auto volume = reg.value(s_valVolume).toDouble(&ok);
  if (ok && (volume >= 0))
    m_volume = volume;

  reg.endGroup();
}

void
Settings::save()
  const {
  auto regPtr = registry();
  auto &reg   = *regPtr;

  reg.beginGroup(s_grpGui);

  reg.setValue(s_valLastOpenDir,   m_lastOpenDir.path());
  reg.setValue(s_valLastOutputDir, m_lastOutputDir.path());
  if (m_volume)
    reg.setValue(s_valVolume, *m_volume);

  reg.endGroup();
}

QString
Settings::lastOpenDirPath()
  const {
  return Util::dirPath(m_lastOpenDir);
}

QString
Settings::lastOutputDirPath()
  const {
  return Util::dirPath(m_lastOutputDir);
}

}
