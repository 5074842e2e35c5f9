#include "common/common_pch.h"

#include "common/qt.h"
#include "vidmix/options.h"
#include "vidmix-gui/app.h"
#include "vidmix-gui/main_window/main_window.h"
#include "vidmix-gui/util/installation_checker.h"
#include "vidmix-gui/util/settings.h"

namespace vmx::gui {

App::App(int &argc,
         char **argv,
         options_c const &options)
  : QApplication{argc, argv}
  , m_options{options}
{
  if (!options.m_config_file_name.empty())
    Util::Settings::setIniFileName(Q(options.m_config_file_name));

  Util::Settings::get().load();

  QObject::connect(this, &App::aboutToQuit, this, &App::saveSettings);
}

App::~App() {
}

void
App::registerMetaTypes() {
  qRegisterMetaType<Util::InstallationChecker::Problems>("Util::InstallationChecker::Problems");
}

void
App::saveSettings()
  const {
  Util::Settings::get().save();
}

int
App::run() {
  MainWindow mainWindow{m_options};
  mainWindow.show();

  return exec();
}

int
run(int &argc,
    char **argv,
    options_c const &options) {
  App::registerMetaTypes();

  auto app = std::make_unique<App>(argc, argv, options);

  return app->run();
}

}
