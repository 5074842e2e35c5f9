#pragma once

#include "common/common_pch.h"

#include <QApplication>

class options_c;

namespace vmx::gui {

class App : public QApplication {
  Q_OBJECT

protected:
  options_c const &m_options;

public:
  App(int &argc, char **argv, options_c const &options);
  virtual ~App();

  int run();

public Q_SLOTS:
  void saveSettings() const;

public:
  static void registerMetaTypes();
};

// Opens the main window pre-populated from the given options and runs the
// event loop until it is closed. Returns the event loop's exit code.
int run(int &argc, char **argv, options_c const &options);

}
