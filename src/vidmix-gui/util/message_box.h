#pragma once

#include "common/common_pch.h"

#include <QMessageBox>

namespace vmx::gui::Util {

class MessageBox;
class MessageBoxPrivate;

using MessageBoxPtr = std::shared_ptr<MessageBox>;

class MessageBox {
protected:
  VMX_DECLARE_PRIVATE(MessageBoxPrivate)

  std::unique_ptr<MessageBoxPrivate> const p_ptr;

public:
  MessageBox(QWidget *parent);
  virtual ~MessageBox();

  MessageBox &buttons(QMessageBox::StandardButtons pButtons);
  MessageBox &defaultButton(QMessageBox::StandardButton pDefaultButton);
  MessageBox &icon(QMessageBox::Icon pIcon);
  MessageBox &text(QString const &pText);
  MessageBox &detailedText(QString const &pDetailedText);
  MessageBox &title(QString const &pTitle);

  QMessageBox::StandardButton exec(std::optional<QMessageBox::StandardButton> pDefaultButton = std::nullopt);

public:
  static MessageBoxPtr question(QWidget *parent);
  static MessageBoxPtr information(QWidget *parent);
  static MessageBoxPtr warning(QWidget *parent);
  static MessageBoxPtr critical(QWidget *parent);

private:
  Q_DISABLE_COPY(MessageBox);
};

}
