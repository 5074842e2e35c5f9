#include "common/common_pch.h"

#include <QDialogButtonBox>
#include <QMessageBox>
#include <QPushButton>

#include "common/qt.h"
#include "vidmix-gui/util/message_box.h"

namespace vmx::gui::Util {

class MessageBoxPrivate {
  friend class MessageBox;

  QWidget *m_parent{};
  QString m_title, m_text, m_detailedText;
  QMessageBox::Icon m_icon{QMessageBox::NoIcon};
  QMessageBox::StandardButtons m_buttons{QMessageBox::Ok};
  QMessageBox::StandardButton m_defaultButton{QMessageBox::Ok};

  explicit MessageBoxPrivate(QWidget *parent)
    : m_parent{parent}
  {
  }
};

MessageBox::MessageBox(QWidget *parent)
  : p_ptr{new MessageBoxPrivate{parent}}
{
}

MessageBox::~MessageBox() {
}

MessageBox &
MessageBox::buttons(QMessageBox::StandardButtons pButtons) {
  p_func()->m_buttons = pButtons;
  return *this;
}

MessageBox &
MessageBox::defaultButton(QMessageBox::StandardButton pDefaultButton) {
  p_func()->m_defaultButton = pDefaultButton;
  return *this;
}

MessageBox &
MessageBox::icon(QMessageBox::Icon pIcon) {
  p_func()->m_icon = pIcon;
  return *this;
}

MessageBox &
MessageBox::text(QString const &pText) {
  p_func()->m_text = pText;
  return *this;
}

MessageBox &
MessageBox::detailedText(QString const &pDetailedText) {
  p_func()->m_detailedText = pDetailedText;
  return *this;
}

MessageBox &
MessageBox::title(QString const &pTitle) {
  p_func()->m_title = pTitle;
  return *this;
}

MessageBoxPtr
MessageBox::question(QWidget *parent) {
  auto box = std::make_shared<MessageBox>(parent);
  box->buttons(QMessageBox::StandardButtons{ QMessageBox::Yes | QMessageBox::No })
    .defaultButton(QMessageBox::No)
    .icon(QMessageBox::Question);
  return box;
}

MessageBoxPtr
MessageBox::information(QWidget *parent) {
  auto box = std::make_shared<MessageBox>(parent);
  box->buttons(QMessageBox::Ok)
    .defaultButton(QMessageBox::NoButton)
    .icon(QMessageBox::Information);
  return box;
}

MessageBoxPtr
MessageBox::warning(QWidget *parent) {
  auto box = std::make_shared<MessageBox>(parent);
  box->buttons(QMessageBox::Ok)
    .defaultButton(QMessageBox::NoButton)
    .icon(QMessageBox::Warning);
  return box;
}

MessageBoxPtr
MessageBox::critical(QWidget *parent) {
  auto box = std::make_shared<MessageBox>(parent);
  box->buttons(QMessageBox::Ok)
    .defaultButton(QMessageBox::NoButton)
    .icon(QMessageBox::Critical);
  return box;
}

QMessageBox::StandardButton
MessageBox::exec(std::optional<QMessageBox::StandardButton> pDefaultButton) {
  auto p = p_func();

  if (pDefaultButton)
    p->m_defaultButton = *pDefaultButton;

  QMessageBox msgBox{p->m_icon, p->m_title, p->m_text, p->m_buttons, p->m_parent};

  if (p->m_defaultButton != QMessageBox::NoButton)
    msgBox.setDefaultButton(p->m_defaultButton);

  if (!p->m_detailedText.isEmpty())
    msgBox.setDetailedText(p->m_detailedText);

  // Force labels the user can select no matter what the current style
  // sheet says.
  msgBox.setTextInteractionFlags(Qt::TextBrowserInteraction);

  if (msgBox.exec() == -1)
    return QMessageBox::Cancel;

  return msgBox.standardButton(msgBox.clickedButton());
}

}
