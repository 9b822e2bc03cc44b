// Modal alerts used outside the kiosk screen: startup failures and host key
// confirmation.
#pragma once

#include <QMessageBox>

class QString;
class QWidget;

namespace UiAlerts {
void configure(QMessageBox &box,
               Qt::WindowModality modality = Qt::ApplicationModal);

QMessageBox::StandardButton
show(QWidget *parent, QMessageBox::Icon icon, const QString &title,
     const QString &text,
     QMessageBox::StandardButtons buttons = QMessageBox::Ok,
     QMessageBox::StandardButton defaultButton = QMessageBox::NoButton);

QMessageBox::StandardButton
critical(QWidget *parent, const QString &title, const QString &text);

// Yes/No, defaulting to No.
bool confirm(QWidget *parent, const QString &title, const QString &text);
} // namespace UiAlerts
