#include "UiAlerts.hpp"

namespace UiAlerts {
namespace {
QMessageBox::StandardButton
resolveDefaultButton(QMessageBox::StandardButtons buttons,
                     QMessageBox::StandardButton requested) {
    if (requested != QMessageBox::NoButton && buttons.testFlag(requested))
        return requested;
    if (buttons.testFlag(QMessageBox::No))
        return QMessageBox::No;
    if (buttons.testFlag(QMessageBox::Ok))
        return QMessageBox::Ok;
    return QMessageBox::NoButton;
}
} // namespace

void configure(QMessageBox &box, Qt::WindowModality modality) {
    box.setTextFormat(Qt::PlainText);
    box.setWindowModality(modality);
}

QMessageBox::StandardButton
show(QWidget *parent, QMessageBox::Icon icon, const QString &title,
     const QString &text, QMessageBox::StandardButtons buttons,
     QMessageBox::StandardButton defaultButton) {
    QMessageBox box(parent);
    configure(box);
    box.setIcon(icon);
    box.setWindowTitle(title);
    box.setText(text);
    box.setStandardButtons(buttons);

    const auto resolvedDefault = resolveDefaultButton(buttons, defaultButton);
    if (resolvedDefault != QMessageBox::NoButton)
        box.setDefaultButton(resolvedDefault);

    return static_cast<QMessageBox::StandardButton>(box.exec());
}

QMessageBox::StandardButton
critical(QWidget *parent, const QString &title, const QString &text) {
    return show(parent, QMessageBox::Critical, title, text);
}

bool confirm(QWidget *parent, const QString &title, const QString &text) {
    return show(parent, QMessageBox::Question, title, text,
                QMessageBox::Yes | QMessageBox::No,
                QMessageBox::No) == QMessageBox::Yes;
}
} // namespace UiAlerts
