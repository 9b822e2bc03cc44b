// Full-window front-end: paints ScreenModel snapshots and turns key presses
// into navigation commands for the session controller.
#pragma once
#include "romfetch/Frontend.hpp"

#include <QWidget>
#include <deque>

class QEventLoop;

namespace romfetchui {

class KioskWindow : public QWidget, public romfetch::Frontend {
    Q_OBJECT
public:
    explicit KioskWindow(QWidget *parent = nullptr);

    void render(const romfetch::ScreenModel &screen) override;
    bool nextCommand(std::chrono::milliseconds timeout,
                     romfetch::NavCommand &cmd) override;
    bool promptText(const std::string &prompt, std::string &out) override;

protected:
    void paintEvent(QPaintEvent *event) override;
    void keyPressEvent(QKeyEvent *event) override;
    void closeEvent(QCloseEvent *event) override;

private:
    void push(romfetch::NavCommand cmd);
    void paintMenu(QPainter &p);
    void paintProgress(QPainter &p);
    void paintFooter(QPainter &p);
    void paintNotifications(QPainter &p);

    romfetch::ScreenModel screen_;
    std::string lastProgressLabel_;
    std::deque<romfetch::NavCommand> pending_;
    QEventLoop *waitLoop_ = nullptr;
    bool closed_ = false;
};

} // namespace romfetchui
