#include "KioskWindow.hpp"
#include "LogSetup.hpp"
#include "TimeUtils.hpp"

#include <QCloseEvent>
#include <QCoreApplication>
#include <QEventLoop>
#include <QInputDialog>
#include <QKeyEvent>
#include <QLineEdit>
#include <QPainter>
#include <QTimer>
#include <algorithm>

namespace romfetchui {

namespace {

const QColor kBackground(30, 30, 30);
const QColor kText(230, 230, 230);
const QColor kHighlight(255, 200, 0);
const QColor kScrollTrack(70, 70, 70);
const QColor kProgressBg(60, 60, 60);
const QColor kProgressFill(0, 180, 90);

constexpr int kRowHeight = 50;
constexpr int kListTop = 200;
constexpr int kNoteWidth = 400;
constexpr int kNoteHeight = 80;
constexpr int kMargin = 20;

QColor notificationColor(romfetch::NotificationKind kind, int alpha) {
    QColor c;
    switch (kind) {
    case romfetch::NotificationKind::Error:
        c = QColor(180, 40, 40);
        break;
    case romfetch::NotificationKind::Success:
        c = QColor(40, 180, 80);
        break;
    case romfetch::NotificationKind::Info:
        c = QColor(40, 120, 180);
        break;
    }
    c.setAlpha(std::clamp(alpha, 0, 255));
    return c;
}

} // namespace

KioskWindow::KioskWindow(QWidget *parent) : QWidget(parent) {
    setWindowTitle(QStringLiteral("RomFetch"));
    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_OpaquePaintEvent);
    setMinimumSize(800, 600);
}

void KioskWindow::render(const romfetch::ScreenModel &screen) {
    if (screen.kind == romfetch::ScreenModel::Kind::Progress &&
        screen.progress.label != lastProgressLabel_) {
        lastProgressLabel_ = screen.progress.label;
        qCInfo(rfTransfer).noquote()
            << "Showing progress for" << QString::fromStdString(lastProgressLabel_);
    } else if (screen.kind != romfetch::ScreenModel::Kind::Progress) {
        lastProgressLabel_.clear();
    }
    screen_ = screen;
    update();
}

bool KioskWindow::nextCommand(std::chrono::milliseconds timeout,
                              romfetch::NavCommand &cmd) {
    if (pending_.empty() && timeout.count() > 0 && !closed_) {
        QEventLoop loop;
        QTimer timer;
        timer.setSingleShot(true);
        connect(&timer, &QTimer::timeout, &loop, &QEventLoop::quit);
        waitLoop_ = &loop;
        timer.start(static_cast<int>(timeout.count()));
        loop.exec();
        waitLoop_ = nullptr;
    } else {
        QCoreApplication::processEvents();
    }

    if (!pending_.empty()) {
        cmd = pending_.front();
        pending_.pop_front();
        return true;
    }
    // Once closed, every blocking wait answers Quit until the session ends.
    if (closed_ && timeout.count() > 0) {
        cmd = romfetch::NavCommand::Quit;
        return true;
    }
    return false;
}

bool KioskWindow::promptText(const std::string &prompt, std::string &out) {
    if (closed_)
        return false;
    bool ok = false;
    const QString text = QInputDialog::getText(
        this, QStringLiteral("Search"), QString::fromStdString(prompt),
        QLineEdit::Normal, QString(), &ok);
    if (!ok)
        return false;
    out = text.trimmed().toStdString();
    return true;
}

void KioskWindow::push(romfetch::NavCommand cmd) {
    pending_.push_back(cmd);
    if (waitLoop_)
        waitLoop_->quit();
}

void KioskWindow::keyPressEvent(QKeyEvent *event) {
    using romfetch::NavCommand;
    const bool repeat = event->isAutoRepeat();
    switch (event->key()) {
    case Qt::Key_Up:
    case Qt::Key_W:
        push(NavCommand::MoveUp);
        return;
    case Qt::Key_Down:
    case Qt::Key_S:
        push(NavCommand::MoveDown);
        return;
    case Qt::Key_Left:
    case Qt::Key_A:
        push(NavCommand::MoveLeft);
        return;
    case Qt::Key_Right:
    case Qt::Key_D:
        push(NavCommand::MoveRight);
        return;
    default:
        break;
    }
    // Held non-directional keys fire once.
    if (repeat) {
        event->ignore();
        return;
    }
    switch (event->key()) {
    case Qt::Key_Return:
    case Qt::Key_Enter:
    case Qt::Key_Space:
        push(NavCommand::Confirm);
        break;
    case Qt::Key_Escape:
    case Qt::Key_Backspace:
        if (screen_.kind == romfetch::ScreenModel::Kind::Progress)
            qCInfo(rfTransfer) << "Cancel requested from keyboard";
        push(NavCommand::Back);
        break;
    case Qt::Key_L:
        push(NavCommand::ToggleMultiSelect);
        break;
    case Qt::Key_R:
        push(NavCommand::StartBatch);
        break;
    case Qt::Key_Q:
        push(NavCommand::Quit);
        break;
    default:
        QWidget::keyPressEvent(event);
        break;
    }
}

void KioskWindow::closeEvent(QCloseEvent *event) {
    if (closed_) {
        event->accept();
        return;
    }
    // The window stays up until the controller has wound down.
    closed_ = true;
    qCInfo(rfUi) << "Window close requested";
    push(romfetch::NavCommand::Quit);
    event->ignore();
}

void KioskWindow::paintEvent(QPaintEvent *) {
    QPainter p(this);
    p.setRenderHint(QPainter::Antialiasing);
    p.fillRect(rect(), kBackground);

    QFont f = font();
    f.setPointSize(18);
    p.setFont(f);

    switch (screen_.kind) {
    case romfetch::ScreenModel::Kind::Menu:
        paintMenu(p);
        break;
    case romfetch::ScreenModel::Kind::Progress:
        paintProgress(p);
        break;
    case romfetch::ScreenModel::Kind::Message:
        break;
    }
    paintFooter(p);
    paintNotifications(p);
}

void KioskWindow::paintMenu(QPainter &p) {
    const romfetch::MenuView &m = screen_.menu;
    p.setPen(kText);
    p.drawText(QRect(0, 70, width(), 60), Qt::AlignCenter,
               QString::fromStdString(m.title));

    const std::size_t end =
        std::min(m.options.size(), m.scrollOffset + m.visibleRows);
    for (std::size_t i = m.scrollOffset; i < end; ++i) {
        const int y = kListTop + static_cast<int>(i - m.scrollOffset) * kRowHeight;
        QString text = QString::fromStdString(m.options[i]);
        if (i < m.marked.size() && m.marked[i])
            text.prepend(QStringLiteral("[x] "));
        const QRect row(100, y - 20, width() - 200, 40);
        if (i == m.selected) {
            p.fillRect(row, kHighlight);
            p.setPen(kBackground);
        } else {
            p.setPen(kText);
        }
        p.drawText(row, Qt::AlignCenter, text);
    }

    // Fixed-length thumb that steps once per item.
    if (m.options.size() > 1) {
        const QRect track(width() - 40, kListTop, 20, height() - 400);
        p.fillRect(track, kScrollTrack);
        const int thumb = std::max(60, std::min(200, track.height() / 4));
        const double step = double(track.height() - thumb) /
                            double(std::max<std::size_t>(1, m.options.size() - 1));
        const int thumbY = track.y() + int(step * double(m.selected));
        p.fillRect(QRect(track.x(), thumbY, track.width(), thumb), kHighlight);
    }
}

void KioskWindow::paintProgress(QPainter &p) {
    const romfetch::ProgressView &v = screen_.progress;
    const QString name = QString::fromStdString(v.label);
    const QString title =
        v.total > 0 ? QStringLiteral("Downloading %1/%2: %3")
                          .arg(v.index)
                          .arg(v.total)
                          .arg(name)
                    : QStringLiteral("Downloading: %1").arg(name);
    p.setPen(kText);
    p.drawText(QRect(0, 70, width(), 60), Qt::AlignCenter, title);

    const QRect bar(100, 300, width() - 200, 50);
    p.fillRect(bar, kProgressBg);
    const double frac = std::clamp(v.fraction, 0.0, 1.0);
    p.fillRect(QRect(bar.x(), bar.y(), int(bar.width() * frac), bar.height()),
               kProgressFill);

    const QString stats = QStringLiteral("%1% | %2 | ETA %3")
                              .arg(frac * 100.0, 0, 'f', 1)
                              .arg(formatSpeed(v.speed))
                              .arg(formatEta(v.eta));
    p.drawText(QRect(0, 370, width(), 50), Qt::AlignCenter, stats);
    if (v.totalBytes > 0) {
        p.drawText(QRect(0, 420, width(), 40), Qt::AlignCenter,
                   QStringLiteral("%1 of %2")
                       .arg(formatBytes(v.bytesRead))
                       .arg(formatBytes(v.totalBytes)));
    }
}

void KioskWindow::paintFooter(QPainter &p) {
    if (screen_.footer.empty())
        return;
    QFont f = p.font();
    f.setPointSize(12);
    p.save();
    p.setFont(f);
    p.setPen(kText);
    const QRect area = screen_.kind == romfetch::ScreenModel::Kind::Message
                           ? rect()
                           : QRect(0, height() - 75, width(), 50);
    p.drawText(area, Qt::AlignCenter | Qt::TextWordWrap,
               QString::fromStdString(screen_.footer));
    p.restore();
}

void KioskWindow::paintNotifications(QPainter &p) {
    QFont f = p.font();
    f.setPointSize(12);
    p.save();
    p.setFont(f);
    int y = kMargin;
    for (const auto &n : screen_.notifications) {
        const QRect box(width() - kNoteWidth - kMargin, y, kNoteWidth, kNoteHeight);
        p.setPen(Qt::NoPen);
        p.setBrush(notificationColor(n.kind, n.alpha));
        p.drawRoundedRect(box, 8, 8);
        QColor textColor(255, 255, 255, std::clamp(n.alpha, 0, 255));
        p.setPen(textColor);
        p.drawText(box.adjusted(12, 8, -12, -8),
                   Qt::AlignVCenter | Qt::AlignLeft | Qt::TextWordWrap,
                   QString::fromStdString(n.message));
        y += kNoteHeight + 10;
    }
    p.restore();
}

} // namespace romfetchui
