#include "app/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QStandardPaths>
#include <QtGlobal>

namespace daybook::app {
namespace {

// A log larger than this is moved aside to daybook.log.1 when opened.
constexpr qint64 kMaxLogBytes = 4 * 1024 * 1024;

QString compute_log_file_path() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString{};
    }
    return QDir(base).filePath(QStringLiteral("logs/daybook.log"));
}

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QString path;
    bool initialized = false;
    QtMessageHandler previous = nullptr;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void rotate_if_large(const QString& path) {
    QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogBytes) return;
    const auto rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void ensure_open(LoggerState& s) {
    if (s.initialized) return;
    s.initialized = true;

    if (s.path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(s.path).absolutePath());
    dir.mkpath(QStringLiteral("."));
    rotate_if_large(s.path);

    s.file.setFileName(s.path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        s.path.clear();
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QtMessageHandler previous = nullptr;
    {
        QMutexLocker lock(&s.mu);
        ensure_open(s);

        const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
        const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QStringLiteral("");
        const auto line = QStringLiteral("%1 %2 %3 %4\n")
                              .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

        if (s.file.isOpen()) {
            s.file.write(line.toUtf8());
            s.file.flush();
        }
        previous = s.previous;
    }
    if (previous) {
        previous(type, ctx, msg);
    }
}

} // namespace

void install_file_logging() {
    install_file_logging(compute_log_file_path());
}

void install_file_logging(const QString& path) {
    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        if (s.file.isOpen()) {
            s.file.close();
        }
        s.path = path;
        s.initialized = false;
    }
    // The handler stamps time and level itself.
    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    auto previous = qInstallMessageHandler(message_handler);
    if (previous != message_handler) {
        QMutexLocker lock(&s.mu);
        s.previous = previous;
    }
}

void uninstall_file_logging() {
    auto& s = state();
    QMutexLocker lock(&s.mu);
    qInstallMessageHandler(s.previous);
    s.previous = nullptr;
    if (s.file.isOpen()) {
        s.file.close();
    }
    s.initialized = false;
}

QString default_log_file_path() {
    return compute_log_file_path();
}

} // namespace daybook::app
