#include "AppLogger.hpp"
#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <iostream>

AppLogger& AppLogger::instance() {
    static AppLogger logger_instance;
    return logger_instance;
}

AppLogger::AppLogger() = default;

AppLogger::~AppLogger() {
    if (log_file_.isOpen()) {
        log_stream_.flush();
        log_file_.close();
    }
}

QString AppLogger::default_log_path() {
    QDir dir(QStandardPaths::writableLocation(QStandardPaths::AppDataLocation));
    if (!dir.exists()) {
        dir.mkpath(".");
    }
    return dir.filePath("auto_sorter.log");
}

bool AppLogger::set_log_file(const QString& path) {
    QMutexLocker locker(&mutex_);
    if (!open_locked(path.isEmpty() ? default_log_path() : path)) {
        return false;
    }
    log_stream_ << QString("=== Log session started at %1 ===")
                       .arg(QDateTime::currentDateTime().toString(Qt::ISODate)) << "\n";
    log_stream_.flush();
    return true;
}

bool AppLogger::open_locked(const QString& path) {
    if (log_file_.isOpen()) {
        log_stream_.flush();
        log_stream_.setDevice(nullptr);
        log_file_.close();
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    log_file_.setFileName(path);
    if (!log_file_.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::cerr << "Cannot open log file " << path.toStdString() << ": "
                  << log_file_.errorString().toStdString() << std::endl;
        return false;
    }
    log_stream_.setDevice(&log_file_);
    return true;
}

void AppLogger::rotate_locked() {
    const QString path = log_file_.fileName();
    log_stream_.flush();
    log_stream_.setDevice(nullptr);
    log_file_.close();

    QFile::remove(QString("%1.%2").arg(path).arg(keep_files_));
    for (int i = keep_files_ - 1; i >= 1; --i) {
        QFile::rename(QString("%1.%2").arg(path).arg(i), QString("%1.%2").arg(path).arg(i + 1));
    }
    if (keep_files_ > 0) {
        QFile::rename(path, path + ".1");
    } else {
        QFile::remove(path);
    }
    open_locked(path);
}

void AppLogger::set_rotation(qint64 max_bytes, int keep_files) {
    QMutexLocker locker(&mutex_);
    max_file_bytes_ = max_bytes;
    keep_files_ = keep_files < 0 ? 0 : keep_files;
}

QString AppLogger::log_file_path() const {
    QMutexLocker locker(&mutex_);
    return log_file_.fileName();
}

void AppLogger::set_minimum_severity(LogSeverity sev) {
    QMutexLocker locker(&mutex_);
    min_severity_ = sev;
}

LogSeverity AppLogger::minimum_severity() const {
    QMutexLocker locker(&mutex_);
    return min_severity_;
}

void AppLogger::set_console_output(bool enabled) {
    QMutexLocker locker(&mutex_);
    console_enabled_ = enabled;
}

bool AppLogger::parse_severity(const QString& text, LogSeverity& out) {
    const QString key = text.trimmed().toLower();
    if (key == "trace")                       { out = LogSeverity::Trace;    return true; }
    if (key == "debug")                       { out = LogSeverity::Debug;    return true; }
    if (key == "info")                        { out = LogSeverity::Info;     return true; }
    if (key == "warn" || key == "warning")    { out = LogSeverity::Warning;  return true; }
    if (key == "error")                       { out = LogSeverity::Error;    return true; }
    if (key == "crit" || key == "critical")   { out = LogSeverity::Critical; return true; }
    return false;
}

QString AppLogger::severity_label(LogSeverity sev) {
    switch (sev) {
        case LogSeverity::Trace:    return "TRACE";
        case LogSeverity::Debug:    return "DEBUG";
        case LogSeverity::Info:     return "INFO";
        case LogSeverity::Warning:  return "WARN";
        case LogSeverity::Error:    return "ERROR";
        case LogSeverity::Critical: return "CRIT";
        default:                    return "???";
    }
}

void AppLogger::log(LogSeverity sev, const QString& component, const QString& msg) {
    QMutexLocker locker(&mutex_);
    if (sev < min_severity_) {
        return;
    }

    const QString entry = QString("[%1] [%2] [%3] %4")
                              .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz"),
                                   severity_label(sev), component, msg);

    if (log_stream_.device()) {
        log_stream_ << entry << "\n";
        log_stream_.flush();
        if (max_file_bytes_ > 0 && log_file_.size() > max_file_bytes_) {
            rotate_locked();
        }
    }

    recent_.append(entry);
    while (recent_.size() > kRecentMax) {
        recent_.removeFirst();
    }

    if (console_enabled_) {
        std::cerr << entry.toStdString() << std::endl;
    }
}

QStringList AppLogger::recent_entries(int count) const {
    QMutexLocker locker(&mutex_);
    if (count >= recent_.size()) {
        return recent_;
    }
    return recent_.mid(recent_.size() - count);
}
