#ifndef APP_LOGGER_HPP
#define APP_LOGGER_HPP

#include <QFile>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QTextStream>

enum class LogSeverity {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

// Process-wide log. Lines look like
//   [2024-05-01 10:00:00.123] [INFO] [Mover] Moved a.pdf -> /x/Documents/PDF/a.pdf
// and go to an append-mode file (rotated by size), optionally to stderr, and
// into a bounded in-memory ring. Safe to call from any thread.
class AppLogger {
public:
    static AppLogger& instance();

    // Opens (or switches to) the log file; an empty path selects the default location.
    bool set_log_file(const QString& path);
    QString log_file_path() const;
    static QString default_log_path();

    // When the file grows past max_bytes it is renamed to "<name>.1" (older
    // backups shift up to keep_files) and a fresh file is started.
    void set_rotation(qint64 max_bytes, int keep_files);

    void set_minimum_severity(LogSeverity sev);
    LogSeverity minimum_severity() const;
    void set_console_output(bool enabled);

    static bool parse_severity(const QString& text, LogSeverity& out);
    static QString severity_label(LogSeverity sev);

    void log(LogSeverity sev, const QString& component, const QString& msg);
    QStringList recent_entries(int count) const;

private:
    AppLogger();
    ~AppLogger();
    AppLogger(const AppLogger&) = delete;
    AppLogger& operator=(const AppLogger&) = delete;

    bool open_locked(const QString& path);
    void rotate_locked();

    QFile log_file_;
    QTextStream log_stream_;
    LogSeverity min_severity_ = LogSeverity::Info;
    bool console_enabled_ = true;
    qint64 max_file_bytes_ = 10 * 1024 * 1024;
    int keep_files_ = 3;
    mutable QMutex mutex_;
    QStringList recent_;
    static constexpr int kRecentMax = 500;
};

#define LOG_TRACE(comp, msg) AppLogger::instance().log(LogSeverity::Trace, comp, msg)
#define LOG_DEBUG(comp, msg) AppLogger::instance().log(LogSeverity::Debug, comp, msg)
#define LOG_INFO(comp, msg) AppLogger::instance().log(LogSeverity::Info, comp, msg)
#define LOG_WARN(comp, msg) AppLogger::instance().log(LogSeverity::Warning, comp, msg)
#define LOG_ERROR(comp, msg) AppLogger::instance().log(LogSeverity::Error, comp, msg)
#define LOG_CRITICAL(comp, msg) AppLogger::instance().log(LogSeverity::Critical, comp, msg)

#endif // APP_LOGGER_HPP
