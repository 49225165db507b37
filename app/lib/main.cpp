#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QSocketNotifier>
#include <QStandardPaths>
#include <QThread>
#include <QTimer>

#include <csignal>
#include <iostream>
#include <memory>
#include <sys/socket.h>
#include <unistd.h>

#include "AppLogger.hpp"
#include "ConfigLoader.hpp"
#include "EngineEventChannel.hpp"
#include "OrganizerEngine.hpp"

namespace {

int signal_fds[2] = {-1, -1};

void unix_signal_handler(int signal_number) {
    const char code = static_cast<char>(signal_number);
    // Only async-signal-safe calls here; the event loop does the rest.
    ssize_t written = ::write(signal_fds[0], &code, sizeof(code));
    (void)written;
}

bool install_signal_handlers() {
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, signal_fds) != 0) {
        return false;
    }
    struct sigaction action = {};
    action.sa_handler = unix_signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0
        && ::sigaction(SIGTERM, &action, nullptr) == 0
        && ::sigaction(SIGHUP, &action, nullptr) == 0;
}

void qt_message_router(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    const QString component = context.category && qstrcmp(context.category, "default") != 0
        ? QString::fromLatin1(context.category) : QString("Qt");
    switch (type) {
        case QtDebugMsg:    LOG_DEBUG(component, msg); break;
        case QtInfoMsg:     LOG_INFO(component, msg); break;
        case QtWarningMsg:  LOG_WARN(component, msg); break;
        case QtCriticalMsg: LOG_ERROR(component, msg); break;
        case QtFatalMsg:    LOG_CRITICAL(component, msg); break;
    }
}

void apply_log_settings(const EngineConfig& config, const QString& level_override) {
    LogSeverity severity = LogSeverity::Info;
    const QString level = level_override.isEmpty() ? config.log_level : level_override;
    if (!AppLogger::parse_severity(level, severity)) {
        LOG_WARN("Main", QString("Unknown log level '%1', using info").arg(level));
    }
    AppLogger::instance().set_minimum_severity(severity);
    if (AppLogger::instance().log_file_path() != (config.log_file.isEmpty() ? AppLogger::default_log_path()
                                                                            : config.log_file)) {
        AppLogger::instance().set_log_file(config.log_file);
    }
}

QString describe(const EngineNotification& n) {
    QString text = QString("%1: %2").arg(notification_kind_name(n.kind), n.message);
    if (n.decision.id > 0) {
        text += QString(" [decision #%1]").arg(n.decision.id);
    }
    return text;
}

} // namespace

// Owns the engine and the two drain threads for the daemon's lifetime.
class SorterDaemon : public QObject {
    Q_OBJECT

public:
    SorterDaemon(const QString& config_path, const EngineConfig& config, const QString& level_override,
                 bool run_once, QObject* parent = nullptr)
        : QObject(parent)
        , config_path_(config_path)
        , level_override_(level_override)
        , run_once_(run_once)
        , channel_(config.notification_capacity, config.move_record_capacity)
        , engine_(config, channel_) {

        record_drain_.reset(QThread::create([this]() {
            MoveRecord record;
            while (channel_.wait_move_record(record)) {
                LOG_INFO("Stats", QString("%1 | %2 -> %3 | %4%5")
                         .arg(record.is_folder ? QString("folder") : QString("file"),
                              record.source_path, record.destination_path, record.category,
                              record.subcategory.isEmpty() ? QString() : "/" + record.subcategory));
            }
        }));
        notification_drain_.reset(QThread::create([this]() {
            EngineNotification notification;
            while (channel_.wait_notification(notification)) {
                if (notification.error == EngineError::None) {
                    LOG_DEBUG("Events", describe(notification));
                } else {
                    LOG_WARN("Events", describe(notification));
                }
            }
        }));
        record_drain_->start();
        notification_drain_->start();

        if (signal_fds[1] >= 0) {
            signal_notifier_ = new QSocketNotifier(signal_fds[1], QSocketNotifier::Read, this);
            connect(signal_notifier_, &QSocketNotifier::activated, this, &SorterDaemon::on_signal);
        }

        if (run_once_) {
            connect(&engine_, &OrganizerEngine::became_idle, this, [this]() {
                LOG_INFO("Main", "All entries settled, exiting (--once)");
                QTimer::singleShot(0, qApp, &QCoreApplication::quit);
            });
        }
    }

    ~SorterDaemon() override {
        engine_.stop();
        channel_.close();
        record_drain_->wait();
        notification_drain_->wait();
    }

    void start() {
        engine_.start();
    }

private slots:
    void on_signal() {
        char code = 0;
        if (::read(signal_fds[1], &code, sizeof(code)) != sizeof(code)) {
            return;
        }
        if (code == SIGHUP) {
            reload();
            return;
        }
        LOG_INFO("Main", QString("Signal %1 received, shutting down").arg(static_cast<int>(code)));
        engine_.stop();
        QCoreApplication::quit();
    }

private:
    void reload() {
        EngineConfig config;
        QString error_message;
        QStringList warnings;
        if (!ConfigLoader::load_file(config_path_, config, error_message, &warnings)) {
            LOG_ERROR("Config", QString("Reload failed, keeping the current rules: %1").arg(error_message));
            return;
        }
        apply_log_settings(config, level_override_);
        engine_.reload(config);
    }

    QString config_path_;
    QString level_override_;
    bool run_once_;
    EngineEventChannel channel_;
    OrganizerEngine engine_;
    std::unique_ptr<QThread> record_drain_;
    std::unique_ptr<QThread> notification_drain_;
    QSocketNotifier* signal_notifier_ = nullptr;
};

int main(int argc, char* argv[]) {
    QCoreApplication qt_app(argc, argv);

    qt_app.setApplicationName("AutoSorter");
    qt_app.setApplicationVersion("1.0.0");
    qt_app.setOrganizationName("AutoSorter");

    QCommandLineParser parser;
    parser.setApplicationDescription("Sorts files dropped into watched folders into category folders.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption config_option(QStringList() << "c" << "config",
                                     "Configuration file (JSON).", "file");
    QCommandLineOption level_option("log-level", "trace, debug, info, warning, error or critical.", "level");
    QCommandLineOption once_option("once", "Sort what is there now, wait for it to settle, then exit.");
    parser.addOption(config_option);
    parser.addOption(level_option);
    parser.addOption(once_option);
    parser.process(qt_app);

    // Remember the last configuration so the daemon can start without arguments
    QSettings settings("AutoSorter", "AutoSorter");
    QString config_path = parser.value(config_option);
    if (config_path.isEmpty()) {
        config_path = settings.value("lastConfig").toString();
    }
    if (config_path.isEmpty()) {
        config_path = QDir(QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation))
                          .filePath("config.json");
    }

    EngineConfig config;
    QString error_message;
    QStringList warnings;
    if (!ConfigLoader::load_file(config_path, config, error_message, &warnings)) {
        std::cerr << "auto_sorter: " << error_message.toStdString() << std::endl;
        return 1;
    }
    settings.setValue("lastConfig", QFileInfo(config_path).absoluteFilePath());

    const QString level_override = parser.value(level_option);
    LogSeverity ignored_level;
    if (!level_override.isEmpty() && !AppLogger::parse_severity(level_override, ignored_level)) {
        std::cerr << "auto_sorter: unknown log level " << level_override.toStdString() << std::endl;
        return 1;
    }
    apply_log_settings(config, level_override);
    qInstallMessageHandler(qt_message_router);
    LOG_INFO("Main", QString("AutoSorter %1 started with %2").arg(qt_app.applicationVersion(), config_path));

    if (!install_signal_handlers()) {
        LOG_WARN("Main", "Signal handlers not installed, use the default terminate behaviour");
    }

    int exit_code = 0;
    {
        SorterDaemon daemon(config_path, config, level_override, parser.isSet(once_option));
        daemon.start();
        exit_code = qt_app.exec();
    }

    LOG_INFO("Main", "Application exiting");
    return exit_code;
}

#include "main.moc"
