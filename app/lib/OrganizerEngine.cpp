#include "OrganizerEngine.hpp"
#include "AppLogger.hpp"
#include "CooldownScheduler.hpp"
#include "DatabaseManager.hpp"
#include "FilesystemWatcher.hpp"
#include "RuleTree.hpp"
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QMetaObject>
#include <QThread>
#include <exception>

OrganizerEngine::OrganizerEngine(const EngineConfig& config, EngineEventChannel& channel, QObject* parent)
    : QObject(parent)
    , config_(config)
    , channel_(channel)
    , ignore_set_(config.ignore_list)
    , classifier_(config.rules ? config.rules : RuleTree::default_tree(),
                  config.folder_mode, config.sample_cap, &ignore_set_, config.transient_suffixes)
    , database_(std::make_unique<DatabaseManager>(config.database_path))
    , watcher_(new FilesystemWatcher(&ignore_set_, this))
    , cooldown_(new CooldownScheduler(config.cooldown_ms, config.transient_suffixes, this)) {
    qRegisterMetaType<FsEvent>("FsEvent");
    qRegisterMetaType<MoveRecord>("MoveRecord");
    qRegisterMetaType<Decision>("Decision");

    if (!database_->initialize()) {
        LOG_WARN("Database", QString("Cannot open %1, decisions will not survive a restart")
                 .arg(database_->database_path()));
        database_.reset();
    }
    decision_log_ = std::make_unique<DecisionLog>(ignore_set_, executor_, database_.get(),
                                                  config.decision_retention);
    decision_log_->load();

    for (const Decision& decision : decision_log_->recent()) {
        if (decision.state == DecisionState::UndoneByUser && QFileInfo::exists(decision.original_path)) {
            restored_paths_.insert(decision.original_path);
        }
    }

    pool_.setMaxThreadCount(config.worker_threads > 0 ? config.worker_threads
                                                      : QThread::idealThreadCount());

    connect(watcher_, &FilesystemWatcher::event_ready, this, &OrganizerEngine::on_watch_event);
    connect(watcher_, &FilesystemWatcher::root_degraded, this, &OrganizerEngine::on_root_degraded);
    connect(watcher_, &FilesystemWatcher::root_recovered, this, &OrganizerEngine::on_root_recovered);
    connect(cooldown_, &CooldownScheduler::path_settled, this, &OrganizerEngine::on_path_settled);
    connect(cooldown_, &CooldownScheduler::path_cancelled, this, &OrganizerEngine::on_path_cancelled);
}

OrganizerEngine::~OrganizerEngine() {
    stop();
    pool_.waitForDone();
}

void OrganizerEngine::start() {
    if (running_) {
        return;
    }
    running_ = true;
    paused_ = false;
    stopping_.storeRelaxed(0);
    LOG_INFO("Engine", QString("Starting: %1 root(s), cooldown %2 ms, folders: %3, %4 worker(s)")
             .arg(config_.target_folders.size())
             .arg(config_.cooldown_ms)
             .arg(folder_handling_mode_name(classifier_.folder_handling_mode()))
             .arg(pool_.maxThreadCount()));

    watcher_->set_category_names(category_names());
    watcher_->start(config_.target_folders);
    check_idle();
}

void OrganizerEngine::stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    stopping_.storeRelaxed(1);
    watcher_->stop();
    cooldown_->cancel_all();

    pool_.clear();
    pool_.waitForDone();
    // Deliver the results of jobs that finished during the wait.
    QCoreApplication::sendPostedEvents(this, QEvent::MetaCall);
    if (!in_flight_.isEmpty()) {
        LOG_INFO("Engine", QString("%1 queued path(s) left in place").arg(in_flight_.size()));
        in_flight_.clear();
    }
    resettle_.clear();
    LOG_INFO("Engine", "Stopped");
}

void OrganizerEngine::pause() {
    if (!running_ || paused_) {
        return;
    }
    paused_ = true;
    watcher_->stop();
    cooldown_->cancel_all();
    LOG_INFO("Engine", "Paused");
    notify(NotificationKind::EnginePaused, EngineError::None, QString(), "Engine paused");
}

void OrganizerEngine::resume() {
    if (!running_ || !paused_) {
        return;
    }
    paused_ = false;
    LOG_INFO("Engine", "Resumed, rescanning");
    notify(NotificationKind::EngineResumed, EngineError::None, QString(), "Engine resumed");
    watcher_->start(config_.target_folders);
    check_idle();
}

void OrganizerEngine::reload(const EngineConfig& config) {
    const bool roots_changed = config.target_folders != config_.target_folders;
    config_ = config;

    if (config.rules) {
        classifier_.set_rule_tree(config.rules);
    }
    classifier_.set_folder_handling_mode(config.folder_mode);
    ignore_set_.replace_all(config.ignore_list + decision_log_->user_ignore_patterns());
    cooldown_->set_cooldown_ms(config.cooldown_ms);
    decision_log_->set_retention(config.decision_retention);
    if (config.worker_threads > 0) {
        pool_.setMaxThreadCount(config.worker_threads);
    }
    watcher_->set_category_names(category_names());

    LOG_INFO("Engine", QString("Configuration reloaded: %1 top-level categor%2, %3 ignore pattern(s)")
             .arg(classifier_.rule_tree()->roots().size())
             .arg(classifier_.rule_tree()->roots().size() == 1 ? QString("y") : QString("ies"))
             .arg(ignore_set_.size()));

    if (running_ && !paused_ && roots_changed) {
        cooldown_->cancel_all();
        watcher_->start(config_.target_folders);
    }
}

DecisionCommandResult OrganizerEngine::undo(qint64 decision_id) {
    DecisionCommandResult result = decision_log_->undo(decision_id);
    if (result.success) {
        restored_paths_.insert(result.decision.original_path);
        notify(NotificationKind::DecisionUndone, EngineError::None, result.decision.original_path,
               QString("Moved back to %1").arg(result.decision.original_path), &result.decision);
    } else if (result.error == EngineError::UndoConflict) {
        notify(NotificationKind::UndoConflict, result.error, result.decision.original_path,
               result.message, &result.decision);
    } else if (result.error == EngineError::MoveFailed) {
        notify(NotificationKind::MoveFailed, result.error, result.decision.new_path,
               result.message, &result.decision);
    } else {
        LOG_WARN("Engine", result.message);
    }
    return result;
}

DecisionCommandResult OrganizerEngine::ignore(qint64 decision_id) {
    DecisionCommandResult result = decision_log_->ignore(decision_id);
    if (result.success) {
        cooldown_->cancel(result.decision.original_path);
        notify(NotificationKind::DecisionIgnored, EngineError::None, result.decision.original_path,
               QString("%1 will be left alone").arg(result.decision.original_path), &result.decision);
    } else {
        LOG_WARN("Engine", result.message);
    }
    return result;
}

std::vector<Decision> OrganizerEngine::recent_decisions(int limit) const {
    return decision_log_->recent(limit);
}

void OrganizerEngine::request_undo(qint64 decision_id) {
    undo(decision_id);
}

void OrganizerEngine::request_ignore(qint64 decision_id) {
    ignore(decision_id);
}

bool OrganizerEngine::is_idle() const {
    return cooldown_->settling_count() == 0 && in_flight_.isEmpty();
}

void OrganizerEngine::set_watch_retry_interval(int initial_ms, int max_ms) {
    watcher_->set_retry_interval(initial_ms, max_ms);
}

void OrganizerEngine::on_watch_event(const FsEvent& event) {
    if (!running_ || paused_) {
        return;
    }

    if (restored_paths_.contains(event.path)) {
        if (event.kind == FsEventKind::Removed) {
            restored_paths_.remove(event.path);
        } else {
            LOG_TRACE("Engine", QString("Leaving restored %1 alone").arg(event.path));
            return;
        }
    }

    cooldown_->on_event(event);
}

void OrganizerEngine::on_path_settled(const QString& path) {
    watcher_->stop_tracking(path);
    if (!running_) {
        return;
    }
    if (in_flight_.contains(path)) {
        resettle_.insert(path);
        return;
    }
    dispatch(path);
}

void OrganizerEngine::on_path_cancelled(const QString& path) {
    watcher_->stop_tracking(path);
    check_idle();
}

void OrganizerEngine::on_root_degraded(const QString& root, const QString& reason) {
    notify(NotificationKind::WatchDegraded, EngineError::WatchUnavailable, root,
           QString("Watching %1 paused: %2").arg(root, reason));
}

void OrganizerEngine::on_root_recovered(const QString& root) {
    notify(NotificationKind::WatchRecovered, EngineError::None, root,
           QString("Watching %1 again").arg(root));
}

void OrganizerEngine::dispatch(const QString& path) {
    in_flight_.insert(path);
    pool_.start([this, path]() {
        JobResult result;
        result.path = path;
        try {
            result = run_job(path);
        } catch (const std::exception& e) {
            result.outcome.success = false;
            result.outcome.error = EngineError::MoveFailed;
            result.outcome.message = QString("Unexpected error while processing %1: %2")
                                         .arg(path, QString::fromLocal8Bit(e.what()));
        }
        QMetaObject::invokeMethod(this, [this, result]() { finish_job(result); }, Qt::QueuedConnection);
    });
}

OrganizerEngine::JobResult OrganizerEngine::run_job(const QString& path) {
    JobResult result;
    result.path = path;
    result.classification = classifier_.classify(path);
    if (result.classification.skip) {
        return result;
    }
    if (stopping_.loadRelaxed()) {
        result.classification.skip = true;
        result.classification.skip_reason = "engine stopping";
        return result;
    }

    QString destination = result.classification.category;
    if (!result.classification.subcategory.isEmpty()) {
        destination += '/' + result.classification.subcategory;
    }

    MoveRequest request;
    request.source_path = path;
    request.destination_dir = QDir(QFileInfo(path).absolutePath()).filePath(destination);
    request.category = result.classification.category;
    request.subcategory = result.classification.subcategory;
    request.is_folder = result.classification.is_folder;

    result.outcome = executor_.execute(request);
    if (result.outcome.success && !channel_.push_move_record(result.outcome.record)) {
        LOG_WARN("Engine", QString("Move record for %1 not delivered, channel closed").arg(path));
    }
    return result;
}

void OrganizerEngine::finish_job(const JobResult& result) {
    in_flight_.remove(result.path);

    if (result.classification.skip) {
        LOG_DEBUG("Classifier", QString("Skipped %1: %2")
                  .arg(result.path, result.classification.skip_reason));
    } else if (result.outcome.success) {
        const MoveRecord& record = result.outcome.record;
        LOG_INFO("Mover", QString("Moved %1 -> %2")
                 .arg(QFileInfo(record.source_path).fileName(), record.destination_path));
        emit move_completed(record);
        notify(NotificationKind::MoveCompleted, EngineError::None, record.destination_path,
               QString("%1 moved to %2").arg(QFileInfo(record.source_path).fileName(), record.category));

        if (record.is_folder) {
            const Decision decision = decision_log_->record(record);
            emit decision_recorded(decision);
            notify(NotificationKind::DecisionRecorded, EngineError::None, record.source_path,
                   QString("Folder %1 filed under %2").arg(QFileInfo(record.source_path).fileName(),
                                                           decision.category), &decision);
        }
    } else {
        LOG_ERROR("Mover", result.outcome.message);
        notify(result.outcome.error == EngineError::ConflictExhausted ? NotificationKind::ConflictExhausted
                                                                      : NotificationKind::MoveFailed,
               result.outcome.error, result.path, result.outcome.message);
    }

    if (resettle_.remove(result.path) && running_ && !paused_ && QFileInfo::exists(result.path)) {
        dispatch(result.path);
        return;
    }
    check_idle();
}

void OrganizerEngine::notify(NotificationKind kind, EngineError error, const QString& path,
                             const QString& message, const Decision* decision) {
    EngineNotification notification;
    notification.kind = kind;
    notification.error = error;
    notification.path = path;
    notification.message = message;
    if (decision) {
        notification.decision = *decision;
    }
    channel_.post_notification(std::move(notification));
}

void OrganizerEngine::check_idle() {
    if (is_idle()) {
        emit became_idle();
    }
}

QStringList OrganizerEngine::category_names() const {
    QStringList names = classifier_.rule_tree()->top_level_categories();
    if (!names.contains(kDefaultCategory, Qt::CaseInsensitive)) {
        names.append(kDefaultCategory);
    }
    return names;
}
