#include "FilesystemWatcher.hpp"
#include "AppLogger.hpp"
#include "IgnoreSet.hpp"
#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QTimer>
#include <algorithm>

QString watch_state_name(WatchState state) {
    switch (state) {
        case WatchState::Stopped:  return "Stopped";
        case WatchState::Watching: return "Watching";
        case WatchState::Degraded: return "Degraded";
        default:                   return "???";
    }
}

FilesystemWatcher::FilesystemWatcher(const IgnoreSet* ignore_set, QObject* parent)
    : QObject(parent)
    , ignore_set_(ignore_set)
    , fs_watcher_(std::make_unique<QFileSystemWatcher>()) {
    connect(fs_watcher_.get(), &QFileSystemWatcher::directoryChanged,
            this, &FilesystemWatcher::on_directory_changed);
    connect(fs_watcher_.get(), &QFileSystemWatcher::fileChanged,
            this, &FilesystemWatcher::on_file_changed);
}

FilesystemWatcher::~FilesystemWatcher() {
    stop();
}

void FilesystemWatcher::start(const QStringList& roots) {
    if (running_) {
        stop();
    }
    running_ = true;
    roots_.clear();

    for (const QString& raw : roots) {
        const QString path = QDir::cleanPath(QFileInfo(raw).absoluteFilePath());
        if (path.isEmpty() || states_.contains(path)) {
            continue;
        }
        roots_.append(path);

        RootState& root = states_[path];
        root.path = path;
        root.retry_ms = initial_retry_ms_;
        root.retry_timer = new QTimer(this);
        root.retry_timer->setSingleShot(true);
        connect(root.retry_timer, &QTimer::timeout, this, [this, path]() { retry(path); });

        QString reason;
        if (!subscribe(root, reason)) {
            enter_degraded(root, reason);
            continue;
        }
        LOG_INFO("Watcher", QString("Watching %1").arg(path));
        diff_and_emit(root);
    }
}

void FilesystemWatcher::stop() {
    if (!running_) {
        return;
    }
    running_ = false;

    QStringList watched = fs_watcher_->files() + fs_watcher_->directories();
    if (!watched.isEmpty()) {
        fs_watcher_->removePaths(watched);
    }
    for (RootState& root : states_) {
        if (root.retry_timer) {
            root.retry_timer->stop();
            root.retry_timer->deleteLater();
        }
    }
    states_.clear();
    tracked_files_.clear();
    LOG_INFO("Watcher", "Stopped");
}

void FilesystemWatcher::rescan(const QString& root_path) {
    auto it = states_.find(QDir::cleanPath(root_path));
    if (!running_ || it == states_.end() || it->state != WatchState::Watching) {
        return;
    }
    it->snapshot.clear();
    diff_and_emit(*it);
}

void FilesystemWatcher::rescan_all() {
    for (const QString& root : roots_) {
        rescan(root);
    }
}

void FilesystemWatcher::set_category_names(const QStringList& names) {
    category_names_ = names;
}

void FilesystemWatcher::set_retry_interval(int initial_ms, int max_ms) {
    initial_retry_ms_ = std::max(1, initial_ms);
    max_retry_ms_ = std::max(initial_retry_ms_, max_ms);
}

void FilesystemWatcher::stop_tracking(const QString& path) {
    if (tracked_files_.remove(path)) {
        fs_watcher_->removePath(path);
    }
}

WatchState FilesystemWatcher::state(const QString& root) const {
    auto it = states_.constFind(QDir::cleanPath(root));
    return it == states_.constEnd() ? WatchState::Stopped : it->state;
}

bool FilesystemWatcher::subscribe(RootState& root, QString& reason) {
    const QFileInfo info(root.path);
    if (!info.exists()) {
        reason = "folder does not exist";
        return false;
    }
    if (!info.isDir()) {
        reason = "not a folder";
        return false;
    }
    if (!info.isReadable()) {
        reason = "permission denied";
        return false;
    }
    if (!fs_watcher_->directories().contains(root.path) && !fs_watcher_->addPath(root.path)) {
        reason = "the system refused the watch";
        return false;
    }
    root.state = WatchState::Watching;
    root.retry_ms = initial_retry_ms_;
    return true;
}

void FilesystemWatcher::enter_degraded(RootState& root, const QString& reason) {
    const bool was_degraded = root.state == WatchState::Degraded;
    root.state = WatchState::Degraded;
    root.snapshot.clear();
    fs_watcher_->removePath(root.path);

    for (auto it = tracked_files_.begin(); it != tracked_files_.end();) {
        if (QFileInfo(*it).absolutePath() == root.path) {
            fs_watcher_->removePath(*it);
            it = tracked_files_.erase(it);
        } else {
            ++it;
        }
    }

    if (!was_degraded) {
        LOG_WARN("Watcher", QString("%1 unavailable (%2), retrying in %3 ms")
                 .arg(root.path, reason).arg(root.retry_ms));
        emit root_degraded(root.path, reason);
    }
    root.retry_timer->start(root.retry_ms);
}

void FilesystemWatcher::retry(const QString& root_path) {
    auto it = states_.find(root_path);
    if (!running_ || it == states_.end() || it->state != WatchState::Degraded) {
        return;
    }

    QString reason;
    if (!subscribe(*it, reason)) {
        it->retry_ms = std::min(it->retry_ms * 2, max_retry_ms_);
        LOG_DEBUG("Watcher", QString("%1 still unavailable (%2), next try in %3 ms")
                  .arg(root_path, reason).arg(it->retry_ms));
        it->retry_timer->start(it->retry_ms);
        return;
    }

    LOG_INFO("Watcher", QString("%1 is back, rescanning").arg(root_path));
    emit root_recovered(root_path);
    diff_and_emit(*it);
}

void FilesystemWatcher::on_directory_changed(const QString& path) {
    auto it = states_.find(path);
    if (!running_ || it == states_.end() || it->state != WatchState::Watching) {
        return;
    }

    const QFileInfo info(path);
    if (!info.isDir() || !info.isReadable()) {
        enter_degraded(*it, info.exists() ? "folder became unreadable" : "folder disappeared");
        return;
    }
    diff_and_emit(*it);
}

void FilesystemWatcher::on_file_changed(const QString& path) {
    if (!running_ || !tracked_files_.contains(path)) {
        return;
    }

    if (!QFileInfo::exists(path)) {
        // The directory diff reports the removal.
        tracked_files_.remove(path);
        return;
    }

    // Replaced files lose their watch.
    if (!fs_watcher_->files().contains(path)) {
        fs_watcher_->addPath(path);
    }
    RootState* root = root_for(path);
    if (root && should_report(root->path, QFileInfo(path).fileName(), false)) {
        forward(path, FsEventKind::Modified);
    }
}

FilesystemWatcher::Snapshot FilesystemWatcher::take_snapshot(const QString& root) const {
    Snapshot snapshot;
    const QFileInfoList entries = QDir(root).entryInfoList(
        QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
    for (const QFileInfo& info : entries) {
        EntryStamp stamp;
        stamp.is_dir = info.isDir();
        stamp.size = stamp.is_dir ? 0 : info.size();
        stamp.modified = info.lastModified();
        snapshot.insert(info.fileName(), stamp);
    }
    return snapshot;
}

void FilesystemWatcher::diff_and_emit(RootState& root) {
    const Snapshot current = take_snapshot(root.path);
    const QDir dir(root.path);

    QStringList removed;
    QStringList created;
    QStringList modified;
    for (auto it = root.snapshot.constBegin(); it != root.snapshot.constEnd(); ++it) {
        if (!current.contains(it.key())) {
            removed.append(it.key());
        }
    }
    for (auto it = current.constBegin(); it != current.constEnd(); ++it) {
        auto old = root.snapshot.constFind(it.key());
        if (old == root.snapshot.constEnd()) {
            created.append(it.key());
        } else if (old->size != it->size || old->modified != it->modified || old->is_dir != it->is_dir) {
            modified.append(it.key());
        }
    }
    root.snapshot = current;

    removed.sort();
    created.sort();
    modified.sort();

    for (const QString& name : removed) {
        const QString path = dir.filePath(name);
        stop_tracking(path);
        if (!name.startsWith('.')) {
            forward(path, FsEventKind::Removed);
        }
    }
    for (const QString& name : created) {
        const QString path = dir.filePath(name);
        const bool is_dir = current.value(name).is_dir;
        if (!should_report(root.path, name, is_dir)) {
            continue;
        }
        if (!is_dir && !tracked_files_.contains(path) && fs_watcher_->addPath(path)) {
            tracked_files_.insert(path);
        }
        forward(path, FsEventKind::Created);
    }
    for (const QString& name : modified) {
        if (should_report(root.path, name, current.value(name).is_dir)) {
            forward(dir.filePath(name), FsEventKind::Modified);
        }
    }
}

bool FilesystemWatcher::should_report(const QString& root, const QString& name, bool is_dir) const {
    if (name.startsWith('.')) {
        return false;
    }
    if (is_dir && category_names_.contains(name, Qt::CaseInsensitive)) {
        return false;
    }
    if (ignore_set_ && ignore_set_->matches(QDir(root).filePath(name))) {
        LOG_TRACE("Watcher", QString("Ignored: %1").arg(name));
        return false;
    }
    return true;
}

void FilesystemWatcher::forward(const QString& path, FsEventKind kind) {
    FsEvent event;
    event.path = path;
    event.kind = kind;
    event.timestamp_ms = QDateTime::currentMSecsSinceEpoch();
    const QString verb = kind == FsEventKind::Created ? QString("created")
                       : kind == FsEventKind::Modified ? QString("modified")
                       : QString("removed");
    LOG_TRACE("Watcher", QString("%1 %2").arg(verb, path));
    emit event_ready(event);
}

FilesystemWatcher::RootState* FilesystemWatcher::root_for(const QString& path) {
    auto it = states_.find(QFileInfo(path).absolutePath());
    return it == states_.end() ? nullptr : &it.value();
}
