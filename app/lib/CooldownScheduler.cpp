#include "CooldownScheduler.hpp"
#include "AppLogger.hpp"
#include <QDateTime>
#include <QFileInfo>
#include <QTimer>

CooldownScheduler::CooldownScheduler(int cooldown_ms, QStringList transient_suffixes, QObject* parent)
    : QObject(parent)
    , cooldown_ms_(cooldown_ms > 0 ? cooldown_ms : 0)
    , transient_suffixes_(std::move(transient_suffixes)) {
}

CooldownScheduler::~CooldownScheduler() {
    for (WatchedEntry& entry : entries_) {
        if (entry.timer) {
            entry.timer->stop();
        }
    }
}

void CooldownScheduler::set_cooldown_ms(int cooldown_ms) {
    cooldown_ms_ = cooldown_ms > 0 ? cooldown_ms : 0;
}

bool CooldownScheduler::is_pending(const QString& path) const {
    return entries_.contains(path);
}

bool CooldownScheduler::is_held(const QString& path) const {
    auto it = entries_.constFind(path);
    return it != entries_.constEnd() && it->held;
}

int CooldownScheduler::settling_count() const {
    int count = 0;
    for (const WatchedEntry& entry : entries_) {
        if (!entry.held) {
            ++count;
        }
    }
    return count;
}

bool CooldownScheduler::entry_for(const QString& path, WatchedEntry& out) const {
    auto it = entries_.constFind(path);
    if (it == entries_.constEnd()) {
        return false;
    }
    out = it.value();
    return true;
}

qint64 CooldownScheduler::current_size(const QString& path) {
    QFileInfo info(path);
    if (!info.exists()) {
        return -1;
    }
    return info.isDir() ? 0 : info.size();
}

void CooldownScheduler::on_event(const FsEvent& event) {
    if (event.kind == FsEventKind::Removed) {
        cancel(event.path);
        return;
    }

    if (!QFileInfo::exists(event.path)) {
        cancel(event.path);
        return;
    }

    const qint64 timestamp = event.timestamp_ms > 0 ? event.timestamp_ms
                                                    : QDateTime::currentMSecsSinceEpoch();

    if (has_transient_suffix(QFileInfo(event.path).fileName(), transient_suffixes_)) {
        const bool known = entries_.contains(event.path);
        WatchedEntry& entry = entries_[event.path];
        entry.path = event.path;
        entry.held = true;
        entry.last_event_time_ms = timestamp;
        entry.last_size = current_size(event.path);
        if (entry.first_seen_size < 0) {
            entry.first_seen_size = entry.last_size;
        }
        if (!known) {
            LOG_DEBUG("Cooldown", QString("Holding in-progress download: %1").arg(event.path));
            emit path_held(event.path);
        }
        return;
    }

    touch(event.path, timestamp);
}

void CooldownScheduler::touch(const QString& path, qint64 timestamp_ms) {
    const bool known = entries_.contains(path);
    WatchedEntry& entry = entries_[path];
    entry.path = path;
    entry.last_event_time_ms = timestamp_ms;
    entry.last_size = current_size(path);
    entry.stable_count = 0;
    if (!known) {
        entry.first_seen_size = entry.last_size;
    }

    if (!entry.timer) {
        entry.timer = new QTimer(this);
        entry.timer->setSingleShot(true);
        connect(entry.timer, &QTimer::timeout, this, [this, path]() { fire(path); });
    }
    entry.timer->start(cooldown_ms_);

    if (!known) {
        LOG_DEBUG("Cooldown", QString("Cooldown started (%1 ms): %2").arg(cooldown_ms_).arg(path));
    }
}

void CooldownScheduler::fire(const QString& path) {
    auto it = entries_.find(path);
    if (it == entries_.end() || it->held) {
        return;
    }

    const qint64 size = current_size(path);
    if (size < 0) {
        cancel(path);
        return;
    }

    // Some writers append without producing events; a size change still counts as activity.
    if (size != it->last_size) {
        it->last_size = size;
        it->stable_count = 0;
        it->last_event_time_ms = QDateTime::currentMSecsSinceEpoch();
        it->timer->start(cooldown_ms_);
        LOG_TRACE("Cooldown", QString("Still growing, cooldown restarted: %1").arg(path));
        return;
    }

    it->stable_count++;
    drop_entry(path);
    LOG_DEBUG("Cooldown", QString("Settled: %1").arg(path));
    emit path_settled(path);
}

void CooldownScheduler::cancel(const QString& path) {
    if (!entries_.contains(path)) {
        return;
    }
    drop_entry(path);
    LOG_DEBUG("Cooldown", QString("Cooldown cancelled: %1").arg(path));
    emit path_cancelled(path);
}

void CooldownScheduler::cancel_all() {
    const QStringList paths = entries_.keys();
    for (const QString& path : paths) {
        drop_entry(path);
    }
    if (!paths.isEmpty()) {
        LOG_INFO("Cooldown", QString("Cancelled %1 pending cooldown(s)").arg(paths.size()));
    }
}

void CooldownScheduler::drop_entry(const QString& path) {
    auto it = entries_.find(path);
    if (it == entries_.end()) {
        return;
    }
    if (it->timer) {
        it->timer->stop();
        it->timer->deleteLater();
    }
    entries_.erase(it);
}
