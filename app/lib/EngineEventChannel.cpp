#include "EngineEventChannel.hpp"
#include <QDateTime>
#include <QDeadlineTimer>

QString notification_kind_name(NotificationKind kind) {
    switch (kind) {
        case NotificationKind::WatchDegraded:        return "WatchDegraded";
        case NotificationKind::WatchRecovered:       return "WatchRecovered";
        case NotificationKind::MoveCompleted:        return "MoveCompleted";
        case NotificationKind::MoveFailed:           return "MoveFailed";
        case NotificationKind::ConflictExhausted:    return "ConflictExhausted";
        case NotificationKind::UndoConflict:         return "UndoConflict";
        case NotificationKind::DecisionRecorded:     return "DecisionRecorded";
        case NotificationKind::DecisionUndone:       return "DecisionUndone";
        case NotificationKind::DecisionIgnored:      return "DecisionIgnored";
        case NotificationKind::EnginePaused:         return "EnginePaused";
        case NotificationKind::EngineResumed:        return "EngineResumed";
        case NotificationKind::NotificationsDropped: return "NotificationsDropped";
        default:                                     return "???";
    }
}

namespace {
QDeadlineTimer deadline_for(int timeout_ms) {
    return timeout_ms < 0 ? QDeadlineTimer(QDeadlineTimer::Forever) : QDeadlineTimer(timeout_ms);
}
}

EngineEventChannel::EngineEventChannel(int notification_capacity, int move_record_capacity)
    : notification_capacity_(notification_capacity > 0 ? notification_capacity : 1)
    , move_record_capacity_(move_record_capacity > 0 ? move_record_capacity : 1) {
}

void EngineEventChannel::post_notification(EngineNotification notification) {
    if (notification.timestamp_ms == 0) {
        notification.timestamp_ms = QDateTime::currentMSecsSinceEpoch();
    }

    QMutexLocker locker(&mutex_);
    if (closed_) {
        return;
    }
    while (static_cast<int>(notifications_.size()) >= notification_capacity_) {
        notifications_.pop_front();
        ++unreported_drops_;
        ++total_drops_;
    }
    notifications_.push_back(std::move(notification));
    notification_ready_.wakeOne();
}

bool EngineEventChannel::take_notification_locked(EngineNotification& out) {
    // The drop summary goes out first so the reader learns about the gap
    // before seeing what came after it.
    if (unreported_drops_ > 0) {
        out = EngineNotification();
        out.kind = NotificationKind::NotificationsDropped;
        out.dropped_count = unreported_drops_;
        out.message = QString("%1 notification(s) dropped, reader too slow").arg(unreported_drops_);
        out.timestamp_ms = QDateTime::currentMSecsSinceEpoch();
        unreported_drops_ = 0;
        return true;
    }
    if (notifications_.empty()) {
        return false;
    }
    out = std::move(notifications_.front());
    notifications_.pop_front();
    return true;
}

bool EngineEventChannel::try_take_notification(EngineNotification& out) {
    QMutexLocker locker(&mutex_);
    return take_notification_locked(out);
}

bool EngineEventChannel::wait_notification(EngineNotification& out, int timeout_ms) {
    QDeadlineTimer deadline = deadline_for(timeout_ms);
    QMutexLocker locker(&mutex_);
    while (notifications_.empty() && unreported_drops_ == 0 && !closed_) {
        if (!notification_ready_.wait(&mutex_, deadline)) {
            break;
        }
    }
    return take_notification_locked(out);
}

bool EngineEventChannel::push_move_record(const MoveRecord& record) {
    QMutexLocker locker(&mutex_);
    while (static_cast<int>(move_records_.size()) >= move_record_capacity_ && !closed_) {
        record_space_.wait(&mutex_);
    }
    if (closed_) {
        return false;
    }
    move_records_.push_back(record);
    record_ready_.wakeOne();
    return true;
}

bool EngineEventChannel::try_take_move_record(MoveRecord& out) {
    QMutexLocker locker(&mutex_);
    if (move_records_.empty()) {
        return false;
    }
    out = move_records_.front();
    move_records_.pop_front();
    record_space_.wakeOne();
    return true;
}

bool EngineEventChannel::wait_move_record(MoveRecord& out, int timeout_ms) {
    QDeadlineTimer deadline = deadline_for(timeout_ms);
    QMutexLocker locker(&mutex_);
    while (move_records_.empty() && !closed_) {
        if (!record_ready_.wait(&mutex_, deadline)) {
            break;
        }
    }
    if (move_records_.empty()) {
        return false;
    }
    out = move_records_.front();
    move_records_.pop_front();
    record_space_.wakeOne();
    return true;
}

void EngineEventChannel::close() {
    QMutexLocker locker(&mutex_);
    closed_ = true;
    notification_ready_.wakeAll();
    record_ready_.wakeAll();
    record_space_.wakeAll();
}

bool EngineEventChannel::is_closed() const {
    QMutexLocker locker(&mutex_);
    return closed_;
}

int EngineEventChannel::pending_notifications() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(notifications_.size());
}

int EngineEventChannel::pending_move_records() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(move_records_.size());
}

quint64 EngineEventChannel::dropped_notifications() const {
    QMutexLocker locker(&mutex_);
    return total_drops_;
}
