#ifndef ENGINE_EVENT_CHANNEL_HPP
#define ENGINE_EVENT_CHANNEL_HPP

#include "EngineTypes.hpp"
#include <QMutex>
#include <QString>
#include <QWaitCondition>
#include <deque>

enum class NotificationKind {
    WatchDegraded,
    WatchRecovered,
    MoveCompleted,
    MoveFailed,
    ConflictExhausted,
    UndoConflict,
    DecisionRecorded,
    DecisionUndone,
    DecisionIgnored,
    EnginePaused,
    EngineResumed,
    NotificationsDropped
};

QString notification_kind_name(NotificationKind kind);

struct EngineNotification {
    NotificationKind kind = NotificationKind::MoveCompleted;
    EngineError error = EngineError::None;
    QString path;
    QString message;
    Decision decision;
    int dropped_count = 0;
    qint64 timestamp_ms = 0;
};

// Outward side of the engine. Two queues with different overflow rules:
//   notifications  bounded; the oldest are dropped and later reported as one
//                  NotificationsDropped entry, so a slow reader never stalls
//                  the engine.
//   move records   bounded; producers block until there is room. Records are
//                  never dropped.
class EngineEventChannel {
public:
    explicit EngineEventChannel(int notification_capacity = 256, int move_record_capacity = 1024);

    void post_notification(EngineNotification notification);
    bool try_take_notification(EngineNotification& out);
    // Waits up to timeout_ms (negative: forever). False on timeout or when closed and empty.
    bool wait_notification(EngineNotification& out, int timeout_ms = -1);

    // Blocks while the queue is full. False once the channel is closed.
    bool push_move_record(const MoveRecord& record);
    bool try_take_move_record(MoveRecord& out);
    bool wait_move_record(MoveRecord& out, int timeout_ms = -1);

    // Wakes every waiter. Queued items can still be taken afterwards.
    void close();
    bool is_closed() const;

    int pending_notifications() const;
    int pending_move_records() const;
    quint64 dropped_notifications() const;

private:
    bool take_notification_locked(EngineNotification& out);

    mutable QMutex mutex_;
    QWaitCondition notification_ready_;
    QWaitCondition record_ready_;
    QWaitCondition record_space_;

    int notification_capacity_;
    int move_record_capacity_;
    std::deque<EngineNotification> notifications_;
    std::deque<MoveRecord> move_records_;
    int unreported_drops_ = 0;
    quint64 total_drops_ = 0;
    bool closed_ = false;
};

#endif // ENGINE_EVENT_CHANNEL_HPP
