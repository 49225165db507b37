#ifndef COOLDOWN_SCHEDULER_HPP
#define COOLDOWN_SCHEDULER_HPP

#include "EngineTypes.hpp"
#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>

class QTimer;

struct WatchedEntry {
    QString path;
    qint64 last_event_time_ms = 0;
    qint64 first_seen_size = -1;
    qint64 last_size = -1;
    int stable_count = 0;
    bool held = false;             // transient download marker; never settles
    QTimer* timer = nullptr;
};

// Debounces raw events per path. Lives on the engine thread: every
// transition for a path (event, timer fire, cancel) runs there, so one
// path can never be settled twice or settled while an event is pending.
class CooldownScheduler : public QObject {
    Q_OBJECT

public:
    explicit CooldownScheduler(int cooldown_ms,
                               QStringList transient_suffixes = default_transient_suffixes(),
                               QObject* parent = nullptr);
    ~CooldownScheduler() override;

    void set_cooldown_ms(int cooldown_ms);
    int cooldown_ms() const { return cooldown_ms_; }

    bool is_pending(const QString& path) const;
    bool is_held(const QString& path) const;
    bool entry_for(const QString& path, WatchedEntry& out) const;
    int pending_count() const { return entries_.size(); }
    int settling_count() const;    // pending entries that are not held
    QStringList pending_paths() const { return entries_.keys(); }

public slots:
    void on_event(const FsEvent& event);
    void cancel(const QString& path);
    void cancel_all();

signals:
    void path_settled(const QString& path);
    void path_cancelled(const QString& path);
    void path_held(const QString& path);

private:
    void touch(const QString& path, qint64 timestamp_ms);
    void fire(const QString& path);
    void drop_entry(const QString& path);
    static qint64 current_size(const QString& path);

    int cooldown_ms_;
    QStringList transient_suffixes_;
    QHash<QString, WatchedEntry> entries_;
};

#endif // COOLDOWN_SCHEDULER_HPP
