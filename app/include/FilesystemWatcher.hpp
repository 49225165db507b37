#ifndef FILESYSTEM_WATCHER_HPP
#define FILESYSTEM_WATCHER_HPP

#include "EngineTypes.hpp"
#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>
#include <memory>

class IgnoreSet;
class QFileSystemWatcher;
class QTimer;

enum class WatchState {
    Stopped,
    Watching,
    Degraded
};

QString watch_state_name(WatchState state);

// Observes the top level of each root and turns QFileSystemWatcher's coarse
// notifications into FsEvents by diffing directory snapshots. Renames come out
// as Removed(old) then Created(new). Hidden entries, ignored paths and the
// category folders at a root are never reported.
class FilesystemWatcher : public QObject {
    Q_OBJECT

public:
    static constexpr int kInitialRetryMs = 1000;
    static constexpr int kMaxRetryMs = 60000;

    FilesystemWatcher(const IgnoreSet* ignore_set, QObject* parent = nullptr);
    ~FilesystemWatcher() override;

    // Subscribes every root and synthesizes a Created event for each entry
    // already present. Inaccessible roots start out Degraded.
    void start(const QStringList& roots);
    void stop();
    bool is_running() const { return running_; }

    // Forgets the snapshot of a root and reports every entry as Created again.
    void rescan(const QString& root);
    void rescan_all();

    void set_category_names(const QStringList& names);
    void set_retry_interval(int initial_ms, int max_ms);

    // Drops the per-file watch added for a path once it no longer needs one.
    void stop_tracking(const QString& path);

    WatchState state(const QString& root) const;
    QStringList roots() const { return roots_; }
    bool is_tracking(const QString& path) const { return tracked_files_.contains(path); }

signals:
    void event_ready(const FsEvent& event);
    void root_degraded(const QString& root, const QString& reason);
    void root_recovered(const QString& root);

private slots:
    void on_directory_changed(const QString& path);
    void on_file_changed(const QString& path);

private:
    struct EntryStamp {
        qint64 size = 0;
        QDateTime modified;
        bool is_dir = false;
    };
    using Snapshot = QHash<QString, EntryStamp>;

    struct RootState {
        QString path;
        WatchState state = WatchState::Stopped;
        Snapshot snapshot;
        QTimer* retry_timer = nullptr;
        int retry_ms = 0;
    };

    bool subscribe(RootState& root, QString& reason);
    void enter_degraded(RootState& root, const QString& reason);
    void retry(const QString& root);
    void diff_and_emit(RootState& root);
    Snapshot take_snapshot(const QString& root) const;
    bool should_report(const QString& root, const QString& name, bool is_dir) const;
    void forward(const QString& path, FsEventKind kind);
    RootState* root_for(const QString& path);

    const IgnoreSet* ignore_set_;
    std::unique_ptr<QFileSystemWatcher> fs_watcher_;
    QStringList roots_;
    QHash<QString, RootState> states_;
    QSet<QString> tracked_files_;
    QStringList category_names_;
    int initial_retry_ms_ = kInitialRetryMs;
    int max_retry_ms_ = kMaxRetryMs;
    bool running_ = false;
};

#endif // FILESYSTEM_WATCHER_HPP
