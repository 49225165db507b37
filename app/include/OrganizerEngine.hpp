#ifndef ORGANIZER_ENGINE_HPP
#define ORGANIZER_ENGINE_HPP

#include "Classifier.hpp"
#include "ConfigLoader.hpp"
#include "DecisionLog.hpp"
#include "EngineEventChannel.hpp"
#include "EngineTypes.hpp"
#include "IgnoreSet.hpp"
#include "MoveExecutor.hpp"
#include <QAtomicInt>
#include <QObject>
#include <QSet>
#include <QString>
#include <QThreadPool>
#include <memory>
#include <vector>

class CooldownScheduler;
class DatabaseManager;
class FilesystemWatcher;
class RuleTree;

// Wires the pipeline together. Lives on one thread (the "engine thread"):
// watcher, cooldown and decision log are only touched there. Classification
// and moves run on a bounded pool and report back through queued calls.
class OrganizerEngine : public QObject {
    Q_OBJECT

public:
    OrganizerEngine(const EngineConfig& config, EngineEventChannel& channel, QObject* parent = nullptr);
    ~OrganizerEngine() override;

    void start();
    // Cancels pending cooldowns and queued jobs; waits only for jobs a worker already picked up.
    void stop();
    bool is_running() const { return running_; }

    void pause();
    void resume();
    bool is_paused() const { return paused_; }

    // Swaps in new rules, ignore list and tunables without dropping in-flight work.
    void reload(const EngineConfig& config);

    DecisionCommandResult undo(qint64 decision_id);
    DecisionCommandResult ignore(qint64 decision_id);
    std::vector<Decision> recent_decisions(int limit = -1) const;

    // Nothing settling and nothing in the pool. Held downloads do not count.
    bool is_idle() const;
    int in_flight_count() const { return in_flight_.size(); }

    std::shared_ptr<const RuleTree> rule_tree() const { return classifier_.rule_tree(); }
    const IgnoreSet& ignore_set() const { return ignore_set_; }
    FilesystemWatcher* watcher() const { return watcher_; }
    CooldownScheduler* cooldown() const { return cooldown_; }
    void set_watch_retry_interval(int initial_ms, int max_ms);

public slots:
    void request_undo(qint64 decision_id);
    void request_ignore(qint64 decision_id);

signals:
    void move_completed(const MoveRecord& record);
    void decision_recorded(const Decision& decision);
    void became_idle();

private slots:
    void on_watch_event(const FsEvent& event);
    void on_path_settled(const QString& path);
    void on_path_cancelled(const QString& path);
    void on_root_degraded(const QString& root, const QString& reason);
    void on_root_recovered(const QString& root);

private:
    struct JobResult {
        QString path;
        ClassificationResult classification;
        MoveOutcome outcome;
    };

    void dispatch(const QString& path);
    JobResult run_job(const QString& path);
    void finish_job(const JobResult& result);
    void notify(NotificationKind kind, EngineError error, const QString& path,
                const QString& message, const Decision* decision = nullptr);
    void check_idle();
    QStringList category_names() const;

    EngineConfig config_;
    EngineEventChannel& channel_;
    IgnoreSet ignore_set_;
    Classifier classifier_;
    MoveExecutor executor_;
    std::unique_ptr<DatabaseManager> database_;
    std::unique_ptr<DecisionLog> decision_log_;
    FilesystemWatcher* watcher_;
    CooldownScheduler* cooldown_;
    QThreadPool pool_;

    QSet<QString> in_flight_;
    QSet<QString> resettle_;        // settled again while a job for it was running
    QSet<QString> restored_paths_;  // put back by undo; left alone until removed
    bool running_ = false;
    QAtomicInt stopping_;           // read by pool jobs before they move anything
    bool paused_ = false;
};

#endif // ORGANIZER_ENGINE_HPP
