#ifndef DECISION_LOG_HPP
#define DECISION_LOG_HPP

#include "EngineTypes.hpp"
#include <QMutex>
#include <QString>
#include <QStringList>
#include <deque>
#include <vector>

class DatabaseManager;
class IgnoreSet;
class MoveExecutor;

struct DecisionCommandResult {
    bool success = false;
    EngineError error = EngineError::None;
    QString message;
    Decision decision;
};

// Bounded history of folder moves, oldest first. Undo and ignore are
// processed one at a time; pruning an entry never touches the filesystem.
class DecisionLog {
public:
    static constexpr int kDefaultRetention = 50;

    DecisionLog(IgnoreSet& ignore_set, MoveExecutor& executor,
                DatabaseManager* database = nullptr, int retention = kDefaultRetention);

    // Restores decisions and user ignore patterns from the database.
    void load();

    Decision record(const MoveRecord& record);
    DecisionCommandResult undo(qint64 id);
    DecisionCommandResult ignore(qint64 id);

    std::vector<Decision> recent(int limit = -1) const;
    bool find(qint64 id, Decision& out) const;
    int size() const;

    void set_retention(int retention);
    int retention() const;

    // Patterns added by ignore(); kept apart from the configured list so a
    // config reload does not forget them.
    QStringList user_ignore_patterns() const;

private:
    Decision* find_locked(qint64 id);
    void prune_locked();
    void set_state_locked(Decision& decision, DecisionState state);

    mutable QMutex mutex_;
    IgnoreSet& ignore_set_;
    MoveExecutor& executor_;
    DatabaseManager* database_;
    int retention_;
    std::deque<Decision> decisions_;
    QStringList user_ignores_;
    qint64 next_id_ = 1;
};

#endif // DECISION_LOG_HPP
