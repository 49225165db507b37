#ifndef MOVE_EXECUTOR_HPP
#define MOVE_EXECUTOR_HPP

#include "EngineTypes.hpp"
#include <QHash>
#include <QMutex>
#include <QString>
#include <memory>

struct MoveRequest {
    QString source_path;
    QString destination_dir;
    QString category;
    QString subcategory;
    bool is_folder = false;
};

struct MoveOutcome {
    bool success = false;
    EngineError error = EngineError::None;
    QString message;
    MoveRecord record;
};

// The only stage that changes the user's filesystem. Thread-safe: moves into
// the same destination directory are serialized so the free-name check and
// the rename happen as one step.
class MoveExecutor {
public:
    MoveExecutor();
    ~MoveExecutor();

    MoveOutcome execute(const MoveRequest& request);

    // Relocates to an exact path without conflict resolution; fails if the
    // destination is occupied. Used to reverse folder moves.
    bool move_exact(const QString& source_path, const QString& destination_path,
                    EngineError& error, QString& error_message);

    void set_max_conflict_attempts(int attempts) { max_conflict_attempts_ = attempts; }

protected:
    // Cross-volume folder move. Refuses up front when some entry of the source
    // could not be unlinked; a failed copy removes the partial destination.
    static bool copy_then_remove_folder(const QString& source, const QString& destination, QString& error_message);
    static bool copy_tree(const QString& source, const QString& destination, QString& error_message);
    static bool source_removable(const QString& source, QString& error_message);

private:
    std::shared_ptr<QMutex> directory_lock(const QString& directory);
    bool relocate(const QString& source, const QString& destination, bool is_folder, QString& error_message);

    QMutex locks_mutex_;
    QHash<QString, std::weak_ptr<QMutex>> directory_locks_;
    int max_conflict_attempts_;
};

#endif // MOVE_EXECUTOR_HPP
