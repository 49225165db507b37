#include "MoveExecutor.hpp"
#include "AppLogger.hpp"
#include "ConflictResolver.hpp"
#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>

namespace {
constexpr int kMaxPrunedLocks = 256;
}

MoveExecutor::MoveExecutor()
    : max_conflict_attempts_(ConflictResolver::kMaxAttempts) {
}

MoveExecutor::~MoveExecutor() = default;

std::shared_ptr<QMutex> MoveExecutor::directory_lock(const QString& directory) {
    QMutexLocker locker(&locks_mutex_);
    const QString key = QDir::cleanPath(directory);

    std::shared_ptr<QMutex> existing = directory_locks_.value(key).lock();
    if (existing) {
        return existing;
    }

    if (directory_locks_.size() > kMaxPrunedLocks) {
        for (auto it = directory_locks_.begin(); it != directory_locks_.end();) {
            if (it.value().expired()) {
                it = directory_locks_.erase(it);
            } else {
                ++it;
            }
        }
    }

    auto created = std::make_shared<QMutex>();
    directory_locks_.insert(key, created);
    return created;
}

MoveOutcome MoveExecutor::execute(const MoveRequest& request) {
    MoveOutcome outcome;

    // Verify source still exists before attempting move
    const QFileInfo source_info(request.source_path);
    if (!source_info.exists() && !source_info.isSymLink()) {
        outcome.error = EngineError::MoveFailed;
        outcome.message = QString("Source no longer exists: %1").arg(request.source_path);
        return outcome;
    }

    const QString source_path = QDir::cleanPath(source_info.absoluteFilePath());
    const QString dest_dir = QDir::cleanPath(request.destination_dir);
    if (request.is_folder && (dest_dir == source_path || dest_dir.startsWith(source_path + '/'))) {
        outcome.error = EngineError::MoveFailed;
        outcome.message = QString("Cannot move %1 into itself").arg(source_path);
        return outcome;
    }

    if (!QDir().mkpath(dest_dir)) {
        outcome.error = EngineError::MoveFailed;
        outcome.message = QString("Failed to create folder: %1").arg(dest_dir);
        return outcome;
    }

    std::shared_ptr<QMutex> lock = directory_lock(dest_dir);
    QMutexLocker locker(lock.get());

    const QString desired = QDir(dest_dir).filePath(source_info.fileName());

    // A second round covers a name taken by someone outside this process
    // between the free-name check and the rename.
    for (int round = 0; round < 2; ++round) {
        QString target;
        if (!ConflictResolver::resolve(desired, target, request.is_folder, max_conflict_attempts_)) {
            outcome.error = EngineError::ConflictExhausted;
            outcome.message = QString("No free name for %1 in %2 after %3 attempts")
                                  .arg(source_info.fileName(), dest_dir)
                                  .arg(max_conflict_attempts_);
            return outcome;
        }
        if (target != desired) {
            LOG_WARN("Mover", QString("Conflict at %1, renaming to %2")
                     .arg(desired, QFileInfo(target).fileName()));
        }

        QString error_message;
        if (relocate(source_path, target, request.is_folder, error_message)) {
            outcome.success = true;
            outcome.record.source_path = source_path;
            outcome.record.destination_path = target;
            outcome.record.category = request.category;
            outcome.record.subcategory = request.subcategory;
            outcome.record.is_folder = request.is_folder;
            outcome.record.timestamp_ms = QDateTime::currentMSecsSinceEpoch();
            return outcome;
        }

        if (!QFileInfo::exists(source_path)) {
            outcome.error = EngineError::MoveFailed;
            outcome.message = QString("Source vanished during move: %1").arg(source_path);
            return outcome;
        }
        if (round == 0 && ConflictResolver::path_taken(target)) {
            continue;
        }

        outcome.error = EngineError::MoveFailed;
        outcome.message = QString("Failed to move %1 to %2: %3").arg(source_path, target, error_message);
        return outcome;
    }

    outcome.error = EngineError::MoveFailed;
    outcome.message = QString("Destination kept changing while moving %1").arg(source_path);
    return outcome;
}

bool MoveExecutor::move_exact(const QString& source_path, const QString& destination_path,
                              EngineError& error, QString& error_message) {
    const QFileInfo source_info(source_path);
    if (!source_info.exists()) {
        error = EngineError::MoveFailed;
        error_message = QString("Nothing to move back, %1 no longer exists").arg(source_path);
        return false;
    }

    const QString parent = QFileInfo(destination_path).absolutePath();
    if (!QDir().mkpath(parent)) {
        error = EngineError::MoveFailed;
        error_message = QString("Failed to create folder: %1").arg(parent);
        return false;
    }

    std::shared_ptr<QMutex> lock = directory_lock(parent);
    QMutexLocker locker(lock.get());

    if (ConflictResolver::path_taken(destination_path)) {
        error = EngineError::UndoConflict;
        error_message = QString("%1 is occupied").arg(destination_path);
        return false;
    }

    if (!relocate(source_path, destination_path, source_info.isDir(), error_message)) {
        error = ConflictResolver::path_taken(destination_path) ? EngineError::UndoConflict
                                                               : EngineError::MoveFailed;
        return false;
    }

    error = EngineError::None;
    return true;
}

bool MoveExecutor::relocate(const QString& source, const QString& destination, bool is_folder,
                            QString& error_message) {
    if (!is_folder) {
        // QFile::rename refuses to overwrite, and across volumes it copies then
        // removes the source, deleting the partial copy if anything fails.
        QFile file(source);
        if (file.rename(destination)) {
            return true;
        }
        error_message = file.errorString();
        return false;
    }

    if (QDir().rename(source, destination)) {
        return true;
    }

    if (ConflictResolver::path_taken(destination)) {
        error_message = "destination appeared during the move";
        return false;
    }
    if (!QFileInfo(source).isDir()) {
        error_message = "source folder disappeared";
        return false;
    }

    // Directory renames do not cross volumes; fall back to copy + delete.
    LOG_INFO("Mover", QString("Rename of %1 failed, copying instead").arg(source));
    return copy_then_remove_folder(source, destination, error_message);
}

bool MoveExecutor::copy_then_remove_folder(const QString& source, const QString& destination,
                                           QString& error_message) {
    if (!source_removable(source, error_message)) {
        return false;
    }

    if (!copy_tree(source, destination, error_message)) {
        // Abort: leave the source alone and discard the partial copy.
        QDir(destination).removeRecursively();
        return false;
    }

    if (!QDir(source).removeRecursively()) {
        // The copy is complete, so the move stands. Whatever could not be
        // removed stays behind and is reported instead of hidden.
        QStringList left_behind;
        QDirIterator it(source, QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                        QDirIterator::Subdirectories);
        while (it.hasNext()) {
            left_behind.append(it.next());
        }
        LOG_WARN("Mover", QString("Copied %1 to %2, but %3 entr%4 could not be removed from the source: %5")
                 .arg(source, destination)
                 .arg(left_behind.size())
                 .arg(left_behind.size() == 1 ? QString("y") : QString("ies"))
                 .arg(left_behind.join(", ")));
    }
    return true;
}

bool MoveExecutor::source_removable(const QString& source, QString& error_message) {
    // Unlinking needs write access to the containing directory.
    const QString parent = QFileInfo(source).absolutePath();
    if (!QFileInfo(parent).isWritable()) {
        error_message = QString("permission denied: cannot remove %1 from %2").arg(source, parent);
        return false;
    }
    if (!QFileInfo(source).isWritable()) {
        error_message = QString("permission denied: %1 is read-only").arg(source);
        return false;
    }

    QDirIterator it(source, QDir::Dirs | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot | QDir::NoSymLinks,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString dir_path = it.next();
        if (!it.fileInfo().isWritable()) {
            error_message = QString("permission denied: %1 is read-only").arg(dir_path);
            return false;
        }
    }
    return true;
}

bool MoveExecutor::copy_tree(const QString& source, const QString& destination, QString& error_message) {
    if (!QDir().mkpath(destination)) {
        error_message = QString("cannot create %1").arg(destination);
        return false;
    }

    const QDir source_dir(source);
    QDirIterator it(source, QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString entry_path = it.next();
        const QFileInfo info = it.fileInfo();
        const QString target = QDir(destination).filePath(source_dir.relativeFilePath(entry_path));

        if (info.isSymLink()) {
            if (!QFile::link(info.symLinkTarget(), target)) {
                error_message = QString("cannot recreate link %1").arg(entry_path);
                return false;
            }
        } else if (info.isDir()) {
            if (!QDir().mkpath(target)) {
                error_message = QString("cannot create %1").arg(target);
                return false;
            }
        } else {
            QDir().mkpath(QFileInfo(target).absolutePath());
            QFile file(entry_path);
            if (!file.copy(target)) {
                error_message = QString("cannot copy %1: %2").arg(entry_path, file.errorString());
                return false;
            }
        }
    }
    return true;
}
