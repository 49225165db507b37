#include "DecisionLog.hpp"
#include "AppLogger.hpp"
#include "DatabaseManager.hpp"
#include "IgnoreSet.hpp"
#include "MoveExecutor.hpp"
#include <QDateTime>
#include <algorithm>

DecisionLog::DecisionLog(IgnoreSet& ignore_set, MoveExecutor& executor,
                         DatabaseManager* database, int retention)
    : ignore_set_(ignore_set)
    , executor_(executor)
    , database_(database)
    , retention_(retention > 0 ? retention : kDefaultRetention) {
}

void DecisionLog::load() {
    if (!database_ || !database_->is_open()) {
        return;
    }

    QMutexLocker locker(&mutex_);
    decisions_.clear();
    for (const Decision& decision : database_->get_decisions()) {
        decisions_.push_back(decision);
        next_id_ = std::max(next_id_, decision.id + 1);
    }

    user_ignores_.clear();
    for (const IgnorePatternRow& row : database_->get_ignore_patterns()) {
        if (row.source == "user") {
            user_ignores_.append(row.pattern);
            ignore_set_.add(row.pattern);
        }
    }

    prune_locked();
    LOG_INFO("DecisionLog", QString("Loaded %1 decision(s), %2 user ignore pattern(s)")
             .arg(decisions_.size()).arg(user_ignores_.size()));
}

Decision DecisionLog::record(const MoveRecord& record) {
    Decision decision;
    decision.original_path = record.source_path;
    decision.new_path = record.destination_path;
    decision.category = record.category;
    decision.timestamp_ms = record.timestamp_ms > 0 ? record.timestamp_ms
                                                    : QDateTime::currentMSecsSinceEpoch();
    decision.state = DecisionState::Active;

    QMutexLocker locker(&mutex_);

    qint64 stored_id = 0;
    if (database_ && database_->is_open() && database_->insert_decision(decision, stored_id)
        && stored_id >= next_id_) {
        decision.id = stored_id;
    } else {
        decision.id = next_id_;
    }
    next_id_ = decision.id + 1;

    decisions_.push_back(decision);
    prune_locked();

    LOG_INFO("DecisionLog", QString("Decision #%1: %2 -> %3 (%4)")
             .arg(decision.id).arg(decision.original_path, decision.new_path, decision.category));
    return decision;
}

DecisionCommandResult DecisionLog::undo(qint64 id) {
    DecisionCommandResult result;
    QMutexLocker locker(&mutex_);

    Decision* decision = find_locked(id);
    if (!decision) {
        result.error = EngineError::NotFound;
        result.message = QString("No decision with id %1").arg(id);
        return result;
    }
    result.decision = *decision;
    if (decision->state != DecisionState::Active) {
        result.error = EngineError::NotFound;
        result.message = QString("Decision #%1 is already %2")
                             .arg(id).arg(decision_state_name(decision->state));
        return result;
    }

    EngineError error = EngineError::None;
    QString error_message;
    if (!executor_.move_exact(decision->new_path, decision->original_path, error, error_message)) {
        result.error = error;
        result.message = error == EngineError::UndoConflict
            ? QString("Cannot undo #%1: %2. Move it back manually.").arg(id).arg(error_message)
            : QString("Cannot undo #%1: %2").arg(id).arg(error_message);
        LOG_ERROR("DecisionLog", result.message);
        return result;
    }

    set_state_locked(*decision, DecisionState::UndoneByUser);
    result.success = true;
    result.decision = *decision;
    LOG_INFO("DecisionLog", QString("Undid #%1: %2 restored").arg(id).arg(decision->original_path));
    return result;
}

DecisionCommandResult DecisionLog::ignore(qint64 id) {
    DecisionCommandResult result;
    QMutexLocker locker(&mutex_);

    Decision* decision = find_locked(id);
    if (!decision) {
        result.error = EngineError::NotFound;
        result.message = QString("No decision with id %1").arg(id);
        return result;
    }
    if (decision->state == DecisionState::Ignored) {
        result.success = true;
        result.decision = *decision;
        return result;
    }

    const QString pattern = decision->original_path;
    ignore_set_.add(pattern);
    if (!user_ignores_.contains(pattern)) {
        user_ignores_.append(pattern);
    }
    if (database_ && database_->is_open() && !database_->add_ignore_pattern(pattern, "user")) {
        LOG_WARN("DecisionLog", QString("Ignore pattern %1 was not persisted").arg(pattern));
    }

    set_state_locked(*decision, DecisionState::Ignored);
    result.success = true;
    result.decision = *decision;
    LOG_INFO("DecisionLog", QString("Ignoring %1 from now on (decision #%2)").arg(pattern).arg(id));
    return result;
}

std::vector<Decision> DecisionLog::recent(int limit) const {
    QMutexLocker locker(&mutex_);
    std::vector<Decision> out;
    for (auto it = decisions_.rbegin(); it != decisions_.rend(); ++it) {
        if (limit >= 0 && static_cast<int>(out.size()) >= limit) {
            break;
        }
        out.push_back(*it);
    }
    return out;
}

bool DecisionLog::find(qint64 id, Decision& out) const {
    QMutexLocker locker(&mutex_);
    for (const Decision& decision : decisions_) {
        if (decision.id == id) {
            out = decision;
            return true;
        }
    }
    return false;
}

int DecisionLog::size() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(decisions_.size());
}

void DecisionLog::set_retention(int retention) {
    QMutexLocker locker(&mutex_);
    retention_ = retention > 0 ? retention : kDefaultRetention;
    prune_locked();
}

int DecisionLog::retention() const {
    QMutexLocker locker(&mutex_);
    return retention_;
}

QStringList DecisionLog::user_ignore_patterns() const {
    QMutexLocker locker(&mutex_);
    return user_ignores_;
}

Decision* DecisionLog::find_locked(qint64 id) {
    for (Decision& decision : decisions_) {
        if (decision.id == id) {
            return &decision;
        }
    }
    return nullptr;
}

void DecisionLog::prune_locked() {
    int pruned = 0;
    while (static_cast<int>(decisions_.size()) > retention_) {
        const Decision& oldest = decisions_.front();
        if (database_ && database_->is_open()) {
            database_->remove_decision(oldest.id);
        }
        decisions_.pop_front();
        ++pruned;
    }
    if (pruned > 0) {
        LOG_DEBUG("DecisionLog", QString("Pruned %1 old decision(s)").arg(pruned));
    }
}

void DecisionLog::set_state_locked(Decision& decision, DecisionState state) {
    decision.state = state;
    if (database_ && database_->is_open() && !database_->update_decision_state(decision.id, state)) {
        LOG_WARN("DecisionLog", QString("State of decision #%1 was not persisted").arg(decision.id));
    }
}
