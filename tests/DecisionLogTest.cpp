#include <gtest/gtest.h>
#include <QDir>
#include <QTemporaryDir>

#include "DatabaseManager.hpp"
#include "DecisionLog.hpp"
#include "IgnoreSet.hpp"
#include "MoveExecutor.hpp"
#include "TestUtils.hpp"

using test_utils::write_file;

class DecisionLogTest : public ::testing::Test {
protected:
    QTemporaryDir temp_;
    IgnoreSet ignore_;
    MoveExecutor executor_;

    QString path(const QString& name) const { return QDir(temp_.path()).filePath(name); }

    // Moves <root>/<name> into <root>/Images the way the engine would.
    MoveRecord move_folder(const QString& name) {
        write_file(path(name + "/pic.jpg"));
        MoveRequest request;
        request.source_path = path(name);
        request.destination_dir = path("Images");
        request.category = "Images";
        request.is_folder = true;
        return executor_.execute(request).record;
    }
};

TEST_F(DecisionLogTest, RecordCreatesActiveDecision) {
    DecisionLog log(ignore_, executor_);
    const Decision decision = log.record(move_folder("ProjectX"));
    EXPECT_GT(decision.id, 0);
    EXPECT_EQ(decision.state, DecisionState::Active);
    EXPECT_EQ(decision.original_path, path("ProjectX"));
    EXPECT_EQ(decision.new_path, path("Images/ProjectX"));
    EXPECT_EQ(decision.category, "Images");
    EXPECT_EQ(log.size(), 1);
}

TEST_F(DecisionLogTest, UndoRestoresFolder) {
    DecisionLog log(ignore_, executor_);
    const Decision decision = log.record(move_folder("ProjectX"));

    const DecisionCommandResult result = log.undo(decision.id);
    ASSERT_TRUE(result.success) << result.message.toStdString();
    EXPECT_EQ(result.decision.state, DecisionState::UndoneByUser);
    EXPECT_TRUE(QFileInfo::exists(path("ProjectX/pic.jpg")));
    EXPECT_FALSE(QFileInfo::exists(path("Images/ProjectX")));

    // A second undo has nothing left to do.
    EXPECT_FALSE(log.undo(decision.id).success);
}

TEST_F(DecisionLogTest, UndoConflictKeepsDecisionActive) {
    DecisionLog log(ignore_, executor_);
    const Decision decision = log.record(move_folder("ProjectX"));
    ASSERT_TRUE(QDir().mkpath(path("ProjectX")));

    const DecisionCommandResult result = log.undo(decision.id);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, EngineError::UndoConflict);
    EXPECT_TRUE(QFileInfo::exists(path("Images/ProjectX/pic.jpg")));

    Decision stored;
    ASSERT_TRUE(log.find(decision.id, stored));
    EXPECT_EQ(stored.state, DecisionState::Active);
}

TEST_F(DecisionLogTest, UnknownIdIsNotFound) {
    DecisionLog log(ignore_, executor_);
    EXPECT_EQ(log.undo(42).error, EngineError::NotFound);
    EXPECT_EQ(log.ignore(42).error, EngineError::NotFound);
}

TEST_F(DecisionLogTest, IgnoreAddsOriginalPathToIgnoreSet) {
    DecisionLog log(ignore_, executor_);
    const Decision decision = log.record(move_folder("ProjectX"));

    const DecisionCommandResult result = log.ignore(decision.id);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.decision.state, DecisionState::Ignored);
    EXPECT_TRUE(ignore_.matches(path("ProjectX")));
    EXPECT_TRUE(ignore_.matches(path("ProjectX/inner.txt")));
    EXPECT_FALSE(ignore_.matches(path("ProjectY")));
    EXPECT_EQ(log.user_ignore_patterns(), QStringList{path("ProjectX")});
    // The folder itself stays where the engine put it.
    EXPECT_TRUE(QFileInfo::exists(path("Images/ProjectX/pic.jpg")));
}

TEST_F(DecisionLogTest, RetentionDropsOldestWithoutUndoing) {
    DecisionLog log(ignore_, executor_, nullptr, 2);
    const Decision first = log.record(move_folder("A"));
    log.record(move_folder("B"));
    const Decision third = log.record(move_folder("C"));

    EXPECT_EQ(log.size(), 2);
    Decision dummy;
    EXPECT_FALSE(log.find(first.id, dummy));
    EXPECT_TRUE(QFileInfo::exists(path("Images/A/pic.jpg")));

    const std::vector<Decision> recent = log.recent();
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent.front().id, third.id);
    EXPECT_EQ(log.recent(1).size(), 1u);
}

TEST_F(DecisionLogTest, DecisionsAndIgnoresSurviveRestart) {
    const QString db_path = path("state/auto_sorter.db");
    qint64 kept_id = 0;
    {
        DatabaseManager db(db_path);
        ASSERT_TRUE(db.initialize());
        DecisionLog log(ignore_, executor_, &db, 10);
        const Decision a = log.record(move_folder("A"));
        const Decision b = log.record(move_folder("B"));
        ASSERT_TRUE(log.undo(a.id).success);
        ASSERT_TRUE(log.ignore(b.id).success);
        kept_id = b.id;
    }

    IgnoreSet fresh_ignores;
    DatabaseManager db(db_path);
    ASSERT_TRUE(db.initialize());
    DecisionLog reloaded(fresh_ignores, executor_, &db, 10);
    reloaded.load();

    EXPECT_EQ(reloaded.size(), 2);
    Decision b;
    ASSERT_TRUE(reloaded.find(kept_id, b));
    EXPECT_EQ(b.state, DecisionState::Ignored);
    EXPECT_EQ(reloaded.recent().back().state, DecisionState::UndoneByUser);
    EXPECT_TRUE(fresh_ignores.matches(path("B")));

    // New ids continue after the stored ones.
    EXPECT_GT(reloaded.record(move_folder("C")).id, kept_id);
}

TEST_F(DecisionLogTest, PruningAlsoDeletesRows) {
    const QString db_path = path("prune.db");
    DatabaseManager db(db_path);
    ASSERT_TRUE(db.initialize());
    DecisionLog log(ignore_, executor_, &db, 1);
    log.record(move_folder("A"));
    log.record(move_folder("B"));
    EXPECT_EQ(db.get_decisions().size(), 1u);
}
