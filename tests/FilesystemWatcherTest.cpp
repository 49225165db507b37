#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "FilesystemWatcher.hpp"
#include "IgnoreSet.hpp"
#include "TestUtils.hpp"

using test_utils::wait_until;
using test_utils::write_file;

class FilesystemWatcherTest : public ::testing::Test {
protected:
    QTemporaryDir temp_;
    IgnoreSet ignore_;
    std::vector<FsEvent> events_;

    QString root() const { return QDir(temp_.path()).filePath("inbox"); }
    QString path(const QString& name) const { return QDir(root()).filePath(name); }

    void SetUp() override {
        ASSERT_TRUE(QDir().mkpath(root()));
    }

    void attach(FilesystemWatcher& watcher) {
        QObject::connect(&watcher, &FilesystemWatcher::event_ready,
                         [this](const FsEvent& e) { events_.push_back(e); });
    }

    bool saw(const QString& p, FsEventKind kind) const {
        for (const FsEvent& e : events_) {
            if (e.path == p && e.kind == kind) {
                return true;
            }
        }
        return false;
    }

    int index_of(const QString& p, FsEventKind kind) const {
        for (size_t i = 0; i < events_.size(); ++i) {
            if (events_[i].path == p && events_[i].kind == kind) {
                return static_cast<int>(i);
            }
        }
        return -1;
    }
};

TEST_F(FilesystemWatcherTest, StartupScanSynthesizesCreatedEvents) {
    ASSERT_TRUE(write_file(path("old.pdf")));
    ASSERT_TRUE(write_file(path("Folder/inner.txt")));
    ASSERT_TRUE(write_file(path(".hidden")));
    ASSERT_TRUE(QDir().mkpath(path("Images")));
    ASSERT_TRUE(write_file(path("skip.log")));
    ignore_.add("*.log");

    FilesystemWatcher watcher(&ignore_);
    watcher.set_category_names({"Images", "Others"});
    attach(watcher);
    watcher.start({root()});

    // Delivered synchronously during start().
    EXPECT_TRUE(saw(path("old.pdf"), FsEventKind::Created));
    EXPECT_TRUE(saw(path("Folder"), FsEventKind::Created));
    EXPECT_FALSE(saw(path(".hidden"), FsEventKind::Created));
    EXPECT_FALSE(saw(path("Images"), FsEventKind::Created));
    EXPECT_FALSE(saw(path("skip.log"), FsEventKind::Created));
    EXPECT_FALSE(saw(path("Folder/inner.txt"), FsEventKind::Created));
    EXPECT_EQ(watcher.state(root()), WatchState::Watching);
    EXPECT_TRUE(watcher.is_tracking(path("old.pdf")));
}

TEST_F(FilesystemWatcherTest, ReportsNewFiles) {
    FilesystemWatcher watcher(&ignore_);
    attach(watcher);
    watcher.start({root()});

    ASSERT_TRUE(write_file(path("new.jpg")));
    EXPECT_TRUE(wait_until([&]() { return saw(path("new.jpg"), FsEventKind::Created); }));
}

TEST_F(FilesystemWatcherTest, RenameIsRemovedThenCreated) {
    ASSERT_TRUE(write_file(path("video.mp4.part")));
    FilesystemWatcher watcher(&ignore_);
    attach(watcher);
    watcher.start({root()});

    ASSERT_TRUE(QFile::rename(path("video.mp4.part"), path("video.mp4")));
    ASSERT_TRUE(wait_until([&]() { return saw(path("video.mp4"), FsEventKind::Created); }));
    const int removed = index_of(path("video.mp4.part"), FsEventKind::Removed);
    const int created = index_of(path("video.mp4"), FsEventKind::Created);
    ASSERT_GE(removed, 0);
    EXPECT_LT(removed, created);
}

TEST_F(FilesystemWatcherTest, WritesToTrackedFileAreReported) {
    ASSERT_TRUE(write_file(path("growing.iso"), "a"));
    FilesystemWatcher watcher(&ignore_);
    attach(watcher);
    watcher.start({root()});

    ASSERT_TRUE(test_utils::append_file(path("growing.iso"), "bbbb"));
    EXPECT_TRUE(wait_until([&]() { return saw(path("growing.iso"), FsEventKind::Modified); }));

    watcher.stop_tracking(path("growing.iso"));
    EXPECT_FALSE(watcher.is_tracking(path("growing.iso")));
}

TEST_F(FilesystemWatcherTest, MissingRootDegradesAndRecovers) {
    const QString late_root = QDir(temp_.path()).filePath("late");
    FilesystemWatcher watcher(&ignore_);
    watcher.set_retry_interval(50, 200);
    QSignalSpy degraded(&watcher, &FilesystemWatcher::root_degraded);
    QSignalSpy recovered(&watcher, &FilesystemWatcher::root_recovered);
    attach(watcher);

    watcher.start({late_root});
    EXPECT_EQ(watcher.state(late_root), WatchState::Degraded);
    EXPECT_EQ(degraded.count(), 1);

    ASSERT_TRUE(write_file(QDir(late_root).filePath("waiting.pdf")));
    ASSERT_TRUE(wait_until([&]() { return recovered.count() == 1; }, 3000));
    EXPECT_EQ(watcher.state(late_root), WatchState::Watching);
    // Recovery rescans what appeared in the meantime.
    EXPECT_TRUE(saw(QDir(late_root).filePath("waiting.pdf"), FsEventKind::Created));
}

TEST_F(FilesystemWatcherTest, DeletedRootDegrades) {
    FilesystemWatcher watcher(&ignore_);
    watcher.set_retry_interval(50, 100);
    QSignalSpy degraded(&watcher, &FilesystemWatcher::root_degraded);
    watcher.start({root()});

    ASSERT_TRUE(QDir(root()).removeRecursively());
    ASSERT_TRUE(wait_until([&]() { return degraded.count() == 1; }, 3000));
    EXPECT_EQ(watcher.state(root()), WatchState::Degraded);

    QSignalSpy recovered(&watcher, &FilesystemWatcher::root_recovered);
    ASSERT_TRUE(QDir().mkpath(root()));
    EXPECT_TRUE(wait_until([&]() { return recovered.count() == 1; }, 3000));
}

TEST_F(FilesystemWatcherTest, StopSilencesEverything) {
    FilesystemWatcher watcher(&ignore_);
    attach(watcher);
    watcher.start({root()});
    watcher.stop();
    EXPECT_FALSE(watcher.is_running());

    ASSERT_TRUE(write_file(path("after.txt")));
    test_utils::pump_events(300);
    EXPECT_FALSE(saw(path("after.txt"), FsEventKind::Created));
    EXPECT_EQ(watcher.state(root()), WatchState::Stopped);
}

TEST_F(FilesystemWatcherTest, RescanReportsEverythingAgain) {
    ASSERT_TRUE(write_file(path("a.txt")));
    FilesystemWatcher watcher(&ignore_);
    attach(watcher);
    watcher.start({root()});
    events_.clear();

    watcher.rescan(root());
    EXPECT_TRUE(saw(path("a.txt"), FsEventKind::Created));
}
