#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "CooldownScheduler.hpp"
#include "TestUtils.hpp"

using test_utils::pump_events;
using test_utils::wait_until;
using test_utils::write_file;

namespace {

FsEvent event_for(const QString& path, FsEventKind kind = FsEventKind::Created) {
    FsEvent event;
    event.path = path;
    event.kind = kind;
    return event;
}

} // namespace

class CooldownSchedulerTest : public ::testing::Test {
protected:
    QTemporaryDir temp_;
    QString path(const QString& name) const { return QDir(temp_.path()).filePath(name); }
};

TEST_F(CooldownSchedulerTest, BurstOfEventsSettlesOnce) {
    CooldownScheduler scheduler(300);
    QStringList settled;
    QObject::connect(&scheduler, &CooldownScheduler::path_settled,
                     [&settled](const QString& p) { settled.append(p); });

    const QString file = path("song.mp3");
    ASSERT_TRUE(write_file(file, "a"));
    scheduler.on_event(event_for(file));
    for (int i = 0; i < 5; ++i) {
        pump_events(40);
        ASSERT_TRUE(test_utils::append_file(file, "more"));
        scheduler.on_event(event_for(file, FsEventKind::Modified));
        EXPECT_TRUE(settled.isEmpty());
        EXPECT_TRUE(scheduler.is_pending(file));
    }

    ASSERT_TRUE(wait_until([&]() { return !settled.isEmpty(); }, 2000));
    pump_events(300);
    EXPECT_EQ(settled, QStringList{file});
    EXPECT_FALSE(scheduler.is_pending(file));
}

TEST_F(CooldownSchedulerTest, EntryTracksSizes) {
    CooldownScheduler scheduler(10000);
    const QString file = path("a.bin");
    ASSERT_TRUE(write_file(file, QByteArray(10, 'x')));
    scheduler.on_event(event_for(file));
    ASSERT_TRUE(test_utils::append_file(file, QByteArray(5, 'y')));
    scheduler.on_event(event_for(file, FsEventKind::Modified));

    WatchedEntry entry;
    ASSERT_TRUE(scheduler.entry_for(file, entry));
    EXPECT_EQ(entry.first_seen_size, 10);
    EXPECT_EQ(entry.last_size, 15);
    EXPECT_FALSE(entry.held);
    scheduler.cancel_all();
    EXPECT_EQ(scheduler.pending_count(), 0);
}

TEST_F(CooldownSchedulerTest, RemovalCancelsWithoutSettling) {
    CooldownScheduler scheduler(100);
    QSignalSpy settled(&scheduler, &CooldownScheduler::path_settled);
    QSignalSpy cancelled(&scheduler, &CooldownScheduler::path_cancelled);

    const QString file = path("doc.pdf");
    ASSERT_TRUE(write_file(file));
    scheduler.on_event(event_for(file));
    ASSERT_TRUE(QFile::remove(file));
    scheduler.on_event(event_for(file, FsEventKind::Removed));

    pump_events(300);
    EXPECT_EQ(settled.count(), 0);
    EXPECT_EQ(cancelled.count(), 1);
}

TEST_F(CooldownSchedulerTest, PathDeletedSilentlyIsNotSettled) {
    CooldownScheduler scheduler(80);
    QSignalSpy settled(&scheduler, &CooldownScheduler::path_settled);

    const QString file = path("temp.txt");
    ASSERT_TRUE(write_file(file));
    scheduler.on_event(event_for(file));
    ASSERT_TRUE(QFile::remove(file));

    pump_events(300);
    EXPECT_EQ(settled.count(), 0);
    EXPECT_FALSE(scheduler.is_pending(file));
}

TEST_F(CooldownSchedulerTest, TransientSuffixIsHeldUntilRenamed) {
    CooldownScheduler scheduler(80);
    QSignalSpy settled(&scheduler, &CooldownScheduler::path_settled);
    QSignalSpy held(&scheduler, &CooldownScheduler::path_held);

    const QString partial = path("video.mp4.crdownload");
    ASSERT_TRUE(write_file(partial, QByteArray(100, 'v')));
    scheduler.on_event(event_for(partial));
    scheduler.on_event(event_for(partial, FsEventKind::Modified));

    pump_events(400);
    EXPECT_EQ(settled.count(), 0);
    EXPECT_EQ(held.count(), 1);
    EXPECT_TRUE(scheduler.is_held(partial));
    EXPECT_EQ(scheduler.settling_count(), 0);

    const QString final_path = path("video.mp4");
    ASSERT_TRUE(QFile::rename(partial, final_path));
    scheduler.on_event(event_for(partial, FsEventKind::Removed));
    scheduler.on_event(event_for(final_path));
    EXPECT_FALSE(scheduler.is_pending(partial));
    EXPECT_TRUE(scheduler.is_pending(final_path));

    ASSERT_TRUE(wait_until([&]() { return settled.count() == 1; }, 2000));
    EXPECT_EQ(settled.first().first().toString(), final_path);
}

TEST_F(CooldownSchedulerTest, CancelAllStopsEveryTimer) {
    CooldownScheduler scheduler(100);
    QSignalSpy settled(&scheduler, &CooldownScheduler::path_settled);
    for (int i = 0; i < 4; ++i) {
        const QString file = path(QString("f%1.txt").arg(i));
        ASSERT_TRUE(write_file(file));
        scheduler.on_event(event_for(file));
    }
    EXPECT_EQ(scheduler.pending_count(), 4);
    scheduler.cancel_all();
    pump_events(300);
    EXPECT_EQ(settled.count(), 0);
}

TEST_F(CooldownSchedulerTest, GrowthWithoutEventsRestartsCooldown) {
    CooldownScheduler scheduler(400);
    QSignalSpy settled(&scheduler, &CooldownScheduler::path_settled);

    const QString file = path("quiet.iso");
    ASSERT_TRUE(write_file(file, "1"));
    scheduler.on_event(event_for(file));
    pump_events(100);
    ASSERT_TRUE(test_utils::append_file(file, "2"));
    pump_events(400);
    // The first timer fired and saw a new size.
    EXPECT_EQ(settled.count(), 0);
    EXPECT_TRUE(scheduler.is_pending(file));
    ASSERT_TRUE(wait_until([&]() { return settled.count() == 1; }, 2000));
}
