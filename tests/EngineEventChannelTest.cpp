#include <gtest/gtest.h>
#include <QThread>
#include <atomic>
#include <memory>

#include "EngineEventChannel.hpp"

namespace {

EngineNotification note(const QString& path) {
    EngineNotification n;
    n.kind = NotificationKind::MoveCompleted;
    n.path = path;
    return n;
}

MoveRecord record(const QString& source) {
    MoveRecord r;
    r.source_path = source;
    r.destination_path = source + ".moved";
    return r;
}

} // namespace

TEST(EngineEventChannelTest, NotificationsComeOutInOrder) {
    EngineEventChannel channel(8, 8);
    channel.post_notification(note("a"));
    channel.post_notification(note("b"));

    EngineNotification out;
    ASSERT_TRUE(channel.try_take_notification(out));
    EXPECT_EQ(out.path, "a");
    EXPECT_GT(out.timestamp_ms, 0);
    ASSERT_TRUE(channel.try_take_notification(out));
    EXPECT_EQ(out.path, "b");
    EXPECT_FALSE(channel.try_take_notification(out));
}

TEST(EngineEventChannelTest, OverflowDropsOldestAndReportsIt) {
    EngineEventChannel channel(3, 8);
    for (int i = 0; i < 5; ++i) {
        channel.post_notification(note(QString::number(i)));
    }
    EXPECT_EQ(channel.dropped_notifications(), 2u);
    EXPECT_EQ(channel.pending_notifications(), 3);

    EngineNotification out;
    ASSERT_TRUE(channel.try_take_notification(out));
    EXPECT_EQ(out.kind, NotificationKind::NotificationsDropped);
    EXPECT_EQ(out.dropped_count, 2);

    ASSERT_TRUE(channel.try_take_notification(out));
    EXPECT_EQ(out.path, "2");
    ASSERT_TRUE(channel.try_take_notification(out));
    ASSERT_TRUE(channel.try_take_notification(out));
    EXPECT_EQ(out.path, "4");
    EXPECT_FALSE(channel.try_take_notification(out));
}

TEST(EngineEventChannelTest, WaitTimesOut) {
    EngineEventChannel channel;
    EngineNotification out;
    EXPECT_FALSE(channel.wait_notification(out, 20));
    MoveRecord r;
    EXPECT_FALSE(channel.wait_move_record(r, 20));
}

TEST(EngineEventChannelTest, FullRecordQueueBlocksProducerInsteadOfDropping) {
    EngineEventChannel channel(4, 2);
    ASSERT_TRUE(channel.push_move_record(record("1")));
    ASSERT_TRUE(channel.push_move_record(record("2")));

    std::atomic<bool> third_pushed{false};
    std::unique_ptr<QThread> producer(QThread::create([&]() {
        channel.push_move_record(record("3"));
        third_pushed = true;
    }));
    producer->start();

    QThread::msleep(100);
    EXPECT_FALSE(third_pushed.load());

    MoveRecord out;
    ASSERT_TRUE(channel.try_take_move_record(out));
    EXPECT_EQ(out.source_path, "1");
    ASSERT_TRUE(producer->wait(2000));
    EXPECT_TRUE(third_pushed.load());

    ASSERT_TRUE(channel.wait_move_record(out, 100));
    EXPECT_EQ(out.source_path, "2");
    ASSERT_TRUE(channel.wait_move_record(out, 100));
    EXPECT_EQ(out.source_path, "3");
}

TEST(EngineEventChannelTest, CloseWakesWaitersAndKeepsQueuedItems) {
    EngineEventChannel channel;
    ASSERT_TRUE(channel.push_move_record(record("left")));

    std::atomic<int> drained{0};
    std::unique_ptr<QThread> consumer(QThread::create([&]() {
        MoveRecord r;
        while (channel.wait_move_record(r)) {
            ++drained;
        }
    }));
    consumer->start();
    QThread::msleep(50);
    channel.close();

    ASSERT_TRUE(consumer->wait(2000));
    EXPECT_EQ(drained.load(), 1);
    EXPECT_TRUE(channel.is_closed());
    EXPECT_FALSE(channel.push_move_record(record("late")));
}

TEST(EngineEventChannelTest, KindNamesAreStable) {
    EXPECT_EQ(notification_kind_name(NotificationKind::WatchDegraded), "WatchDegraded");
    EXPECT_EQ(notification_kind_name(NotificationKind::NotificationsDropped), "NotificationsDropped");
}
