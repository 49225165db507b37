#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "AppLogger.hpp"

TEST(AppLoggerTest, ParsesSeverityNames) {
    LogSeverity sev = LogSeverity::Trace;
    EXPECT_TRUE(AppLogger::parse_severity("WARNING", sev));
    EXPECT_EQ(sev, LogSeverity::Warning);
    EXPECT_TRUE(AppLogger::parse_severity(" crit ", sev));
    EXPECT_EQ(sev, LogSeverity::Critical);
    EXPECT_FALSE(AppLogger::parse_severity("verbose", sev));
}

TEST(AppLoggerTest, KeepsRecentEntriesAboveMinimumSeverity) {
    AppLogger& logger = AppLogger::instance();
    const LogSeverity previous = logger.minimum_severity();
    logger.set_minimum_severity(LogSeverity::Info);

    LOG_DEBUG("Test", "hidden-entry");
    LOG_WARN("Test", "visible-entry");

    const QStringList recent = logger.recent_entries(1);
    ASSERT_EQ(recent.size(), 1);
    EXPECT_TRUE(recent.first().contains("[WARN] [Test] visible-entry"));
    EXPECT_FALSE(logger.recent_entries(5).join('\n').contains("hidden-entry"));

    logger.set_minimum_severity(previous);
}

TEST(AppLoggerTest, WritesToConfiguredFile) {
    QTemporaryDir temp;
    const QString log_path = QDir(temp.path()).filePath("logs/test.log");
    AppLogger& logger = AppLogger::instance();
    ASSERT_TRUE(logger.set_log_file(log_path));
    EXPECT_EQ(logger.log_file_path(), log_path);

    LOG_ERROR("Test", "written-to-disk");

    QFile file(log_path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    EXPECT_TRUE(file.readAll().contains("written-to-disk"));
}

TEST(AppLoggerTest, RotatesWhenFileGrowsTooLarge) {
    QTemporaryDir temp;
    const QString log_path = QDir(temp.path()).filePath("rotating.log");
    AppLogger& logger = AppLogger::instance();
    ASSERT_TRUE(logger.set_log_file(log_path));
    logger.set_rotation(512, 2);

    for (int i = 0; i < 40; ++i) {
        LOG_ERROR("Test", QString("line %1 %2").arg(i).arg(QString(40, 'x')));
    }

    EXPECT_TRUE(QFileInfo::exists(log_path + ".1"));
    EXPECT_FALSE(QFileInfo::exists(log_path + ".3"));
    EXPECT_LE(QFileInfo(log_path).size(), 512 + 200);

    logger.set_rotation(10 * 1024 * 1024, 3);
}
