#include <gtest/gtest.h>
#include <QDir>
#include <QTemporaryDir>

#include "FolderAnalyzer.hpp"
#include "RuleTree.hpp"
#include "TestUtils.hpp"

using test_utils::write_file;

class FolderAnalyzerTest : public ::testing::Test {
protected:
    QTemporaryDir temp_;
    std::shared_ptr<const RuleTree> rules_ = RuleTree::default_tree();

    QString make(const QString& relative, int bytes = 4) {
        const QString full = QDir(temp_.path()).filePath(relative);
        write_file(full, QByteArray(bytes, 'x'));
        return full;
    }
};

TEST_F(FolderAnalyzerTest, PluralityCategoryWins) {
    for (int i = 0; i < 8; ++i) {
        make(QString("ProjectX/img%1.jpg").arg(i));
    }
    make("ProjectX/notes.txt");
    make("ProjectX/sub/readme.txt");

    FolderAnalyzer analyzer;
    const FolderAnalysis analysis = analyzer.analyze(QDir(temp_.path()).filePath("ProjectX"), *rules_);
    EXPECT_EQ(analysis.category, "Images");
    EXPECT_EQ(analysis.sampled_files, 10);
    EXPECT_EQ(analysis.tally.value("Images").count, 8);
    EXPECT_EQ(analysis.tally.value("Documents").count, 2);
    EXPECT_FALSE(analysis.truncated);
}

TEST_F(FolderAnalyzerTest, UnmatchedFilesCountAsOthers) {
    make("Mixed/a.zzz");
    make("Mixed/b.zzz");
    make("Mixed/c.mp3");

    FolderAnalyzer analyzer;
    const FolderAnalysis analysis = analyzer.analyze(QDir(temp_.path()).filePath("Mixed"), *rules_);
    EXPECT_EQ(analysis.category, "Others");
}

TEST_F(FolderAnalyzerTest, EmptyFolderFallsBackToDefault) {
    QDir(temp_.path()).mkpath("Empty/nested");
    FolderAnalyzer analyzer;
    const FolderAnalysis analysis = analyzer.analyze(QDir(temp_.path()).filePath("Empty"), *rules_);
    EXPECT_EQ(analysis.category, "Others");
    EXPECT_EQ(analysis.classified_files, 0);
}

TEST_F(FolderAnalyzerTest, SampleCapStopsTheWalk) {
    for (int i = 0; i < 20; ++i) {
        make(QString("Big/f%1.mp3").arg(i));
    }
    FolderAnalyzer analyzer(5);
    const FolderAnalysis analysis = analyzer.analyze(QDir(temp_.path()).filePath("Big"), *rules_);
    EXPECT_EQ(analysis.sampled_files, 5);
    EXPECT_TRUE(analysis.truncated);
    EXPECT_EQ(analysis.category, "Audio");
}

TEST_F(FolderAnalyzerTest, DoesNotTouchTheFolder) {
    make("Keep/a.jpg");
    make("Keep/b.pdf");
    const QString folder = QDir(temp_.path()).filePath("Keep");
    const QStringList before = QDir(folder).entryList(QDir::Files);

    FolderAnalyzer analyzer;
    analyzer.analyze(folder, *rules_);
    EXPECT_EQ(QDir(folder).entryList(QDir::Files), before);
}

TEST(FolderAnalyzerTieBreakTest, TieGoesToLargerTotalSize) {
    QMap<QString, CategoryTally> tally;
    tally["Audio"] = {3, 100};
    tally["Video"] = {3, 5000};
    tally["Images"] = {1, 99999};
    EXPECT_EQ(FolderAnalyzer::pick_dominant(tally), "Video");
}

TEST(FolderAnalyzerTieBreakTest, FullTieGoesToAlphabeticallyFirst) {
    QMap<QString, CategoryTally> tally;
    tally["Video"] = {2, 10};
    tally["Audio"] = {2, 10};
    EXPECT_EQ(FolderAnalyzer::pick_dominant(tally), "Audio");
}

TEST(FolderAnalyzerTieBreakTest, EmptyTallyGivesDefault) {
    EXPECT_EQ(FolderAnalyzer::pick_dominant({}), "Others");
}
