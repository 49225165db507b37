#include <gtest/gtest.h>

#include "IgnoreSet.hpp"

TEST(IgnoreSetTest, AbsolutePathCoversItselfAndDescendants) {
    IgnoreSet set({"/home/u/Downloads/Keep"});
    EXPECT_TRUE(set.matches("/home/u/Downloads/Keep"));
    EXPECT_TRUE(set.matches("/home/u/Downloads/Keep/inner/file.txt"));
    EXPECT_FALSE(set.matches("/home/u/Downloads/Keeper"));
    EXPECT_FALSE(set.matches("/home/u/Downloads"));
}

TEST(IgnoreSetTest, BareNameMatchesBasenameAnywhere) {
    IgnoreSet set({"desktop.ini", "*.log"});
    EXPECT_TRUE(set.matches("/a/b/desktop.ini"));
    EXPECT_TRUE(set.matches("/a/b/server.log"));
    EXPECT_FALSE(set.matches("/a/b/server.log.txt"));
}

TEST(IgnoreSetTest, AbsoluteWildcardMatchesFullPath) {
    IgnoreSet set({"/data/*/cache"});
    EXPECT_TRUE(set.matches("/data/app/cache"));
    EXPECT_FALSE(set.matches("/data/app/other"));
}

TEST(IgnoreSetTest, AddIsDeduplicatedAndNormalized) {
    IgnoreSet set;
    EXPECT_TRUE(set.add("/x/y/"));
    EXPECT_FALSE(set.add("/x/y"));
    EXPECT_FALSE(set.add("   "));
    EXPECT_EQ(set.size(), 1);
    EXPECT_TRUE(set.contains_pattern("/x//y"));
    EXPECT_TRUE(set.remove("/x/y"));
    EXPECT_FALSE(set.matches("/x/y"));
}

TEST(IgnoreSetTest, ReplaceAllSwapsEverything) {
    IgnoreSet set({"a.txt"});
    set.replace_all({"b.txt", "/c"});
    EXPECT_FALSE(set.matches("/r/a.txt"));
    EXPECT_TRUE(set.matches("/r/b.txt"));
    EXPECT_EQ(set.patterns(), (QStringList{"b.txt", "/c"}));
}
