/**
 * @file test_duplicates.cpp
 * @brief Structural conflicts between entries
 *
 * Tests: duplicate files and directories, files used as parents in either
 * order, conflicting entries kept for diagnostics.
 */

#include <gtest/gtest.h>
#include "hrx/archive.hpp"
#include "hrx/error.hpp"

using namespace hrx;

TEST(DuplicatesTest, DuplicateFiles) {
    try {
        (void)Archive::parse("<======> file\n<======> file");
        FAIL() << "expected DuplicateEntryError";
    } catch (const DuplicateEntryError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::DuplicateEntry);
        EXPECT_EQ(e.path(), "file");
        EXPECT_EQ(e.existing(), Entry::file());
        EXPECT_EQ(e.incoming(), Entry::file());
        EXPECT_EQ(e.line(), 2);
    }
}

TEST(DuplicatesTest, DuplicateDirectories) {
    try {
        (void)Archive::parse("<======> dir/\n<======> dir/");
        FAIL() << "expected DuplicateEntryError";
    } catch (const DuplicateEntryError& e) {
        EXPECT_EQ(e.path(), "dir");
        EXPECT_EQ(e.existing(), Entry::directory());
        EXPECT_EQ(e.incoming(), Entry::directory());
    }
}

TEST(DuplicatesTest, FileAndDirectoryWithSamePath) {
    try {
        (void)Archive::parse("<===>\nfirst\n<===> x\nbody\n<===>\nsecond\n<===> x/");
        FAIL() << "expected DuplicateEntryError";
    } catch (const DuplicateEntryError& e) {
        EXPECT_EQ(e.path(), "x");
        EXPECT_EQ(e.existing(), Entry(File{"body"}, "first"));
        EXPECT_EQ(e.incoming(), Entry(Directory{}, "second"));
    }
}

TEST(DuplicatesTest, FileAsParent) {
    try {
        (void)Archive::parse("<======> file\n<======> file/sub");
        FAIL() << "expected FileAsDirectoryError";
    } catch (const FileAsDirectoryError& e) {
        EXPECT_EQ(e.kind(), ParseErrorKind::FileAsDirectory);
        EXPECT_EQ(e.parentPath(), "file");
        EXPECT_EQ(e.childPath(), "file/sub");
    }
}

TEST(DuplicatesTest, FileAsGrandparent) {
    try {
        (void)Archive::parse("<===> a\n<===> a/b/c/");
        FAIL() << "expected FileAsDirectoryError";
    } catch (const FileAsDirectoryError& e) {
        EXPECT_EQ(e.parentPath(), "a");
        EXPECT_EQ(e.childPath(), "a/b/c");
    }
}

TEST(DuplicatesTest, FileAfterItsChildren) {
    try {
        (void)Archive::parse("<===> a/b\n<===> a/c\n<===> a");
        FAIL() << "expected FileAsDirectoryError";
    } catch (const FileAsDirectoryError& e) {
        EXPECT_EQ(e.parentPath(), "a");
        EXPECT_EQ(e.childPath(), "a/b");
        EXPECT_EQ(e.line(), 3);
    }
}

TEST(DuplicatesTest, DirectoryAfterItsChildrenIsFine) {
    auto archive = Archive::parse("<===> a/b\n<===> a/");
    EXPECT_EQ(archive.entries().size(), 2);
}

TEST(DuplicatesTest, SiblingPrefixIsNotAParent) {
    auto archive = Archive::parse("<===> file\n<===> file2/sub\n<===> file.d/x");
    EXPECT_EQ(archive.entries().size(), 3);
}
