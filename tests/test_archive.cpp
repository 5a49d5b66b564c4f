#include <gtest/gtest.h>
#include "hrx/archive.hpp"
#include "hrx/error.hpp"

using namespace hrx;

namespace {

const char* kMixedBoundaries =
    "<===> boundary-5.txt\n"
    "This file contains a 5-length boundary:\n"
    "<=====>\n"
    "^ right there\n"
    "\n"
    "<===>\n"
    "This is a comment,\n"
    "<=======>\n"
    "which contains a 7-length boundary.\n"
    "\n"
    "<===> fine.txt\n"
    "This file consists of\n"
    "multiple lines, but none of them\n"
    "starts with any sort of boundary-like string";

ContentViolation rejectedLength(Archive& archive, size_t length) {
    try {
        archive.setBoundaryLength(BoundaryLength(length));
    } catch (const ContentError& e) {
        return e.violation();
    }
    ADD_FAILURE() << "expected ContentError for length " << length;
    return {};
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST(ArchiveTest, EmptyArchive) {
    Archive archive(BoundaryLength(5));
    EXPECT_EQ(archive.boundaryLength().value(), 5);
    EXPECT_TRUE(archive.entries().empty());
    EXPECT_FALSE(archive.comment().has_value());
    EXPECT_EQ(archive.commentPlacement(), CommentPlacement::Leading);
}

TEST(ArchiveTest, ParseDiscoversBoundaryLength) {
    auto archive = Archive::parse(
        "<===> input.scss\n"
        "ul {\n"
        "  margin-left: 1em;\n"
        "  li {\n"
        "    list-style-type: none;\n"
        "  }\n"
        "}\n"
        "\n"
        "<===> output.css\n"
        "ul {\n"
        "  margin-left: 1em;\n"
        "}\n"
        "ul li {\n"
        "  list-style-type: none;\n"
        "}");
    EXPECT_EQ(archive.boundaryLength().value(), 3);
    EXPECT_EQ(archive.entries().size(), 2);
}

// ============================================================================
// Boundary length changes
// ============================================================================

TEST(ArchiveTest, SetBoundaryLength) {
    auto archive = Archive::parse(kMixedBoundaries);
    EXPECT_EQ(archive.boundaryLength().value(), 3);
    ASSERT_EQ(archive.entries().size(), 2);
    EXPECT_EQ(*archive.entries().find(Path::parse("boundary-5.txt"))->body(),
              "This file contains a 5-length boundary:\n<=====>\n^ right there\n");
    EXPECT_EQ(*archive.entries().find(Path::parse("fine.txt"))->comment,
              "This is a comment,\n<=======>\nwhich contains a 7-length boundary.\n");

    archive.setBoundaryLength(BoundaryLength(4));
    EXPECT_EQ(archive.boundaryLength().value(), 4);

    EXPECT_EQ(rejectedLength(archive, 5), (ContentViolation{ContentLocation::EntryData, "boundary-5.txt"}));
    EXPECT_EQ(archive.boundaryLength().value(), 4);

    archive.setBoundaryLength(BoundaryLength(6));
    EXPECT_EQ(archive.boundaryLength().value(), 6);

    EXPECT_EQ(rejectedLength(archive, 7), (ContentViolation{ContentLocation::EntryComment, "fine.txt"}));
    EXPECT_EQ(archive.boundaryLength().value(), 6);

    archive.setBoundaryLength(BoundaryLength(8));
    EXPECT_EQ(archive.boundaryLength().value(), 8);
}

TEST(ArchiveTest, RejectedBoundaryLengthLeavesArchiveUnchanged) {
    auto archive = Archive::parse(kMixedBoundaries);
    Archive before = archive;

    EXPECT_THROW(archive.setBoundaryLength(BoundaryLength(5)), ContentError);
    EXPECT_EQ(archive, before);
    EXPECT_EQ(archive.toString(), kMixedBoundaries);
}

TEST(ArchiveTest, ChangedBoundaryIsUsedForOutput) {
    auto archive = Archive::parse("<===> a\nbody\n<===>\nnote\n<===> b/");
    archive.setBoundaryLength(BoundaryLength(1));
    EXPECT_EQ(archive.toString(), "<=> a\nbody\n<=>\nnote\n<=> b/");
    EXPECT_EQ(Archive::parse(archive.toString()), archive);
}

TEST(ArchiveTest, ChangedBoundaryKeepsMixedArchiveReadable) {
    auto archive = Archive::parse(kMixedBoundaries);
    archive.setBoundaryLength(BoundaryLength(8));

    auto reparsed = Archive::parse(archive.toString());
    EXPECT_EQ(reparsed.boundaryLength().value(), 8);
    EXPECT_EQ(reparsed, archive);
}

// ============================================================================
// Editing
// ============================================================================

TEST(ArchiveTest, EditThenValidate) {
    auto archive = Archive::parse("<===> file\ncontents");

    auto* entry = archive.entries().find(Path::parse("file"));
    ASSERT_NE(entry, nullptr);
    std::get<File>(entry->data).body = "contents\n<===>\nsneaky";

    EXPECT_THROW(archive.validateContent(), ContentError);
    EXPECT_THROW((void)archive.toString(), ContentError);

    archive.setBoundaryLength(BoundaryLength(4));
    EXPECT_NO_THROW(archive.validateContent());
    EXPECT_EQ(archive.toString(), "<====> file\ncontents\n<===>\nsneaky");
}

TEST(ArchiveTest, CopiesAreIndependent) {
    auto archive = Archive::parse("<===> a\n<===> b\n");
    Archive copy = archive;

    copy.entries().remove(Path::parse("a"));
    copy.comment() = "changed";

    EXPECT_EQ(archive.entries().size(), 2);
    EXPECT_FALSE(archive.comment().has_value());
    EXPECT_NE(copy, archive);
}

// ============================================================================
// Equality
// ============================================================================

TEST(ArchiveTest, EqualityIgnoresCommentPlacement) {
    Archive a(BoundaryLength(3));
    Archive b(BoundaryLength(3));
    a.comment() = "c";
    b.comment() = "c";
    b.setCommentPlacement(CommentPlacement::Trailing);
    EXPECT_EQ(a, b);
}

TEST(ArchiveTest, EqualityComparesOrderAndBoundary) {
    auto ab = Archive::parse("<===> a\n<===> b\n");
    auto ba = Archive::parse("<===> b\n<===> a\n");
    auto wide = Archive::parse("<====> a\n<====> b\n");

    EXPECT_NE(ab, ba);
    EXPECT_NE(ab, wide);
    wide.setBoundaryLength(BoundaryLength(3));
    EXPECT_EQ(ab, wide);
}
