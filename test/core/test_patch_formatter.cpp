#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <vector>
#include "test_utils.hpp"
#include "core/PatchFormatter.hpp"
#include "util/Logger.hpp"

using namespace gitscribe;
using namespace gitscribe::test::utils;

/**
 * Hunk used by most tests, placed after a 4-line diff header:
 *   4 @@ -1,3 +1,4 @@
 *   5  a
 *   6 -b
 *   7 +B
 *   8 +c
 *   9  d
 */
class PatchFormatterTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setStream(&logOutput);
        diff.hunks.push_back(makeHunk(1, 3, 1, 4, {" a", "-b", "+B", "+c", " d"}, 4));
    }

    void TearDown() override {
        Logger::instance().setStream(nullptr);
    }

    std::string patchFor(const DiffSelection& selection, AppFileStatusKind kind = AppFileStatusKind::Modified) {
        auto result = PatchFormatter::formatPatch("f.txt", kind, diff.hunks, selection);
        EXPECT_TRUE(result.has_value()) << result.error().message;
        return result.has_value() ? result.value() : std::string();
    }

    TextDiff diff;
    std::ostringstream logOutput;
};

TEST_F(PatchFormatterTest, HunkHeader) {
    EXPECT_EQ(PatchFormatter::formatHunkHeader(10, 1, 10, 3), "@@ -10 +10,3 @@\n");
    EXPECT_EQ(PatchFormatter::formatHunkHeader(0, 0, 1, 2), "@@ -0,0 +1,2 @@\n");
    EXPECT_EQ(PatchFormatter::formatHunkHeader(5, 2, 5, 2, "int main()"), "@@ -5,2 +5,2 @@ int main()\n");
}

TEST_F(PatchFormatterTest, PatchHeaders) {
    EXPECT_EQ(PatchFormatter::formatPatchHeader(std::string("a.txt"), std::string("a.txt")),
              "--- a/a.txt\n+++ b/a.txt\n");
    EXPECT_EQ(PatchFormatter::formatPatchHeader(std::nullopt, std::string("n.txt")),
              "--- /dev/null\n+++ b/n.txt\n");
    EXPECT_EQ(PatchFormatter::formatPatchHeader(std::string("gone.txt"), std::nullopt),
              "--- a/gone.txt\n+++ /dev/null\n");

    EXPECT_EQ(PatchFormatter::formatPatchHeaderForFile("u.txt", AppFileStatusKind::Untracked),
              "--- /dev/null\n+++ b/u.txt\n");
    EXPECT_EQ(PatchFormatter::formatPatchHeaderForFile("m.txt", AppFileStatusKind::Deleted),
              "--- a/m.txt\n+++ b/m.txt\n");
}

// Test: With everything selected the hunk is reproduced as is
TEST_F(PatchFormatterTest, AllSelectedReproducesHunk) {
    EXPECT_EQ(patchFor(DiffSelection(DiffSelectionType::All)),
              "--- a/f.txt\n+++ b/f.txt\n"
              "@@ -1,3 +1,4 @@\n a\n-b\n+B\n+c\n d\n");
}

// Test: An unselected addition in an existing file becomes context
TEST_F(PatchFormatterTest, UnselectedAdditionBecomesContext) {
    DiffSelection selection = DiffSelection(DiffSelectionType::All).withLineSelection(8, false);
    EXPECT_EQ(patchFor(selection),
              "--- a/f.txt\n+++ b/f.txt\n"
              "@@ -1,4 +1,4 @@\n a\n-b\n+B\n c\n d\n");
}

// Test: An unselected deletion is left out of the patch
TEST_F(PatchFormatterTest, UnselectedDeletionIsDropped) {
    DiffSelection selection = DiffSelection(DiffSelectionType::All).withLineSelection(6, false);
    EXPECT_EQ(patchFor(selection),
              "--- a/f.txt\n+++ b/f.txt\n"
              "@@ -1,2 +1,4 @@\n a\n+B\n+c\n d\n");
}

// Test: New files drop unselected additions instead of keeping them as context
TEST_F(PatchFormatterTest, NewFilePartialSelection) {
    diff.hunks = {makeHunk(0, 0, 1, 2, {"+x", "+y"}, 4)};
    DiffSelection selection = DiffSelection(DiffSelectionType::All).withLineSelection(6, false);
    EXPECT_EQ(patchFor(selection, AppFileStatusKind::New),
              "--- /dev/null\n+++ b/f.txt\n"
              "@@ -0,0 +1 @@\n+x\n");
}

TEST_F(PatchFormatterTest, NothingSelectedIsEmptyPatch) {
    auto result = PatchFormatter::formatPatch("f.txt", AppFileStatusKind::Modified, diff.hunks, DiffSelection());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::EmptyPatch);
    EXPECT_EQ(result.error().message, "Could not generate a patch, no changes for file f.txt");
}

// Test: Hunks without a selected change are skipped entirely
TEST_F(PatchFormatterTest, SkipsHunksWithoutSelection) {
    // Second hunk starts right after the first (absolute indexes 10..12)
    diff.hunks.push_back(makeHunk(20, 1, 21, 2, {" x", "+y"}, 10));
    DiffSelection selection = DiffSelection().withLineSelection(12, true);
    EXPECT_EQ(patchFor(selection),
              "--- a/f.txt\n+++ b/f.txt\n"
              "@@ -20 +21,2 @@\n x\n+y\n");
}

TEST_F(PatchFormatterTest, KeepsNoNewlineMarker) {
    diff.hunks = {makeHunk(3, 1, 3, 1, {"-old", "\\", "+new", "\\"}, 4)};
    EXPECT_EQ(patchFor(DiffSelection(DiffSelectionType::All)),
              "--- a/f.txt\n+++ b/f.txt\n"
              "@@ -3 +3 @@\n-old\n\\ No newline at end of file\n+new\n\\ No newline at end of file\n");
}

TEST_F(PatchFormatterTest, WorkingDirectoryChangeOverload) {
    AppFileStatus status;
    status.kind = AppFileStatusKind::Modified;
    WorkingDirectoryFileChange file{"f.txt", status, DiffSelection(DiffSelectionType::All)};

    auto result = PatchFormatter::formatPatch(file, diff);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(), patchFor(DiffSelection(DiffSelectionType::All)));
    EXPECT_EQ(PatchFormatter::formatPatchHeaderForFile(file), "--- a/f.txt\n+++ b/f.txt\n");
}

// Test: Discarding an added line removes it; other additions stay as context
TEST_F(PatchFormatterTest, DiscardSelectedAddition) {
    DiffSelection selection = DiffSelection().withLineSelection(8, true);
    auto result = PatchFormatter::formatPatchToDiscardChanges("f.txt", diff, selection);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(),
              "--- a/f.txt\n+++ b/f.txt\n"
              "@@ -1,4 +1,3 @@\n a\n B\n-c\n d\n");
}

// Test: Discarding a deleted line restores it
TEST_F(PatchFormatterTest, DiscardSelectedDeletion) {
    DiffSelection selection = DiffSelection().withLineSelection(6, true);
    auto result = PatchFormatter::formatPatchToDiscardChanges("f.txt", diff, selection);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(),
              "--- a/f.txt\n+++ b/f.txt\n"
              "@@ -1,4 +1,5 @@\n a\n+b\n B\n c\n d\n");
}

TEST_F(PatchFormatterTest, DiscardNothingSelected) {
    auto result = PatchFormatter::formatPatchToDiscardChanges("f.txt", diff, DiffSelection());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::EmptyPatch);
    EXPECT_EQ(result.error().message, "Nothing to discard for file f.txt");
}
