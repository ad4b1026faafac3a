#include "syncmd/sync/merge.hpp"

#include <gtest/gtest.h>

#include <string>

using syncmd::sync::count_lines;
using syncmd::sync::merge_bodies;
using syncmd::sync::merge_document;
using syncmd::sync::split_preamble;

namespace {

std::string lines(int n, const std::string& prefix) {
    std::string out;
    for (int i = 0; i < n; ++i) {
        out += prefix + std::to_string(i) + "\n";
    }
    return out;
}

} // namespace

TEST(SplitPreambleTest, SeparatesPreambleAndBody) {
    const auto parts = split_preamble("---\ntitle: X\ntags: [a]\n---\n\nHello\n");
    EXPECT_EQ(parts.preamble, "title: X\ntags: [a]\n");
    EXPECT_EQ(parts.body, "Hello\n");
}

TEST(SplitPreambleTest, NoOpeningMarkerMeansNoPreamble) {
    const std::string text = "Hello\n---\nnot a preamble\n---\n";
    const auto parts = split_preamble(text);
    EXPECT_TRUE(parts.preamble.empty());
    EXPECT_EQ(parts.body, text);
}

TEST(SplitPreambleTest, UnclosedPreambleIsBody) {
    const std::string text = "---\ntitle: X\nno closing marker\n";
    const auto parts = split_preamble(text);
    EXPECT_TRUE(parts.preamble.empty());
    EXPECT_EQ(parts.body, text);
}

TEST(CountLinesTest, CountsFinalLineWithoutNewline) {
    EXPECT_EQ(count_lines(""), 0u);
    EXPECT_EQ(count_lines("a"), 1u);
    EXPECT_EQ(count_lines("a\n"), 1u);
    EXPECT_EQ(count_lines("a\nb"), 2u);
}

TEST(MergeBodiesTest, BothSidesMaterialProducesConflictMarkers) {
    const std::string base = "shared\n";
    const std::string local = base + lines(5, "local ");
    const std::string remote = base + lines(6, "remote ");

    const auto merged = merge_bodies(local, remote, base);
    EXPECT_TRUE(merged.has_conflict_markers);
    EXPECT_EQ(merged.content, "<<<<<<< local\n" + local + "=======\n" + remote + ">>>>>>> remote\n");
}

TEST(MergeBodiesTest, ExactlyThresholdIsNotMaterial) {
    const std::string base = "shared\n";
    const std::string local = base + lines(3, "local ");
    const std::string remote = base + lines(3, "remote ");

    const auto merged = merge_bodies(local, remote, base);
    EXPECT_FALSE(merged.has_conflict_markers);
    EXPECT_EQ(merged.content, local + "\n\n" + remote);
}

TEST(MergeBodiesTest, PrefersTheSideThatChanged) {
    const std::string base = "one\ntwo\n";
    const std::string edited = "one\ntwo\nthree\n";

    EXPECT_EQ(merge_bodies(base, edited, base).content, edited);
    EXPECT_EQ(merge_bodies(edited, base, base).content, edited);
}

TEST(MergeBodiesTest, MaterialSideWinsOverSmallEdit) {
    const std::string base = "start\n";
    const std::string local = "start, tweaked\n";
    const std::string remote = base + lines(10, "added ");

    const auto merged = merge_bodies(local, remote, base);
    EXPECT_FALSE(merged.has_conflict_markers);
    EXPECT_EQ(merged.content, remote);
}

TEST(MergeDocumentTest, RemotePreambleWithUnchangedBody) {
    const std::string body = "Shared body line\n";
    const std::string local = body;
    const std::string remote = "---\ntitle: X\n---\n\n" + body;
    const std::string base = body;

    const auto merged = merge_document(local, remote, base);
    EXPECT_FALSE(merged.has_conflict_markers);
    EXPECT_EQ(merged.content, "---\ntitle: X\n---\n\n" + body);
}

TEST(MergeDocumentTest, LocalPreambleKeptWhenRemoteHasNone) {
    const std::string local = "---\ntitle: Local\n---\n\nbody\n";
    const std::string remote = "body\n";

    const auto merged = merge_document(local, remote, "body\n");
    EXPECT_EQ(merged.content, "---\ntitle: Local\n---\n\nbody\n");
}

TEST(MergeDocumentTest, RemotePreambleOverridesLocal) {
    const std::string local = "---\ntitle: Local\n---\n\nbody\n";
    const std::string remote = "---\ntitle: Remote\n---\n\nbody\n";

    const auto merged = merge_document(local, remote, "body\n");
    EXPECT_EQ(merged.content, "---\ntitle: Remote\n---\n\nbody\n");
}
