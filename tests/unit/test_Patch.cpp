#include <gtest/gtest.h>
#include "delta/Patch.hpp"
#include "error/Error.hpp"

#include <string>

using namespace sp::delta;
using namespace sp::error;

class PatchTest : public ::testing::Test {
protected:
    static std::string roundTrip(const std::string& base, const std::string& result) {
        return applyPatch(base, makePatch(base, result));
    }
};

TEST_F(PatchTest, SplitLinesKeepsTerminators) {
    const auto lines = splitLines("a\nb\nc");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "a\n");
    EXPECT_EQ(lines[1], "b\n");
    EXPECT_EQ(lines[2], "c");
    EXPECT_TRUE(splitLines("").empty());
}

TEST_F(PatchTest, IdenticalInputsGiveEmptyPatch) {
    EXPECT_TRUE(makePatch("same\n", "same\n").empty());
    EXPECT_EQ(applyPatch("same\n", ""), "same\n");
}

TEST_F(PatchTest, DiffFindsMinimalEdit) {
    const auto a = splitLines("a\nb\nc\n");
    const auto b = splitLines("a\nx\nc\n");
    const auto ops = diffLines(a, b);

    size_t equal = 0, del = 0, ins = 0;
    for (const auto op : ops) {
        if (op == EditType::Equal) ++equal;
        else if (op == EditType::Delete) ++del;
        else ++ins;
    }
    EXPECT_EQ(equal, 2u);
    EXPECT_EQ(del, 1u);
    EXPECT_EQ(ins, 1u);
}

TEST_F(PatchTest, PatchFormatIsReadable) {
    EXPECT_EQ(makePatch("a\nb\n", "a\nc\n"), "@@ 2 4 4\n=1\n-1\n+2\nc\n");
}

TEST_F(PatchTest, AppliesInsertions) {
    EXPECT_EQ(roundTrip("one\nthree\n", "one\ntwo\nthree\n"), "one\ntwo\nthree\n");
    EXPECT_EQ(roundTrip("", "brand new\ncontent\n"), "brand new\ncontent\n");
}

TEST_F(PatchTest, AppliesDeletions) {
    EXPECT_EQ(roundTrip("one\ntwo\nthree\n", "one\nthree\n"), "one\nthree\n");
    EXPECT_EQ(roundTrip("gone\n", ""), "");
}

TEST_F(PatchTest, HandlesMissingTrailingNewline) {
    EXPECT_EQ(roundTrip("a\nb", "a\nb\n"), "a\nb\n");
    EXPECT_EQ(roundTrip("a\nb\n", "a\nc"), "a\nc");
}

TEST_F(PatchTest, HandlesBinaryContent) {
    std::string base("\x00\x01\x02\n\xff\xfe", 6);
    std::string result("\x00\x01\x02\n\x7f\x00\xfe\n", 8);
    EXPECT_EQ(roundTrip(base, result), result);
}

TEST_F(PatchTest, HandlesLargeRewrites) {
    std::string base, result;
    for (int i = 0; i < 300; ++i) {
        base += "line " + std::to_string(i) + "\n";
        if (i % 3 != 0) result += "line " + std::to_string(i) + "\n";
        if (i % 5 == 0) result += "added " + std::to_string(i) + "\n";
    }
    EXPECT_EQ(roundTrip(base, result), result);
}

TEST_F(PatchTest, FullRewriteOfLargeFileFallsBackToReplace) {
    std::string base, result;
    for (int i = 0; i < 50000; ++i) {
        base += "old line " + std::to_string(i) + "\n";
        result += "new line " + std::to_string(i) + "\n";
    }

    const auto patch = makePatch(base, result);
    EXPECT_EQ(applyPatch(base, patch), result);
    EXPECT_NE(patch.find("\n-50000\n+"), std::string::npos);
}

TEST_F(PatchTest, FallbackKeepsCommonPrefixAndSuffix) {
    std::string base = "header\n", result = "header\n";
    for (int i = 0; i < 3000; ++i) {
        base += "a" + std::to_string(i) + "\n";
        result += "b" + std::to_string(i) + "\n";
    }
    base += "footer\n";
    result += "footer\n";

    const auto ops = diffLines(splitLines(base), splitLines(result));
    ASSERT_EQ(ops.size(), 6002u);
    EXPECT_EQ(ops.front(), EditType::Equal);
    EXPECT_EQ(ops[1], EditType::Delete);
    EXPECT_EQ(ops[3001], EditType::Insert);
    EXPECT_EQ(ops.back(), EditType::Equal);
    EXPECT_EQ(roundTrip(base, result), result);
}

TEST_F(PatchTest, SmallEditInLargeFileStaysSmall) {
    std::string base;
    for (int i = 0; i < 50000; ++i) base += "line " + std::to_string(i) + "\n";
    auto result = base;
    result.replace(result.find("line 100\n"), 9, "changed 100\n");
    result.replace(result.find("line 40000\n"), 11, "changed 40000\n");

    const auto patch = makePatch(base, result);
    EXPECT_LT(patch.size(), 200u);
    EXPECT_EQ(applyPatch(base, patch), result);
}

TEST_F(PatchTest, RejectsWrongBase) {
    const auto patch = makePatch("a\nb\n", "a\nc\n");
    EXPECT_THROW(applyPatch("a\nb\nextra\n", patch), PatchError);
    EXPECT_THROW(applyPatch("a\nbb\n", patch), PatchError);
}

TEST_F(PatchTest, RejectsMalformedScripts) {
    EXPECT_THROW(applyPatch("a\n", "garbage"), PatchError);
    EXPECT_THROW(applyPatch("a\n", "@@ 1 2 2\n?1\n"), PatchError);
    EXPECT_THROW(applyPatch("a\n", "@@ 1 2 2\n=5\n"), PatchError);
    EXPECT_THROW(applyPatch("a\n", "@@ 1 2 9\n=1\n+100\nshort"), PatchError);
    EXPECT_THROW(applyPatch("a\n", "@@ 1 2 0\n"), PatchError);
}

TEST_F(PatchTest, EncodeDecode) {
    const auto patch = makePatch("x\ny\n", "x\nz\n");
    const auto encoded = encodePatch(patch, 6);
    EXPECT_NE(encoded, patch);
    EXPECT_EQ(encoded.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(decodePatch(encoded), patch);
}

TEST_F(PatchTest, DecodeRejectsBadInput) {
    EXPECT_THROW(decodePatch("not hex!"), IntegrityError);
    EXPECT_THROW(decodePatch("abcdef"), IntegrityError);
}
