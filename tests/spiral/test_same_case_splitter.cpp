#include <gtest/gtest.h>
#include <spiral/same_case_splitter.hpp>
#include <chrono>
#include <memory>
#include <numeric>

using namespace spiral;

class SameCaseSplitterTest : public ::testing::Test {
protected:
    // Build the scoring chain over the fixture's current data
    const SameCaseSplitter& splitter() {
        scoring_ = std::make_unique<ScoringModel>(frequencies_, dictionary_);
        splitter_ = std::make_unique<SameCaseSplitter>(*scoring_);
        return *splitter_;
    }

    static std::string join(const Split& split) {
        return std::accumulate(split.begin(), split.end(), std::string());
    }

    FrequencyTable frequencies_;
    WordListDictionary dictionary_;
    std::unique_ptr<ScoringModel> scoring_;
    std::unique_ptr<SameCaseSplitter> splitter_;
};

// ============================================================================
// Base Cases
// ============================================================================

TEST_F(SameCaseSplitterTest, SingleCharacterIsNotSplit) {
    frequencies_.add("x", 1000);
    EXPECT_EQ(splitter().split("x"), Split({"x"}));
    EXPECT_EQ(splitter().split("x", 0), Split({"x"}));
}

TEST_F(SameCaseSplitterTest, DictionaryWordIsNotSplit) {
    frequencies_.add("thresh", 500);
    frequencies_.add("old", 800);
    dictionary_.add("threshold");

    EXPECT_EQ(splitter().split("threshold", 0), Split({"threshold"}));
    EXPECT_EQ(splitter().split("THRESHOLD", 0), Split({"THRESHOLD"}));
}

TEST_F(SameCaseSplitterTest, WithoutEvidenceTokenIsNotSplit) {
    EXPECT_EQ(splitter().split("qwzxv"), Split({"qwzxv"}));
}

// ============================================================================
// Case 1: both halves clear the threshold
// ============================================================================

TEST_F(SameCaseSplitterTest, SplitsIntoTwoScoredWords) {
    frequencies_.add("auto", 5000);
    frequencies_.add("commit", 8000);

    EXPECT_EQ(splitter().split("autocommit"), Split({"auto", "commit"}));
}

TEST_F(SameCaseSplitterTest, KeepsOriginalCase) {
    frequencies_.add("auto", 5000);
    frequencies_.add("commit", 8000);

    EXPECT_EQ(splitter().split("AUTOCOMMIT"), Split({"AUTO", "COMMIT"}));
}

TEST_F(SameCaseSplitterTest, HighestScoringCutWins) {
    frequencies_.add("sun", 500);
    frequencies_.add("moonday", 40);
    frequencies_.add("sunmoon", 40);
    frequencies_.add("day", 300);

    // 500 + 40 beats 40 + 300
    EXPECT_EQ(splitter().split("sunmoonday"), Split({"sun", "moonday"}));
}

TEST_F(SameCaseSplitterTest, LaterHigherScoringCutReplacesEarlierOne) {
    frequencies_.add("sun", 500);
    frequencies_.add("moonday", 40);
    frequencies_.add("sunmoon", 400);
    frequencies_.add("day", 300);

    // 400 + 300 beats 500 + 40
    EXPECT_EQ(splitter().split("sunmoonday"), Split({"sunmoon", "day"}));
}

TEST_F(SameCaseSplitterTest, ThresholdComesFromScoreFloor) {
    frequencies_.add("auto", 5000);
    frequencies_.add("commit", 8000);

    // 5000^(1/2.5) is about 30, far below the floor
    EXPECT_EQ(splitter().split("autocommit", 1e6), Split({"autocommit"}));
}

TEST_F(SameCaseSplitterTest, ThresholdComesFromTokenScore) {
    frequencies_.add("auto", 5000);
    frequencies_.add("commit", 8000);
    frequencies_.add("autocommit", 1e8);

    EXPECT_EQ(splitter().split("autocommit", 0), Split({"autocommit"}));
}

// ============================================================================
// Case 2: only the left half clears the threshold
// ============================================================================

TEST_F(SameCaseSplitterTest, RecursesIntoRightHalf) {
    frequencies_.add("http", 900);
    frequencies_.add("get", 800);
    frequencies_.add("data", 700);

    // "getdata" has no score of its own, so the cut after "http" recurses
    EXPECT_EQ(splitter().split("httpgetdata"), Split({"http", "get", "data"}));
}

TEST_F(SameCaseSplitterTest, UnsplittableRightHalfRecordsNothing) {
    frequencies_.add("arg", 500);

    EXPECT_EQ(splitter().split("argv"), Split({"argv"}));
}

TEST_F(SameCaseSplitterTest, FailedRecursionKeepsEarlierResult) {
    frequencies_.add("dog", 300);
    frequencies_.add("catz", 100);
    frequencies_.add("dogcat", 200);

    // The cut after "dogcat" recurses on "z", which cannot split
    EXPECT_EQ(splitter().split("dogcatz"), Split({"dog", "catz"}));
}

TEST_F(SameCaseSplitterTest, LaterRecursiveSplitOverridesEarlierBestCut) {
    frequencies_.add("foo", 100);
    frequencies_.add("barbazqux", 100);
    frequencies_.add("foobar", 100);
    frequencies_.add("baz", 100);
    frequencies_.add("qux", 100);

    // i = 3 gives foo | barbazqux with both halves scored; i = 6 gives
    // foobar | bazqux where bazqux only splits recursively. The later
    // recursive result wins regardless of the earlier score.
    EXPECT_EQ(splitter().split("foobarbazqux"), Split({"foobar", "baz", "qux"}));
}

// ============================================================================
// Affix suppression
// ============================================================================

TEST_F(SameCaseSplitterTest, DoesNotSplitOffPrefix) {
    frequencies_.add("un", 500);
    frequencies_.add("directed", 800);

    EXPECT_EQ(splitter().split("undirected"), Split({"undirected"}));
}

TEST_F(SameCaseSplitterTest, SameCutWithoutPrefixSplits) {
    frequencies_.add("on", 500);
    frequencies_.add("directed", 800);

    EXPECT_EQ(splitter().split("ondirected"), Split({"on", "directed"}));
}

TEST_F(SameCaseSplitterTest, DoesNotSplitOffSuffix) {
    frequencies_.add("work", 800);
    frequencies_.add("er", 400);

    EXPECT_EQ(splitter().split("worker"), Split({"worker"}));
}

TEST_F(SameCaseSplitterTest, SameCutWithoutSuffixSplits) {
    frequencies_.add("work", 800);
    frequencies_.add("it", 400);

    EXPECT_EQ(splitter().split("workit"), Split({"work", "it"}));
}

// ============================================================================
// Reconstruction
// ============================================================================

TEST_F(SameCaseSplitterTest, SplitReconstructsToken) {
    frequencies_.add("foo", 100);
    frequencies_.add("barbazqux", 100);
    frequencies_.add("foobar", 100);
    frequencies_.add("baz", 100);
    frequencies_.add("qux", 100);
    frequencies_.add("auto", 5000);
    frequencies_.add("commit", 8000);

    for (const std::string token : {"foobarbazqux", "autocommit", "bazquxfoo",
                                    "quxquxqux", "zz", "autobaz"}) {
        Split result = splitter().split(token);
        EXPECT_EQ(join(result), token);
        for (const auto& piece : result) {
            EXPECT_FALSE(piece.empty()) << token;
        }
    }
}

// ============================================================================
// Long runs
// ============================================================================

TEST_F(SameCaseSplitterTest, LongRepetitiveRunFinishesQuickly) {
    frequencies_.add("aa", 100);
    frequencies_.add("aaa", 100);

    // Every cut recurses; each suffix must be solved only once
    const std::string token(200, 'a');
    auto start = std::chrono::steady_clock::now();
    Split result = splitter().split(token);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(join(result), token);
    EXPECT_GT(result.size(), 1u);
    for (const auto& piece : result) {
        EXPECT_FALSE(piece.empty());
    }
}

TEST_F(SameCaseSplitterTest, RepeatedCallsGiveSameSplit) {
    frequencies_.add("aa", 100);
    frequencies_.add("aaa", 100);

    const std::string token(30, 'a');
    EXPECT_EQ(splitter().split(token), splitter().split(token));
}
