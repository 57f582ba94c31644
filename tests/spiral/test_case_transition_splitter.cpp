#include <gtest/gtest.h>
#include <spiral/case_transition_splitter.hpp>
#include <memory>

using namespace spiral;

class CaseTransitionSplitterTest : public ::testing::Test {
protected:
    const CaseTransitionSplitter& splitter() {
        scoring_ = std::make_unique<ScoringModel>(frequencies_, dictionary_);
        splitter_ = std::make_unique<CaseTransitionSplitter>(*scoring_);
        return *splitter_;
    }

    FrequencyTable frequencies_;
    WordListDictionary dictionary_;
    std::unique_ptr<ScoringModel> scoring_;
    std::unique_ptr<CaseTransitionSplitter> splitter_;
};

TEST_F(CaseTransitionSplitterTest, FindsFirstUpperToLowerPair) {
    EXPECT_EQ(CaseTransitionSplitter::find_transition("GPSmodule"), 2u);
    EXPECT_EQ(CaseTransitionSplitter::find_transition("Foo"), 0u);
    EXPECT_EQ(CaseTransitionSplitter::find_transition("ASTVisitorNode"), 3u);
    EXPECT_FALSE(CaseTransitionSplitter::find_transition("getdata").has_value());
    EXPECT_FALSE(CaseTransitionSplitter::find_transition("MAX").has_value());
    EXPECT_FALSE(CaseTransitionSplitter::find_transition("aB").has_value());
    EXPECT_FALSE(CaseTransitionSplitter::find_transition("").has_value());
}

TEST_F(CaseTransitionSplitterTest, NoTransitionLeavesSegmentWhole) {
    EXPECT_EQ(splitter().split("getdata"), Split({"getdata"}));
    EXPECT_EQ(splitter().split("NSTEMPLATEMATCHREFSET"), Split({"NSTEMPLATEMATCHREFSET"}));
}

TEST_F(CaseTransitionSplitterTest, CapitalEndsPrecedingRun) {
    frequencies_.add("module", 6000);

    EXPECT_EQ(splitter().split("GPSmodule"), Split({"GPS", "module"}));
}

TEST_F(CaseTransitionSplitterTest, CapitalStartsFollowingWord) {
    frequencies_.add("visitor", 700);

    EXPECT_EQ(splitter().split("ASTVisitor"), Split({"AST", "Visitor"}));
}

TEST_F(CaseTransitionSplitterTest, RawScoreComparedAgainstRescaledAlternative) {
    // 100 > 6000^(1/2.5), about 32.5, so the capital stays with "module"
    frequencies_.add("smodule", 100);
    frequencies_.add("module", 6000);

    EXPECT_EQ(splitter().split("GPSmodule"), Split({"GP", "Smodule"}));
}

TEST_F(CaseTransitionSplitterTest, EqualScoresSplitAfterCapital) {
    // Both sides score zero; a tie does not keep the capital with "ef"
    EXPECT_EQ(splitter().split("abcDef"), Split({"abcD", "ef"}));
}

TEST_F(CaseTransitionSplitterTest, HigherCamelScoreSplitsBeforeCapital) {
    frequencies_.add("def", 900);

    EXPECT_EQ(splitter().split("abcDef"), Split({"abc", "Def"}));
}

TEST_F(CaseTransitionSplitterTest, LeadingTransitionKeepsWholeSegment) {
    frequencies_.add("foobar", 100);

    EXPECT_EQ(splitter().split("Foobar"), Split({"Foobar"}));
}

TEST_F(CaseTransitionSplitterTest, LeadingTransitionWithoutEvidenceSplitsOffCapital) {
    EXPECT_EQ(splitter().split("Foobar"), Split({"F", "oobar"}));
}

TEST_F(CaseTransitionSplitterTest, OnlyFirstTransitionIsExamined) {
    frequencies_.add("xmlhttprequest", 50);

    EXPECT_EQ(splitter().split("XmlHttpRequest"), Split({"XmlHttpRequest"}));
}
