#include <gtest/gtest.h>
#include "eval/evaluator.hpp"
#include "core/card.hpp"

#include <stdexcept>

using namespace Eval;

class EvaluatorTest : public ::testing::Test {
protected:
    RankClass rank(const char* s) const {
        return evaluator.rankClass(*Game::parseCards(s));
    }

    ClassEvaluator evaluator;
};

TEST_F(EvaluatorTest, FindsEveryCategory) {
    EXPECT_EQ(rank("AsKsQsJsTs").handClass, HandClass::StraightFlush);
    EXPECT_EQ(rank("AsAhAdAcKs").handClass, HandClass::FourOfAKind);
    EXPECT_EQ(rank("AsAhAdKsKh").handClass, HandClass::FullHouse);
    EXPECT_EQ(rank("AsKsQsJs9s").handClass, HandClass::Flush);
    EXPECT_EQ(rank("AsKhQdJsTc").handClass, HandClass::Straight);
    EXPECT_EQ(rank("7s7h7d3c2s").handClass, HandClass::ThreeOfAKind);
    EXPECT_EQ(rank("JsJhTsTh2s").handClass, HandClass::TwoPair);
    EXPECT_EQ(rank("7s5h4d3c3s").handClass, HandClass::Pair);
    EXPECT_EQ(rank("7s5h4d3c2s").handClass, HandClass::HighCard);
}

TEST_F(EvaluatorTest, KeepsTheDefiningRanks) {
    EXPECT_EQ(rank("AsAhAdKsKh"), (RankClass{HandClass::FullHouse, 12, 11}));
    EXPECT_EQ(rank("JsJhTsTh2s"), (RankClass{HandClass::TwoPair, 9, 8}));
    EXPECT_EQ(rank("7s5h4d3c2s"), (RankClass{HandClass::HighCard, 5, 0}));
}

TEST_F(EvaluatorTest, WheelIsTheLowestStraight) {
    RankClass wheel = rank("As2h4s3d5s");
    EXPECT_EQ(wheel, (RankClass{HandClass::Straight, 3, 0}));
    EXPECT_TRUE(wheel < rank("2s3h4d5c6s"));

    RankClass steelWheel = rank("As2s4s3s5s");
    EXPECT_EQ(steelWheel.handClass, HandClass::StraightFlush);
    EXPECT_TRUE(steelWheel < rank("AsKsQsJsTs"));
}

TEST_F(EvaluatorTest, BestFiveOfSeven) {
    // the flush beats the straight also on board
    EXPECT_EQ(rank("9h8h7h6d5h2h3c").handClass, HandClass::Flush);
    // the higher straight wins out of six connected cards
    EXPECT_EQ(rank("9h8s7d6c5h4s2c"), (RankClass{HandClass::Straight, 7, 0}));
    // two sets of trips make a full house
    EXPECT_EQ(rank("KsKhKd5s5h5dAc"), (RankClass{HandClass::FullHouse, 11, 3}));
    // three pairs play as the top two
    EXPECT_EQ(rank("KsKh5s5h2d2cAc"), (RankClass{HandClass::TwoPair, 11, 3}));
    // quads beat the full house hidden in the same cards
    EXPECT_EQ(rank("9s9h9d9cKsKhKd").handClass, HandClass::FourOfAKind);
}

TEST_F(EvaluatorTest, MoreThanSevenCards) {
    // four hole cards on a five card board
    EXPECT_EQ(rank("AsAhQcQd2c5d9hJsKd"), (RankClass{HandClass::TwoPair, 12, 10}));
    // two flush suits, the ace high one plays
    EXPECT_EQ(rank("KsQsJs9s8sAcKcQcJc9c"), (RankClass{HandClass::Flush, 12, 0}));
    // two straight flushes, the higher one plays
    EXPECT_EQ(rank("TsJsQsKsAs5c6c7c8c9c"), (RankClass{HandClass::StraightFlush, 12, 0}));
    EXPECT_EQ(rank("5c6c7c8c9cTsJsQsKsAs"), (RankClass{HandClass::StraightFlush, 12, 0}));
}

TEST_F(EvaluatorTest, FewerThanFiveCards) {
    EXPECT_EQ(rank("AsAhAd").handClass, HandClass::ThreeOfAKind);
    EXPECT_EQ(rank("AsKh2d"), (RankClass{HandClass::HighCard, 12, 0}));
    EXPECT_EQ(rank("AsAhKdKc").handClass, HandClass::TwoPair);
}

TEST_F(EvaluatorTest, KickersAreIgnored) {
    EXPECT_EQ(rank("KsKh9d5c2s"), rank("KdKcAsQhJd"));
    EXPECT_TRUE(rank("KsKh9d5c2s") < rank("AsAh3d4c6s"));
}

TEST_F(EvaluatorTest, CategoriesAreOrdered) {
    const char* ladder[] = {
        "7s5h4d3c2s", "7s5h4d3c3s", "JsJhTsTh2s", "7s7h7d3c2s", "AsKhQdJsTc",
        "AsKsQsJs9s", "AsAhAdKsKh", "AsAhAdAcKs", "AsKsQsJsTs"
    };
    for (int i = 1; i < 9; ++i) {
        EXPECT_TRUE(rank(ladder[i - 1]) < rank(ladder[i])) << ladder[i - 1] << " vs " << ladder[i];
        EXPECT_TRUE(rank(ladder[i]) > rank(ladder[i - 1]));
    }
}

TEST_F(EvaluatorTest, RejectsBadInput) {
    EXPECT_THROW(rank("AsKs"), std::invalid_argument);
    EXPECT_THROW(evaluator.rankClass({Game::Card{13, 0}, Game::Card{1, 0}, Game::Card{2, 0}}), std::invalid_argument);
}

TEST(SmallHandTest, PairBeatsHighCard) {
    using Game::Card;
    EXPECT_EQ(rankSmallHand({Card{2, 0}}), (RankClass{HandClass::HighCard, 2, 0}));
    EXPECT_EQ(rankSmallHand({Card{1, 0}, Card{1, 1}}), (RankClass{HandClass::Pair, 1, 0}));
    EXPECT_EQ(rankSmallHand({Card{0, 0}, Card{2, 1}}), (RankClass{HandClass::HighCard, 2, 0}));
    EXPECT_TRUE(rankSmallHand({Card{2, 0}, Card{1, 1}}) < rankSmallHand({Card{0, 0}, Card{0, 1}}));
    EXPECT_THROW(rankSmallHand({}), std::invalid_argument);
}

TEST(RankClassTest, Describes) {
    EXPECT_EQ(rankClassToString(RankClass{HandClass::FullHouse, 12, 11}), "full house A over K");
    EXPECT_EQ(rankClassToString(RankClass{HandClass::TwoPair, 9, 8}), "two pair JT");
    EXPECT_EQ(rankClassToString(RankClass{HandClass::HighCard, 5, 0}), "high card 7");
}
