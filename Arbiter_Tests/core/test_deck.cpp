#include <gtest/gtest.h>
#include "core/deck.hpp"
#include "test_games.hpp"

#include <algorithm>
#include <random>
#include <set>

using namespace Game;

TEST(DeckTest, FullDeckIsRankMajor) {
    GameInfo info = TestGames::headsUp();
    Cards deck = generateDeck(info);

    ASSERT_EQ(deck.size(), 52u);
    EXPECT_EQ(cardToString(deck[0]), "2c");
    EXPECT_EQ(cardToString(deck[1]), "2d");
    EXPECT_EQ(cardToString(deck[4]), "3c");
    EXPECT_EQ(cardToString(deck[51]), "As");
    EXPECT_TRUE(std::is_sorted(deck.begin(), deck.end()));
}

TEST(DeckTest, RangeRestarts) {
    DeckRange range(TestGames::leduc());
    EXPECT_EQ(range.size(), 6);
    EXPECT_EQ(std::distance(range.begin(), range.end()), 6);
    // a second walk sees the same cards
    EXPECT_EQ(std::distance(range.begin(), range.end()), 6);
    EXPECT_EQ(*range.begin(), (Card{0, 0}));
}

TEST(DeckTest, SmallDeckUsesLowestRanks) {
    Cards deck = generateDeck(TestGames::leduc());
    ASSERT_EQ(deck.size(), 6u);
    for (const Card& c : deck) {
        EXPECT_LT(c.rank, 3);
        EXPECT_LT(c.suit, 2);
    }
}

TEST(DeckTest, ShuffleIsSeededByTheCaller) {
    GameInfo info = TestGames::headsUp();
    std::mt19937 a(7), b(7), c(8);

    Cards first = generateShuffledDeck(info, a);
    EXPECT_EQ(first, generateShuffledDeck(info, b));
    EXPECT_NE(first, generateShuffledDeck(info, c));

    std::sort(first.begin(), first.end());
    EXPECT_EQ(first, generateDeck(info));
}

TEST(DeckTest, DealHasNoDuplicates) {
    GameInfo info = TestGames::noLimit({100, 100, 100}, {0, 1, 2});
    std::mt19937 rng(3);
    Deal deal = dealHoleAndBoardCards(info, rng);

    std::set<Card> seen(deal.board.begin(), deal.board.end());
    EXPECT_EQ(deal.board.size(), 5u);
    for (int p = 0; p < 3; ++p) {
        ASSERT_EQ(deal.holeCards[p].size(), 2u);
        seen.insert(deal.holeCards[p].begin(), deal.holeCards[p].end());
    }
    EXPECT_EQ(seen.size(), 11u);
    // empty seats get nothing
    EXPECT_TRUE(deal.holeCards[3].empty());
}

TEST(DeckTest, BoardForRoundShowsTheVisibleCards) {
    GameInfo info = TestGames::headsUp();
    Cards board = *parseCards("2c3d4h5s6c");

    EXPECT_TRUE(boardForRound(info, board, 0).empty());
    EXPECT_EQ(cardsToString(boardForRound(info, board, 1)), "2c3d4h");
    EXPECT_EQ(cardsToString(boardForRound(info, board, 2)), "2c3d4h5s");
    EXPECT_EQ(boardForRound(info, board, 3), board);
}
