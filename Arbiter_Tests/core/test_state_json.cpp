#include <gtest/gtest.h>
#include "core/state_json.hpp"
#include "test_games.hpp"

#include <stdexcept>

using namespace Game;
using TestGames::play;

TEST(StateJsonTest, HandInProgressReadsBackEqual) {
    GameInfo info = TestGames::noLimit({100, 100, 100}, {0, 1, 2});
    GameState s = play(info, GameState(info, 42), {Game::raise(10), fold(), call(), Game::raise(30)});

    GameState back = stateFromJson(boost::json::parse(boost::json::serialize(stateToJson(s))));
    EXPECT_EQ(back, s);
    EXPECT_EQ(back.handId(), 42u);
    EXPECT_EQ(back.actionAt(1, 0), Game::raise(30));

    // the restored state keeps playing like the live one
    ApplyResult a = s.applyAction(info, call());
    ApplyResult b = back.applyAction(info, call());
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(*a.state, *b.state);
}

TEST(StateJsonTest, FullActionLogIsReported) {
    GameInfo info = TestGames::headsUp();
    boost::json::value jv = stateToJson(GameState(info, 0));
    jv.as_object()["num_actions"].as_array()[0] = MAX_NUM_ACTIONS;

    GameState full = stateFromJson(jv);
    ApplyResult r = full.applyAction(info, call());
    EXPECT_EQ(r.status, ApplyStatus::RoundActionsFull);
    EXPECT_FALSE(r.state);
    EXPECT_STREQ(statusMessage(r.status), "cannot apply action to state: already at max actions for this round");
}

TEST(StateJsonTest, MalformedInputThrows) {
    GameInfo info = TestGames::headsUp();
    const boost::json::value good = stateToJson(GameState(info, 0));

    EXPECT_THROW(stateFromJson(boost::json::value(3)), std::invalid_argument);

    boost::json::value missing = good;
    missing.as_object().erase("spent");
    EXPECT_THROW(stateFromJson(missing), std::invalid_argument);

    boost::json::value shortArray = good;
    shortArray.as_object()["spent"].as_array().pop_back();
    EXPECT_THROW(stateFromJson(shortArray), std::invalid_argument);

    boost::json::value badRound = good;
    badRound.as_object()["round"] = MAX_ROUNDS;
    EXPECT_THROW(stateFromJson(badRound), std::invalid_argument);

    boost::json::value tooManyActions = good;
    tooManyActions.as_object()["num_actions"].as_array()[0] = MAX_NUM_ACTIONS + 1;
    EXPECT_THROW(stateFromJson(tooManyActions), std::invalid_argument);

    // type bits 3 are not an action
    boost::json::value badAction = good;
    badAction.as_object()["actions"].as_array()[0].as_array()[0] = 3;
    EXPECT_THROW(stateFromJson(badAction), std::invalid_argument);

    boost::json::value badFlag = good;
    badFlag.as_object()["players_folded"].as_array()[0] = 1;
    EXPECT_THROW(stateFromJson(badFlag), std::invalid_argument);
}
