#include <gtest/gtest.h>
#include "bet-abstraction/bet_abstraction.hpp"
#include "bet-abstraction/bet_maths.hpp"
#include "test_games.hpp"

#include <string>
#include <vector>

using namespace BetAbstraction;
using Game::Action;
using Game::call;
using Game::fold;
using Game::raise;
using TestGames::play;

namespace {

std::vector<RaiseRoundConfig> everyRound(RoundRule rule, uint32_t limit = 0) {
    return std::vector<RaiseRoundConfig>(4, RaiseRoundConfig{rule, limit});
}

AbstractRaise potRatio(float f, RoundRule rule = RoundRule::Always, uint32_t limit = 0) {
    return AbstractRaise{AbstractRaiseType{RaiseKind::PotRatio, f, 0}, everyRound(rule, limit)};
}

AbstractRaise fixed(uint32_t chips, int rounds = 4) {
    return AbstractRaise{AbstractRaiseType{RaiseKind::Fixed, 0.0f, chips},
                         std::vector<RaiseRoundConfig>(rounds, RaiseRoundConfig{RoundRule::Always, 0})};
}

AbstractRaise allIn(int rounds = 4) {
    return AbstractRaise{AbstractRaiseType{RaiseKind::AllIn, 0.0f, 0},
                         std::vector<RaiseRoundConfig>(rounds, RaiseRoundConfig{RoundRule::Always, 0})};
}

const char* HOLDEM_ACTIONS = R"({
    "possible_raises": [
        {"raise_type": {"PotRatio": 0.5}, "round_config": ["Always", "Always", "Always", "Always"]},
        {"raise_type": {"Fixed": 4}, "round_config": [{"Before": 1}, "NotAllowed", "NotAllowed", "NotAllowed"]},
        {"raise_type": "AllIn", "round_config": ["Always", "Always", "Always", "Always"]}
    ]
})";

}

TEST(BetMathsTest, PotRatioCallsFirst) {
    // pot 30, 10 to match with 4 in: call 6, pot 36, 75% adds 27
    EXPECT_EQ(computePotRatioAmount(0.75f, 30, 10, 4, 1000), 37u);
    // capped at the stack
    EXPECT_EQ(computePotRatioAmount(1.0f, 30, 10, 4, 20), 20u);
    // nothing to call
    EXPECT_EQ(computePotRatioAmount(0.5f, 20, 10, 10, 1000), 20u);
}

TEST(BetMathsTest, FixedAddsToTheBet) {
    EXPECT_EQ(computeFixedAmount(4, 10, 100), 14u);
    EXPECT_EQ(computeFixedAmount(4, 98, 100), 100u);
}

TEST(BetMathsTest, DeduplicateSortsAscending) {
    EXPECT_EQ(deduplicate({5, 3, 5, 1, 3}), (std::vector<uint32_t>{1, 3, 5}));
    EXPECT_TRUE(deduplicate({}).empty());
}

TEST(ActionAbstractionTest, OpeningActionsHeadsUp) {
    Game::GameInfo info = TestGames::headsUp();
    Game::GameState s(info, 0);

    // pot sized and fixed 4 both land on raise-to 6
    ActionAbstraction abstraction({potRatio(0.5f), potRatio(1.0f), fixed(4), allIn()});
    std::vector<Action> actions = abstraction.getActions(info, s);

    std::vector<Action> expected = {fold(), call(), Game::raise(4), Game::raise(6), Game::raise(100)};
    EXPECT_EQ(actions, expected);
}

TEST(ActionAbstractionTest, RoundRulesGateRaises) {
    Game::GameInfo info = TestGames::headsUp();
    Game::GameState s = play(info, Game::GameState(info, 0), {Game::raise(6)});
    ASSERT_EQ(s.numRaises(), 1);

    EXPECT_FALSE(isRaiseAllowed(potRatio(1.0f, RoundRule::Before, 1), s));
    EXPECT_TRUE(isRaiseAllowed(potRatio(1.0f, RoundRule::Before, 2), s));
    EXPECT_TRUE(isRaiseAllowed(potRatio(1.0f, RoundRule::Always), s));
    EXPECT_FALSE(isRaiseAllowed(potRatio(1.0f, RoundRule::NotAllowed), s));

    EXPECT_FALSE(abstractRaiseToReal(info, s, potRatio(1.0f, RoundRule::Before, 1)));
}

TEST(ActionAbstractionTest, SizesBelowTheMinimumAreDropped) {
    Game::GameInfo info = TestGames::headsUp();
    Game::GameState s = play(info, Game::GameState(info, 0), {Game::raise(6)});
    ASSERT_EQ(s.minNoLimitRaiseTo(), 10u);

    // pot 8, 4 to call: a quarter of 12 only reaches 9
    EXPECT_FALSE(abstractRaiseToReal(info, s, potRatio(0.25f)));
    std::optional<Action> pot = abstractRaiseToReal(info, s, potRatio(1.0f));
    ASSERT_TRUE(pot);
    EXPECT_EQ(*pot, Game::raise(18));
}

TEST(ActionAbstractionTest, FacingAnAllInBlindOnlyFoldsOrCalls) {
    Game::GameInfo info = TestGames::noLimit({100, 2}, {1, 2}, {0, 0, 0, 0});
    Game::GameState s(info, 0);

    ActionAbstraction abstraction({potRatio(0.5f), allIn()});
    std::vector<Action> expected = {fold(), call()};
    EXPECT_EQ(abstraction.getActions(info, s), expected);
}

TEST(ActionAbstractionTest, FinishedHandHasNoActions) {
    Game::GameInfo info = TestGames::headsUp();
    Game::GameState s = play(info, Game::GameState(info, 0), {fold()});

    ActionAbstraction abstraction({allIn()});
    EXPECT_TRUE(abstraction.getActions(info, s).empty());
    EXPECT_FALSE(abstractRaiseToReal(info, s, allIn()));
}

TEST(ActionAbstractionTest, LimitUsesTheRoundSize) {
    Game::GameInfo info = TestGames::leduc();
    Game::GameState s(info, 0);

    EXPECT_EQ(abstractRaiseToReal(info, s, fixed(2, 2)), Game::raise(2));
    EXPECT_FALSE(abstractRaiseToReal(info, s, fixed(4, 2)));
    // no all-in in a limit game
    EXPECT_FALSE(abstractRaiseToReal(info, s, allIn(2)));

    ActionAbstraction abstraction({fixed(2, 2), fixed(4, 2)});
    std::vector<Action> expected = {fold(), call(), Game::raise(2)};
    EXPECT_EQ(abstraction.getActions(info, s), expected);
}

TEST(ActionAbstractionTest, EveryOfferedActionIsValid) {
    Game::GameInfo info = TestGames::noLimit({100, 60, 150}, {0, 1, 2});
    ActionAbstraction abstraction({potRatio(0.5f), potRatio(1.0f, RoundRule::Before, 2), fixed(4), allIn()});

    Game::GameState s(info, 0);
    int steps = 0;
    while (!s.isFinished()) {
        std::vector<Action> actions = abstraction.getActions(info, s);
        ASSERT_FALSE(actions.empty());
        for (const Action& a : actions) {
            EXPECT_TRUE(s.isValidAction(info, a)) << Game::actionToString(a);
        }
        // always take the smallest raise when there is one, to walk deep
        s = *s.applyAction(info, actions.size() > 2 ? actions[2] : actions.back()).state;
        ASSERT_LT(++steps, 200);
    }
}

TEST(ActionAbstractionTest, ParsesJson) {
    Game::GameInfo info = TestGames::headsUp();
    ActionAbstraction abstraction = parseActionAbstraction(HOLDEM_ACTIONS, info);

    ASSERT_EQ(abstraction.possibleRaises().size(), 3u);
    const AbstractRaise& pot = abstraction.possibleRaises()[0];
    EXPECT_EQ(pot.raiseType.kind, RaiseKind::PotRatio);
    EXPECT_FLOAT_EQ(pot.raiseType.ratio, 0.5f);

    const AbstractRaise& fix = abstraction.possibleRaises()[1];
    EXPECT_EQ(fix.raiseType.kind, RaiseKind::Fixed);
    EXPECT_EQ(fix.raiseType.chips, 4u);
    EXPECT_EQ(fix.roundConfig[0].rule, RoundRule::Before);
    EXPECT_EQ(fix.roundConfig[0].limit, 1u);
    EXPECT_EQ(fix.roundConfig[1].rule, RoundRule::NotAllowed);

    EXPECT_EQ(abstraction.possibleRaises()[2].raiseType.kind, RaiseKind::AllIn);
}

TEST(ActionAbstractionTest, MalformedJsonIsAConfigError) {
    Game::GameInfo info = TestGames::headsUp();

    // round_config needs one entry per round
    EXPECT_THROW(parseActionAbstraction(HOLDEM_ACTIONS, TestGames::leduc()), Game::ConfigError);
    EXPECT_THROW(parseActionAbstraction(R"({"possible_raises": [{"raise_type": "Half",
        "round_config": ["Always", "Always", "Always", "Always"]}]})", info), Game::ConfigError);
    EXPECT_THROW(parseActionAbstraction(R"({"possible_raises": [{"raise_type": {"PotRatio": -1},
        "round_config": ["Always", "Always", "Always", "Always"]}]})", info), Game::ConfigError);
    EXPECT_THROW(parseActionAbstraction(R"({"possible_raises": [{"raise_type": "AllIn",
        "round_config": ["Sometimes", "Always", "Always", "Always"]}]})", info), Game::ConfigError);
    EXPECT_THROW(parseActionAbstraction(R"({"raises": []})", info), Game::ConfigError);
    EXPECT_THROW(loadActionAbstraction("/nonexistent/actions.json", info), Game::ConfigError);
}

TEST(ActionAbstractionTest, SampleConfigsLoad) {
    const std::string dir = ARBITER_CONFIG_DIR;
    Game::GameInfo holdem = Game::loadGameInfo(dir + "/holdem_nl_2p.json");
    Game::GameInfo kuhn = Game::loadGameInfo(dir + "/kuhn.json");
    Game::GameInfo leduc = Game::loadGameInfo(dir + "/leduc.json");

    EXPECT_NO_THROW(loadActionAbstraction(dir + "/holdem_nl_actions.json", holdem));
    EXPECT_NO_THROW(loadActionAbstraction(dir + "/leduc_actions.json", leduc));

    ActionAbstraction kuhnActions = loadActionAbstraction(dir + "/kuhn_actions.json", kuhn);
    std::vector<Action> expected = {fold(), call(), Game::raise(1)};
    EXPECT_EQ(kuhnActions.getActions(kuhn, Game::GameState(kuhn, 0)), expected);
}
