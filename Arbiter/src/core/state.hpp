#pragma once

#include "action.hpp"
#include "deck.hpp"
#include "game_info.hpp"
#include "eval/evaluator.hpp"

#include <array>
#include <cstdint>
#include <optional>

namespace Game {

// why a transition was refused; Ok means a new state was produced
enum class ApplyStatus : uint8_t {
    Ok,
    HandFinished,      // the hand is already over
    RoundActionsFull,  // the round's action log holds MAX_NUM_ACTIONS entries
    InvalidAction      // isValidAction rejected the action
};

const char* statusMessage(ApplyStatus status);

// legal raise-to interval under no-limit rules, (0, 0) when no raise is possible
struct RaiseRange {
    uint32_t min;
    uint32_t max;

    bool possible() const { return max != 0; }
};

struct ApplyResult;

/*
 State of one hand.

 Value type with fixed-size storage, copying it is a plain memberwise copy.
 Every transition builds a new state from a const one, so callers can keep
 any earlier state around (e.g. as a node of a decision tree) and explore
 several branches from it, in parallel if they like.

 chips:
  spent[p]            total chips player p committed over the whole hand
  sumRoundSpent[r][p] chips player p committed during round r
  stackPlayer[p]      starting stack, the all-in ceiling for spent[p]
  maxSpent            largest spent[p], the amount a call has to match
*/
class GameState {
public:
    // posts the blinds and seats the first player of round 0
    GameState(const GameInfo& info, uint32_t handId);

    uint32_t handId() const { return handId_; }
    uint32_t potTotal(const GameInfo& info) const;
    uint32_t playerStack(PlayerId player) const { return stackPlayer_[player]; }
    uint32_t playerSpent(PlayerId player) const { return spent_[player]; }
    uint32_t roundSpent(int round, PlayerId player) const { return sumRoundSpent_[round][player]; }
    uint32_t maxSpent() const { return maxSpent_; }
    uint32_t minNoLimitRaiseTo() const { return minNoLimitRaiseTo_; }
    int currentRound() const { return round_; }
    bool isFinished() const { return finished_; }
    bool hasFolded(PlayerId player) const { return playersFolded_[player]; }
    bool isAllIn(PlayerId player) const { return spent_[player] == stackPlayer_[player]; }

    // action log of a round
    int numActions(int round) const { return numActions_[round]; }
    Action actionAt(int round, int i) const { return actions_[round][i]; }
    PlayerId actingPlayerAt(int round, int i) const { return actingPlayer_[round][i]; }

    // throws std::logic_error once the hand is finished
    PlayerId currentPlayer() const;

    // players who have not folded and are not all-in
    int numActivePlayers(const GameInfo& info) const;
    // players who called (or made the last raise) since the last raise of this round, all-in players excluded
    int numCalled(const GameInfo& info) const;
    int numFolded(const GameInfo& info) const;
    // raises made in the current round
    int numRaises() const;

    RaiseRange raiseRange(const GameInfo& info) const;
    bool isValidAction(const GameInfo& info, const Action& action) const;

    // never touches *this, the result carries the new state or the reason it was refused
    ApplyResult applyAction(const GameInfo& info, const Action& action) const;

    /*
     Net chips won (positive) or lost (negative) by player at the end of the hand.
     Folded players just lose what they put in. Otherwise the pot is split
     layer by layer (side pots). Folded chips above every live commitment go
     to the winners of the top live layer. The integer remainder of an uneven
     split is dropped, so payouts of a hand can sum to slightly below zero.
     Throws std::logic_error if the hand isn't finished.
    */
    int64_t getPayout(const GameInfo& info, const Eval::HandRanker& ranker, const Cards& board,
                      const HoleCards& holeCards, PlayerId player) const;

    bool operator==(const GameState& other) const;
    bool operator!=(const GameState& other) const { return !(*this == other); }

private:
    friend class StateCodec;

    GameState() = default;

    // next seat after the active one that can still act, wrapping around the table
    PlayerId nextPlayer(const GameInfo& info) const;

    uint32_t handId_ = 0;
    uint32_t maxSpent_ = 0;
    // smallest raise-to a no-limit raise may use
    uint32_t minNoLimitRaiseTo_ = 0;
    std::array<uint32_t, MAX_PLAYERS> spent_{};
    std::array<uint32_t, MAX_PLAYERS> stackPlayer_{};
    std::array<std::array<uint32_t, MAX_PLAYERS>, MAX_ROUNDS> sumRoundSpent_{};
    std::array<std::array<Action, MAX_NUM_ACTIONS>, MAX_ROUNDS> actions_{};
    std::array<std::array<PlayerId, MAX_NUM_ACTIONS>, MAX_ROUNDS> actingPlayer_{};
    std::array<uint8_t, MAX_ROUNDS> numActions_{};
    PlayerId activePlayer_ = 0;
    uint8_t round_ = 0;
    bool finished_ = false;
    std::array<bool, MAX_PLAYERS> playersFolded_{};
};

struct ApplyResult {
    ApplyStatus status;
    std::optional<GameState> state;

    bool ok() const { return status == ApplyStatus::Ok; }
};

}
