#pragma once

#include <vector>
#include <string>
#include <cstdint>
#include <optional>
#include "core/action.hpp"
#include "core/game_info.hpp"
#include "core/state.hpp"


/*
Action abstraction: a small, configurable set of raise sizes a solver is
allowed to consider at every node. Each abstract raise is turned into a real
raise-to amount and only kept if the state accepts it as a valid action.

Raise conventions:
 AllIn:       raise to the active player's whole stack
 PotRatio(f): call-first pot fraction (see bet_maths.hpp)
 Fixed(n):    no-limit: n chips on top of the current bet; limit: n itself (must equal the round's raise size)

Round conventions, one entry per round:
 NotAllowed:  never offered in that round
 Always:      offered whenever the state allows a raise
 Before(n):   offered while fewer than n raises were made this round
*/

namespace BetAbstraction {

enum class RaiseKind : uint8_t {
    AllIn,
    PotRatio,
    Fixed
};

struct AbstractRaiseType {
    RaiseKind kind;
    float ratio;     // PotRatio only
    uint32_t chips;  // Fixed only
};

enum class RoundRule : uint8_t {
    NotAllowed,
    Always,
    Before
};

struct RaiseRoundConfig {
    RoundRule rule;
    uint32_t limit; // Before only
};

struct AbstractRaise {
    AbstractRaiseType raiseType;
    std::vector<RaiseRoundConfig> roundConfig;
};

// true if the raise may be offered in the state's round given the raises made so far
bool isRaiseAllowed(const AbstractRaise& raise, const Game::GameState& state);

// converts an abstract raise into a real raise if the state accepts it
std::optional<Game::Action> abstractRaiseToReal(const Game::GameInfo& info, const Game::GameState& state,
                                                const AbstractRaise& raise);

class ActionAbstraction {
public:
    explicit ActionAbstraction(std::vector<AbstractRaise> possibleRaises);

    /*
    Returns all legal abstract actions for the current player.
     fold (when legal), call, then the distinct real raises in ascending order.
     Empty once the hand is finished.
    */
    std::vector<Game::Action> getActions(const Game::GameInfo& info, const Game::GameState& state) const;

    const std::vector<AbstractRaise>& possibleRaises() const { return possibleRaises_; }

private:
    std::vector<AbstractRaise> possibleRaises_;
};

/*
Reads an abstraction from JSON, e.g.
 {"possible_raises": [
   {"raise_type": {"PotRatio": 0.5}, "round_config": ["Always", {"Before": 2}, "Always", "NotAllowed"]},
   {"raise_type": "AllIn",           "round_config": ["Always", "Always", "Always", "Always"]}
 ]}
Every round_config must hold one entry per round of info. Throws Game::ConfigError.
*/
ActionAbstraction loadActionAbstraction(const std::string& path, const Game::GameInfo& info);
ActionAbstraction parseActionAbstraction(const std::string& json, const Game::GameInfo& info);

}
