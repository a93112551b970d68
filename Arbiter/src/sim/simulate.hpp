#pragma once

#include "bet-abstraction/bet_abstraction.hpp"
#include "core/game_info.hpp"
#include "core/state.hpp"
#include "eval/evaluator.hpp"

#include <array>
#include <cstdint>
#include <random>

namespace Sim {

struct HandResult {
    std::array<int64_t, Game::MAX_PLAYERS> payouts{};
    bool showdown = false;  // more than one player left at the end
    int numActions = 0;     // over all rounds

    int64_t total() const;
};

struct SimStats {
    uint64_t hands = 0;
    uint64_t showdowns = 0;
    uint64_t actions = 0;
    // hands whose payouts don't sum to zero (uneven side pot splits)
    uint64_t unbalancedHands = 0;
    // chips lost to uneven splits over all hands, always <= 0
    int64_t chipsDropped = 0;
    std::array<int64_t, Game::MAX_PLAYERS> netByPlayer{};
};

/*
 Plays one hand to the end, every decision drawn uniformly from the
 abstraction's actions, and returns the payout of every seat.
 Throws std::logic_error if the state refuses an action the abstraction offered.
*/
HandResult playRandomHand(const Game::GameInfo& info, const BetAbstraction::ActionAbstraction& abstraction,
                          const Eval::HandRanker& ranker, uint32_t handId, std::mt19937& rng);

/*
 Plays numHands independent hands, in parallel when built with OpenMP.
 Hand i uses its own generator seeded with seed + i, so the totals don't
 depend on the number of threads.
*/
SimStats runRandomHands(const Game::GameInfo& info, const BetAbstraction::ActionAbstraction& abstraction,
                        uint64_t numHands, uint32_t seed);

}
