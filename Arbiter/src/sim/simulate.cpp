#include "simulate.hpp"
#include "core/deck.hpp"

#include <stdexcept>
#include <string>

namespace Sim {

int64_t HandResult::total() const {
    int64_t sum = 0;
    for (int64_t p : payouts) sum += p;
    return sum;
}

HandResult playRandomHand(const Game::GameInfo& info, const BetAbstraction::ActionAbstraction& abstraction,
                          const Eval::HandRanker& ranker, uint32_t handId, std::mt19937& rng) {
    const Game::Deal deal = Game::dealHoleAndBoardCards(info, rng);
    Game::GameState state(info, handId);
    HandResult result;

    while (!state.isFinished()) {
        const std::vector<Game::Action> actions = abstraction.getActions(info, state);
        std::uniform_int_distribution<size_t> pick(0, actions.size() - 1);
        const Game::Action action = actions[pick(rng)];

        Game::ApplyResult next = state.applyAction(info, action);
        if (!next.ok()) {
            throw std::logic_error("hand " + std::to_string(handId) + ": " + Game::actionToString(action) +
                                   " refused: " + Game::statusMessage(next.status));
        }
        state = *next.state;
        result.numActions++;
    }

    result.showdown = state.numFolded(info) + 1 < info.numPlayers();

    const Game::Cards board = Game::boardForRound(info, deal.board, state.currentRound());
    for (int p = 0; p < info.numPlayers(); ++p) {
        result.payouts[p] = state.getPayout(info, ranker, board, deal.holeCards, static_cast<Game::PlayerId>(p));
    }

    return result;
}

SimStats runRandomHands(const Game::GameInfo& info, const BetAbstraction::ActionAbstraction& abstraction,
                        uint64_t numHands, uint32_t seed) {
    if (numHands == 0) {
        throw std::invalid_argument("runRandomHands: numHands must be positive");
    }

    const Eval::ClassEvaluator ranker;
    SimStats stats;
    std::string error;

    // without OpenMP the pragmas are ignored and everything runs on one thread
    #pragma omp parallel
    {
        SimStats local;

        #pragma omp for schedule(dynamic, 64)
        for (int64_t i = 0; i < static_cast<int64_t>(numHands); ++i) {
            try {
                std::mt19937 rng(seed + static_cast<uint32_t>(i));
                const HandResult hand = playRandomHand(info, abstraction, ranker, static_cast<uint32_t>(i), rng);

                local.hands++;
                local.actions += hand.numActions;
                if (hand.showdown) local.showdowns++;
                if (hand.total() != 0) {
                    local.unbalancedHands++;
                    local.chipsDropped += hand.total();
                }
                for (int p = 0; p < info.numPlayers(); ++p) {
                    local.netByPlayer[p] += hand.payouts[p];
                }
            } catch (const std::exception& e) {
                // exceptions can't leave the parallel region, keep the first one and rethrow below
                #pragma omp critical
                {
                    if (error.empty()) error = e.what();
                }
            }
        }

        #pragma omp critical
        {
            stats.hands += local.hands;
            stats.showdowns += local.showdowns;
            stats.actions += local.actions;
            stats.unbalancedHands += local.unbalancedHands;
            stats.chipsDropped += local.chipsDropped;
            for (int p = 0; p < Game::MAX_PLAYERS; ++p) {
                stats.netByPlayer[p] += local.netByPlayer[p];
            }
        }
    }

    if (!error.empty()) {
        throw std::runtime_error("simulation failed: " + error);
    }

    return stats;
}

}
