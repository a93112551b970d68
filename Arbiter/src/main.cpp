// plays random hands under a game config and an action abstraction, prints the totals
#include "bet-abstraction/bet_abstraction.hpp"
#include "bucketing/card_abstraction.hpp"
#include "core/card.hpp"
#include "core/deck.hpp"
#include "core/game_info.hpp"
#include "sim/simulate.hpp"

#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

namespace {

void usage() {
    std::cerr << "usage: arbiter <game.json> <action_abstraction.json> [hands] [seed] [card_abstraction.json]\n";
}

// buckets of seat 0 in every round of one sample deal
void printSampleBuckets(const Game::GameInfo& info, const Bucketer::CardAbstraction& cards, uint32_t seed) {
    std::mt19937 rng(seed);
    const Game::Deal deal = Game::dealHoleAndBoardCards(info, rng);

    std::cout << "sample deal: " << Game::cardsToString(deal.holeCards[0])
              << " | " << Game::cardsToString(deal.board) << "\n";
    for (int r = 0; r < info.numRounds(); ++r) {
        std::cout << "  round " << r << " bucket " << cards.getBucket(r, deal.board, deal.holeCards[0]) << "\n";
    }
}

}

int main(int argc, char** argv) {
    if (argc < 3 || argc > 6) {
        usage();
        return 1;
    }

    uint64_t numHands = 10000;
    uint32_t seed = 42;
    try {
        if (argc > 3) numHands = std::stoull(argv[3]);
        if (argc > 4) seed = static_cast<uint32_t>(std::stoul(argv[4]));
    } catch (const std::logic_error& e) {
        std::cerr << "bad number: " << e.what() << "\n";
        usage();
        return 1;
    }

    try {
        const Game::GameInfo info = Game::loadGameInfo(argv[1]);
        const BetAbstraction::ActionAbstraction abstraction = BetAbstraction::loadActionAbstraction(argv[2], info);

        std::cout << info.numPlayers() << " players, " << info.numRounds() << " rounds, "
                  << Game::bettingTypeName(info.bettingType()) << "\n";

        if (argc > 5) {
            printSampleBuckets(info, Bucketer::loadCardAbstraction(argv[5], info), seed);
        }

        const Sim::SimStats stats = Sim::runRandomHands(info, abstraction, numHands, seed);

        std::cout << "hands:      " << stats.hands << "\n"
                  << "showdowns:  " << stats.showdowns << "\n"
                  << "actions:    " << stats.actions << "\n"
                  << "unbalanced: " << stats.unbalancedHands << " (" << stats.chipsDropped << " chips)\n";
        for (int p = 0; p < info.numPlayers(); ++p) {
            std::cout << "  seat " << p << ": " << stats.netByPlayer[p] << "\n";
        }
    } catch (const Game::ConfigError& e) {
        std::cerr << "config error: " << e.what() << "\n";
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
