#include "state.hpp"

#include <algorithm>
#include <limits>
#include <optional>
#include <stdexcept>

namespace Game {

namespace {

// one player still holding chips in the pot during side pot resolution
struct Contender {
    uint32_t remaining;                    // chips not yet matched into a resolved layer
    std::optional<Eval::RankClass> rank;   // empty for folded players, they feed pots but never win
};

Eval::RankClass rankHand(const Eval::HandRanker& ranker, const Cards& hole, const Cards& board) {
    Cards cards = hole;
    cards.insert(cards.end(), board.begin(), board.end());

    // one and two card games (kuhn, leduc) are below what the general evaluator handles
    if (cards.size() <= 2) {
        return Eval::rankSmallHand(cards);
    }
    return ranker.rankClass(cards);
}

}

int64_t GameState::getPayout(const GameInfo& info, const Eval::HandRanker& ranker, const Cards& board,
                             const HoleCards& holeCards, PlayerId player) const {
    if (hasFolded(player)) {
        return -static_cast<int64_t>(spent_[player]);
    }

    if (!finished_) {
        throw std::logic_error("cannot calculate payout when the hand is not over or the player has not folded");
    }

    // everybody else folded, the last player takes all of it
    if (numFolded(info) + 1 == info.numPlayers()) {
        int64_t value = 0;
        for (int i = 0; i < info.numPlayers(); ++i) {
            if (i == player) continue;
            value += spent_[i];
        }
        return value;
    }

    // nothing committed, nothing to win or lose
    if (spent_[player] == 0) return 0;

    // folded chips above the largest live commitment have nobody left to contest them,
    // they go to the winners of the top live layer
    uint32_t liveMax = 0;
    for (int i = 0; i < info.numPlayers(); ++i) {
        if (!playersFolded_[i]) liveMax = std::max(liveMax, spent_[i]);
    }

    std::array<Contender, MAX_PLAYERS> contenders;
    int playersLeft = 0;
    int playerIdx = -1;
    int64_t deadChips = 0;

    for (int i = 0; i < info.numPlayers(); ++i) {
        if (spent_[i] == 0) continue;

        Contender& c = contenders[playersLeft];
        c.remaining = std::min(spent_[i], liveMax);
        deadChips += spent_[i] - c.remaining;
        c.rank.reset();
        if (!playersFolded_[i]) {
            if (i == player) playerIdx = playersLeft;
            c.rank = rankHand(ranker, holeCards[i], board);
        }
        playersLeft++;
    }

    if (playersLeft < 2 || playerIdx < 0) {
        throw std::logic_error("side pot resolution needs the queried player and at least one opponent");
    }

    int64_t value = 0;

    while (true) {
        // smallest commitment still in play defines this layer
        uint32_t size = std::numeric_limits<uint32_t>::max();
        std::optional<Eval::RankClass> winRank;
        int numWinners = 0;

        for (int i = 0; i < playersLeft; ++i) {
            const Contender& c = contenders[i];
            size = std::min(size, c.remaining);

            if (!c.rank) continue;
            if (!winRank || *c.rank > *winRank) {
                winRank = c.rank;
                numWinners = 1;
            } else if (*c.rank == *winRank) {
                numWinners++;
            }
        }

        if (numWinners == 0) {
            throw std::logic_error("side pot layer has no eligible winner");
        }

        // winners split the layer contributed by everyone else, the division remainder is dropped
        if (*contenders[playerIdx].rank == *winRank) {
            int64_t won = static_cast<int64_t>(size) * (playersLeft - numWinners);
            if (contenders[playerIdx].remaining == size && spent_[player] == liveMax) {
                won += deadChips;
            }
            value += won / numWinners;
        } else {
            value -= size;
        }

        int newPlayersLeft = 0;
        int newPlayerIdx = -1;
        for (int i = 0; i < playersLeft; ++i) {
            contenders[i].remaining -= size;
            if (contenders[i].remaining == 0) {
                // the queried player is fully resolved once their own commitment is used up
                if (i == playerIdx) return value;
                continue;
            }
            if (i == playerIdx) newPlayerIdx = newPlayersLeft;
            contenders[newPlayersLeft++] = contenders[i];
        }

        playersLeft = newPlayersLeft;
        playerIdx = newPlayerIdx;
    }
}

}
