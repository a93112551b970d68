#include "deck.hpp"

#include <algorithm>

namespace Game {

Cards generateDeck(const GameInfo& info) {
    DeckRange range(info);
    return Cards(range.begin(), range.end());
}

Cards generateShuffledDeck(const GameInfo& info, std::mt19937& rng) {
    Cards cards = generateDeck(info);
    std::shuffle(cards.begin(), cards.end(), rng);
    return cards;
}

Deal dealHoleAndBoardCards(const GameInfo& info, std::mt19937& rng) {
    const Cards deck = generateShuffledDeck(info, rng);
    Deal deal;
    size_t c = 0;

    // GameInfo already guarantees the deck covers every card dealt here
    for (int p = 0; p < info.numPlayers(); ++p) {
        for (int i = 0; i < info.numHoleCards(); ++i) {
            deal.holeCards[p].push_back(deck[c++]);
        }
    }

    const int boardCards = info.totalBoardCards(info.numRounds() - 1);
    deal.board.assign(deck.begin() + c, deck.begin() + c + boardCards);

    return deal;
}

Cards boardForRound(const GameInfo& info, const Cards& fullBoard, int round) {
    const size_t visible = std::min<size_t>(info.totalBoardCards(round), fullBoard.size());
    return Cards(fullBoard.begin(), fullBoard.begin() + visible);
}

}
