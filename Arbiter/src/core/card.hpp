#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Game {

/*
 A single playing card.
 rank: 0 = deuce ... 12 = ace (small decks use the lowest ranks only)
 suit: 0 = clubs, 1 = diamonds, 2 = hearts, 3 = spades
*/
struct Card {
    uint8_t rank;
    uint8_t suit;

    bool operator==(const Card& other) const { return rank == other.rank && suit == other.suit; }
    bool operator!=(const Card& other) const { return !(*this == other); }
    // rank-major ordering, same order the deck is generated in
    bool operator<(const Card& other) const {
        return rank != other.rank ? rank < other.rank : suit < other.suit;
    }
};

using Cards = std::vector<Card>;

// from string to card ("As", "td", ...), nullopt on garbage
std::optional<Card> parseCard(const std::string& s);

// parses a run of cards with no separators ("AsKd7c")
std::optional<Cards> parseCards(const std::string& s);

std::string cardToString(const Card& c);
std::string cardsToString(const Cards& cards);

}
