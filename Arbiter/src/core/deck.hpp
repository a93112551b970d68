#pragma once

#include "card.hpp"
#include "game_info.hpp"

#include <array>
#include <cstddef>
#include <iterator>
#include <random>

namespace Game {

/*
 Lazy view over every (rank, suit) combination allowed by a ruleset,
 rank-major: 2c 2d 2h 2s 3c ... Nothing is materialised, begin() can be
 called any number of times to restart the walk.
*/
class DeckRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Card;
        using difference_type = std::ptrdiff_t;
        using pointer = const Card*;
        using reference = Card;

        iterator(int index, int numSuits) : index_(index), numSuits_(numSuits) {}

        Card operator*() const {
            return Card{static_cast<uint8_t>(index_ / numSuits_), static_cast<uint8_t>(index_ % numSuits_)};
        }
        iterator& operator++() { ++index_; return *this; }
        iterator operator++(int) { iterator tmp = *this; ++index_; return tmp; }
        bool operator==(const iterator& other) const { return index_ == other.index_; }
        bool operator!=(const iterator& other) const { return index_ != other.index_; }

    private:
        int index_;
        int numSuits_;
    };

    explicit DeckRange(const GameInfo& info) : numSuits_(info.numSuits()), size_(info.numSuits() * info.numRanks()) {}

    iterator begin() const { return iterator(0, numSuits_); }
    iterator end() const { return iterator(size_, numSuits_); }
    int size() const { return size_; }

private:
    int numSuits_;
    int size_;
};

using HoleCards = std::array<Cards, MAX_PLAYERS>;

// every hole card of every seat plus the full board of the last round
struct Deal {
    HoleCards holeCards;
    Cards board;
};

// materialised, ordered deck
Cards generateDeck(const GameInfo& info);

// the caller owns the generator, so hands are reproducible from a seed
Cards generateShuffledDeck(const GameInfo& info, std::mt19937& rng);

// deals hole cards seat by seat, then the board, from one shuffled deck
Deal dealHoleAndBoardCards(const GameInfo& info, std::mt19937& rng);

// board visible in a given round (first totalBoardCards(round) cards)
Cards boardForRound(const GameInfo& info, const Cards& fullBoard, int round);

}
