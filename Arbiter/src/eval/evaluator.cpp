#include "evaluator.hpp"
#include "encoding/card_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace Eval {

namespace {

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;
// A-2-3-4-5: ace bit plus the four lowest ranks
constexpr int WHEEL_MASK = 0x100F;

// pure bitwise logic function to find a straight fast
// returns the top rank of the highest straight in the mask, -1 if there is none
inline int find_straight_high(int mask) {
    // finds any sequence of 5 consecutive ranks
    int tmp = mask & (mask << 1) & (mask << 2) & (mask << 3) & (mask << 4);

    if (tmp != 0) {
        // the highest set bit is the top rank of the straight
        return 31 - __builtin_clz(tmp);
    }

    // ace-low straight: returns 3 (rank of the five)
    if ((mask & WHEEL_MASK) == WHEEL_MASK) return 3;

    return -1;
}

inline int highest_bit(int mask) {
    return 31 - __builtin_clz(mask);
}

RankClass make(HandClass c, int primary, int secondary = 0) {
    return RankClass{c, static_cast<uint8_t>(primary), static_cast<uint8_t>(secondary)};
}

}

RankClass ClassEvaluator::rankClass(const Game::Cards& cards) const {
    if (cards.size() < static_cast<size_t>(MIN_EVAL_CARDS)) {
        throw std::invalid_argument("evaluator needs at least 3 cards, got " + std::to_string(cards.size()));
    }

    // count summary variables
    // eg. "As-Ks-Qs-Js-Ts-2d-9c"
    // suit_counts[spades] = 5, suit_masks[spades] = bits on for A,K,Q,J,T
    int rank_counts[NUM_RANKS] = {0};
    int suit_counts[NUM_SUITS] = {0};
    int suit_masks[NUM_SUITS] = {0};
    int full_rank_mask = 0;

    for (const Game::Card& c : cards) {
        if (c.rank >= NUM_RANKS || c.suit >= NUM_SUITS) {
            throw std::invalid_argument("card out of range: " + Game::cardToString(c));
        }
        const int rank_bit = 1 << c.rank;
        rank_counts[c.rank]++;
        suit_counts[c.suit]++;
        suit_masks[c.suit] |= rank_bit;
        full_rank_mask |= rank_bit;
    }

    // straight flush and flush need one suit with 5 or more cards
    // with more than 9 cards two suits can qualify, keep the best of each
    int flush_mask = 0;
    int sf_top = -1;
    for (int s = 0; s < NUM_SUITS; ++s) {
        if (suit_counts[s] >= 5) {
            if (flush_mask == 0 || highest_bit(suit_masks[s]) > highest_bit(flush_mask)) {
                flush_mask = suit_masks[s];
            }
            sf_top = std::max(sf_top, find_straight_high(suit_masks[s]));
        }
    }
    if (sf_top != -1) return make(HandClass::StraightFlush, sf_top);

    // walk ranks high to low to find the sets
    int quads = -1, trips = -1, second_trips = -1;
    int pairs[2] = {-1, -1};
    for (int r = NUM_RANKS - 1; r >= 0; --r) {
        const int n = rank_counts[r];
        if (n >= 4 && quads == -1) {
            quads = r;
        } else if (n == 3) {
            if (trips == -1) trips = r;
            else if (second_trips == -1) second_trips = r;
        } else if (n == 2) {
            if (pairs[0] == -1) pairs[0] = r;
            else if (pairs[1] == -1) pairs[1] = r;
        }
    }

    if (quads != -1) return make(HandClass::FourOfAKind, quads);

    if (trips != -1) {
        // a second set of trips plays as the pair of the full house
        int pair = std::max(pairs[0], second_trips);
        if (pair != -1) return make(HandClass::FullHouse, trips, pair);
    }

    if (flush_mask != 0) return make(HandClass::Flush, highest_bit(flush_mask));

    int str_top = find_straight_high(full_rank_mask);
    if (str_top != -1) return make(HandClass::Straight, str_top);

    if (trips != -1) return make(HandClass::ThreeOfAKind, trips);

    if (pairs[1] != -1) return make(HandClass::TwoPair, pairs[0], pairs[1]);

    if (pairs[0] != -1) return make(HandClass::Pair, pairs[0]);

    return make(HandClass::HighCard, highest_bit(full_rank_mask));
}

RankClass rankSmallHand(const Game::Cards& cards) {
    if (cards.size() == 1) {
        return make(HandClass::HighCard, cards[0].rank);
    }
    if (cards.size() == 2) {
        if (cards[0].rank == cards[1].rank) {
            return make(HandClass::Pair, cards[0].rank);
        }
        return make(HandClass::HighCard, std::max(cards[0].rank, cards[1].rank));
    }
    throw std::invalid_argument("small hand comparison takes one or two cards, got " + std::to_string(cards.size()));
}

std::string rankClassToString(const RankClass& rc) {
    const std::string p(1, CardUtils::rankChar(rc.primary));
    const std::string s(1, CardUtils::rankChar(rc.secondary));
    switch (rc.handClass) {
        case HandClass::HighCard: return "high card " + p;
        case HandClass::Pair: return "pair of " + p;
        case HandClass::TwoPair: return "two pair " + p + s;
        case HandClass::ThreeOfAKind: return "trips " + p;
        case HandClass::Straight: return "straight to " + p;
        case HandClass::Flush: return "flush " + p + " high";
        case HandClass::FullHouse: return "full house " + p + " over " + s;
        case HandClass::FourOfAKind: return "quads " + p;
        case HandClass::StraightFlush: return "straight flush to " + p;
    }
    return "?";
}

}
