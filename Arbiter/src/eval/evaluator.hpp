#pragma once

#include "core/card.hpp"

#include <cstdint>
#include <string>

namespace Eval {

// hand categories, weakest first
enum class HandClass : uint8_t {
    HighCard,
    Pair,
    TwoPair,
    ThreeOfAKind,
    Straight,
    Flush,
    FullHouse,
    FourOfAKind,
    StraightFlush
};

/*
 Ordered hand strength category.
 Only the category and the ranks that define it are kept, kickers are not:
 two "pair of kings" hands compare equal whatever else they hold.

 primary:   high card / pair / high pair / trips / straight top / flush top / full house trips / quads
 secondary: low pair of a two pair, pair of a full house, 0 otherwise
*/
struct RankClass {
    HandClass handClass;
    uint8_t primary;
    uint8_t secondary;

    bool operator==(const RankClass& o) const {
        return handClass == o.handClass && primary == o.primary && secondary == o.secondary;
    }
    bool operator!=(const RankClass& o) const { return !(*this == o); }
    bool operator<(const RankClass& o) const {
        if (handClass != o.handClass) return handClass < o.handClass;
        if (primary != o.primary) return primary < o.primary;
        return secondary < o.secondary;
    }
    bool operator>(const RankClass& o) const { return o < *this; }
};

// the general evaluator needs at least this many cards
constexpr int MIN_EVAL_CARDS = 3;

/*
 Card/hand-strength collaborator used by the payout computation.
 Implementations must return a total order consistent between calls.
*/
class HandRanker {
public:
    virtual ~HandRanker() = default;
    virtual RankClass rankClass(const Game::Cards& cards) const = 0;
};

// best category over any number of cards (MIN_EVAL_CARDS or more), bitmask based
class ClassEvaluator : public HandRanker {
public:
    RankClass rankClass(const Game::Cards& cards) const override;
};

// simplified comparison for one or two card hands (kuhn / leduc style decks): high card or pair
RankClass rankSmallHand(const Game::Cards& cards);

std::string rankClassToString(const RankClass& rc);

}
