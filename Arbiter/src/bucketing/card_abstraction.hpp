#pragma once

#include "core/card.hpp"
#include "core/game_info.hpp"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace Bucketer {

using BucketId = uint64_t;

/*
 Exact cards, no abstraction at all.
 Mixed radix number over the hole cards, then the visible board, one digit
 per card: rank * numSuits + suit. Order of the cards matters.
*/
struct NoBuckets {
    int numSuits;
    int numRanks;
    int numBoardCards;
    int numHoleCards;

    BucketId getBucket(const Game::Cards& board, const Game::Cards& hole) const;
};

/*
 Suit isomorphism only.
 Hole and board are each treated as unordered sets, and suits are renamed to
 the permutation giving the smallest index, so e.g. AhKh|2h and AsKs|2s land
 in the same bucket while AhKh|2s does not.
*/
struct LosslessBuckets {
    int numSuits;
    int numRanks;
    int numBoardCards;
    int numHoleCards;

    BucketId getBucket(const Game::Cards& board, const Game::Cards& hole) const;
};

// closed set of per-round strategies, picked when the abstraction is built
using RoundBuckets = std::variant<NoBuckets, LosslessBuckets>;

enum class BucketKind : uint8_t {
    None,
    Lossless
};

RoundBuckets makeRoundBuckets(BucketKind kind, const Game::GameInfo& info, int round);

class CardAbstraction {
public:
    explicit CardAbstraction(std::vector<RoundBuckets> roundBuckets);

    // same strategy for every round of the game
    static CardAbstraction uniform(BucketKind kind, const Game::GameInfo& info);

    // board holds at least the cards visible in that round, extra cards are ignored
    BucketId getBucket(int round, const Game::Cards& board, const Game::Cards& hole) const;

    int numRounds() const { return static_cast<int>(roundBuckets_.size()); }
    BucketKind kind(int round) const;

private:
    std::vector<RoundBuckets> roundBuckets_;
};

/*
 JSON layout, one entry per round:
  {"round_buckets": [{"type": "NoBuckets"}, {"type": "LosslessBuckets"}, ...]}
 Card counts are taken from the ruleset. Throws Game::ConfigError.
*/
CardAbstraction loadCardAbstraction(const std::string& path, const Game::GameInfo& info);
CardAbstraction parseCardAbstraction(const std::string& json, const Game::GameInfo& info);
std::string cardAbstractionToJson(const CardAbstraction& abstraction);

}
