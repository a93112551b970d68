#include "card_abstraction.hpp"
#include "util/json_util.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <stdexcept>

namespace Bucketer {

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

inline BucketId digit(const Game::Card& c, int numSuits) {
    return static_cast<BucketId>(c.rank) * numSuits + c.suit;
}

// hole digits first, then the board
BucketId mixedRadix(const Game::Cards& hole, int numHole, const Game::Cards& board, int numBoard,
                    int numSuits, int numRanks) {
    const BucketId radix = static_cast<BucketId>(numSuits) * numRanks;
    BucketId bucket = 0;
    for (int i = 0; i < numHole; ++i) bucket = bucket * radix + digit(hole[i], numSuits);
    for (int i = 0; i < numBoard; ++i) bucket = bucket * radix + digit(board[i], numSuits);
    return bucket;
}

void requireCards(const Game::Cards& board, const Game::Cards& hole, int numBoard, int numHole) {
    if (static_cast<int>(hole.size()) < numHole || static_cast<int>(board.size()) < numBoard) {
        throw std::invalid_argument("not enough cards to compute a bucket");
    }
}

const char* kindName(BucketKind kind) {
    return kind == BucketKind::Lossless ? "LosslessBuckets" : "NoBuckets";
}

}

BucketId NoBuckets::getBucket(const Game::Cards& board, const Game::Cards& hole) const {
    requireCards(board, hole, numBoardCards, numHoleCards);
    return mixedRadix(hole, numHoleCards, board, numBoardCards, numSuits, numRanks);
}

BucketId LosslessBuckets::getBucket(const Game::Cards& board, const Game::Cards& hole) const {
    requireCards(board, hole, numBoardCards, numHoleCards);

    std::array<uint8_t, 4> perm = {0, 1, 2, 3};
    Game::Cards h(hole.begin(), hole.begin() + numHoleCards);
    Game::Cards b(board.begin(), board.begin() + numBoardCards);
    BucketId best = std::numeric_limits<BucketId>::max();

    // at most 4! relabelings, keep the smallest index
    do {
        for (int i = 0; i < numHoleCards; ++i) h[i] = Game::Card{hole[i].rank, perm[hole[i].suit]};
        for (int i = 0; i < numBoardCards; ++i) b[i] = Game::Card{board[i].rank, perm[board[i].suit]};
        std::sort(h.begin(), h.end());
        std::sort(b.begin(), b.end());
        best = std::min(best, mixedRadix(h, numHoleCards, b, numBoardCards, numSuits, numRanks));
    } while (std::next_permutation(perm.begin(), perm.begin() + numSuits));

    return best;
}

RoundBuckets makeRoundBuckets(BucketKind kind, const Game::GameInfo& info, int round) {
    const int numBoard = info.totalBoardCards(round);
    const int digits = info.numHoleCards() + numBoard;
    const long double radix = static_cast<long double>(info.numSuits()) * info.numRanks();

    // the whole index space has to fit in a BucketId
    long double space = 1.0L;
    for (int i = 0; i < digits; ++i) space *= radix;
    if (space > static_cast<long double>(std::numeric_limits<BucketId>::max())) {
        throw Game::ConfigError("bucket index of round " + std::to_string(round) + " does not fit in 64 bits");
    }

    if (kind == BucketKind::Lossless) {
        return LosslessBuckets{info.numSuits(), info.numRanks(), numBoard, info.numHoleCards()};
    }
    return NoBuckets{info.numSuits(), info.numRanks(), numBoard, info.numHoleCards()};
}

CardAbstraction::CardAbstraction(std::vector<RoundBuckets> roundBuckets) : roundBuckets_(std::move(roundBuckets)) {}

CardAbstraction CardAbstraction::uniform(BucketKind kind, const Game::GameInfo& info) {
    std::vector<RoundBuckets> rounds;
    for (int r = 0; r < info.numRounds(); ++r) {
        rounds.push_back(makeRoundBuckets(kind, info, r));
    }
    return CardAbstraction(std::move(rounds));
}

BucketId CardAbstraction::getBucket(int round, const Game::Cards& board, const Game::Cards& hole) const {
    if (round < 0 || round >= numRounds()) {
        throw std::out_of_range("no bucket strategy for round " + std::to_string(round));
    }
    return std::visit([&](const auto& buckets) { return buckets.getBucket(board, hole); }, roundBuckets_[round]);
}

BucketKind CardAbstraction::kind(int round) const {
    return std::visit(overloaded{
        [](const NoBuckets&) { return BucketKind::None; },
        [](const LosslessBuckets&) { return BucketKind::Lossless; }
    }, roundBuckets_.at(round));
}

namespace {

CardAbstraction fromJson(const boost::json::value& jv, const Game::GameInfo& info) {
    const boost::json::object& obj = JsonUtil::asObject(jv, "card abstraction");
    const boost::json::value& list = JsonUtil::field(obj, "round_buckets");
    if (!list.is_array()) throw std::invalid_argument("'round_buckets' must be an array");

    if (static_cast<int>(list.get_array().size()) != info.numRounds()) {
        throw Game::ConfigError("round_buckets has " + std::to_string(list.get_array().size()) +
                                " entries, expected one per round (" + std::to_string(info.numRounds()) + ")");
    }

    std::vector<RoundBuckets> rounds;
    int round = 0;
    for (const boost::json::value& item : list.get_array()) {
        const std::string type = JsonUtil::getString(JsonUtil::asObject(item, "round_buckets entry"), "type");
        if (type == "NoBuckets") {
            rounds.push_back(makeRoundBuckets(BucketKind::None, info, round));
        } else if (type == "LosslessBuckets") {
            rounds.push_back(makeRoundBuckets(BucketKind::Lossless, info, round));
        } else {
            throw std::invalid_argument("unknown bucket type '" + type + "'");
        }
        round++;
    }
    return CardAbstraction(std::move(rounds));
}

}

CardAbstraction parseCardAbstraction(const std::string& json, const Game::GameInfo& info) {
    try {
        return fromJson(JsonUtil::parse(json), info);
    } catch (const std::invalid_argument& e) {
        throw Game::ConfigError(std::string("invalid card abstraction: ") + e.what());
    }
}

CardAbstraction loadCardAbstraction(const std::string& path, const Game::GameInfo& info) {
    try {
        return fromJson(JsonUtil::readFile(path), info);
    } catch (const std::invalid_argument& e) {
        throw Game::ConfigError(path + ": " + e.what());
    } catch (const Game::ConfigError& e) {
        throw Game::ConfigError(path + ": " + e.what());
    }
}

std::string cardAbstractionToJson(const CardAbstraction& abstraction) {
    boost::json::array rounds;
    for (int r = 0; r < abstraction.numRounds(); ++r) {
        boost::json::object entry;
        entry["type"] = kindName(abstraction.kind(r));
        rounds.push_back(std::move(entry));
    }
    boost::json::object obj;
    obj["round_buckets"] = std::move(rounds);
    return boost::json::serialize(obj);
}

}
