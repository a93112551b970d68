#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Game {

// compile-time bounds for the fixed-size state arrays
constexpr int MAX_PLAYERS = 22;
constexpr int MAX_ROUNDS = 4;
constexpr int MAX_NUM_ACTIONS = 32;
constexpr int MAX_BOARD_CARDS = 7;
constexpr int MAX_HOLE_CARDS = 5;
constexpr int MAX_SUITS = 4;
constexpr int MAX_RANKS = 13;
// raise amounts are packed into 30 bits (see encodeAction)
constexpr uint32_t MAX_STACK = 0x3FFFFFFF;

using PlayerId = uint8_t;

enum class BettingType : uint8_t {
    Limit,
    NoLimit
};

// thrown when a ruleset is malformed, never recoverable
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/*
 Rules and parameters of a poker game.
 Loaded once, then shared read-only between every state of every hand.

 per player: startingStacks, blinds
 per round:  raiseSizes, maxRaises, firstPlayer, numBoardCards
*/
class GameInfo {
public:
    struct Params {
        std::vector<uint32_t> startingStacks;
        std::vector<uint32_t> blinds;
        // fixed raise size per round, only meaningful for limit games
        std::vector<uint32_t> raiseSizes;
        BettingType bettingType = BettingType::NoLimit;
        int numPlayers = 0;
        int numRounds = 0;
        std::vector<uint8_t> maxRaises;
        std::vector<PlayerId> firstPlayer;
        int numSuits = 0;
        int numRanks = 0;
        int numHoleCards = 0;
        // board cards revealed at the start of each round
        std::vector<uint8_t> numBoardCards;
    };

    // validates every length and bound, throws ConfigError on the first violation
    explicit GameInfo(Params params);

    int numPlayers() const { return p_.numPlayers; }
    int numRounds() const { return p_.numRounds; }
    int numSuits() const { return p_.numSuits; }
    int numRanks() const { return p_.numRanks; }
    int numHoleCards() const { return p_.numHoleCards; }
    BettingType bettingType() const { return p_.bettingType; }

    uint32_t startingStack(PlayerId player) const { return p_.startingStacks[player]; }
    uint32_t blind(PlayerId player) const { return p_.blinds[player]; }
    uint32_t raiseSize(int round) const { return p_.raiseSizes[round]; }
    uint8_t maxRaises(int round) const { return p_.maxRaises[round]; }
    PlayerId firstPlayer(int round) const { return p_.firstPlayer[round]; }
    int numBoardCards(int round) const { return p_.numBoardCards[round]; }

    // board cards accumulate across rounds: sum of numBoardCards[0..=round]
    int totalBoardCards(int round) const;

    // largest posted blind, 0 when the game has no blinds
    uint32_t maxBlind() const;

    const Params& params() const { return p_; }

private:
    Params p_;
};

// reads and validates a JSON ruleset, throws ConfigError with the path on any failure
GameInfo loadGameInfo(const std::string& path);

// parses a ruleset already held in memory
GameInfo parseGameInfo(const std::string& json);

// writes the same layout parseGameInfo reads
std::string gameInfoToJson(const GameInfo& info);

const char* bettingTypeName(BettingType type);

}
