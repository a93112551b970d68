#include "game_info.hpp"
#include "util/json_util.hpp"

#include <algorithm>

namespace Game {

namespace {

// per-player / per-round arrays must match the declared counts exactly
template <typename T>
void requireLength(const std::vector<T>& v, int expected, const char* name, const char* per) {
    if (static_cast<int>(v.size()) != expected) {
        throw ConfigError(std::string(name) + " has " + std::to_string(v.size()) +
                          " entries, expected one per " + per + " (" + std::to_string(expected) + ")");
    }
}

void requireRange(int value, int lo, int hi, const char* name) {
    if (value < lo || value > hi) {
        throw ConfigError(std::string(name) + " = " + std::to_string(value) + " is outside [" +
                          std::to_string(lo) + ", " + std::to_string(hi) + "]");
    }
}

template <typename T>
std::vector<T> narrow(const std::vector<uint64_t>& in, uint64_t limit, const char* name) {
    std::vector<T> out;
    out.reserve(in.size());
    for (uint64_t v : in) {
        if (v > limit) {
            throw ConfigError(std::string(name) + " entry " + std::to_string(v) + " is too large");
        }
        out.push_back(static_cast<T>(v));
    }
    return out;
}

int narrowScalar(uint64_t v, const char* name) {
    if (v > 255) {
        throw ConfigError(std::string(name) + " = " + std::to_string(v) + " is too large");
    }
    return static_cast<int>(v);
}

GameInfo fromJson(const boost::json::value& jv) {
    const boost::json::object& obj = JsonUtil::asObject(jv, "game info");

    GameInfo::Params p;
    p.startingStacks = narrow<uint32_t>(JsonUtil::getUintArray(obj, "starting_stacks"), MAX_STACK, "starting_stacks");
    p.blinds = narrow<uint32_t>(JsonUtil::getUintArray(obj, "blinds"), MAX_STACK, "blinds");
    p.raiseSizes = narrow<uint32_t>(JsonUtil::getUintArray(obj, "raise_sizes"), MAX_STACK, "raise_sizes");
    p.maxRaises = narrow<uint8_t>(JsonUtil::getUintArray(obj, "max_raises"), 255, "max_raises");
    p.firstPlayer = narrow<PlayerId>(JsonUtil::getUintArray(obj, "first_player"), 255, "first_player");
    p.numBoardCards = narrow<uint8_t>(JsonUtil::getUintArray(obj, "num_board_cards"), 255, "num_board_cards");

    const std::string betting = JsonUtil::getString(obj, "betting_type");
    if (betting == "Limit") {
        p.bettingType = BettingType::Limit;
    } else if (betting == "NoLimit") {
        p.bettingType = BettingType::NoLimit;
    } else {
        throw ConfigError("unknown betting_type '" + betting + "'");
    }

    p.numPlayers = narrowScalar(JsonUtil::getUint(obj, "num_players"), "num_players");
    p.numRounds = narrowScalar(JsonUtil::getUint(obj, "num_rounds"), "num_rounds");
    p.numSuits = narrowScalar(JsonUtil::getUint(obj, "num_suits"), "num_suits");
    p.numRanks = narrowScalar(JsonUtil::getUint(obj, "num_ranks"), "num_ranks");
    p.numHoleCards = narrowScalar(JsonUtil::getUint(obj, "num_hole_cards"), "num_hole_cards");

    return GameInfo(std::move(p));
}

template <typename T>
boost::json::array toArray(const std::vector<T>& v) {
    boost::json::array out;
    for (const T& x : v) out.push_back(static_cast<uint64_t>(x));
    return out;
}

}

GameInfo::GameInfo(Params params) : p_(std::move(params)) {
    requireRange(p_.numPlayers, 2, MAX_PLAYERS, "num_players");
    requireRange(p_.numRounds, 1, MAX_ROUNDS, "num_rounds");
    requireRange(p_.numSuits, 1, MAX_SUITS, "num_suits");
    requireRange(p_.numRanks, 1, MAX_RANKS, "num_ranks");
    requireRange(p_.numHoleCards, 0, MAX_HOLE_CARDS, "num_hole_cards");

    requireLength(p_.startingStacks, p_.numPlayers, "starting_stacks", "player");
    requireLength(p_.blinds, p_.numPlayers, "blinds", "player");
    requireLength(p_.raiseSizes, p_.numRounds, "raise_sizes", "round");
    requireLength(p_.maxRaises, p_.numRounds, "max_raises", "round");
    requireLength(p_.firstPlayer, p_.numRounds, "first_player", "round");
    requireLength(p_.numBoardCards, p_.numRounds, "num_board_cards", "round");

    for (int i = 0; i < p_.numPlayers; ++i) {
        if (p_.startingStacks[i] > MAX_STACK) {
            throw ConfigError("starting stack of player " + std::to_string(i) + " is too large");
        }
        // a blind can't be posted from chips the player doesn't have
        if (p_.blinds[i] > p_.startingStacks[i]) {
            throw ConfigError("blind of player " + std::to_string(i) + " exceeds their starting stack");
        }
    }

    for (int r = 0; r < p_.numRounds; ++r) {
        if (p_.firstPlayer[r] >= p_.numPlayers) {
            throw ConfigError("first_player of round " + std::to_string(r) + " is not a seated player");
        }
    }

    const int boardCards = totalBoardCards(p_.numRounds - 1);
    requireRange(boardCards, 0, MAX_BOARD_CARDS, "total board cards");

    const int deckSize = p_.numSuits * p_.numRanks;
    const int needed = p_.numPlayers * p_.numHoleCards + boardCards;
    if (needed > deckSize) {
        throw ConfigError("a deck of " + std::to_string(deckSize) + " cards can't deal " +
                          std::to_string(needed) + " cards");
    }
}

int GameInfo::totalBoardCards(int round) const {
    int total = 0;
    for (int i = 0; i <= round; ++i) {
        total += p_.numBoardCards[i];
    }
    return total;
}

uint32_t GameInfo::maxBlind() const {
    return *std::max_element(p_.blinds.begin(), p_.blinds.end());
}

const char* bettingTypeName(BettingType type) {
    switch (type) {
        case BettingType::Limit: return "Limit";
        case BettingType::NoLimit: return "NoLimit";
    }
    return "?";
}

GameInfo parseGameInfo(const std::string& json) {
    try {
        return fromJson(JsonUtil::parse(json));
    } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("invalid game info: ") + e.what());
    }
}

GameInfo loadGameInfo(const std::string& path) {
    try {
        return fromJson(JsonUtil::readFile(path));
    } catch (const std::invalid_argument& e) {
        throw ConfigError(path + ": " + e.what());
    } catch (const ConfigError& e) {
        throw ConfigError(path + ": " + e.what());
    }
}

std::string gameInfoToJson(const GameInfo& info) {
    const GameInfo::Params& p = info.params();

    boost::json::object obj;
    obj["starting_stacks"] = toArray(p.startingStacks);
    obj["blinds"] = toArray(p.blinds);
    obj["raise_sizes"] = toArray(p.raiseSizes);
    obj["betting_type"] = bettingTypeName(p.bettingType);
    obj["num_players"] = p.numPlayers;
    obj["num_rounds"] = p.numRounds;
    obj["max_raises"] = toArray(p.maxRaises);
    obj["first_player"] = toArray(p.firstPlayer);
    obj["num_suits"] = p.numSuits;
    obj["num_ranks"] = p.numRanks;
    obj["num_hole_cards"] = p.numHoleCards;
    obj["num_board_cards"] = toArray(p.numBoardCards);

    return boost::json::serialize(obj);
}

}
