#include "bet_abstraction.hpp"
#include "bet_maths.hpp"
#include "util/json_util.hpp"

namespace BetAbstraction {

namespace {

AbstractRaiseType parseRaiseType(const boost::json::value& v) {
    // unit variant as a bare string, data variants as a one-key object
    if (v.is_string()) {
        if (v.get_string() == "AllIn") return AbstractRaiseType{RaiseKind::AllIn, 0.0f, 0};
        throw std::invalid_argument("unknown raise_type '" + std::string(v.get_string().c_str()) + "'");
    }

    const boost::json::object& obj = JsonUtil::asObject(v, "raise_type");
    if (obj.if_contains("PotRatio")) {
        const double ratio = JsonUtil::getDouble(obj, "PotRatio");
        if (!(ratio > 0.0)) throw std::invalid_argument("PotRatio must be positive");
        return AbstractRaiseType{RaiseKind::PotRatio, static_cast<float>(ratio), 0};
    }
    if (obj.if_contains("Fixed")) {
        const uint64_t chips = JsonUtil::getUint(obj, "Fixed");
        if (chips > Game::MAX_STACK) throw std::invalid_argument("Fixed raise is too large");
        return AbstractRaiseType{RaiseKind::Fixed, 0.0f, static_cast<uint32_t>(chips)};
    }
    throw std::invalid_argument("raise_type must be \"AllIn\", {\"PotRatio\": f} or {\"Fixed\": n}");
}

RaiseRoundConfig parseRoundConfig(const boost::json::value& v) {
    if (v.is_string()) {
        if (v.get_string() == "NotAllowed") return RaiseRoundConfig{RoundRule::NotAllowed, 0};
        if (v.get_string() == "Always") return RaiseRoundConfig{RoundRule::Always, 0};
        throw std::invalid_argument("unknown round_config '" + std::string(v.get_string().c_str()) + "'");
    }

    const boost::json::object& obj = JsonUtil::asObject(v, "round_config entry");
    const uint64_t limit = JsonUtil::getUint(obj, "Before");
    if (limit > UINT32_MAX) throw std::invalid_argument("Before limit is too large");
    return RaiseRoundConfig{RoundRule::Before, static_cast<uint32_t>(limit)};
}

ActionAbstraction fromJson(const boost::json::value& jv, const Game::GameInfo& info) {
    const boost::json::object& obj = JsonUtil::asObject(jv, "action abstraction");
    const boost::json::value& list = JsonUtil::field(obj, "possible_raises");
    if (!list.is_array()) throw std::invalid_argument("'possible_raises' must be an array");

    std::vector<AbstractRaise> raises;
    for (const boost::json::value& item : list.get_array()) {
        const boost::json::object& entry = JsonUtil::asObject(item, "possible_raises entry");

        AbstractRaise raise;
        raise.raiseType = parseRaiseType(JsonUtil::field(entry, "raise_type"));

        const boost::json::value& rounds = JsonUtil::field(entry, "round_config");
        if (!rounds.is_array()) throw std::invalid_argument("'round_config' must be an array");
        for (const boost::json::value& r : rounds.get_array()) {
            raise.roundConfig.push_back(parseRoundConfig(r));
        }

        if (static_cast<int>(raise.roundConfig.size()) != info.numRounds()) {
            throw Game::ConfigError("round_config has " + std::to_string(raise.roundConfig.size()) +
                                    " entries, expected one per round (" + std::to_string(info.numRounds()) + ")");
        }
        raises.push_back(std::move(raise));
    }

    return ActionAbstraction(std::move(raises));
}

}

bool isRaiseAllowed(const AbstractRaise& raise, const Game::GameState& state) {
    const int round = state.currentRound();
    if (round >= static_cast<int>(raise.roundConfig.size())) return false;

    const RaiseRoundConfig& config = raise.roundConfig[round];
    switch (config.rule) {
        case RoundRule::Always: return true;
        case RoundRule::Before: return config.limit > static_cast<uint32_t>(state.numRaises());
        case RoundRule::NotAllowed: return false;
    }
    return false;
}

std::optional<Game::Action> abstractRaiseToReal(const Game::GameInfo& info, const Game::GameState& state,
                                                const AbstractRaise& raise) {
    if (state.isFinished() || !isRaiseAllowed(raise, state)) return std::nullopt;

    const Game::PlayerId player = state.currentPlayer();
    const uint32_t stack = state.playerStack(player);
    uint32_t amount = 0;

    switch (raise.raiseType.kind) {
        case RaiseKind::AllIn:
            amount = stack;
            break;
        case RaiseKind::Fixed:
            // limit raises are named by the fixed size itself
            amount = info.bettingType() == Game::BettingType::NoLimit
                   ? computeFixedAmount(raise.raiseType.chips, state.maxSpent(), stack)
                   : raise.raiseType.chips;
            break;
        case RaiseKind::PotRatio:
            amount = computePotRatioAmount(raise.raiseType.ratio, state.potTotal(info), state.maxSpent(),
                                           state.playerSpent(player), stack);
            break;
    }

    const Game::Action action = Game::raise(amount);
    if (state.isValidAction(info, action)) return action;

    return std::nullopt;
}

ActionAbstraction::ActionAbstraction(std::vector<AbstractRaise> possibleRaises)
    : possibleRaises_(std::move(possibleRaises)) {}

std::vector<Game::Action> ActionAbstraction::getActions(const Game::GameInfo& info, const Game::GameState& state) const {
    std::vector<Game::Action> actions;
    if (state.isFinished()) return actions;

    actions.reserve(2 + possibleRaises_.size());

    if (state.isValidAction(info, Game::fold())) {
        actions.push_back(Game::fold());
    }
    // a call (or check) is always there
    actions.push_back(Game::call());

    std::vector<uint32_t> amounts;
    for (const AbstractRaise& raise : possibleRaises_) {
        if (auto real = abstractRaiseToReal(info, state, raise)) {
            amounts.push_back(real->amount);
        }
    }

    // several sizes can collapse onto the same raise-to (most often the all-in)
    for (uint32_t amount : deduplicate(std::move(amounts))) {
        actions.push_back(Game::raise(amount));
    }

    return actions;
}

ActionAbstraction parseActionAbstraction(const std::string& json, const Game::GameInfo& info) {
    try {
        return fromJson(JsonUtil::parse(json), info);
    } catch (const std::invalid_argument& e) {
        throw Game::ConfigError(std::string("invalid action abstraction: ") + e.what());
    }
}

ActionAbstraction loadActionAbstraction(const std::string& path, const Game::GameInfo& info) {
    try {
        return fromJson(JsonUtil::readFile(path), info);
    } catch (const std::invalid_argument& e) {
        throw Game::ConfigError(path + ": " + e.what());
    } catch (const Game::ConfigError& e) {
        throw Game::ConfigError(path + ": " + e.what());
    }
}

}
