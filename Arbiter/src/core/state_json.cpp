#include "state_json.hpp"
#include "util/json_util.hpp"

#include <stdexcept>
#include <string>

namespace Game {

namespace {

template <typename T, size_t N>
boost::json::array toArray(const std::array<T, N>& a) {
    boost::json::array out;
    for (const T& x : a) out.push_back(static_cast<uint64_t>(x));
    return out;
}

// reads a fixed size array back, every entry must fit in T and stay below limit
template <typename T, size_t N>
void fromArray(const boost::json::value& v, std::array<T, N>& out, uint64_t limit, const std::string& key) {
    if (!v.is_array() || v.get_array().size() != N) {
        throw std::invalid_argument("'" + key + "' must be an array of " + std::to_string(N) + " entries");
    }
    for (size_t i = 0; i < N; ++i) {
        const uint64_t x = JsonUtil::toUint(v.get_array()[i], key);
        if (x > limit) {
            throw std::invalid_argument("'" + key + "' entry " + std::to_string(x) + " is out of range");
        }
        out[i] = static_cast<T>(x);
    }
}

template <typename T, size_t N, size_t M>
void fromNested(const boost::json::value& v, std::array<std::array<T, M>, N>& out, uint64_t limit,
                const std::string& key) {
    if (!v.is_array() || v.get_array().size() != N) {
        throw std::invalid_argument("'" + key + "' must be an array of " + std::to_string(N) + " rows");
    }
    for (size_t r = 0; r < N; ++r) {
        fromArray(v.get_array()[r], out[r], limit, key);
    }
}

}

// has access to the private fields of GameState
class StateCodec {
public:
    static boost::json::value toJson(const GameState& s) {
        boost::json::object obj;
        obj["hand_id"] = s.handId_;
        obj["max_spent"] = s.maxSpent_;
        obj["min_no_limit_raise_to"] = s.minNoLimitRaiseTo_;
        obj["spent"] = toArray(s.spent_);
        obj["stack_player"] = toArray(s.stackPlayer_);

        boost::json::array roundSpent, actions, acting;
        for (int r = 0; r < MAX_ROUNDS; ++r) {
            roundSpent.push_back(toArray(s.sumRoundSpent_[r]));
            acting.push_back(toArray(s.actingPlayer_[r]));

            boost::json::array row;
            for (const Action& a : s.actions_[r]) row.push_back(encodeAction(a));
            actions.push_back(std::move(row));
        }
        obj["sum_round_spent"] = std::move(roundSpent);
        obj["actions"] = std::move(actions);
        obj["acting_player"] = std::move(acting);

        obj["num_actions"] = toArray(s.numActions_);
        obj["active_player"] = s.activePlayer_;
        obj["round"] = s.round_;
        obj["finished"] = s.finished_;

        boost::json::array folded;
        for (bool f : s.playersFolded_) folded.push_back(f);
        obj["players_folded"] = std::move(folded);

        return obj;
    }

    static GameState fromJson(const boost::json::value& jv) {
        const boost::json::object& obj = JsonUtil::asObject(jv, "game state");
        GameState s;

        s.handId_ = static_cast<uint32_t>(limited(JsonUtil::getUint(obj, "hand_id"), UINT32_MAX, "hand_id"));
        s.maxSpent_ = static_cast<uint32_t>(limited(JsonUtil::getUint(obj, "max_spent"), MAX_STACK, "max_spent"));
        s.minNoLimitRaiseTo_ = static_cast<uint32_t>(
            limited(JsonUtil::getUint(obj, "min_no_limit_raise_to"), MAX_STACK, "min_no_limit_raise_to"));

        fromArray(JsonUtil::field(obj, "spent"), s.spent_, MAX_STACK, "spent");
        fromArray(JsonUtil::field(obj, "stack_player"), s.stackPlayer_, MAX_STACK, "stack_player");
        fromNested(JsonUtil::field(obj, "sum_round_spent"), s.sumRoundSpent_, MAX_STACK, "sum_round_spent");
        fromNested(JsonUtil::field(obj, "acting_player"), s.actingPlayer_, MAX_PLAYERS - 1, "acting_player");

        std::array<std::array<uint32_t, MAX_NUM_ACTIONS>, MAX_ROUNDS> words{};
        fromNested(JsonUtil::field(obj, "actions"), words, UINT32_MAX, "actions");
        for (int r = 0; r < MAX_ROUNDS; ++r) {
            for (int i = 0; i < MAX_NUM_ACTIONS; ++i) {
                // type bits 3 don't name an action
                if ((words[r][i] & 0b11) > static_cast<uint32_t>(ActionType::Raise)) {
                    throw std::invalid_argument("'actions' holds an unknown action type");
                }
                s.actions_[r][i] = decodeAction(words[r][i]);
            }
        }

        fromArray(JsonUtil::field(obj, "num_actions"), s.numActions_, MAX_NUM_ACTIONS, "num_actions");
        s.activePlayer_ = static_cast<PlayerId>(
            limited(JsonUtil::getUint(obj, "active_player"), MAX_PLAYERS - 1, "active_player"));
        s.round_ = static_cast<uint8_t>(limited(JsonUtil::getUint(obj, "round"), MAX_ROUNDS - 1, "round"));
        s.finished_ = JsonUtil::getBool(obj, "finished");

        const boost::json::value& folded = JsonUtil::field(obj, "players_folded");
        if (!folded.is_array() || folded.get_array().size() != MAX_PLAYERS) {
            throw std::invalid_argument("'players_folded' must be an array of " + std::to_string(MAX_PLAYERS) + " entries");
        }
        for (int i = 0; i < MAX_PLAYERS; ++i) {
            const boost::json::value& f = folded.get_array()[i];
            if (!f.is_bool()) throw std::invalid_argument("'players_folded' entries must be booleans");
            s.playersFolded_[i] = f.get_bool();
        }

        return s;
    }

private:
    static uint64_t limited(uint64_t v, uint64_t limit, const char* key) {
        if (v > limit) {
            throw std::invalid_argument(std::string("'") + key + "' is out of range");
        }
        return v;
    }
};

boost::json::value stateToJson(const GameState& state) {
    return StateCodec::toJson(state);
}

GameState stateFromJson(const boost::json::value& jv) {
    return StateCodec::fromJson(jv);
}

}
