#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace Game {

    // a check is a Call that puts no additional chips in
    enum class ActionType : uint8_t {
        Fold,
        Call,
        Raise
    };

    struct Action {
        ActionType type;
        uint32_t amount; // only used for raises: the new total commitment (raise-to), not the increment

        bool operator==(const Action& other) const {
            return type == other.type && amount == other.amount;
        }
        bool operator!=(const Action& other) const { return !(*this == other); }
        bool operator<(const Action& other) const {
            return type != other.type ? type < other.type : amount < other.amount;
        }
    };

    inline Action fold() { return Action{ActionType::Fold, 0}; }
    inline Action call() { return Action{ActionType::Call, 0}; }
    inline Action raise(uint32_t to) { return Action{ActionType::Raise, to}; }

    // from string to action ('f', 'c', 'r(n)')
    std::optional<Action> getAction(const std::string&);

    // action back to the same short string form
    std::string actionToString(const Action&);

    // action to bits
    // first 2 bits hold the type, the remaining 30 the raise-to amount
    // 30 bits cover any stack we load (stacks above 2^30 are rejected at load time)
    uint32_t encodeAction(const Action&);

    // decodes bits to an action again
    Action decodeAction(uint32_t);

}
