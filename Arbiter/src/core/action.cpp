#include "action.hpp"
#include <cctype>

namespace Game {
    // this function gets the action string and assigns an enum 'ActionType' for the corresponding letter
    std::optional<Action> getAction(const std::string& s) {
        if (s.empty()) return std::nullopt;

        // fold and call always come as one char, raises carry the raise-to amount right after the 'r'
        char c = s[0];

        if (c == 'f' && s.size() == 1) return fold();
        if (c == 'c' && s.size() == 1) return call();
        if (c == 'r') {
            // "r" alone or "r-5" or "r10x" are all garbage
            if (s.size() < 2 || s.size() > 11) return std::nullopt;

            uint64_t amount = 0;
            for (size_t i = 1; i < s.size(); ++i) {
                if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
                amount = amount * 10 + static_cast<uint64_t>(s[i] - '0');
            }
            if (amount > 0x3FFFFFFFu) return std::nullopt;

            return raise(static_cast<uint32_t>(amount));
        }

        return std::nullopt;
    }

    std::string actionToString(const Action& a) {
        switch (a.type) {
            case ActionType::Fold: return "f";
            case ActionType::Call: return "c";
            case ActionType::Raise:
                return "r" + std::to_string(a.amount);
        }
        return "?";
    }

    uint32_t encodeAction(const Action& a) {
        // first 2 bits action type, following 30 bits raise-to amount
        uint32_t bits = static_cast<uint32_t>(a.type) & 0b11;

        if (a.type == ActionType::Raise) {
            bits |= (a.amount << 2); // bitshift the amount to start from 3rd bit
        }

        return bits;
    }

    Action decodeAction(uint32_t bits) {
        Action a;
        // unmask the first 2 bits
        a.type = static_cast<ActionType>(bits & 0b11);
        // unshift to get the amount
        a.amount = (bits >> 2);
        return a;
    }
}
