#include "bet_maths.hpp"

#include <algorithm>
#include <cmath>

namespace BetAbstraction {

uint32_t computePotRatioAmount(float fraction, uint32_t pot, uint32_t maxSpent, uint32_t heroSpent, uint32_t stack) {

    // call-first geometry:
    // simulate calling the current bet first, then compute the pot
    // handles any errors if heroSpent is accidentally bigger than maxSpent
    uint64_t callAmount = maxSpent > heroSpent ? maxSpent - heroSpent : 0;
    uint64_t potAfterCall = static_cast<uint64_t>(pot) + callAmount;

    // raiseAmount is the additional chips beyond the call
    uint64_t raiseAmount = static_cast<uint64_t>(std::floor(static_cast<double>(potAfterCall) * fraction));

    // raise-to = current bet + raise
    uint64_t total = static_cast<uint64_t>(maxSpent) + raiseAmount;

    // cap at stack (all-in)
    return static_cast<uint32_t>(std::min<uint64_t>(total, stack));
}

uint32_t computeFixedAmount(uint32_t increment, uint32_t maxSpent, uint32_t stack) {
    uint64_t total = static_cast<uint64_t>(maxSpent) + increment;
    return static_cast<uint32_t>(std::min<uint64_t>(total, stack));
}

std::vector<uint32_t> deduplicate(std::vector<uint32_t> amounts) {
    // sort ascending
    std::sort(amounts.begin(), amounts.end());

    // remove duplicates
    amounts.erase(std::unique(amounts.begin(), amounts.end()), amounts.end());

    return amounts;
}

}
