#pragma once
#include <cstdint>
#include <vector>

/*
 Generic cases to be handled when turning abstract sizes into chips:

 1. pot ratio raise (call-first geometry)
 pot, current bet, chips already in -> raise-to amount
 example: pot 30, bet to match 10, hero has 4 in -> call 6 first, pot after call 36,
 75% raise adds 27 -> raise to 10 + 27 = 37

 2. fixed raise
 no-limit: chips on top of the current bet; limit: the round's fixed size itself

 3. remove duplicate raise entries
 several abstract sizes can collapse onto the same raise-to (typically the stack)
*/

namespace BetAbstraction {

/*
Computes the raise-to amount for a fraction of the pot.
 pot after calling = pot + (maxSpent - heroSpent)
 raise-to = maxSpent + pot after calling * fraction
 result capped at stack (all-in)
*/
uint32_t computePotRatioAmount(float fraction, uint32_t pot, uint32_t maxSpent, uint32_t heroSpent, uint32_t stack);

/*
Computes the raise-to amount for a fixed no-limit increment on top of the current bet.
 result capped at stack
*/
uint32_t computeFixedAmount(uint32_t increment, uint32_t maxSpent, uint32_t stack);

/*
Sorts ascending and removes duplicate amounts.
*/
std::vector<uint32_t> deduplicate(std::vector<uint32_t> amounts);

}
