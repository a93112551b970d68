#pragma once

#include "state.hpp"

#include <boost/json.hpp>

namespace Game {

/*
 Persistence of a hand in progress.
 Every field of GameState is written verbatim (action logs as encodeAction
 words), so a state read back compares equal to the one written.
*/
boost::json::value stateToJson(const GameState& state);

// throws std::invalid_argument on missing keys, wrong lengths or out of range values
GameState stateFromJson(const boost::json::value& jv);

}
