#include "state.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace Game {

const char* statusMessage(ApplyStatus status) {
    switch (status) {
        case ApplyStatus::Ok: return "ok";
        case ApplyStatus::HandFinished: return "cannot apply action to finished state";
        case ApplyStatus::RoundActionsFull: return "cannot apply action to state: already at max actions for this round";
        case ApplyStatus::InvalidAction: return "cannot apply an invalid action";
    }
    return "unknown status";
}

GameState::GameState(const GameInfo& info, uint32_t handId) : handId_(handId) {
    // empty seats count as folded so they never get the action
    playersFolded_.fill(true);

    for (int i = 0; i < info.numPlayers(); ++i) {
        spent_[i] = info.blind(i);
        sumRoundSpent_[0][i] = info.blind(i);
        stackPlayer_[i] = info.startingStack(i);
        maxSpent_ = std::max(maxSpent_, info.blind(i));
        playersFolded_[i] = false;
    }

    if (info.bettingType() == BettingType::NoLimit) {
        minNoLimitRaiseTo_ = maxSpent_ > 0 ? maxSpent_ * 2 : 1;
    }

    activePlayer_ = info.firstPlayer(0);

    // a blind can take a whole stack, nobody may be left to act
    if (numActivePlayers(info) == 0) {
        finished_ = true;
        round_ = static_cast<uint8_t>(info.numRounds() - 1);
        return;
    }

    while (playersFolded_[activePlayer_] || spent_[activePlayer_] >= stackPlayer_[activePlayer_]) {
        activePlayer_ = static_cast<PlayerId>((activePlayer_ + 1) % info.numPlayers());
    }

    // a lone player with nothing to call has no decision left, run it out to showdown
    if (numActivePlayers(info) == 1 && spent_[activePlayer_] >= maxSpent_) {
        finished_ = true;
        round_ = static_cast<uint8_t>(info.numRounds() - 1);
    }
}

uint32_t GameState::potTotal(const GameInfo& info) const {
    uint32_t total = 0;
    for (int i = 0; i < info.numPlayers(); ++i) {
        total += spent_[i];
    }
    return total;
}

PlayerId GameState::currentPlayer() const {
    if (finished_) {
        throw std::logic_error("state is finished so there is no active player");
    }
    return activePlayer_;
}

int GameState::numActivePlayers(const GameInfo& info) const {
    int count = 0;
    for (int i = 0; i < info.numPlayers(); ++i) {
        if (!playersFolded_[i] && spent_[i] < stackPlayer_[i]) {
            count++;
        }
    }
    return count;
}

int GameState::numCalled(const GameInfo&) const {
    int count = 0;

    // walk the round backwards until the last raise, the raiser counts as having called themselves
    for (int i = numActions_[round_] - 1; i >= 0; --i) {
        const PlayerId player = actingPlayer_[round_][i];
        const ActionType type = actions_[round_][i].type;

        if (type == ActionType::Fold) continue;

        if (spent_[player] < stackPlayer_[player]) {
            count++;
        }
        if (type == ActionType::Raise) {
            return count;
        }
    }

    return count;
}

int GameState::numFolded(const GameInfo& info) const {
    int count = 0;
    for (int i = 0; i < info.numPlayers(); ++i) {
        if (playersFolded_[i]) count++;
    }
    return count;
}

int GameState::numRaises() const {
    int count = 0;
    for (int i = 0; i < numActions_[round_]; ++i) {
        if (actions_[round_][i].type == ActionType::Raise) count++;
    }
    return count;
}

PlayerId GameState::nextPlayer(const GameInfo& info) const {
    PlayerId p = activePlayer_;

    // the active player itself can always act, so this stops at the latest when we wrap back to them
    do {
        p = static_cast<PlayerId>((p + 1) % info.numPlayers());
    } while (playersFolded_[p] || spent_[p] >= stackPlayer_[p]);

    return p;
}

RaiseRange GameState::raiseRange(const GameInfo& info) const {
    const RaiseRange none{0, 0};

    if (finished_) return none;

    if (numRaises() >= info.maxRaises(round_)) return none;

    // every other player may still answer the raise, that must fit in the round's log
    if (numActions_[round_] + info.numPlayers() > MAX_NUM_ACTIONS) {
        std::cerr << "Warning: making raise invalid since possible actions "
                  << numActions_[round_] + info.numPlayers() << " > " << MAX_NUM_ACTIONS << "\n";
        return none;
    }

    if (numActivePlayers(info) <= 1) return none;

    if (info.bettingType() == BettingType::Limit) {
        std::cerr << "Warning: raiseRange called for a limit game\n";
        return none;
    }

    const uint32_t stack = stackPlayer_[activePlayer_];
    uint32_t minRaise = minNoLimitRaiseTo_;

    if (stack < minNoLimitRaiseTo_) {
        // can't even reach the current bet, so no raise at all
        if (maxSpent_ >= stack) return none;
        // short all-in is the only raise left
        minRaise = stack;
    }

    return RaiseRange{minRaise, stack};
}

bool GameState::isValidAction(const GameInfo& info, const Action& action) const {
    if (finished_) return false;

    switch (action.type) {
        case ActionType::Fold:
            // an all-in player has nothing left to protect
            return spent_[activePlayer_] != stackPlayer_[activePlayer_];
        case ActionType::Call:
            return true;
        case ActionType::Raise: {
            if (numRaises() >= info.maxRaises(round_)) return false;

            if (info.bettingType() == BettingType::Limit) {
                // fixed size only, and the raiser must have chips beyond the current bet
                return action.amount == info.raiseSize(round_) && stackPlayer_[activePlayer_] > maxSpent_;
            }

            const RaiseRange range = raiseRange(info);
            return range.possible() && action.amount >= range.min && action.amount <= range.max;
        }
    }
    return false;
}

ApplyResult GameState::applyAction(const GameInfo& info, const Action& action) const {
    if (finished_) {
        return ApplyResult{ApplyStatus::HandFinished, std::nullopt};
    }
    if (numActions_[round_] >= MAX_NUM_ACTIONS) {
        return ApplyResult{ApplyStatus::RoundActionsFull, std::nullopt};
    }
    if (!isValidAction(info, action)) {
        return ApplyResult{ApplyStatus::InvalidAction, std::nullopt};
    }

    GameState next = *this;
    const PlayerId player = activePlayer_;
    const int r = round_;

    next.actions_[r][numActions_[r]] = action;
    next.actingPlayer_[r][numActions_[r]] = player;
    next.numActions_[r]++;

    switch (action.type) {
        case ActionType::Fold:
            next.playersFolded_[player] = true;
            break;
        case ActionType::Call: {
            // a short stack calls for whatever it has left (all-in)
            const uint32_t to = std::min(next.stackPlayer_[player], next.maxSpent_);
            next.sumRoundSpent_[r][player] += to - next.spent_[player];
            next.spent_[player] = to;
            break;
        }
        case ActionType::Raise: {
            if (info.bettingType() == BettingType::NoLimit) {
                // the next raise has to be at least as big as this one
                const uint64_t reraiseTo = 2 * static_cast<uint64_t>(action.amount) - next.maxSpent_;
                if (reraiseTo > next.minNoLimitRaiseTo_) {
                    next.minNoLimitRaiseTo_ = static_cast<uint32_t>(std::min<uint64_t>(reraiseTo, MAX_STACK));
                }
                next.maxSpent_ = action.amount;
            } else {
                next.maxSpent_ = std::min(next.maxSpent_ + info.raiseSize(r), next.stackPlayer_[player]);
            }

            next.sumRoundSpent_[r][player] += next.maxSpent_ - next.spent_[player];
            next.spent_[player] = next.maxSpent_;
            break;
        }
    }

    next.activePlayer_ = nextPlayer(info);

    if (next.numFolded(info) + 1 >= info.numPlayers()) {
        next.finished_ = true;
    } else if (next.numCalled(info) >= next.numActivePlayers(info)) {
        if (next.numActivePlayers(info) > 1) {
            if (next.round_ + 1 < info.numRounds()) {
                next.round_++;
                next.minNoLimitRaiseTo_ = std::max<uint32_t>(1, info.maxBlind()) + next.maxSpent_;
                next.activePlayer_ = info.firstPlayer(next.round_);
                while (next.playersFolded_[next.activePlayer_] ||
                       next.spent_[next.activePlayer_] >= next.stackPlayer_[next.activePlayer_]) {
                    next.activePlayer_ = static_cast<PlayerId>((next.activePlayer_ + 1) % info.numPlayers());
                }
            } else {
                next.finished_ = true;
            }
        } else {
            // nobody can bet anymore, run it out to showdown
            next.finished_ = true;
            next.round_ = static_cast<uint8_t>(info.numRounds() - 1);
        }
    }

    return ApplyResult{ApplyStatus::Ok, next};
}

bool GameState::operator==(const GameState& other) const {
    return handId_ == other.handId_ &&
           maxSpent_ == other.maxSpent_ &&
           minNoLimitRaiseTo_ == other.minNoLimitRaiseTo_ &&
           spent_ == other.spent_ &&
           stackPlayer_ == other.stackPlayer_ &&
           sumRoundSpent_ == other.sumRoundSpent_ &&
           actions_ == other.actions_ &&
           actingPlayer_ == other.actingPlayer_ &&
           numActions_ == other.numActions_ &&
           activePlayer_ == other.activePlayer_ &&
           round_ == other.round_ &&
           finished_ == other.finished_ &&
           playersFolded_ == other.playersFolded_;
}

}
