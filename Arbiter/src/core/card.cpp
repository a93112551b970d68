#include "card.hpp"
#include "encoding/card_utils.hpp"

namespace Game {

std::optional<Card> parseCard(const std::string& s) {
    // a card is always exactly a rank letter followed by a suit letter
    if (s.size() != 2) return std::nullopt;

    int rank = CardUtils::getRankIndex(s[0]);
    int suit = CardUtils::getSuitIndex(s[1]);
    if (rank < 0 || suit < 0) return std::nullopt;

    return Card{static_cast<uint8_t>(rank), static_cast<uint8_t>(suit)};
}

std::optional<Cards> parseCards(const std::string& s) {
    if (s.size() % 2 != 0) return std::nullopt;

    Cards cards;
    cards.reserve(s.size() / 2);
    for (size_t i = 0; i < s.size(); i += 2) {
        auto card = parseCard(s.substr(i, 2));
        if (!card) return std::nullopt;
        cards.push_back(*card);
    }
    return cards;
}

std::string cardToString(const Card& c) {
    std::string out;
    out += CardUtils::rankChar(c.rank);
    out += CardUtils::suitChar(c.suit);
    return out;
}

std::string cardsToString(const Cards& cards) {
    std::string out;
    for (const Card& c : cards) out += cardToString(c);
    return out;
}

}
