#pragma once

#include <cctype>
#include <cstdint>

namespace CardUtils {

    // rank characters in ascending order, index 0 is the deuce
    constexpr char RANK_CHARS[] = "23456789TJQKA";
    // suit characters, index order matches the deck generation order
    constexpr char SUIT_CHARS[] = "cdhs";

    constexpr int NUM_RANK_CHARS = 13;
    constexpr int NUM_SUIT_CHARS = 4;

    // if rank is lowercase, uppercase it
    inline char normalizeRank(char r) {
        return std::toupper(static_cast<unsigned char>(r));
    }

    // if suit is uppercase, lowercase it
    inline char normalizeSuit(char s) {
        return std::tolower(static_cast<unsigned char>(s));
    }

    // turn rank letter into its index (-1 if garbage)
    inline int getRankIndex(char r) {
        const char c = normalizeRank(r);
        for (int i = 0; i < NUM_RANK_CHARS; ++i) {
            if (RANK_CHARS[i] == c) return i;
        }
        return -1;
    }

    // turn suit letter into its index (-1 if garbage)
    inline int getSuitIndex(char s) {
        const char c = normalizeSuit(s);
        for (int i = 0; i < NUM_SUIT_CHARS; ++i) {
            if (SUIT_CHARS[i] == c) return i;
        }
        return -1;
    }

    // check whether full card is OK or something is off
    inline bool isValidCard(char rank, char suit) {
        return getRankIndex(rank) != -1 && getSuitIndex(suit) != -1;
    }

    inline char rankChar(uint8_t rank) {
        return rank < NUM_RANK_CHARS ? RANK_CHARS[rank] : '?';
    }

    inline char suitChar(uint8_t suit) {
        return suit < NUM_SUIT_CHARS ? SUIT_CHARS[suit] : '?';
    }
}
