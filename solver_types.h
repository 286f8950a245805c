#pragma once

#include <cstdint>

// --- Type Definitions ---
// Words are packed 5 bits per letter, first letter in the high bits, so two
// encoded words compare in the same order as their spellings.
using encoded_word = uint64_t;

// One bit per letter code (1-26).
using letter_mask = uint32_t;

// Bit i set means position i (0-based).
using position_mask = uint8_t;

inline constexpr int kWordLength = 5;
inline constexpr int kAlphabetSize = 26;
inline constexpr letter_mask kAllLetters = 0x7FFFFFEu;

static_assert(kWordLength * 5 <= 64, "encoded_word holds at most 12 letters");
static_assert(kWordLength <= 8, "position_mask holds at most 8 positions");
