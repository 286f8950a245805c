#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "solver_types.h"
#include "words_data.h"

// Everything learned from feedback so far. Positions are 0-based; letters are
// codes 1-26. Rounds produce a new value instead of mutating a shared one.
//
// Invariants kept by apply_feedback():
//  - a fixed letter is never in excluded_letters;
//  - excluded_positions[c] never includes a position fixed to c.
struct ConstraintSet {
  std::array<uint8_t, kWordLength> fixed{}; // 0 when the position is free
  std::array<position_mask, kAlphabetSize + 1> excluded_positions{};
  letter_mask excluded_letters = 0;

  bool empty() const;
  bool solved() const;
  int fixed_count() const;

  bool is_fixed(int pos) const { return fixed[pos] != 0; }
  bool is_fixed_letter(uint8_t code) const;
  bool is_excluded(uint8_t code) const {
    return (excluded_letters & letter_bit(code)) != 0;
  }
  bool is_excluded_at(uint8_t code, int pos) const {
    return (excluded_positions[code] >> pos) & 1u;
  }
  bool known_present(uint8_t code) const {
    return is_fixed_letter(code) || excluded_positions[code] != 0;
  }

  // Letters that must appear somewhere in the word.
  letter_mask required_letters() const;

  // Compact form for logs, e.g. "pl.n. +a{2} -er".
  std::string describe() const;

  bool operator==(const ConstraintSet &other) const {
    return fixed == other.fixed &&
           excluded_positions == other.excluded_positions &&
           excluded_letters == other.excluded_letters;
  }
};
