#include "constraint_set.h"

#include <algorithm>

bool ConstraintSet::empty() const {
  if (excluded_letters != 0)
    return false;
  if (std::any_of(fixed.begin(), fixed.end(),
                  [](uint8_t code) { return code != 0; }))
    return false;
  return std::all_of(excluded_positions.begin(), excluded_positions.end(),
                     [](position_mask mask) { return mask == 0; });
}

bool ConstraintSet::solved() const { return fixed_count() == kWordLength; }

int ConstraintSet::fixed_count() const {
  return static_cast<int>(std::count_if(
      fixed.begin(), fixed.end(), [](uint8_t code) { return code != 0; }));
}

bool ConstraintSet::is_fixed_letter(uint8_t code) const {
  return std::find(fixed.begin(), fixed.end(), code) != fixed.end();
}

letter_mask ConstraintSet::required_letters() const {
  letter_mask required = 0;
  for (uint8_t code = 1; code <= kAlphabetSize; ++code) {
    if (excluded_positions[code] != 0)
      required |= letter_bit(code);
  }
  return required;
}

std::string ConstraintSet::describe() const {
  std::string out;
  for (const uint8_t code : fixed) {
    out += code ? letter_char(code) : '.';
  }
  for (uint8_t code = 1; code <= kAlphabetSize; ++code) {
    const position_mask mask = excluded_positions[code];
    if (mask == 0)
      continue;
    out += " +";
    out += letter_char(code);
    out += '{';
    bool first = true;
    for (int pos = 0; pos < kWordLength; ++pos) {
      if (!((mask >> pos) & 1u))
        continue;
      if (!first)
        out += ',';
      out += std::to_string(pos + 1);
      first = false;
    }
    out += '}';
  }
  if (excluded_letters != 0) {
    out += " -";
    for (uint8_t code = 1; code <= kAlphabetSize; ++code) {
      if (is_excluded(code))
        out += letter_char(code);
    }
  }
  return out;
}
