#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "solver_types.h"

// Per-position letter codes, most frequent first. Only the order of the
// source files is kept; the counts are discarded.
struct FrequencyTable {
  std::array<std::vector<uint8_t>, kWordLength> ranked;
  // Source file line of each entry in `ranked`. Lists built in code leave
  // this empty and count one letter per line.
  std::array<std::vector<size_t>, kWordLength> lines;

  bool loaded() const;
  const std::vector<uint8_t> &letters_at(int pos) const { return ranked[pos]; }

  // 1-based line of `code` in the list for `pos`. Blank and malformed lines
  // in the source file still count.
  std::optional<size_t> line_number(int pos, uint8_t code) const;
};

// Reads "<count> <letter>" or "<letter>" records. Blank lines, non-letters
// and repeated letters are skipped. If `line_numbers` is set it receives the
// line of each letter kept, counted from the first non-blank line.
std::vector<uint8_t> read_frequency_letters(
    std::istream &in, std::vector<size_t> *line_numbers = nullptr);

// Builds one position's list from a string such as "eyatr".
std::vector<uint8_t> frequency_letters_from(std::string_view letters);

// Loads pos1.txt..pos5.txt from `dir`. Check loaded() on the result.
FrequencyTable load_frequency_table(const std::string &dir);
