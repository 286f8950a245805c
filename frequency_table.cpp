#include "frequency_table.h"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

#include "words_data.h"

namespace {

bool append_letter(std::vector<uint8_t> &letters, letter_mask &seen, char c) {
  if (!std::isalpha(static_cast<unsigned char>(c)))
    return false;
  const uint8_t code = letter_code(
      static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (seen & letter_bit(code))
    return false;
  seen |= letter_bit(code);
  letters.push_back(code);
  return true;
}

} // namespace

bool FrequencyTable::loaded() const {
  for (const auto &letters : ranked) {
    if (letters.empty())
      return false;
  }
  return true;
}

std::optional<size_t> FrequencyTable::line_number(int pos,
                                                  uint8_t code) const {
  const auto &letters = ranked[pos];
  for (size_t i = 0; i < letters.size(); ++i) {
    if (letters[i] != code)
      continue;
    return i < lines[pos].size() ? lines[pos][i] : i + 1;
  }
  return std::nullopt;
}

std::vector<uint8_t> read_frequency_letters(std::istream &in,
                                            std::vector<size_t> *line_numbers) {
  std::vector<uint8_t> letters;
  letter_mask seen = 0;
  size_t line_number = 0;
  std::string line;
  while (std::getline(in, line)) {
    std::istringstream fields(line);
    std::string field;
    std::string last;
    while (fields >> field) {
      last = field;
    }
    // Leading blank lines are not counted.
    if (line_number == 0 && last.empty())
      continue;
    ++line_number;
    if (last.size() != 1)
      continue;
    if (append_letter(letters, seen, last[0]) && line_numbers)
      line_numbers->push_back(line_number);
  }
  return letters;
}

std::vector<uint8_t> frequency_letters_from(std::string_view letters) {
  std::vector<uint8_t> out;
  letter_mask seen = 0;
  for (const char c : letters) {
    append_letter(out, seen, c);
  }
  return out;
}

FrequencyTable load_frequency_table(const std::string &dir) {
  FrequencyTable table;
  for (int pos = 0; pos < kWordLength; ++pos) {
    const std::string path = dir + "/pos" + std::to_string(pos + 1) + ".txt";
    std::ifstream in(path);
    if (!in.is_open()) {
      std::cerr << "Failed to open frequency file '" << path << "'.\n";
      return {};
    }
    table.ranked[pos] = read_frequency_letters(in, &table.lines[pos]);
    if (table.ranked[pos].empty()) {
      std::cerr << "No letters found in frequency file '" << path << "'.\n";
      return {};
    }
  }
  return table;
}
