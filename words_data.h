#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "solver_types.h"

// Encodes a lowercase word into a 64-bit integer with 5 bits per letter.
constexpr encoded_word encode_word(std::string_view word) {
  encoded_word encoded = 0;
  for (const char c : word) {
    encoded <<= 5;
    encoded |= (c - 'a' + 1);
  }
  return encoded;
}

// Helper to extract the encoded letter (1-26) at position [0,kWordLength).
inline uint8_t get_char_code_at(encoded_word word, int pos) {
  return (word >> (5 * (kWordLength - 1 - pos))) & 0x1F;
}

constexpr uint8_t letter_code(char lower) {
  return static_cast<uint8_t>(lower - 'a' + 1);
}

constexpr char letter_char(uint8_t code) {
  return static_cast<char>(code + 'a' - 1);
}

constexpr letter_mask letter_bit(uint8_t code) {
  return letter_mask{1} << code;
}

std::string decode_word(encoded_word encoded);
std::string to_lower_ascii(std::string_view text);
std::string to_upper_ascii(std::string_view text);

// True for exactly kWordLength ASCII letters, either case.
bool is_word_token(std::string_view text);

letter_mask word_letter_mask(encoded_word word);
bool has_unique_letters(encoded_word word);

// The set of legal solution words. Duplicates are dropped on construction,
// keeping the first occurrence, so filtering has set semantics.
struct WordCorpus {
  std::vector<encoded_word> words;
  std::unordered_map<encoded_word, size_t> word_index;

  bool contains(encoded_word word) const { return word_index.count(word) > 0; }
  size_t size() const { return words.size(); }
  bool empty() const { return words.empty(); }
};

WordCorpus build_corpus(const std::vector<encoded_word> &words);

std::vector<encoded_word> read_words(std::istream &in);
std::vector<encoded_word> load_words_from_file(const std::string &path);

inline constexpr std::string_view kDefaultFirstGuess = "saint";
inline constexpr std::string_view kDefaultWordsPath = "lib/wordle-words.txt";
inline constexpr std::string_view kDefaultFrequencyDir = "lib";
