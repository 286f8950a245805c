#include "words_data.h"

#include <bitset>
#include <cctype>
#include <fstream>
#include <iostream>

std::string decode_word(encoded_word encoded) {
  std::string word(kWordLength, ' ');
  for (int i = kWordLength - 1; i >= 0; --i) {
    word[i] = static_cast<char>((encoded & 0x1F) + 'a' - 1);
    encoded >>= 5;
  }
  return word;
}

std::string to_lower_ascii(std::string_view text) {
  std::string out(text);
  for (char &c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::string to_upper_ascii(std::string_view text) {
  std::string out(text);
  for (char &c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

bool is_word_token(std::string_view text) {
  if (text.size() != kWordLength)
    return false;
  for (const char c : text) {
    if (!std::isalpha(static_cast<unsigned char>(c)))
      return false;
  }
  return true;
}

letter_mask word_letter_mask(encoded_word word) {
  letter_mask mask = 0;
  for (int i = 0; i < kWordLength; ++i) {
    mask |= letter_bit(get_char_code_at(word, i));
  }
  return mask;
}

bool has_unique_letters(encoded_word word) {
  return std::bitset<32>(word_letter_mask(word)).count() ==
         static_cast<size_t>(kWordLength);
}

WordCorpus build_corpus(const std::vector<encoded_word> &words) {
  WordCorpus corpus;
  corpus.words.reserve(words.size());
  corpus.word_index.reserve(words.size());
  for (const auto word : words) {
    if (corpus.word_index.emplace(word, corpus.words.size()).second) {
      corpus.words.push_back(word);
    }
  }
  return corpus;
}

std::vector<encoded_word> read_words(std::istream &in) {
  std::vector<encoded_word> words;
  std::string line;
  while (std::getline(in, line)) {
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos)
      continue;
    const auto last = line.find_last_not_of(" \t\r");
    const std::string_view token(line.data() + first, last - first + 1);
    if (!is_word_token(token))
      continue;
    words.push_back(encode_word(to_lower_ascii(token)));
  }
  return words;
}

std::vector<encoded_word> load_words_from_file(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    std::cerr << "Failed to open word list '" << path << "'.\n";
    return {};
  }
  std::vector<encoded_word> words = read_words(in);
  if (words.empty()) {
    std::cerr << "No valid words found in '" << path << "'.\n";
  }
  return words;
}
