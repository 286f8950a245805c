#include "solver_core.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <iostream>

namespace {

constexpr letter_mask kVowels = letter_bit(letter_code('a')) |
                                letter_bit(letter_code('e')) |
                                letter_bit(letter_code('i')) |
                                letter_bit(letter_code('o')) |
                                letter_bit(letter_code('u'));

encoded_word encode_codes(const std::array<uint8_t, kWordLength> &codes) {
  encoded_word encoded = 0;
  for (const uint8_t code : codes) {
    encoded <<= 5;
    encoded |= code;
  }
  return encoded;
}

int count_vowels(encoded_word word) {
  int count = 0;
  for (int i = 0; i < kWordLength; ++i) {
    if (kVowels & letter_bit(get_char_code_at(word, i)))
      ++count;
  }
  return count;
}

} // namespace

FilteredResult filter_candidates(const ConstraintSet &constraints,
                                 const WordCorpus &corpus) {
  std::array<letter_mask, kWordLength> allowed{};
  for (int pos = 0; pos < kWordLength; ++pos) {
    if (constraints.is_fixed(pos)) {
      allowed[pos] = letter_bit(constraints.fixed[pos]);
      continue;
    }
    letter_mask mask = kAllLetters & ~constraints.excluded_letters;
    for (uint8_t code = 1; code <= kAlphabetSize; ++code) {
      if (constraints.is_excluded_at(code, pos))
        mask &= ~letter_bit(code);
    }
    allowed[pos] = mask;
  }
  const letter_mask required = constraints.required_letters();

  std::vector<encoded_word> matches;
  for (const auto word : corpus.words) {
    bool fits = true;
    for (int pos = 0; pos < kWordLength; ++pos) {
      if (!(allowed[pos] & letter_bit(get_char_code_at(word, pos)))) {
        fits = false;
        break;
      }
    }
    if (fits && (word_letter_mask(word) & required) == required)
      matches.push_back(word);
  }

  FilteredResult result;
  for (const auto word : matches) {
    if (has_unique_letters(word)) {
      result.unique.push_back(word);
    } else {
      result.repeated.push_back(word);
    }
  }
  return result;
}

std::optional<encoded_word> expand_candidates(const ConstraintSet &constraints,
                                              const WordCorpus &corpus,
                                              const FrequencyTable &frequencies) {
  std::vector<int> free_positions;
  std::vector<std::vector<uint8_t>> pools;
  size_t max_depth = 0;
  for (int pos = 0; pos < kWordLength; ++pos) {
    if (constraints.is_fixed(pos))
      continue;
    std::vector<uint8_t> pool;
    for (const uint8_t code : frequencies.letters_at(pos)) {
      if (constraints.is_excluded(code) || constraints.is_excluded_at(code, pos))
        continue;
      pool.push_back(code);
    }
    if (pool.empty())
      return std::nullopt;
    max_depth = std::max(max_depth, pool.size());
    free_positions.push_back(pos);
    pools.push_back(std::move(pool));
  }
  if (free_positions.empty())
    return std::nullopt;

  const letter_mask required = constraints.required_letters();
  std::array<uint8_t, kWordLength> letters = constraints.fixed;
  const size_t slots = free_positions.size();
  std::vector<size_t> index(slots);
  std::vector<size_t> limit(slots);

  // Depth d visits every combination whose deepest rank is exactly d - 1, so
  // each combination is tried once and shallower ranks always come first.
  for (size_t depth = 1; depth <= max_depth; ++depth) {
    const size_t frontier = depth - 1;
    for (size_t j = 0; j < slots; ++j) {
      index[j] = 0;
      limit[j] = std::min(depth, pools[j].size());
    }
    while (true) {
      if (std::find(index.begin(), index.end(), frontier) != index.end()) {
        for (size_t j = 0; j < slots; ++j) {
          letters[free_positions[j]] = pools[j][index[j]];
        }
        const encoded_word word = encode_codes(letters);
        if (corpus.contains(word) &&
            (word_letter_mask(word) & required) == required)
          return word;
      }
      size_t j = slots;
      while (j > 0 && ++index[j - 1] == limit[j - 1]) {
        index[j - 1] = 0;
        --j;
      }
      if (j == 0)
        break;
    }
  }
  return std::nullopt;
}

std::optional<encoded_word> recommend_guess(const FilteredResult &result) {
  if (!result.unique.empty())
    return result.unique.front();
  if (!result.repeated.empty())
    return result.repeated.front();
  return std::nullopt;
}

std::vector<ScoredWord> rank_suggestions(const FilteredResult &result,
                                         const ConstraintSet &constraints,
                                         const FrequencyTable &frequencies) {
  std::vector<encoded_word> best;
  int max_vowels = -1;
  for (const auto *bucket : {&result.unique, &result.repeated}) {
    for (const auto word : *bucket) {
      const int vowels = count_vowels(word);
      if (vowels > max_vowels) {
        max_vowels = vowels;
        best.clear();
      }
      if (vowels == max_vowels)
        best.push_back(word);
    }
  }

  std::vector<ScoredWord> scored;
  scored.reserve(best.size());
  for (const auto word : best) {
    uint32_t score = 0;
    for (int pos = 0; pos < kWordLength; ++pos) {
      if (constraints.is_fixed(pos))
        continue;
      const auto line =
          frequencies.line_number(pos, get_char_code_at(word, pos));
      score += line ? static_cast<uint32_t>(*line) : kMissingLetterPenalty;
    }
    scored.push_back({word, score});
  }
  std::sort(scored.begin(), scored.end(),
            [](const ScoredWord &a, const ScoredWord &b) {
              if (a.score != b.score)
                return a.score < b.score;
              return a.word < b.word;
            });
  return scored;
}

RoundOutcome recommend_round(const ConstraintSet &constraints,
                             const WordCorpus &corpus,
                             const FrequencyTable &frequencies,
                             const SolverConfig &config) {
  const auto round_start = std::chrono::high_resolution_clock::now();
  auto log_duration = [&](const char *tag) {
    if (!config.debug)
      return;
    const auto end = std::chrono::high_resolution_clock::now();
    const auto ms =
        std::chrono::duration<double, std::milli>(end - round_start).count();
    std::cerr << "[timer] " << tag << " " << ms << " ms\n";
  };

  RoundOutcome outcome;
  if (constraints.empty()) {
    outcome.recommendation = config.first_guess;
    outcome.used_first_guess = true;
    return outcome;
  }

  outcome.result = filter_candidates(constraints, corpus);
  if (config.debug) {
    std::cerr << "[filter] " << constraints.describe() << " -> "
              << outcome.result.size() << " of " << corpus.size()
              << " words (" << outcome.result.unique.size() << " unique, "
              << outcome.result.repeated.size() << " repeated)\n";
  }
  log_duration("filter");

  if (outcome.result.empty()) {
    const auto expanded = expand_candidates(constraints, corpus, frequencies);
    if (config.debug) {
      std::cerr << "[expand] "
                << (expanded ? decode_word(*expanded) : std::string("exhausted"))
                << "\n";
    }
    log_duration("expand");
    if (!expanded)
      return outcome;
    if (has_unique_letters(*expanded)) {
      outcome.result.unique.push_back(*expanded);
    } else {
      outcome.result.repeated.push_back(*expanded);
    }
    outcome.result.expanded = true;
  }

  outcome.recommendation = recommend_guess(outcome.result);
  outcome.suggestions = rank_suggestions(outcome.result, constraints, frequencies);
  log_duration("round");
  return outcome;
}
