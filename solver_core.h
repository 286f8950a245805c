#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "constraint_set.h"
#include "frequency_table.h"
#include "solver_types.h"
#include "words_data.h"

// Matching words split by letter uniqueness, each bucket in corpus order.
struct FilteredResult {
  std::vector<encoded_word> unique;
  std::vector<encoded_word> repeated;
  bool expanded = false; // produced by expand_candidates()

  size_t size() const { return unique.size() + repeated.size(); }
  bool empty() const { return unique.empty() && repeated.empty(); }
};

struct ScoredWord {
  encoded_word word = 0;
  uint32_t score = 0;
};

struct SolverConfig {
  encoded_word first_guess = encode_word(kDefaultFirstGuess);
  bool debug = false;
};

struct RoundOutcome {
  FilteredResult result;
  std::optional<encoded_word> recommendation;
  std::vector<ScoredWord> suggestions;
  bool used_first_guess = false;
};

inline constexpr uint32_t kMissingLetterPenalty = 1000;

FilteredResult filter_candidates(const ConstraintSet &constraints,
                                 const WordCorpus &corpus);

// Recovery for an empty filter: tries the free positions' letters in
// frequency order, growing every position's pool one rank at a time, and
// returns the first corpus word consistent with `constraints`.
std::optional<encoded_word> expand_candidates(const ConstraintSet &constraints,
                                              const WordCorpus &corpus,
                                              const FrequencyTable &frequencies);

std::optional<encoded_word> recommend_guess(const FilteredResult &result);

// Candidates with the most vowels, scored by the frequency rank of their
// letters in the free positions (lower is better).
std::vector<ScoredWord> rank_suggestions(const FilteredResult &result,
                                         const ConstraintSet &constraints,
                                         const FrequencyTable &frequencies);

RoundOutcome recommend_round(const ConstraintSet &constraints,
                             const WordCorpus &corpus,
                             const FrequencyTable &frequencies,
                             const SolverConfig &config);
