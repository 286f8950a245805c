#include "solver_core.h"

#include <algorithm>

#include "feedback_parser.h"
#include "test_support.h"

using namespace test_support;

namespace {

ConstraintSet Feedback(const ConstraintSet &current, const char *guess,
                       const char *green, const char *yellow,
                       const char *greys) {
  const FeedbackResult result =
      apply_feedback(current, guess, green, yellow, greys);
  if (!result.ok()) {
    std::cerr << "unexpected rejection of " << guess << ": " << result.message
              << "\n";
  }
  return result.constraints;
}

FrequencyTable Frequencies(const char *p1, const char *p2, const char *p3,
                           const char *p4, const char *p5) {
  FrequencyTable table;
  table.ranked[0] = frequency_letters_from(p1);
  table.ranked[1] = frequency_letters_from(p2);
  table.ranked[2] = frequency_letters_from(p3);
  table.ranked[3] = frequency_letters_from(p4);
  table.ranked[4] = frequency_letters_from(p5);
  return table;
}

bool Contains(const std::vector<encoded_word> &words, encoded_word word) {
  return std::find(words.begin(), words.end(), word) != words.end();
}

std::string Decode(const std::optional<encoded_word> &word) {
  return word ? decode_word(*word) : std::string("<none>");
}

const WordCorpus &SampleCorpus() {
  static const WordCorpus corpus = build_corpus(
      Words({"saint", "slant", "plant", "chant", "grant", "crane", "speed",
             "sheep", "freak", "dread", "fiend", "eerie", "lever", "crypt",
             "audio", "adieu", "skate", "grate", "plate", "state"}));
  return corpus;
}

void TestSaintScenario() {
  const WordCorpus corpus =
      build_corpus(Words({"saint", "slant", "plant", "chant", "grant"}));
  const ConstraintSet set = Feedback({}, "SAINT", ".....", ".A...", "E R");
  const FilteredResult result = filter_candidates(set, corpus);
  ExpectEqual(Join(result.unique), std::string("slant plant chant"),
              "saint scenario unique bucket");
  ExpectTrue(result.repeated.empty(), "saint scenario has no repeats");
  ExpectEqual(result.size(), size_t{3}, "saint scenario count");
  ExpectFalse(result.expanded, "direct filter is not an expansion");
}

void TestFullyFixedWord() {
  const ConstraintSet set = Feedback({}, "plant", "plant", ".....", "");
  const FilteredResult result = filter_candidates(set, SampleCorpus());
  ExpectEqual(Join(result.unique), std::string("plant"),
              "green PLANT leaves only plant");
  ExpectTrue(result.repeated.empty(), "no repeated-letter words");
}

void TestEmptyConstraintsKeepCorpus() {
  const FilteredResult result = filter_candidates({}, SampleCorpus());
  ExpectEqual(result.size(), SampleCorpus().size(),
              "no constraints keeps every word");
  ExpectEqual(Join(result.repeated),
              std::string("speed sheep dread eerie lever state"),
              "repeated bucket keeps corpus order");
}

void TestYellowLetterMustBePresent() {
  const WordCorpus corpus = build_corpus(Words({"crypt", "slant"}));
  const ConstraintSet set = Feedback({}, "saint", ".....", ".a...", "");
  const FilteredResult result = filter_candidates(set, corpus);
  ExpectFalse(Contains(result.unique, encode_word("crypt")),
              "word without the yellow letter is excluded");
  ExpectEqual(Join(result.unique), std::string("slant"),
              "word with the yellow letter elsewhere is kept");
}

void TestGreyDuplicateKeepsLetter() {
  const WordCorpus corpus =
      build_corpus(Words({"freak", "dread", "sheep", "fiend"}));
  const ConstraintSet set = Feedback({}, "speed", "..e..", ".....", "e");
  const FilteredResult result = filter_candidates(set, corpus);
  ExpectEqual(Join(result.unique), std::string("freak fiend"),
              "words with the green e survive its grey duplicate");
  ExpectEqual(Join(result.repeated), std::string("dread"),
              "repeated bucket");
  ExpectFalse(Contains(result.repeated, encode_word("sheep")),
              "e at the grey position is ruled out");
}

void TestFilterIsIdempotent() {
  const ConstraintSet set = Feedback({}, "crane", "..a..", "c....", "r e");
  const FilteredResult first = filter_candidates(set, SampleCorpus());
  const FilteredResult second = filter_candidates(set, SampleCorpus());
  ExpectTrue(first.unique == second.unique, "unique bucket repeatable");
  ExpectTrue(first.repeated == second.repeated, "repeated bucket repeatable");
}

void TestMoreFeedbackNeverWidens() {
  const ConstraintSet one = Feedback({}, "saint", ".....", ".....", "i");
  const ConstraintSet two = Feedback(one, "crane", "..a..", ".....", "e");
  const ConstraintSet three = Feedback(two, "slant", "..a.t", ".....", "s");
  const ConstraintSet *steps[] = {&one, &two, &three};
  FilteredResult previous = filter_candidates({}, SampleCorpus());
  for (const ConstraintSet *step : steps) {
    const FilteredResult next = filter_candidates(*step, SampleCorpus());
    ExpectTrue(next.size() <= previous.size(), "candidate count never grows");
    for (const auto *bucket : {&next.unique, &next.repeated}) {
      for (const auto word : *bucket) {
        ExpectTrue(Contains(previous.unique, word) ||
                       Contains(previous.repeated, word),
                   "narrowed result is a subset");
      }
    }
    previous = next;
  }
  ExpectEqual(Join(previous.unique), std::string("plant chant grant"),
              "three rounds of feedback");
}

void TestPartitionIsExact() {
  const FilteredResult result = filter_candidates({}, SampleCorpus());
  for (const auto word : result.unique) {
    ExpectTrue(has_unique_letters(word), "unique bucket has distinct letters");
    ExpectFalse(Contains(result.repeated, word), "buckets are disjoint");
  }
  for (const auto word : result.repeated) {
    ExpectFalse(has_unique_letters(word), "repeated bucket repeats a letter");
  }
  ExpectEqual(result.unique.size() + result.repeated.size(),
              SampleCorpus().size(), "buckets cover every match");
}

void TestDuplicateCorpusWords() {
  const WordCorpus corpus =
      build_corpus(Words({"slant", "plant", "slant", "plant", "chant"}));
  ExpectEqual(corpus.size(), size_t{3}, "duplicates dropped");
  const ConstraintSet set = Feedback({}, "saint", ".....", ".a...", "");
  ExpectEqual(Join(filter_candidates(set, corpus).unique),
              std::string("slant plant chant"),
              "duplicates do not change the result");
}

void TestExpansionFollowsFrequencyOrder() {
  const ConstraintSet set = Feedback({}, "plane", "plan.", ".....", "e");
  const FrequencyTable freq = Frequencies("p", "l", "a", "n", "eyatr");

  const WordCorpus only_plant = build_corpus(Words({"plane", "plant"}));
  ExpectEqual(Decode(expand_candidates(set, only_plant, freq)),
              std::string("plant"), "grey e skipped, plant found");

  const WordCorpus with_plana = build_corpus(Words({"plant", "plana"}));
  ExpectEqual(Decode(expand_candidates(set, with_plana, freq)),
              std::string("plana"), "a ranks before t");

  const WordCorpus with_plany = build_corpus(Words({"plant", "plany"}));
  ExpectEqual(Decode(expand_candidates(set, with_plany, freq)),
              std::string("plany"), "y ranks first once e is excluded");
}

void TestExpansionGrowsAllPositionsTogether() {
  const ConstraintSet set = Feedback({}, "grate", "..ate", ".....", "");
  const FrequencyTable freq = Frequencies("sgpc", "lkrt", "a", "t", "e");

  ExpectEqual(
      Decode(expand_candidates(set, build_corpus(Words({"crate", "skate"})),
                               freq)),
      std::string("skate"), "depth two reaches the second rank of position 2");
  ExpectEqual(
      Decode(expand_candidates(set, build_corpus(Words({"crate", "grate"})),
                               freq)),
      std::string("grate"), "third ranks are tried before fourth ranks");
}

void TestExpansionRespectsConstraints() {
  const FrequencyTable freq = Frequencies("sgpc", "lkrt", "a", "t", "e");
  ConstraintSet set = Feedback({}, "grate", "..ate", ".....", "");

  ConstraintSet no_s = set;
  no_s.excluded_letters |= letter_bit(letter_code('s'));
  ExpectEqual(
      Decode(expand_candidates(no_s, build_corpus(Words({"skate", "grate"})),
                               freq)),
      std::string("grate"), "excluded letters are never tried");

  ConstraintSet needs_k = set;
  needs_k.excluded_positions[letter_code('k')] = 0b00001;
  ExpectEqual(
      Decode(expand_candidates(needs_k, build_corpus(Words({"slate", "skate"})),
                               freq)),
      std::string("skate"), "words without a yellow letter are skipped");

  const FrequencyTable with_l = Frequencies("sgplc", "lkrt", "a", "t", "e");
  ConstraintSet not_l_second = set;
  not_l_second.excluded_positions[letter_code('l')] = 0b00010;
  ExpectEqual(Decode(expand_candidates(
                  not_l_second, build_corpus(Words({"slate", "lrate"})),
                  with_l)),
              std::string("lrate"),
              "letters excluded at a position are not tried there");
}

void TestExpansionIsDeterministic() {
  const ConstraintSet set = Feedback({}, "grate", "..ate", ".....", "");
  const FrequencyTable freq = Frequencies("sgpc", "lkrt", "a", "t", "e");
  const WordCorpus corpus = build_corpus(Words({"state", "plate", "crate"}));
  const auto first = expand_candidates(set, corpus, freq);
  const auto second = expand_candidates(set, corpus, freq);
  ExpectTrue(first.has_value(), "expansion finds a word");
  ExpectEqual(Decode(first), Decode(second), "same inputs, same word");
}

void TestExpansionExhaustion() {
  const FrequencyTable freq = Frequencies("sgpc", "lkrt", "a", "t", "e");
  const ConstraintSet set = Feedback({}, "grate", "..ate", ".....", "");
  ExpectFalse(
      expand_candidates(set, build_corpus(Words({"zebra"})), freq).has_value(),
      "no match in the frequency lists");

  const ConstraintSet fixed = Feedback({}, "zesty", "zesty", ".....", "");
  ExpectFalse(expand_candidates(fixed, SampleCorpus(), freq).has_value(),
              "nothing to widen when every position is fixed");

  ConstraintSet starved = set;
  for (const uint8_t c : freq.letters_at(0)) {
    starved.excluded_letters |= letter_bit(c);
  }
  ExpectFalse(
      expand_candidates(starved, build_corpus(Words({"skate"})), freq)
          .has_value(),
      "a position with no letters left cannot be filled");
}

void TestRecommendGuess() {
  FilteredResult result;
  ExpectFalse(recommend_guess(result).has_value(), "nothing to recommend");

  result.repeated = Words({"sheep", "dread"});
  ExpectEqual(Decode(recommend_guess(result)), std::string("sheep"),
              "first repeated word when no unique word exists");

  result.unique = Words({"plant", "chant"});
  ExpectEqual(Decode(recommend_guess(result)), std::string("plant"),
              "unique bucket preferred");
}

void TestRecommendRound() {
  const FrequencyTable freq = Frequencies("spcg", "lh", "a", "n", "t");

  const RoundOutcome opening =
      recommend_round({}, SampleCorpus(), freq, SolverConfig{});
  ExpectTrue(opening.used_first_guess, "empty constraints use the seed word");
  ExpectEqual(Decode(opening.recommendation), std::string("saint"),
              "default seed word");

  SolverConfig config;
  config.first_guess = encode_word("crane");
  ExpectEqual(Decode(recommend_round({}, SampleCorpus(), freq, config)
                         .recommendation),
              std::string("crane"), "seed word is configurable");

  const ConstraintSet set = Feedback({}, "saint", ".....", ".a...", "e r");
  const RoundOutcome round = recommend_round(set, SampleCorpus(), freq, config);
  ExpectFalse(round.used_first_guess, "feedback turns off the seed word");
  ExpectEqual(Join(round.result.unique),
              std::string("slant plant chant audio"),
              "round filters the corpus");
  ExpectEqual(Decode(round.recommendation), std::string("slant"),
              "first unique candidate recommended");
  ExpectEqual(round.suggestions.size(), size_t{1},
              "ranking keeps the vowel-richest candidate");

  const ConstraintSet dead_end = Feedback({}, "quick", "q....", ".....", "");
  const RoundOutcome stuck =
      recommend_round(dead_end, SampleCorpus(), freq, config);
  ExpectTrue(stuck.result.empty(), "no q words in the corpus");
  ExpectFalse(stuck.recommendation.has_value(),
              "exhausted expansion gives no suggestion");
}

void TestRankSuggestions() {
  const FrequencyTable freq = Frequencies("spcg", "lh", "a", "n", "t");
  FilteredResult result;
  result.unique = Words({"chant", "plant", "slant"});
  const ConstraintSet set = Feedback({}, "saint", ".....", ".a...", "");
  const std::vector<ScoredWord> ranked = rank_suggestions(result, set, freq);
  ExpectEqual(ranked.size(), size_t{3}, "three ranked words");
  if (ranked.size() == 3) {
    ExpectEqual(decode_word(ranked[0].word), std::string("slant"), "best");
    ExpectEqual(ranked[0].score, uint32_t{5}, "slant score");
    ExpectEqual(decode_word(ranked[1].word), std::string("plant"), "second");
    ExpectEqual(ranked[1].score, uint32_t{6}, "plant score");
    ExpectEqual(decode_word(ranked[2].word), std::string("chant"), "third");
    ExpectEqual(ranked[2].score, uint32_t{8}, "chant score");
  }

  FilteredResult vowels;
  vowels.unique = Words({"slant", "audio"});
  const auto vowel_rank = rank_suggestions(vowels, {}, freq);
  ExpectEqual(vowel_rank.size(), size_t{1}, "only the most vowels kept");
  if (!vowel_rank.empty()) {
    ExpectEqual(decode_word(vowel_rank[0].word), std::string("audio"),
                "audio has the most vowels");
    ExpectEqual(vowel_rank[0].score, 5 * kMissingLetterPenalty,
                "unlisted letters take the penalty");
  }

  const ConstraintSet fixed = Feedback({}, "plant", "plant", ".....", "");
  FilteredResult single;
  single.unique = Words({"plant"});
  const auto fixed_rank = rank_suggestions(single, fixed, freq);
  ExpectEqual(fixed_rank.size(), size_t{1}, "one fixed word");
  if (!fixed_rank.empty()) {
    ExpectEqual(fixed_rank[0].score, uint32_t{0}, "no free position, no score");
  }

  FilteredResult tie;
  tie.unique = Words({"shant", "slant"});
  const auto tie_rank = rank_suggestions(tie, fixed, freq);
  ExpectEqual(tie_rank.size(), size_t{2}, "two tied words");
  if (tie_rank.size() == 2) {
    ExpectEqual(decode_word(tie_rank[0].word), std::string("shant"),
                "ties break alphabetically");
  }
}

} // namespace

int main() {
  TestSaintScenario();
  TestFullyFixedWord();
  TestEmptyConstraintsKeepCorpus();
  TestYellowLetterMustBePresent();
  TestGreyDuplicateKeepsLetter();
  TestFilterIsIdempotent();
  TestMoreFeedbackNeverWidens();
  TestPartitionIsExact();
  TestDuplicateCorpusWords();
  TestExpansionFollowsFrequencyOrder();
  TestExpansionGrowsAllPositionsTogether();
  TestExpansionRespectsConstraints();
  TestExpansionIsDeterministic();
  TestExpansionExhaustion();
  TestRecommendGuess();
  TestRecommendRound();
  TestRankSuggestions();
  return Finish("solver_core_tests");
}
