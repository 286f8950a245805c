#include "solver_runtime.h"

#include <algorithm>
#include <iostream>
#include <sstream>

#include "feedback_parser.h"

namespace {

std::string_view trim(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos)
    return {};
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool all_green(std::string_view green) {
  return green.size() == kWordLength &&
         std::none_of(green.begin(), green.end(),
                      [](char c) { return c == '.'; });
}

} // namespace

const char *round_state_name(RoundState state) {
  switch (state) {
  case RoundState::kAwaitGuess:
    return "await-guess";
  case RoundState::kAwaitGreen:
    return "await-green";
  case RoundState::kAwaitYellow:
    return "await-yellow";
  case RoundState::kAwaitGrey:
    return "await-grey";
  case RoundState::kDisplay:
    return "display";
  }
  return "unknown";
}

RoundSession::RoundSession(const WordCorpus &corpus,
                           const FrequencyTable &frequencies,
                           SolverConfig config)
    : corpus_(corpus), frequencies_(frequencies), config_(config) {}

const char *RoundSession::prompt() const {
  switch (state_) {
  case RoundState::kAwaitGuess:
    return "Enter your guess: ";
  case RoundState::kAwaitGreen:
    return "Enter green letters feedback (use dots for unknown positions, "
           "e.g., 'S..NT'): ";
  case RoundState::kAwaitYellow:
    return "Enter yellow letters feedback (use dots for positions, e.g., "
           "'.A...'): ";
  case RoundState::kAwaitGrey:
    return "Enter grey letters (space-separated, e.g., 'E R T'): ";
  case RoundState::kDisplay:
    return "";
  }
  return "";
}

std::optional<std::string> RoundSession::submit(std::string_view line) {
  const std::string_view input = trim(line);
  switch (state_) {
  case RoundState::kAwaitGuess: {
    if (auto reason = validate_guess(input))
      return reason;
    guess_ = to_lower_ascii(input);
    state_ = RoundState::kAwaitGreen;
    return std::nullopt;
  }
  case RoundState::kAwaitGreen: {
    if (auto reason = validate_pattern(input, "Green", false))
      return reason;
    FeedbackResult checked = apply_feedback(constraints_, guess_, input, "", "");
    if (!checked.ok()) {
      state_ = RoundState::kAwaitGuess;
      return checked.message;
    }
    green_ = to_lower_ascii(input);
    if (all_green(green_)) {
      finish_round(checked.constraints, true);
      return std::nullopt;
    }
    state_ = RoundState::kAwaitYellow;
    return std::nullopt;
  }
  case RoundState::kAwaitYellow: {
    if (auto reason = validate_pattern(input, "Yellow", true))
      return reason;
    FeedbackResult checked =
        apply_feedback(constraints_, guess_, green_, input, "");
    if (!checked.ok()) {
      state_ = RoundState::kAwaitGuess;
      return checked.message;
    }
    yellow_ = to_lower_ascii(input);
    state_ = RoundState::kAwaitGrey;
    return std::nullopt;
  }
  case RoundState::kAwaitGrey: {
    if (auto reason = validate_grey(input))
      return reason;
    FeedbackResult applied =
        apply_feedback(constraints_, guess_, green_, yellow_, input);
    if (!applied.ok()) {
      state_ = RoundState::kAwaitGuess;
      return applied.message;
    }
    finish_round(applied.constraints, false);
    return std::nullopt;
  }
  case RoundState::kDisplay:
    return std::string("Round complete; start the next round first.");
  }
  return std::string("Unknown session state.");
}

void RoundSession::next_round() {
  if (state_ != RoundState::kDisplay)
    return;
  ++round_;
  guess_.clear();
  green_.clear();
  yellow_.clear();
  state_ = RoundState::kAwaitGuess;
}

void RoundSession::finish_round(const ConstraintSet &next, bool solved) {
  constraints_ = next;
  if (config_.debug) {
    std::cerr << "[round] " << round_ << " guess=" << guess_ << " "
              << constraints_.describe() << "\n";
  }
  report_ = RoundReport{};
  report_.round = round_;
  report_.solved = solved;
  report_.outcome =
      recommend_round(constraints_, corpus_, frequencies_, config_);
  state_ = RoundState::kDisplay;
}

ReplayResult replay_feedback(const std::vector<std::string> &fields,
                             bool debug) {
  ReplayResult replay;
  if (fields.size() % 4 != 0) {
    replay.error = FeedbackError::kInputFormat;
    replay.message = "Each round needs four fields: guess, green, yellow and "
                     "grey.";
    return replay;
  }
  for (size_t i = 0; i < fields.size(); i += 4) {
    const FeedbackResult applied =
        apply_feedback(replay.constraints, fields[i], fields[i + 1],
                       fields[i + 2], fields[i + 3]);
    if (!applied.ok()) {
      replay.error = applied.error;
      replay.message = applied.message;
      return replay;
    }
    replay.constraints = applied.constraints;
    ++replay.rounds_applied;
    if (debug) {
      std::cerr << "[round] " << replay.rounds_applied
                << " guess=" << fields[i] << " "
                << replay.constraints.describe() << "\n";
    }
  }
  return replay;
}

std::string outcome_to_json(const RoundOutcome &outcome) {
  const FilteredResult &result = outcome.result;
  std::ostringstream out;
  out << "{\"candidates\":[";
  bool first = true;
  for (const auto *bucket : {&result.unique, &result.repeated}) {
    for (const auto word : *bucket) {
      if (!first)
        out << ",";
      out << "\"" << decode_word(word) << "\"";
      first = false;
    }
  }
  out << "],\"unique\":" << result.unique.size()
      << ",\"repeated\":" << result.repeated.size()
      << ",\"expanded\":" << (result.expanded ? "true" : "false")
      << ",\"suggestions\":[";
  for (size_t i = 0; i < outcome.suggestions.size(); ++i) {
    const auto &scored = outcome.suggestions[i];
    out << "{\"word\":\"" << to_upper_ascii(decode_word(scored.word))
        << "\",\"score\":" << scored.score << "}";
    if (i + 1 < outcome.suggestions.size())
      out << ",";
  }
  out << "],\"recommendation\":";
  if (outcome.recommendation) {
    out << "\"" << decode_word(*outcome.recommendation) << "\"";
  } else {
    out << "null";
  }
  out << "}";
  return out.str();
}
