#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "constraint_set.h"
#include "feedback_parser.h"
#include "frequency_table.h"
#include "solver_core.h"
#include "words_data.h"

enum class RoundState {
  kAwaitGuess,
  kAwaitGreen,
  kAwaitYellow,
  kAwaitGrey,
  kDisplay,
};

const char *round_state_name(RoundState state);

struct RoundReport {
  int round = 0;
  bool solved = false;
  RoundOutcome outcome;
};

// Drives one puzzle: each round collects a guess and its three feedback
// fields, then filters and recommends. Input comes in one line at a time so
// any front end (console, test, request handler) can feed it.
//
// Format errors keep the current state so the field can be re-entered. A
// contradiction drops the round back to kAwaitGuess; the constraints are only
// replaced once a whole round has been accepted.
class RoundSession {
public:
  RoundSession(const WordCorpus &corpus, const FrequencyTable &frequencies,
               SolverConfig config);

  RoundState state() const { return state_; }
  int round() const { return round_; }
  const ConstraintSet &constraints() const { return constraints_; }
  const SolverConfig &config() const { return config_; }

  // Valid once state() is kDisplay.
  const RoundReport &report() const { return report_; }

  // What the session is waiting for, suitable for a console prompt.
  const char *prompt() const;

  // Returns the reason the line was rejected, or nullopt if accepted.
  std::optional<std::string> submit(std::string_view line);

  // Leaves kDisplay and waits for the next guess.
  void next_round();

private:
  void finish_round(const ConstraintSet &next, bool solved);

  const WordCorpus &corpus_;
  const FrequencyTable &frequencies_;
  SolverConfig config_;

  RoundState state_ = RoundState::kAwaitGuess;
  int round_ = 1;
  ConstraintSet constraints_;
  RoundReport report_;

  std::string guess_;
  std::string green_;
  std::string yellow_;
};

// Constraints rebuilt from scripted rounds of feedback.
struct ReplayResult {
  ConstraintSet constraints;
  int rounds_applied = 0;
  FeedbackError error = FeedbackError::kNone;
  std::string message;

  bool ok() const { return error == FeedbackError::kNone; }
};

// Applies rounds of four fields (guess, green, yellow, grey) in order. Stops at
// the first rejected round; `constraints` then holds the rounds before it.
ReplayResult replay_feedback(const std::vector<std::string> &fields,
                             bool debug);

// Single-line JSON summary of a round, as printed by --dump-json.
std::string outcome_to_json(const RoundOutcome &outcome);
